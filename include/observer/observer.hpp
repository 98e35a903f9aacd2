/**
 * @file observer.hpp
 * @brief Header‑only, in‑process publish/subscribe hubs.
 *
 * A *hub* holds a registry of callbacks; publishers notify the hub with a
 * value and the hub invokes every matching subscriber before `notify`
 * returns.
 *
 *   * **Hub**            – every subscriber receives every value.
 *   * **StatefulHub**    – additionally remembers the latest value.
 *   * **ReactiveHub**    – broadcasts what an injected producer returns.
 *   * **TopicHub[2-4] / MultiTopicHub** – string topics in one or more
 *     dimensions, routed through a trie index, with the `"*"` wildcard.
 *   * **FilteredHub**    – unindexed filtering on topics of any
 *     equality‑comparable type.
 *
 * Every subscribe returns an @ref Unsubscriber.  The `with_new_*` helpers
 * scope a hub to a block and stop it on every exit path.
 *
 * The code is header‑only and depends on `Boost.Lockfree` and (optionally)
 * the `quill` logging library.
 *
 * @note All public types live inside the `observer` namespace.
 */

#pragma once

#include "observer/dispatcher.hpp"
#include "observer/filtered_hub.hpp"
#include "observer/hub.hpp"
#include "observer/logging.hpp"
#include "observer/options.hpp"
#include "observer/reactive_hub.hpp"
#include "observer/registry.hpp"
#include "observer/stateful_hub.hpp"
#include "observer/topic_hub.hpp"
#include "observer/topic_index.hpp"
#include "observer/types.hpp"
#include "observer/unsubscriber.hpp"
