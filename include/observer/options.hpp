/**
 * @file options.hpp
 * @brief Runtime configuration accepted by every hub constructor.
 */

#pragma once

#include "observer/dispatcher.hpp"

#include <memory>
#include <string>

namespace observer {

/// How the indexed topic hubs treat the `"*"` topic.
enum class WildcardMatching {
    /// `"*"` matches on the subscriber side and on the publisher side.
    Symmetric,
    /// Only a publisher's `"*"` is universal; a subscriber's `"*"` is an
    /// ordinary topic that a publisher reaches by notifying `"*"`.
    PublisherOnly,
};

struct HubOptions {
    /// Used in log lines and in @ref HubStoppedError messages.
    std::string name = "hub";

    /// Ignored when @ref dispatcher is set.
    DispatchPolicy dispatch = DispatchPolicy::Inline;

    /// Explicit dispatcher, shareable between hubs.
    std::shared_ptr<Dispatcher> dispatcher;

    /// Called for every exception escaping a subscriber callback.
    ErrorHandler on_callback_error;

    /**
     * Only consulted by the indexed topic hubs.  With the default a
     * subscription to `{"a", "*"}` also receives `{"d"}`; choose
     * WildcardMatching::PublisherOnly when a subscriber's `"*"` should only
     * be reached by a publisher notifying `"*"`.
     */
    WildcardMatching wildcard = WildcardMatching::Symmetric;

    std::shared_ptr<Dispatcher> resolve_dispatcher() const {
        if (dispatcher) {
            return dispatcher;
        }
        return dispatch == DispatchPolicy::Parallel
                   ? Dispatcher::shared_pool()
                   : Dispatcher::inline_dispatcher();
    }
};

} // namespace observer
