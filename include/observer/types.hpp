/**
 * @file types.hpp
 * @brief Vocabulary types shared by all hub variants.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace observer {

/// Unique per hub, assigned from 1 upwards and never reused.
using SubscriptionId = uint64_t;

/// Subscriber callback receiving one notified value.
template <typename T> using Callback = std::function<void(const T&)>;

/// A single routing label of the indexed topic hubs.
using Topic = std::string;

/// Topics of one dimension. Matching is by intersection, order is
/// irrelevant and duplicates are ignored.
using TopicList = std::vector<Topic>;

/// One @ref TopicList per dimension.
using TopicSets = std::vector<TopicList>;

/// Topic that matches every non-empty topic list of its dimension.
inline const Topic wildcard_topic = "*";

/**
 * @brief Thrown by every hub operation issued after the hub was stopped.
 *
 * Unsubscribe handles are the exception: they silently do nothing once their
 * hub is gone.
 */
class HubStoppedError : public std::logic_error {
  public:
    explicit HubStoppedError(const std::string& hub_name)
        : std::logic_error("hub '" + hub_name + "' used after stop()") {}
};

} // namespace observer
