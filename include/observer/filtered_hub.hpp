/**
 * @file filtered_hub.hpp
 * @brief Topic filtering for arbitrary equality‑comparable topic types.
 *
 * Unlike the indexed topic hubs, a `FilteredHub` keeps no index: every
 * notify reaches every subscriber of the underlying @ref Hub and each
 * subscriber tests locally whether its topics intersect the notified ones.
 * The cost is O(subscribers) per notify, in exchange topics can be any type
 * with `operator==` – numbers, enums, or hub handles used as identity
 * tokens.  There is no wildcard; `"*"` is an ordinary value here.
 *
 * Each dimension adds one layer: `FilteredHub<T, A, B>` wraps
 * `FilteredHub<Envelope<A, T>, B>`, which wraps
 * `Hub<Envelope<B, Envelope<A, T>>>`.
 */

#pragma once

#include "observer/hub.hpp"
#include "observer/options.hpp"
#include "observer/types.hpp"
#include "observer/unsubscriber.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace observer {

/// A value travelling together with the topics it was notified under.
template <typename TopicType, typename T> struct Envelope {
    std::vector<TopicType> topics;
    T value;
};

namespace detail {

template <typename TopicType>
bool intersects(const std::vector<TopicType>& lhs,
                const std::vector<TopicType>& rhs) {
    return std::find_first_of(lhs.begin(), lhs.end(), rhs.begin(),
                              rhs.end()) != lhs.end();
}

} // namespace detail

template <typename T, typename... Topics> class FilteredHub;

/// Zero dimensions: a plain hub, the innermost layer of every filtered hub.
template <typename T> class FilteredHub<T> {
  private:
    Hub<T> m_hub;

  public:
    using value_type = T;

    explicit FilteredHub(const HubOptions& options = {}) : m_hub(options) {}

    Unsubscriber subscribe(Callback<T> callback) {
        return m_hub.subscribe(std::move(callback));
    }

    void notify(const T& value) { m_hub.notify(value); }

    void unsubscribe(SubscriptionId id) { m_hub.unsubscribe(id); }
    void stop() { m_hub.stop(); }
    bool stopped() const { return m_hub.stopped(); }
    size_t subscriber_count() const { return m_hub.subscriber_count(); }
};

/**
 * @brief Hub filtering on one topic list per topic type.
 *
 * A subscriber receives a value when, for every dimension, its topic list
 * and the notified list share at least one element.
 *
 * @tparam T     Value type delivered to subscribers.
 * @tparam Topic Topic type of the outermost dimension.
 * @tparam Rest  Topic types of the remaining dimensions.
 */
template <typename T, typename Topic, typename... Rest>
class FilteredHub<T, Topic, Rest...> {
  private:
    using Inner = FilteredHub<Envelope<Topic, T>, Rest...>;

    Inner m_inner;

  public:
    using value_type = T;
    static constexpr size_t dimensions = 1 + sizeof...(Rest);

    explicit FilteredHub(const HubOptions& options = {}) : m_inner(options) {}

    /**
     * @throws std::invalid_argument for an empty callback.
     * @throws HubStoppedError after @ref stop.
     */
    Unsubscriber subscribe(std::vector<Topic> topics,
                           std::vector<Rest>... rest, Callback<T> callback) {
        if (!callback) {
            throw std::invalid_argument("cannot subscribe an empty callback");
        }
        return m_inner.subscribe(
            std::move(rest)...,
            [topics = std::move(topics), callback = std::move(callback)](
                const Envelope<Topic, T>& envelope) {
                if (detail::intersects(topics, envelope.topics)) {
                    callback(envelope.value);
                }
            });
    }

    /// @throws HubStoppedError after @ref stop.
    void notify(std::vector<Topic> topics, std::vector<Rest>... rest,
                const T& value) {
        m_inner.notify(std::move(rest)...,
                       Envelope<Topic, T>{std::move(topics), value});
    }

    void unsubscribe(SubscriptionId id) { m_inner.unsubscribe(id); }
    void stop() { m_inner.stop(); }
    bool stopped() const { return m_inner.stopped(); }
    size_t subscriber_count() const { return m_inner.subscriber_count(); }
};

template <typename T, typename... Topics, typename Body>
decltype(auto) with_new_filtered_hub(Body&& body) {
    return detail::with_new<FilteredHub<T, Topics...>>(
        std::forward<Body>(body));
}

} // namespace observer
