/**
 * @file topic_hub.hpp
 * @brief Hubs routing notifications through a @ref TopicIndex.
 *
 *   * **MultiTopicHub** – the N‑dimensional implementation.  Subscribers
 *     and publishers pass one topic list per dimension.
 *   * **TopicHub / TopicHub2 / TopicHub3 / TopicHub4** – fixed arity
 *     front‑ends taking the topic lists as separate arguments.
 *
 * @code
 *   observer::TopicHub2<double> prices;
 *   auto unsubscribe = prices.subscribe({"EURUSD", "GBPUSD"}, {"*"},
 *                                       [](const double& px) { ... });
 *   prices.notify({"EURUSD"}, {"LMAX"}, 1.0842);
 *   unsubscribe();
 * @endcode
 */

#pragma once

#include "observer/dispatcher.hpp"
#include "observer/hub.hpp"
#include "observer/logging.hpp"
#include "observer/options.hpp"
#include "observer/registry.hpp"
#include "observer/topic_index.hpp"
#include "observer/types.hpp"
#include "observer/unsubscriber.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace observer {

namespace detail {

template <typename T> struct TopicHubState {
    const std::string name;
    CallbackRegistry<T> registry;
    const std::shared_ptr<Dispatcher> dispatcher;
    const ErrorHandler on_error;
    logging::Logger logger;

    mutable std::mutex mutex; ///< Protects index and topics.
    TopicIndex index;
    std::unordered_map<SubscriptionId, TopicSets> topics;

    TopicHubState(size_t dimensions, const HubOptions& options)
        : name(options.name), registry(options.name),
          dispatcher(options.resolve_dispatcher()),
          on_error(options.on_callback_error),
          logger(logging::create_logger("topic-hub")),
          index(dimensions, options.wildcard) {}

    void unsubscribe(SubscriptionId id) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = topics.find(id);
            if (it != topics.end()) {
                index.remove(it->second, id);
                topics.erase(it);
            }
        }
        registry.remove(id);
    }

    bool stopped() const { return registry.closed(); }
};

} // namespace detail

// ==========================================================================
// MultiTopicHub – N dimensions
// ==========================================================================

/**
 * @brief Hub delivering a value only to subscribers whose topics intersect
 *        the notified topics in every dimension.
 *
 * Thread‑safe.  The match is computed under the hub lock, callbacks run
 * outside of it, so callbacks may subscribe, unsubscribe or notify on the
 * same hub.
 *
 * @tparam T Value type delivered to subscribers.
 */
template <typename T> class MultiTopicHub {
  public:
    using value_type = T;

  private:
    std::shared_ptr<detail::TopicHubState<T>> m_state;

  public:
    /**
     * @param dimensions Topic lists per subscribe / notify, at least 1.
     * @throws std::invalid_argument for zero dimensions.
     */
    explicit MultiTopicHub(size_t dimensions, const HubOptions& options = {})
        : m_state(std::make_shared<detail::TopicHubState<T>>(dimensions,
                                                             options)) {}

    /**
     * @brief Register @p callback for notifications intersecting
     *        @p topic_sets in every dimension.
     * @throws std::invalid_argument on a dimension count mismatch.
     * @throws HubStoppedError after @ref stop.
     */
    Unsubscriber subscribe(TopicSets topic_sets, Callback<T> callback) {
        auto& state = *m_state;
        if (topic_sets.size() != state.index.dimensions()) {
            throw std::invalid_argument(
                "subscribe: wrong number of topic lists for hub '" +
                state.name + "'");
        }
        SubscriptionId id = state.registry.add(std::move(callback));
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (state.registry.closed()) {
                throw HubStoppedError(state.name);
            }
            state.index.insert(topic_sets, id);
            state.topics.emplace(id, std::move(topic_sets));
        }
        OBSERVER_LOG_DEBUG(state.logger, "{}: subscription {} indexed",
                           state.name, id);
        return Unsubscriber::bind(m_state, id);
    }

    /**
     * @brief Invoke every subscriber matching @p topic_sets with @p value.
     *
     * Returns once all matched callbacks have completed.
     *
     * @throws std::invalid_argument on a dimension count mismatch.
     * @throws HubStoppedError after @ref stop.
     */
    void notify(const TopicSets& topic_sets, const T& value) {
        auto state = m_state;
        if (state->stopped()) {
            throw HubStoppedError(state->name);
        }
        std::vector<SubscriptionId> ids;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto matched = state->index.match(topic_sets);
            ids.assign(matched.begin(), matched.end());
        }
        OBSERVER_LOG_DEBUG(state->logger, "{}: {} subscribers matched",
                           state->name, ids.size());
        state->registry.invoke_all(ids, value, *state->dispatcher,
                                   state->on_error);
    }

    /// Unknown ids are ignored.
    void unsubscribe(SubscriptionId id) { m_state->unsubscribe(id); }

    /**
     * @brief Drop all subscribers and the index; later operations throw.
     */
    void stop() {
        m_state->registry.close();
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->index.clear();
        m_state->topics.clear();
    }

    bool stopped() const { return m_state->stopped(); }
    size_t dimensions() const { return m_state->index.dimensions(); }
    size_t subscriber_count() const { return m_state->registry.size(); }
    const std::string& name() const { return m_state->name; }

    /// Live topic index nodes including the root.
    size_t index_node_count() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->index.node_count();
    }

    bool operator==(const MultiTopicHub& other) const {
        return m_state == other.m_state;
    }
    bool operator!=(const MultiTopicHub& other) const {
        return !(*this == other);
    }
};

// ==========================================================================
// Fixed arity front‑ends
// ==========================================================================

namespace detail {

/// Shared part of the fixed arity hubs; no matching logic lives here.
template <typename T, size_t N> class FixedTopicHub {
  protected:
    MultiTopicHub<T> m_hub;

  public:
    using value_type = T;
    static constexpr size_t dimensions = N;

    explicit FixedTopicHub(const HubOptions& options) : m_hub(N, options) {}

    void unsubscribe(SubscriptionId id) { m_hub.unsubscribe(id); }
    void stop() { m_hub.stop(); }
    bool stopped() const { return m_hub.stopped(); }
    size_t subscriber_count() const { return m_hub.subscriber_count(); }
    size_t index_node_count() const { return m_hub.index_node_count(); }
    const std::string& name() const { return m_hub.name(); }

    /// The underlying N‑dimensional hub.
    MultiTopicHub<T>& multi() { return m_hub; }
};

} // namespace detail

/// One dimension of topics.
template <typename T> class TopicHub : public detail::FixedTopicHub<T, 1> {
  public:
    explicit TopicHub(const HubOptions& options = {})
        : detail::FixedTopicHub<T, 1>(options) {}

    Unsubscriber subscribe(TopicList topics, Callback<T> callback) {
        return this->m_hub.subscribe(TopicSets{std::move(topics)},
                                     std::move(callback));
    }

    void notify(TopicList topics, const T& value) {
        this->m_hub.notify(TopicSets{std::move(topics)}, value);
    }
};

/// Two dimensions of topics.
template <typename T> class TopicHub2 : public detail::FixedTopicHub<T, 2> {
  public:
    explicit TopicHub2(const HubOptions& options = {})
        : detail::FixedTopicHub<T, 2>(options) {}

    Unsubscriber subscribe(TopicList topics1, TopicList topics2,
                           Callback<T> callback) {
        return this->m_hub.subscribe(
            TopicSets{std::move(topics1), std::move(topics2)},
            std::move(callback));
    }

    void notify(TopicList topics1, TopicList topics2, const T& value) {
        this->m_hub.notify(TopicSets{std::move(topics1), std::move(topics2)},
                           value);
    }
};

/// Three dimensions of topics.
template <typename T> class TopicHub3 : public detail::FixedTopicHub<T, 3> {
  public:
    explicit TopicHub3(const HubOptions& options = {})
        : detail::FixedTopicHub<T, 3>(options) {}

    Unsubscriber subscribe(TopicList topics1, TopicList topics2,
                           TopicList topics3, Callback<T> callback) {
        return this->m_hub.subscribe(TopicSets{std::move(topics1),
                                               std::move(topics2),
                                               std::move(topics3)},
                                     std::move(callback));
    }

    void notify(TopicList topics1, TopicList topics2, TopicList topics3,
                const T& value) {
        this->m_hub.notify(TopicSets{std::move(topics1), std::move(topics2),
                                     std::move(topics3)},
                           value);
    }
};

/// Four dimensions of topics.
template <typename T> class TopicHub4 : public detail::FixedTopicHub<T, 4> {
  public:
    explicit TopicHub4(const HubOptions& options = {})
        : detail::FixedTopicHub<T, 4>(options) {}

    Unsubscriber subscribe(TopicList topics1, TopicList topics2,
                           TopicList topics3, TopicList topics4,
                           Callback<T> callback) {
        return this->m_hub.subscribe(
            TopicSets{std::move(topics1), std::move(topics2),
                      std::move(topics3), std::move(topics4)},
            std::move(callback));
    }

    void notify(TopicList topics1, TopicList topics2, TopicList topics3,
                TopicList topics4, const T& value) {
        this->m_hub.notify(TopicSets{std::move(topics1), std::move(topics2),
                                     std::move(topics3), std::move(topics4)},
                           value);
    }
};

template <typename T, typename Body>
decltype(auto) with_new_multi_topic_hub(size_t dimensions,
                                        const HubOptions& options, Body&& body) {
    return detail::with_new<MultiTopicHub<T>>(std::forward<Body>(body),
                                              dimensions, options);
}

template <typename T, typename Body>
decltype(auto) with_new_multi_topic_hub(size_t dimensions, Body&& body) {
    return with_new_multi_topic_hub<T>(dimensions, HubOptions{},
                                       std::forward<Body>(body));
}

template <typename T, typename Body>
decltype(auto) with_new_topic_hub(Body&& body) {
    return detail::with_new<TopicHub<T>>(std::forward<Body>(body));
}

template <typename T, typename Body>
decltype(auto) with_new_topic_hub2(Body&& body) {
    return detail::with_new<TopicHub2<T>>(std::forward<Body>(body));
}

template <typename T, typename Body>
decltype(auto) with_new_topic_hub3(Body&& body) {
    return detail::with_new<TopicHub3<T>>(std::forward<Body>(body));
}

template <typename T, typename Body>
decltype(auto) with_new_topic_hub4(Body&& body) {
    return detail::with_new<TopicHub4<T>>(std::forward<Body>(body));
}

} // namespace observer
