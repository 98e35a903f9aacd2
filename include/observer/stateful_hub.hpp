/**
 * @file stateful_hub.hpp
 * @brief Hub that remembers the last notified value.
 */

#pragma once

#include "observer/hub.hpp"
#include "observer/options.hpp"
#include "observer/types.hpp"
#include "observer/unsubscriber.hpp"

#include <memory>
#include <mutex>
#include <utility>

namespace observer {

/**
 * @brief A @ref Hub plus the most recently notified value.
 *
 * `state()` returns the value of the latest `notify`, or the initial value
 * if nothing was notified yet.  Copies share hub and state.
 */
template <typename T> class StatefulHub {
  private:
    struct State {
        mutable std::mutex mutex;
        T value;

        explicit State(T initial) : value(std::move(initial)) {}
    };

    Hub<T> m_hub;
    std::shared_ptr<State> m_state;

    void ensure_running() const {
        if (m_hub.stopped()) {
            throw HubStoppedError(m_hub.name());
        }
    }

  public:
    explicit StatefulHub(T initial, const HubOptions& options = {})
        : m_hub(options), m_state(std::make_shared<State>(std::move(initial))) {}

    /**
     * @brief Register @p callback for future notifies.
     *
     * With @p notify_current_state the callback is first invoked once with
     * the current state, synchronously and before it is registered, so it
     * cannot additionally fire from a notify racing with this call.
     * Exceptions from that first call propagate to the caller and nothing
     * is registered.
     *
     * @throws HubStoppedError after @ref stop.
     */
    Unsubscriber subscribe(Callback<T> callback,
                           bool notify_current_state = false) {
        ensure_running();
        if (notify_current_state && callback) {
            callback(state());
        }
        return m_hub.subscribe(std::move(callback));
    }

    /**
     * @brief Store @p value as the current state and broadcast it.
     * @throws HubStoppedError after @ref stop.
     */
    void notify(const T& value) {
        ensure_running();
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->value = value;
        }
        m_hub.notify(value);
    }

    /// @throws HubStoppedError after @ref stop.
    T state() const {
        ensure_running();
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->value;
    }

    void unsubscribe(SubscriptionId id) { m_hub.unsubscribe(id); }
    size_t subscriber_count() const { return m_hub.subscriber_count(); }
    void stop() { m_hub.stop(); }
    bool stopped() const { return m_hub.stopped(); }
    const std::string& name() const { return m_hub.name(); }

    bool operator==(const StatefulHub& other) const {
        return m_hub == other.m_hub;
    }
    bool operator!=(const StatefulHub& other) const {
        return !(*this == other);
    }
};

template <typename T, typename Body>
decltype(auto) with_new_stateful_hub(T initial, const HubOptions& options,
                                     Body&& body) {
    return detail::with_new<StatefulHub<T>>(std::forward<Body>(body),
                                            std::move(initial), options);
}

template <typename T, typename Body>
decltype(auto) with_new_stateful_hub(T initial, Body&& body) {
    return with_new_stateful_hub<T>(std::move(initial), HubOptions{},
                                    std::forward<Body>(body));
}

} // namespace observer
