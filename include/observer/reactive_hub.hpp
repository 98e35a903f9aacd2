/**
 * @file reactive_hub.hpp
 * @brief Stateful hub whose value is computed by an injected function.
 */

#pragma once

#include "observer/options.hpp"
#include "observer/stateful_hub.hpp"
#include "observer/types.hpp"
#include "observer/unsubscriber.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

namespace observer {

/// Zero‑argument function producing the value a reactive hub broadcasts.
template <typename T> using Producer = std::function<T()>;

/**
 * @brief Broadcasts whatever its producer returns.
 *
 * The producer is called once at construction for the initial state and
 * once per `notify()`.  It runs on the notifying thread and is shared by
 * all copies of the hub.
 */
template <typename T> class ReactiveHub {
  private:
    std::shared_ptr<const Producer<T>> m_producer;
    StatefulHub<T> m_hub;

    static std::shared_ptr<const Producer<T>> checked(Producer<T> producer) {
        if (!producer) {
            throw std::invalid_argument("reactive hub needs a producer");
        }
        return std::make_shared<Producer<T>>(std::move(producer));
    }

  public:
    explicit ReactiveHub(Producer<T> producer, const HubOptions& options = {})
        : m_producer(checked(std::move(producer))),
          m_hub((*m_producer)(), options) {}

    /// See StatefulHub::subscribe.
    Unsubscriber subscribe(Callback<T> callback,
                           bool notify_current_state = false) {
        return m_hub.subscribe(std::move(callback), notify_current_state);
    }

    /**
     * @brief Compute a new value, store and broadcast it.
     * @return The computed value.
     * @throws HubStoppedError after @ref stop.
     */
    T notify() {
        if (m_hub.stopped()) {
            throw HubStoppedError(m_hub.name());
        }
        T value = (*m_producer)();
        m_hub.notify(value);
        return value;
    }

    T state() const { return m_hub.state(); }

    void unsubscribe(SubscriptionId id) { m_hub.unsubscribe(id); }
    size_t subscriber_count() const { return m_hub.subscriber_count(); }
    void stop() { m_hub.stop(); }
    bool stopped() const { return m_hub.stopped(); }
    const std::string& name() const { return m_hub.name(); }

    bool operator==(const ReactiveHub& other) const {
        return m_hub == other.m_hub;
    }
    bool operator!=(const ReactiveHub& other) const {
        return !(*this == other);
    }
};

template <typename T, typename Body>
decltype(auto) with_new_reactive_hub(Producer<T> producer,
                                     const HubOptions& options, Body&& body) {
    return detail::with_new<ReactiveHub<T>>(std::forward<Body>(body),
                                            std::move(producer), options);
}

template <typename T, typename Body>
decltype(auto) with_new_reactive_hub(Producer<T> producer, Body&& body) {
    return with_new_reactive_hub<T>(std::move(producer), HubOptions{},
                                    std::forward<Body>(body));
}

} // namespace observer
