/**
 * @file hub.hpp
 * @brief Stateless hub: every subscriber receives every notified value.
 *
 * `Hub<T>` is the primitive the stateful, reactive and filtered hubs are
 * layered on.  They only use its public subscribe / notify / unsubscribe
 * contract.
 */

#pragma once

#include "observer/dispatcher.hpp"
#include "observer/logging.hpp"
#include "observer/options.hpp"
#include "observer/registry.hpp"
#include "observer/types.hpp"
#include "observer/unsubscriber.hpp"

#include <memory>
#include <string>
#include <utility>

namespace observer {

namespace detail {

template <typename T> struct HubState {
    const std::string name;
    CallbackRegistry<T> registry;
    const std::shared_ptr<Dispatcher> dispatcher;
    const ErrorHandler on_error;

    explicit HubState(const HubOptions& options)
        : name(options.name), registry(options.name),
          dispatcher(options.resolve_dispatcher()),
          on_error(options.on_callback_error) {}

    void unsubscribe(SubscriptionId id) { registry.remove(id); }
    bool stopped() const { return registry.closed(); }
};

/// Stops a hub when the enclosing scope is left, normally or not.
template <typename HubType> class StopGuard {
  private:
    HubType& m_hub;

  public:
    explicit StopGuard(HubType& hub) : m_hub(hub) {}
    ~StopGuard() { m_hub.stop(); }

    StopGuard(const StopGuard&) = delete;
    StopGuard& operator=(const StopGuard&) = delete;
};

/// Create a hub, hand it to @p body and stop it on every exit path.
template <typename HubType, typename Body, typename... Args>
decltype(auto) with_new(Body&& body, Args&&... args) {
    HubType hub(std::forward<Args>(args)...);
    StopGuard<HubType> guard(hub);
    return std::forward<Body>(body)(hub);
}

} // namespace detail

/**
 * @brief Cheap, copyable handle to a hub.
 *
 * Copies refer to the same hub and compare equal, which lets hubs serve as
 * identity tokens (e.g. topics of a @ref FilteredHub).
 *
 * @tparam T Value type delivered to subscribers.
 */
template <typename T> class Hub {
  public:
    using value_type = T;

  private:
    std::shared_ptr<detail::HubState<T>> m_state;
    logging::Logger m_logger;

    void ensure_running() const {
        if (m_state->stopped()) {
            throw HubStoppedError(m_state->name);
        }
    }

  public:
    explicit Hub(const HubOptions& options = {})
        : m_state(std::make_shared<detail::HubState<T>>(options)),
          m_logger(logging::create_logger("hub")) {}

    /**
     * @brief Register @p callback for every future notify.
     * @throws HubStoppedError after @ref stop.
     */
    Unsubscriber subscribe(Callback<T> callback) {
        SubscriptionId id = m_state->registry.add(std::move(callback));
        return Unsubscriber::bind(m_state, id);
    }

    /**
     * @brief Invoke every current subscriber with @p value.
     *
     * Returns once all callbacks have completed.  Subscribers that throw do
     * not affect the caller or each other.
     *
     * @throws HubStoppedError after @ref stop.
     */
    void notify(const T& value) {
        auto state = m_state;
        ensure_running();
        auto ids = state->registry.ids();
        OBSERVER_LOG_DEBUG(m_logger, "{}: notifying {} subscribers",
                           state->name, ids.size());
        state->registry.invoke_all(ids, value, *state->dispatcher,
                                   state->on_error);
    }

    /// Unknown ids are ignored.
    void unsubscribe(SubscriptionId id) { m_state->unsubscribe(id); }

    size_t subscriber_count() const { return m_state->registry.size(); }

    /** @brief Drop all subscribers; later operations throw. Idempotent. */
    void stop() { m_state->registry.close(); }

    bool stopped() const { return m_state->stopped(); }

    const std::string& name() const { return m_state->name; }

    bool operator==(const Hub& other) const {
        return m_state == other.m_state;
    }
    bool operator!=(const Hub& other) const { return !(*this == other); }
};

/**
 * @brief Run @p body with a fresh hub that is stopped afterwards.
 * @return Whatever @p body returns.
 */
template <typename T, typename Body>
decltype(auto) with_new_hub(const HubOptions& options, Body&& body) {
    return detail::with_new<Hub<T>>(std::forward<Body>(body), options);
}

template <typename T, typename Body> decltype(auto) with_new_hub(Body&& body) {
    return with_new_hub<T>(HubOptions{}, std::forward<Body>(body));
}

} // namespace observer
