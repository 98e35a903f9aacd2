/**
 * @file registry.hpp
 * @brief Thread‑safe id → callback map owned by every hub.
 */

#pragma once

#include "observer/dispatcher.hpp"
#include "observer/logging.hpp"
#include "observer/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace observer {

/**
 * @brief Stores the callbacks of one hub under monotonically increasing ids.
 *
 *   * Ids start at 1 and are never reused, not even after removal.
 *   * Callbacks are held by `std::shared_ptr` so an invocation in flight
 *     keeps its callback alive even if it is unsubscribed meanwhile.
 *   * Callbacks are destroyed outside the internal lock; a destructor that
 *     calls back into the registry cannot deadlock.
 *
 * @tparam T Value type delivered to the callbacks.
 */
template <typename T> class CallbackRegistry {
  public:
    using CallbackPtr = std::shared_ptr<const Callback<T>>;

  private:
    const std::string m_name;
    mutable std::mutex m_mutex; ///< Protects everything below.
    SubscriptionId m_last_id{0};
    std::map<SubscriptionId, CallbackPtr> m_callbacks;
    bool m_closed{false};
    logging::Logger m_logger;

  public:
    explicit CallbackRegistry(std::string name = "hub")
        : m_name(std::move(name)),
          m_logger(logging::create_logger("callback-registry")) {}

    CallbackRegistry(const CallbackRegistry&) = delete;
    CallbackRegistry& operator=(const CallbackRegistry&) = delete;

    /**
     * @brief Store @p callback under a fresh id.
     * @throws HubStoppedError once @ref close was called.
     * @throws std::invalid_argument for an empty callback.
     */
    SubscriptionId add(Callback<T> callback) {
        if (!callback) {
            throw std::invalid_argument("cannot subscribe an empty callback");
        }
        CallbackPtr stored = std::make_shared<Callback<T>>(std::move(callback));
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw HubStoppedError(m_name);
        }
        SubscriptionId id = ++m_last_id;
        m_callbacks.emplace(id, std::move(stored));
        OBSERVER_LOG_DEBUG(m_logger, "{}: added subscription {}", m_name, id);
        return id;
    }

    /// @return `false` when @p id is unknown, which is not an error.
    bool remove(SubscriptionId id) {
        CallbackPtr removed;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_callbacks.find(id);
            if (it == m_callbacks.end()) {
                return false;
            }
            removed = std::move(it->second);
            m_callbacks.erase(it);
        }
        OBSERVER_LOG_DEBUG(m_logger, "{}: removed subscription {}", m_name,
                           id);
        return true;
    }

    /// @return The callback registered under @p id, or `nullptr`.
    CallbackPtr find(SubscriptionId id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_callbacks.find(id);
        return it == m_callbacks.end() ? nullptr : it->second;
    }

    /// @return Snapshot of the registered ids in ascending order.
    std::vector<SubscriptionId> ids() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<SubscriptionId> out;
        out.reserve(m_callbacks.size());
        for (const auto& entry : m_callbacks) {
            out.push_back(entry.first);
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_callbacks.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    /** @brief Drop every callback and refuse further additions. */
    void close() {
        std::map<SubscriptionId, CallbackPtr> dropped;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
            dropped.swap(m_callbacks);
        }
        OBSERVER_LOG_DEBUG(m_logger, "{}: closed, dropped {} subscriptions",
                           m_name, dropped.size());
    }

    /**
     * @brief Invoke the callbacks of @p ids with @p value and join on them.
     *
     * Each id is resolved when its invocation starts; ids removed after
     * @p ids was computed are skipped.
     */
    void invoke_all(const std::vector<SubscriptionId>& ids, const T& value,
                    Dispatcher& dispatcher,
                    const ErrorHandler& on_error) const {
        std::vector<Dispatcher::Invocation> invocations;
        invocations.reserve(ids.size());
        for (SubscriptionId id : ids) {
            invocations.emplace_back(id, [this, id, &value]() {
                if (CallbackPtr callback = find(id)) {
                    (*callback)(value);
                }
            });
        }
        dispatcher.run_all(std::move(invocations), on_error);
    }
};

} // namespace observer
