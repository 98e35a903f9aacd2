/**
 * @file unsubscriber.hpp
 * @brief Idempotent handle returned by every subscribe call.
 */

#pragma once

#include "observer/types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <utility>

namespace observer {

/**
 * @brief Removes one subscription when called.
 *
 * The first call removes the subscription, every later call does nothing.
 * Copies share the same state, so calling any copy consumes all of them.
 * The handle only keeps a weak reference to its hub: calling it after the
 * hub was stopped or destroyed is a no‑op.
 */
class Unsubscriber {
  private:
    struct Handle {
        SubscriptionId id = 0;
        std::function<void(SubscriptionId)> remove;
        std::function<bool()> alive;
        std::atomic<bool> used{false};
    };

    std::shared_ptr<Handle> m_handle;

  public:
    /// An empty handle; calling it does nothing.
    Unsubscriber() = default;

    /**
     * @param id     Subscription to remove.
     * @param remove Performs the removal; only called once.
     * @param alive  Reports whether the owning hub still accepts removals.
     */
    Unsubscriber(SubscriptionId id, std::function<void(SubscriptionId)> remove,
                 std::function<bool()> alive)
        : m_handle(std::make_shared<Handle>()) {
        m_handle->id = id;
        m_handle->remove = std::move(remove);
        m_handle->alive = std::move(alive);
    }

    /**
     * @brief Bind to hub state exposing `unsubscribe(id)` and `stopped()`.
     */
    template <typename State>
    static Unsubscriber bind(const std::shared_ptr<State>& state,
                             SubscriptionId id) {
        std::weak_ptr<State> weak = state;
        return Unsubscriber(
            id,
            [weak](SubscriptionId removed) {
                if (auto locked = weak.lock()) {
                    locked->unsubscribe(removed);
                }
            },
            [weak]() {
                auto locked = weak.lock();
                return locked && !locked->stopped();
            });
    }

    void operator()() const {
        if (!m_handle || m_handle->used.exchange(true)) {
            return;
        }
        m_handle->remove(m_handle->id);
    }

    /// @return The subscription id, 0 for an empty handle.
    SubscriptionId id() const { return m_handle ? m_handle->id : 0; }

    /// @return `true` while a call would still remove a live subscription.
    bool active() const {
        return m_handle && !m_handle->used.load() && m_handle->alive();
    }
};

} // namespace observer
