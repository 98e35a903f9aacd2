/**
 * @file dispatcher.hpp
 * @brief Executes the callbacks matched by one notify and joins on them.
 *
 * Two execution policies are supported:
 *
 *   * **Inline**   – callbacks run one after another on the notifying
 *     thread.  This is the default for every hub.
 *   * **Parallel** – every callback becomes a task on a worker pool.  The
 *     notifying thread helps draining the task queue while it waits, so a
 *     callback that itself notifies (and therefore waits) never starves
 *     the pool.
 *
 * Whatever the policy, a throwing callback is isolated: the exception is
 * logged, counted and handed to the optional error handler, and the
 * remaining callbacks still run.
 */

#pragma once

#include "observer/logging.hpp"
#include "observer/types.hpp"

#include <boost/lockfree/queue.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace observer {

/// How a hub runs the callbacks of a single notify.
enum class DispatchPolicy { Inline, Parallel };

/// Receives every exception escaping a subscriber callback.
using ErrorHandler =
    std::function<void(SubscriptionId, std::exception_ptr)>;

/// Compile-time tuning of the parallel dispatcher.
struct DispatcherConfig {
    static constexpr size_t fast_queue_size = 1024; ///< Ring capacity.
    static constexpr std::chrono::microseconds help_interval{100};
    static constexpr std::chrono::milliseconds idle_interval{10};

    /// Worker count used by @ref Dispatcher::shared_pool.
    static size_t default_workers() {
        return std::max<size_t>(2, std::thread::hardware_concurrency());
    }
};

namespace detail {

/// Completion state of the tasks issued by one notify.
struct Batch {
    std::mutex mutex;
    std::condition_variable done;
    size_t remaining = 0;
    const ErrorHandler* on_error = nullptr;

    void complete_one() {
        std::lock_guard<std::mutex> lock(mutex);
        if (--remaining == 0) {
            done.notify_all();
        }
    }
};

/// A single callback invocation owned by a @ref Batch.
struct Task {
    SubscriptionId id = 0;
    std::function<void()> run;
    Batch* batch = nullptr;
};

// ==========================================================================
// TaskQueue – lock‑free fast path + locked overflow path
// ==========================================================================

/**
 * @brief Multi‑producer / multi‑consumer queue of pending tasks.
 *
 * A bounded lock‑free ring (Boost.Lockfree) is the fast path.  If the ring
 * is full, producers push to a secondary std::queue protected by a mutex;
 * consumers move overflow tasks back into the ring before popping.
 */
class TaskQueue {
  private:
    std::queue<Task*> m_slow_queue;
    std::mutex m_mutex;
    std::atomic<size_t> m_slow_size{0};

    boost::lockfree::queue<
        Task*, boost::lockfree::capacity<DispatcherConfig::fast_queue_size>>
        m_fast_queue;

    logging::Logger m_logger;

    void push_slow(Task* task) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slow_queue.push(task);
        m_slow_size.fetch_add(1, std::memory_order_release);
        OBSERVER_LOG_WARNING(m_logger,
                             "task ring full: overflow queue size={}",
                             m_slow_size.load(std::memory_order_relaxed));
    }

    void drain_slow() {
        if (m_slow_size.load(std::memory_order_acquire) > 0) {
            std::lock_guard<std::mutex> lock(m_mutex);
            while (!m_slow_queue.empty()) {
                if (!m_fast_queue.push(m_slow_queue.front())) {
                    break;
                }
                m_slow_queue.pop();
            }
            m_slow_size.store(m_slow_queue.size(), std::memory_order_release);
        }
    }

  public:
    TaskQueue() : m_logger(logging::create_logger("task-queue")) {}

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /** @brief Non‑blocking push usable from any thread. */
    void push(Task* task) {
        if (!m_fast_queue.push(task)) {
            push_slow(task);
        }
    }

    /** @return Next task or `nullptr` when the queue is empty. */
    Task* pop() {
        drain_slow();
        Task* task = nullptr;
        if (m_fast_queue.pop(task)) {
            return task;
        }
        return nullptr;
    }
};

} // namespace detail

// ==========================================================================
// Dispatcher
// ==========================================================================

class Dispatcher {
  public:
    /// One callback invocation: the subscription it belongs to and the call.
    using Invocation = std::pair<SubscriptionId, std::function<void()>>;

  private:
    const DispatchPolicy m_policy;
    detail::TaskQueue m_queue;
    std::atomic<size_t> m_queued{0};
    std::atomic<uint64_t> m_failures{0};

    std::atomic<bool> m_should_run{false};
    std::mutex m_wake_mutex;
    std::condition_variable m_wake;
    std::vector<std::thread> m_workers;

    logging::Logger m_logger;

    void report_failure(SubscriptionId id, std::exception_ptr error,
                        const ErrorHandler* on_error) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        if (on_error && *on_error) {
            try {
                (*on_error)(id, error);
            } catch (const std::exception& e) {
                OBSERVER_LOG_CRITICAL(
                    m_logger, "error handler threw for subscription {}: {}",
                    id, e.what());
            } catch (...) {
                OBSERVER_LOG_CRITICAL(
                    m_logger,
                    "error handler threw a non-standard exception for "
                    "subscription {}",
                    id);
            }
        }
    }

    void invoke(SubscriptionId id, const std::function<void()>& run,
                const ErrorHandler* on_error) {
        try {
            run();
        } catch (const std::exception& e) {
            OBSERVER_LOG_ERROR(m_logger, "subscription {} callback threw: {}",
                               id, e.what());
            report_failure(id, std::current_exception(), on_error);
        } catch (...) {
            OBSERVER_LOG_ERROR(m_logger,
                               "subscription {} callback threw a "
                               "non-standard exception",
                               id);
            report_failure(id, std::current_exception(), on_error);
        }
    }

    void execute(detail::Task& task) {
        invoke(task.id, task.run, task.batch->on_error);
        task.batch->complete_one();
    }

    detail::Task* take() {
        detail::Task* task = m_queue.pop();
        if (task) {
            m_queued.fetch_sub(1, std::memory_order_relaxed);
        }
        return task;
    }

    void worker_loop() {
        while (m_should_run.load(std::memory_order_relaxed)) {
            if (detail::Task* task = take()) {
                execute(*task);
                continue;
            }
            std::unique_lock<std::mutex> lock(m_wake_mutex);
            m_wake.wait_for(lock, DispatcherConfig::idle_interval, [this] {
                return !m_should_run.load(std::memory_order_relaxed) ||
                       m_queued.load(std::memory_order_relaxed) > 0;
            });
        }
    }

    void run_parallel(std::vector<Invocation>& invocations,
                      const ErrorHandler* on_error) {
        detail::Batch batch;
        batch.remaining = invocations.size();
        batch.on_error = on_error;

        std::vector<detail::Task> tasks;
        tasks.reserve(invocations.size());
        for (auto& [id, run] : invocations) {
            tasks.push_back(detail::Task{id, std::move(run), &batch});
        }
        for (auto& task : tasks) {
            m_queue.push(&task);
            m_queued.fetch_add(1, std::memory_order_relaxed);
        }
        {
            std::lock_guard<std::mutex> lock(m_wake_mutex);
            m_wake.notify_all();
        }

        // Help while waiting. Leaving the loop with the batch lock held
        // guarantees no worker still touches `batch` or `tasks`.
        while (true) {
            if (detail::Task* task = take()) {
                execute(*task);
                continue;
            }
            std::unique_lock<std::mutex> lock(batch.mutex);
            if (batch.done.wait_for(lock, DispatcherConfig::help_interval,
                                    [&batch] { return batch.remaining == 0; })) {
                break;
            }
        }
    }

  public:
    /**
     * @param policy  Inline or Parallel execution.
     * @param workers Worker threads started for the Parallel policy.
     */
    explicit Dispatcher(DispatchPolicy policy = DispatchPolicy::Inline,
                        size_t workers = DispatcherConfig::default_workers())
        : m_policy(policy), m_logger(logging::create_logger("dispatcher")) {
        if (m_policy == DispatchPolicy::Parallel) {
            if (workers == 0) {
                throw std::invalid_argument(
                    "parallel dispatcher needs at least one worker");
            }
            m_should_run = true;
            m_workers.reserve(workers);
            for (size_t i = 0; i < workers; ++i) {
                m_workers.emplace_back([this]() { worker_loop(); });
            }
            OBSERVER_LOG_DEBUG(m_logger, "started {} dispatcher workers",
                               workers);
        }
    }

    ~Dispatcher() {
        m_should_run.store(false, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(m_wake_mutex);
            m_wake.notify_all();
        }
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Process-wide inline dispatcher, the default of every hub.
    static std::shared_ptr<Dispatcher> inline_dispatcher() {
        static std::shared_ptr<Dispatcher> dispatcher =
            std::make_shared<Dispatcher>(DispatchPolicy::Inline, 0);
        return dispatcher;
    }

    /// Process-wide worker pool used by hubs asking for Parallel dispatch.
    static std::shared_ptr<Dispatcher> shared_pool() {
        static std::shared_ptr<Dispatcher> dispatcher =
            std::make_shared<Dispatcher>(DispatchPolicy::Parallel);
        return dispatcher;
    }

    DispatchPolicy policy() const { return m_policy; }
    size_t worker_count() const { return m_workers.size(); }

    /// Number of callbacks that threw since construction.
    uint64_t failures() const {
        return m_failures.load(std::memory_order_relaxed);
    }

    /**
     * @brief Run every invocation and return once all of them finished.
     *
     * Exceptions thrown by an invocation never escape; they are reported
     * to @p on_error (which may be empty).
     */
    void run_all(std::vector<Invocation> invocations,
                 const ErrorHandler& on_error = {}) {
        if (invocations.empty()) {
            return;
        }
        if (m_policy == DispatchPolicy::Inline || invocations.size() == 1) {
            for (const auto& [id, run] : invocations) {
                invoke(id, run, &on_error);
            }
            return;
        }
        run_parallel(invocations, &on_error);
    }
};

} // namespace observer
