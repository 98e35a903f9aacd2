#include <gtest/gtest.h>

#include <observer/observer.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

TEST(hub_tests, every_subscriber_receives_value) {
    observer::Hub<int> hub;
    std::vector<int> a, b;
    hub.subscribe([&](const int& v) { a.push_back(v); });
    hub.subscribe([&](const int& v) { b.push_back(v); });

    hub.notify(1);
    hub.notify(2);

    EXPECT_EQ(a, (std::vector<int>{1, 2}));
    EXPECT_EQ(b, (std::vector<int>{1, 2}));
}

TEST(hub_tests, notify_without_subscribers_is_noop) {
    observer::Hub<std::string> hub;
    EXPECT_NO_THROW(hub.notify("nobody listens"));
}

TEST(hub_tests, unsubscribe_is_terminal_and_idempotent) {
    observer::Hub<int> hub;
    int calls = 0;
    auto unsubscribe = hub.subscribe([&](const int&) { ++calls; });
    EXPECT_TRUE(unsubscribe.active());

    hub.notify(1);
    unsubscribe();
    EXPECT_FALSE(unsubscribe.active());
    hub.notify(2);
    EXPECT_NO_THROW(unsubscribe()); // second call does nothing
    hub.notify(3);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(hub.subscriber_count(), 0u);
}

TEST(hub_tests, unsubscribe_copy_shares_state) {
    observer::Hub<int> hub;
    auto unsubscribe = hub.subscribe([](const int&) {});
    auto copy = unsubscribe;
    copy();
    EXPECT_FALSE(unsubscribe.active());
    EXPECT_EQ(copy.id(), unsubscribe.id());
}

TEST(hub_tests, unsubscribe_by_id) {
    observer::Hub<int> hub;
    int calls = 0;
    auto unsubscribe = hub.subscribe([&](const int&) { ++calls; });
    hub.unsubscribe(unsubscribe.id());
    hub.unsubscribe(unsubscribe.id());
    hub.unsubscribe(12345);
    hub.notify(1);
    EXPECT_EQ(calls, 0);
}

TEST(hub_tests, operations_after_stop_throw) {
    observer::Hub<int> hub(observer::HubOptions{.name = "stopped-hub"});
    auto unsubscribe = hub.subscribe([](const int&) {});
    hub.stop();

    EXPECT_TRUE(hub.stopped());
    EXPECT_THROW(hub.notify(1), observer::HubStoppedError);
    EXPECT_THROW(hub.subscribe([](const int&) {}), observer::HubStoppedError);
    EXPECT_FALSE(unsubscribe.active());
    EXPECT_NO_THROW(unsubscribe()); // handles outlive the hub safely
    EXPECT_NO_THROW(hub.stop());
}

TEST(hub_tests, unsubscribe_after_hub_destroyed_is_noop) {
    observer::Unsubscriber unsubscribe;
    {
        observer::Hub<int> hub;
        unsubscribe = hub.subscribe([](const int&) {});
    }
    EXPECT_FALSE(unsubscribe.active());
    EXPECT_NO_THROW(unsubscribe());
}

TEST(hub_tests, throwing_subscriber_does_not_affect_siblings) {
    std::vector<observer::SubscriptionId> failed;
    observer::HubOptions options;
    options.on_callback_error = [&](observer::SubscriptionId id,
                                    std::exception_ptr) {
        failed.push_back(id);
    };
    observer::Hub<int> hub(options);

    int before = 0, after = 0;
    hub.subscribe([&](const int&) { ++before; });
    auto failing = hub.subscribe(
        [](const int&) { throw std::runtime_error("subscriber failure"); });
    hub.subscribe([&](const int&) { ++after; });

    EXPECT_NO_THROW(hub.notify(1));
    EXPECT_EQ(before, 1);
    EXPECT_EQ(after, 1);
    EXPECT_EQ(failed, (std::vector<observer::SubscriptionId>{failing.id()}));
}

TEST(hub_tests, throwing_error_handler_does_not_fail_notify) {
    observer::HubOptions options;
    options.on_callback_error = [](observer::SubscriptionId,
                                   std::exception_ptr) { throw 42; };
    observer::Hub<int> hub(options);

    int after = 0;
    hub.subscribe(
        [](const int&) { throw std::runtime_error("subscriber failure"); });
    hub.subscribe([&](const int&) { ++after; });

    EXPECT_NO_THROW(hub.notify(1));
    EXPECT_EQ(after, 1);
}

TEST(hub_tests, reentrant_notify_and_subscribe) {
    observer::Hub<int> hub;
    std::vector<int> seen;
    observer::Unsubscriber late;

    hub.subscribe([&](const int& v) {
        seen.push_back(v);
        if (v == 1) {
            hub.notify(2); // same hub, from inside a callback
            late = hub.subscribe([&](const int& w) { seen.push_back(w * 100); });
        }
    });

    hub.notify(1);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));

    hub.notify(3);
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 300}));
}

TEST(hub_tests, callback_may_unsubscribe_itself) {
    observer::Hub<int> hub;
    int calls = 0;
    observer::Unsubscriber self;
    self = hub.subscribe([&](const int&) {
        ++calls;
        self();
    });
    hub.notify(1);
    hub.notify(2);
    EXPECT_EQ(calls, 1);
}

TEST(hub_tests, hub_passed_through_another_hub) {
    observer::Hub<observer::Hub<int>> outer;
    observer::Hub<int> inner;
    int received = 0;
    inner.subscribe([&](const int& v) { received = v; });

    outer.subscribe([](const observer::Hub<int>& hub) {
        auto copy = hub;
        copy.notify(42);
    });
    outer.notify(inner);

    EXPECT_EQ(received, 42);
}

TEST(hub_tests, copies_compare_equal) {
    observer::Hub<int> hub;
    observer::Hub<int> copy = hub;
    observer::Hub<int> other;
    EXPECT_TRUE(hub == copy);
    EXPECT_TRUE(hub != other);
}

TEST(hub_tests, parallel_dispatch_joins_before_returning) {
    observer::Hub<int> hub(
        observer::HubOptions{.dispatch = observer::DispatchPolicy::Parallel});
    std::atomic<int> sum{0};
    for (int i = 0; i < 16; ++i) {
        hub.subscribe([&](const int& v) { sum.fetch_add(v); });
    }
    hub.notify(2);
    EXPECT_EQ(sum.load(), 32);
}

TEST(hub_tests, parallel_reentrant_notify_does_not_deadlock) {
    auto dispatcher = std::make_shared<observer::Dispatcher>(
        observer::DispatchPolicy::Parallel, 2);
    observer::Hub<int> hub(observer::HubOptions{.dispatcher = dispatcher});
    std::atomic<int> leaves{0};

    for (int i = 0; i < 4; ++i) {
        hub.subscribe([&](const int& depth) {
            if (depth > 0) {
                hub.notify(depth - 1);
            } else {
                leaves.fetch_add(1);
            }
        });
    }
    hub.notify(2);
    EXPECT_EQ(leaves.load(), 4 * 4 * 4);
}

TEST(hub_tests, with_new_hub_stops_on_exit) {
    observer::Hub<int> escaped;
    int result = observer::with_new_hub<int>([&](observer::Hub<int>& hub) {
        escaped = hub;
        int total = 0;
        hub.subscribe([&](const int& v) { total += v; });
        hub.notify(5);
        return total;
    });

    EXPECT_EQ(result, 5);
    EXPECT_TRUE(escaped.stopped());
    EXPECT_THROW(escaped.notify(1), observer::HubStoppedError);
}

TEST(hub_tests, with_new_hub_stops_on_exception) {
    observer::Hub<int> escaped;
    EXPECT_THROW(observer::with_new_hub<int>([&](observer::Hub<int>& hub) {
                     escaped = hub;
                     throw std::runtime_error("body failed");
                 }),
                 std::runtime_error);
    EXPECT_TRUE(escaped.stopped());
}
