#include <gtest/gtest.h>

#include <observer/observer.hpp>

#include <stdexcept>
#include <vector>

namespace {

/// Producer incrementing a shared counter on every call.
observer::Producer<int> counter(int& value) {
    return [&value]() { return ++value; };
}

} // anonymous namespace

TEST(reactive_hub_tests, initial_state_comes_from_producer) {
    int count = 0;
    observer::ReactiveHub<int> hub(counter(count));
    EXPECT_EQ(hub.state(), 1);
    EXPECT_EQ(count, 1);
}

TEST(reactive_hub_tests, notify_broadcasts_and_returns_produced_value) {
    int count = 0;
    observer::ReactiveHub<int> hub(counter(count));
    std::vector<int> seen;
    hub.subscribe([&](const int& v) { seen.push_back(v); });

    EXPECT_EQ(hub.notify(), 2); // state was 1, incremented before broadcast
    EXPECT_EQ(hub.state(), 2);
    EXPECT_EQ(hub.notify(), 3);
    EXPECT_EQ(seen, (std::vector<int>{2, 3}));
}

TEST(reactive_hub_tests, notify_current_state_sees_latest_value) {
    int count = 0;
    observer::ReactiveHub<int> hub(counter(count));
    hub.notify();

    std::vector<int> seen;
    hub.subscribe([&](const int& v) { seen.push_back(v); }, true);
    EXPECT_EQ(seen, (std::vector<int>{2}));
}

TEST(reactive_hub_tests, copies_share_the_producer) {
    int count = 0;
    observer::ReactiveHub<int> hub(counter(count));
    auto copy = hub;
    copy.notify();
    hub.notify();
    EXPECT_EQ(hub.state(), 3);
    EXPECT_EQ(count, 3);
}

TEST(reactive_hub_tests, empty_producer_is_rejected) {
    EXPECT_THROW(observer::ReactiveHub<int>(observer::Producer<int>{}),
                 std::invalid_argument);
}

TEST(reactive_hub_tests, stopped_hub_does_not_call_producer) {
    int count = 0;
    observer::ReactiveHub<int> hub(counter(count));
    hub.stop();
    EXPECT_THROW(hub.notify(), observer::HubStoppedError);
    EXPECT_EQ(count, 1);
}

TEST(reactive_hub_tests, with_new_reactive_hub_scopes_hub) {
    int count = 0;
    int produced = observer::with_new_reactive_hub<int>(
        counter(count),
        [](observer::ReactiveHub<int>& hub) { return hub.notify(); });
    EXPECT_EQ(produced, 2);
}
