#include <gtest/gtest.h>

#include <observer/observer.hpp>

#include <stdexcept>
#include <vector>

TEST(callback_registry_tests, ids_start_at_one_and_increase) {
    observer::CallbackRegistry<int> registry;
    auto a = registry.add([](const int&) {});
    auto b = registry.add([](const int&) {});
    auto c = registry.add([](const int&) {});
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(c, 3u);
    EXPECT_EQ(registry.size(), 3u);
}

TEST(callback_registry_tests, ids_are_never_reused) {
    observer::CallbackRegistry<int> registry;
    registry.add([](const int&) {});
    auto second = registry.add([](const int&) {});
    EXPECT_TRUE(registry.remove(second));

    auto third = registry.add([](const int&) {});
    EXPECT_EQ(third, 3u); // previous max + 1, not the freed id
}

TEST(callback_registry_tests, remove_unknown_id_is_noop) {
    observer::CallbackRegistry<int> registry;
    auto id = registry.add([](const int&) {});
    EXPECT_FALSE(registry.remove(42));
    EXPECT_TRUE(registry.remove(id));
    EXPECT_FALSE(registry.remove(id)); // twice
    EXPECT_EQ(registry.size(), 0u);
}

TEST(callback_registry_tests, ids_snapshot_is_sorted) {
    observer::CallbackRegistry<int> registry;
    for (int i = 0; i < 5; ++i) {
        registry.add([](const int&) {});
    }
    registry.remove(3);
    EXPECT_EQ(registry.ids(),
              (std::vector<observer::SubscriptionId>{1, 2, 4, 5}));
}

TEST(callback_registry_tests, invoke_all_skips_absent_ids) {
    observer::CallbackRegistry<int> registry;
    std::vector<int> seen;
    auto a = registry.add([&](const int& v) { seen.push_back(v); });
    auto b = registry.add([&](const int& v) { seen.push_back(v * 10); });
    registry.remove(b);

    auto dispatcher = observer::Dispatcher::inline_dispatcher();
    registry.invoke_all({a, b, 99}, 3, *dispatcher, {});

    EXPECT_EQ(seen, (std::vector<int>{3}));
}

TEST(callback_registry_tests, callback_removed_by_sibling_is_skipped) {
    observer::CallbackRegistry<int> registry;
    observer::SubscriptionId second = 0;
    int second_calls = 0;
    auto first = registry.add([&](const int&) { registry.remove(second); });
    second = registry.add([&](const int&) { ++second_calls; });

    auto dispatcher = observer::Dispatcher::inline_dispatcher();
    registry.invoke_all({first, second}, 0, *dispatcher, {});

    EXPECT_EQ(second_calls, 0);
}

TEST(callback_registry_tests, callback_may_add_during_invoke) {
    observer::CallbackRegistry<int> registry;
    int added_calls = 0;
    auto id = registry.add([&](const int&) {
        registry.add([&](const int&) { ++added_calls; });
    });

    auto dispatcher = observer::Dispatcher::inline_dispatcher();
    registry.invoke_all({id}, 0, *dispatcher, {});

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(added_calls, 0); // not part of the snapshot
}

TEST(callback_registry_tests, close_clears_and_rejects_additions) {
    observer::CallbackRegistry<int> registry("closing");
    registry.add([](const int&) {});
    registry.close();

    EXPECT_TRUE(registry.closed());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_THROW(registry.add([](const int&) {}), observer::HubStoppedError);
    EXPECT_FALSE(registry.remove(1));
}

TEST(callback_registry_tests, empty_callback_is_rejected) {
    observer::CallbackRegistry<int> registry;
    EXPECT_THROW(registry.add(observer::Callback<int>{}),
                 std::invalid_argument);
}
