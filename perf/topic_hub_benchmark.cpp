#include <benchmark/benchmark.h>

#include <observer/observer.hpp>

#include <string>
#include <vector>

namespace {

observer::TopicList symbols(size_t n) {
    observer::TopicList out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back("SYM" + std::to_string(i));
    }
    return out;
}

} // anonymous namespace

// Match cost against a growing number of single-topic subscriptions.
static void topic_index_match(benchmark::State& st) {
    const auto n = static_cast<size_t>(st.range(0));
    const auto topics = symbols(n);

    observer::TopicIndex index(2);
    for (size_t i = 0; i < n; ++i) {
        index.insert({{topics[i]}, {"*"}}, i + 1);
    }

    size_t i = 0;
    for (auto _ : st) {
        auto ids = index.match({{topics[i % n]}, {"venue"}});
        benchmark::DoNotOptimize(ids);
        ++i;
    }
    st.SetItemsProcessed(st.iterations());
}

BENCHMARK(topic_index_match)->RangeMultiplier(8)->Range(8, 4096);

// Subscribe / unsubscribe churn including node pruning.
static void topic_index_churn(benchmark::State& st) {
    const auto topics = symbols(64);
    observer::TopicIndex index(2);

    observer::SubscriptionId id = 0;
    for (auto _ : st) {
        ++id;
        observer::TopicSets sets{{topics[id % 64], topics[(id + 7) % 64]},
                                 {"*"}};
        index.insert(sets, id);
        index.remove(sets, id);
    }
    st.SetItemsProcessed(st.iterations());
}

BENCHMARK(topic_index_churn);

// End to end notify on a two dimensional hub.
static void topic_hub_notify(benchmark::State& st) {
    const auto n = static_cast<size_t>(st.range(0));
    const auto topics = symbols(n);

    observer::TopicHub2<double> hub;
    double sink = 0;
    for (size_t i = 0; i < n; ++i) {
        hub.subscribe({topics[i]}, {"*"}, [&sink](const double& px) {
            sink += px;
        });
    }

    size_t i = 0;
    for (auto _ : st) {
        hub.notify({topics[i % n]}, {"venue"}, 1.0);
        ++i;
    }
    benchmark::DoNotOptimize(sink);
    st.SetItemsProcessed(st.iterations());
}

BENCHMARK(topic_hub_notify)->RangeMultiplier(8)->Range(8, 4096);

// Unindexed filtering visits every subscriber on each notify.
static void filtered_hub_notify(benchmark::State& st) {
    const auto n = static_cast<int>(st.range(0));

    observer::FilteredHub<double, int> hub;
    double sink = 0;
    for (int i = 0; i < n; ++i) {
        hub.subscribe({i}, [&sink](const double& px) { sink += px; });
    }

    int i = 0;
    for (auto _ : st) {
        hub.notify({i % n}, 1.0);
        ++i;
    }
    benchmark::DoNotOptimize(sink);
    st.SetItemsProcessed(st.iterations());
}

BENCHMARK(filtered_hub_notify)->RangeMultiplier(8)->Range(8, 4096);

BENCHMARK_MAIN();
