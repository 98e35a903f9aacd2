/**
 * @file market_watch_example.cpp
 * @brief Minimal end‑to‑end demonstration of the observer hubs.
 *
 * A two dimensional topic hub routes quotes by *symbol* and *venue*:
 *
 *   1. **Desk** — watches EURUSD and GBPUSD on every venue (`"*"`).
 *   2. **Auditor** — watches every symbol, but only on LMAX.
 *
 * A stateful hub keeps the last traded price so a late subscriber can
 * start from it, and a reactive hub derives a quote counter.
 */

#include <observer/observer.hpp>

#include <iostream>
#include <string>

struct Quote {
    std::string symbol;
    std::string venue;
    double price;
};

int main() {
    // Quill uses a dedicated backend thread. Start it once per process.
    observer::logging::start_backend();
    auto logger = observer::logging::create_logger("market-watch");

    size_t quotes_seen = 0;

    observer::with_new_topic_hub2<Quote>([&](observer::TopicHub2<Quote>& quotes) {
        observer::StatefulHub<double> last_price(0.0);
        observer::ReactiveHub<size_t> counter(
            [&quotes_seen]() { return quotes_seen; });

        auto desk = quotes.subscribe(
            {"EURUSD", "GBPUSD"}, {"*"}, [&](const Quote& q) {
                std::cout << "desk    " << q.symbol << "@" << q.venue << " "
                          << q.price << "\n";
                last_price.notify(q.price);
            });
        quotes.subscribe({"*"}, {"LMAX"}, [&](const Quote& q) {
            std::cout << "auditor " << q.symbol << "@" << q.venue << " "
                      << q.price << "\n";
        });
        quotes.subscribe({"*"}, {"*"}, [&](const Quote&) {
            ++quotes_seen;
            counter.notify();
        });

        for (const Quote& q : {Quote{"EURUSD", "LMAX", 1.0842},
                               Quote{"USDJPY", "EBS", 151.20},
                               Quote{"GBPUSD", "EBS", 1.2710},
                               Quote{"USDJPY", "LMAX", 151.22}}) {
            quotes.notify({q.symbol}, {q.venue}, q);
        }

        desk();
        quotes.notify({"EURUSD"}, {"EBS"}, Quote{"EURUSD", "EBS", 1.0845});

        last_price.subscribe(
            [](const double& px) {
                std::cout << "late subscriber starts from " << px << "\n";
            },
            true);

        OBSERVER_LOG_INFO(logger, "quotes routed: {}", counter.state());
    });

    std::cout << "quotes routed: " << quotes_seen << "\n";
    return 0;
}
