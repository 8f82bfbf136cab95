#include <tether.h>

#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

#include "common.h"

// Shares one property between writer threads, needs the TETHER_THREAD_SAFE cmake option (default)
int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    tether::property<long> counter(0);
    std::atomic<int> notifications{0};

    auto h = tether::hook(&counter, [&](const long&) { notifications.fetch_add(1); });

    std::printf("=== Four writers, each incrementing 1000 times ===\n");
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&counter] {
            for (int i = 0; i < 1000; ++i) {
                tether::update(&counter, [](long& v) { ++v; });
            }
        });
    }

    // A reader polling while the writers run never sees a value nobody wrote
    std::thread reader([&counter] {
        for (int i = 0; i < 5; ++i) {
            std::printf("  reader sees %ld\n", tether::get(&counter));
            tether_sleep(1);
        }
    });

    for (auto& w : writers) {
        w.join();
    }
    reader.join();

    std::printf("\nFinal value: %ld, notifications: %d\n",
        tether::get(&counter),
        notifications.load());

    std::printf("\n=== Summary ===\n");
    std::printf("TETHER_THREAD_SAFE: Locks guard the value and the hook list\n");
    std::printf(
        "Hooks run after the locks are released, so they may call back into the property\n");
    std::printf("Notifications of concurrent writers may interleave\n\n");

    return 0;
}
