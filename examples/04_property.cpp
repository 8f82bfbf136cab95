#include <tether.h>

#include <cstdio>
#include <string>

struct window_size {
    int width = 0;
    int height = 0;
};

int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    tether::property<int> volume(50);

    std::printf("=== Scenario 1: Hooking does not replay the current value ===\n");
    auto volume_hook =
        tether::hook(&volume, [](const int& v) { std::printf("  Volume -> %d\n", v); });
    std::printf("Hooked, nothing printed yet, current volume is %d\n", tether::get(&volume));

    std::printf("\n=== Scenario 2: Every write notifies, equal writes included ===\n");
    tether::set(&volume, 60);
    tether::set(&volume, 60);
    tether::set(&volume, 75);

    std::printf("\n=== Scenario 3: Updating in place ===\n");
    tether::property<window_size> size(window_size{800, 600});
    auto size_hook = tether::hook(&size, [](const window_size& s) {
        std::printf("  Window resized to %dx%d\n", s.width, s.height);
    });

    tether::update(&size, [](window_size& s) { s.width *= 2; });

    std::printf("\n=== Scenario 4: Reading without copying ===\n");
    {
        auto guard = tether::read(&size);
        std::printf("  Read guard sees %dx%d\n", guard->width, guard->height);
    }

    std::printf("\n=== Scenario 5: Default constructed property ===\n");
    tether::property<std::string> title;
    auto title_hook = tether::once(&title, [](const std::string& t) {
        std::printf("  First title: '%s'\n", t.c_str());
    });
    tether::set(&title, std::string("untitled"));
    tether::set(&title, std::string("report.txt"));
    std::printf("Current title: '%s'\n", tether::get(&title).c_str());

    std::printf("\n=== Summary ===\n");
    std::printf("tether::property<T>: Stores a value and notifies hooks after every write\n");
    std::printf("tether::set / tether::update: Write, then notify with the new value\n");
    std::printf("tether::get / tether::read: Copy the value or borrow it under a read lock\n\n");

    return 0;
}
