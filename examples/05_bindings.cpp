#include <tether.h>

#include <cstdio>

int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    tether::property<int> brightness(10);

    // Two views bound to the same value, each writes through its own binding
    auto slider = tether::bind(&brightness, [](const int& v) {
        std::printf("  [slider] moved to %d\n", v);
    });

    auto spinbox = tether::bind(&brightness, [](const int& v) {
        std::printf("  [spinbox] shows %d\n", v);
    });

    auto logger = tether::hook(&brightness, [](const int& v) {
        std::printf("  [logger] brightness = %d\n", v);
    });

    std::printf("=== Scenario 1: The slider writes, everyone else hears about it ===\n");
    slider.set(40);

    std::printf("\n=== Scenario 2: The spinbox writes, the slider follows ===\n");
    spinbox.set(55);

    std::printf("\n=== Scenario 3: A plain write reaches every binding ===\n");
    tether::set(&brightness, 70);

    std::printf("\nslider reads %d, spinbox reads %d\n", slider.get(), spinbox.get());

    std::printf("\n=== Summary ===\n");
    std::printf("tether::bind: A hook that can also read and write the property\n");
    std::printf("binding::set: Notifies every other hook but not the binding itself\n");
    std::printf("Two way bindings stay in sync without echoing their own writes\n\n");

    return 0;
}
