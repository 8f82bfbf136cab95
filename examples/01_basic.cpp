#include <tether.h>

#include <cstdio>
#include <string>

// Hooks receive a const reference to the emitted payload
void hook_func(const std::string& data) {
    std::printf("  Free function hook: '%s'\n", data.c_str());
}

int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    tether::event<std::string> e;

    // --- Scenario 1: Hooking with Lambdas ---
    // the returned owned_hook keeps the hook registered, dropping it unhooks
    auto lambda_hook = tether::hook(&e, [](const std::string& data) {
        std::printf("  Lambda hook: '%s'\n", data.c_str());
    });

    // --- Scenario 2: Hooking with Function Pointers ---
    auto func_hook = tether::hook(&e, hook_func);

    // --- Scenario 3: Hooking a single emit ---
    auto once_hook = tether::once(&e, [](const std::string& data) {
        std::printf("  Once hook: '%s'\n", data.c_str());
    });

    // --- Scenario 4: Emitting ---
    std::printf("=== Initial State: Three hooks registered (one is once-only) ===\n");

    std::printf("Emitting 'gabagool':\n");
    tether::emit(&e, "gabagool");

    std::printf("\nEmitting 'something creative':\n");
    tether::emit(&e, "something creative");

    // --- Scenario 5: Signals without payload ---
    tether::event<> ping;
    auto ping_hook = tether::hook(&ping, [] { std::printf("  Ping received\n"); });

    std::printf("\nEmitting a payload-less event:\n");
    tether::emit(&ping);

    std::printf("\n=== Summary ===\n");
    std::printf("tether::event<Args...>: Notifies hooks with a payload of type Args...\n");
    std::printf("tether::hook: Registers a callback, returns the owned_hook that keeps it alive\n");
    std::printf("tether::once: Registers a callback that unhooks itself on the first emit\n");
    std::printf("tether::emit: Calls every hook synchronously in registration order\n");
    std::printf(
        "Functional Style: Always passes &event as the first argument (see 02_event_methods for "
        "other style)\n\n");
    return 0;
}
