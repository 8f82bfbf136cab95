#define TETHER_METHODS
#include <tether.h>

#include <cstdio>
#include <string>

void hook_func(const std::string& data) {
    std::printf("  Free function hook: '%s'\n", data.c_str());
}

// This is the same example as 01_basic, but rewritten to use the member methods
int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    // The event has member functions defined due to #define TETHER_METHODS
    tether::event<std::string> e;

    std::printf("=== Using Member Function Syntax ===\n");

    // e.hook instead of tether::hook(&e, ...)
    auto lambda_hook = e.hook([](const std::string& data) {
        std::printf("  Lambda hook: '%s'\n", data.c_str());
    });

    auto func_hook = e.hook(hook_func);

    auto once_hook = e.once([](const std::string& data) {
        std::printf("  Once hook: '%s'\n", data.c_str());
    });

    std::printf("Hooks registered: %zu\n\n", e.hook_count());

    // e.emit instead of tether::emit(&e, ...)
    std::printf("Emitting 'gabagool':\n");
    e.emit("gabagool");

    std::printf("\nEmitting 'something creative':\n");
    e.emit("something creative");

    std::printf("\n=== Summary ===\n");
    std::printf(
        "TETHER_METHODS: Must be defined before including <tether.h> for member methods to be "
        "included\n");
    std::printf(
        "Member Syntax: e.emit(data) is shorthand for tether::emit(&e, data) and so on for all "
        "methods\n");
    std::printf(
        "Paradigm: This makes tether more oop-ish, for a more functional style see 01_basic\n\n");

    return 0;
}
