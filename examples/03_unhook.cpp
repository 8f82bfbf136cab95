#include <tether.h>

#include <cstdio>
#include <string>

struct cleanup_event {
    int value;
};

int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    tether::event<cleanup_event> e;
    tether::owned_hook hooks[3];

    // Hook multiple handlers to the event
    hooks[0] = tether::hook(&e, [&](const cleanup_event& c) {
        std::printf("  Hook 1 (ID: %lld): value = %d\n",
            static_cast<long long>(hooks[0].id()),
            c.value);
    });

    hooks[1] = tether::hook(&e, [&](const cleanup_event& c) {
        std::printf("  Hook 2 (ID: %lld): value = %d\n",
            static_cast<long long>(hooks[1].id()),
            c.value);
    });

    hooks[2] = tether::hook(&e, [&](const cleanup_event& c) {
        std::printf("  Hook 3 (ID: %lld): value = %d\n",
            static_cast<long long>(hooks[2].id()),
            c.value);
    });

    std::printf("=== Initial State: All hooks active ===\n");
    tether::emit(&e, cleanup_event{420});

    // Unhook one through its handle
    std::printf("\n=== Unhook Hook 2 ===\n");
    auto status = hooks[1].unhook();
    std::printf("Status: %s\n", tether::status_string(status));
    tether::emit(&e, cleanup_event{69});

    // Unhooking again is harmless
    std::printf("\n=== Unhook Hook 2 again ===\n");
    status = hooks[1].unhook();
    std::printf("Status: %s\n", tether::status_string(status));

    // Unhook by id through the event, the handle does not know yet
    std::printf("\n=== Unhook Hook 1 by id ===\n");
    status = tether::unhook(&e, hooks[0].id());
    std::printf("Status: %s\n", tether::status_string(status));
    tether::emit(&e, cleanup_event{2137});

    // Remove everything that is left
    std::printf("\n=== Unhook everything ===\n");
    status = tether::unhook_all(&e);
    std::printf("Status: %s, hooks left: %zu\n",
        tether::status_string(status),
        tether::hook_count(&e));

    std::printf("Emitting with no hooks remaining:\n");
    tether::emit(&e, cleanup_event{1337});

    std::printf("\n=== Summary ===\n");
    std::printf("owned_hook::unhook: Removes the hook, later calls are harmless no-ops\n");
    std::printf("tether::unhook: Removes a hook by id\n");
    std::printf("tether::unhook_all: Removes every hook, outstanding handles become stale\n\n");

    return 0;
}
