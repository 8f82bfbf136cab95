#include <tether.h>

#include <cstdio>
#include <memory>
#include <string>

struct message {
    std::string text;
};

int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    tether::event<message> e;

    std::printf("=== Scenario 1: Automatic RAII Cleanup (Scope-based) ===\n");
    {
        tether::owned_hook h = tether::hook(&e, [](const message& m) {
            std::printf("  Callback: Received '%s'\n", m.text.c_str());
        });

        std::printf("Hook active. owned_hook is valid: %s\n", h.valid() ? "yes" : "no");
        tether::emit(&e, message{"Message inside scope"});

        std::printf("Leaving scope... (Destructor will unhook)\n");
    }

    std::printf("\nOutside scope. Emitting again, hooks left: %zu\n", tether::hook_count(&e));
    tether::emit(&e, message{"Message outside scope"});

    std::printf("\n=== Scenario 2: Manual Release ===\n");
    tether::hook_id regular_id;  // by default hook_id is invalid and will fail any operations

    {
        auto owned = tether::hook(&e, [](const message& m) {
            std::printf("  Callback: Received '%s'\n", m.text.c_str());
        });

        tether::emit(&e, message{"Message before release"});

        std::printf("\nReleasing ownership to a regular ID...\n");
        regular_id = owned.release();

        std::printf("owned_hook is now valid: %s\n", owned.valid() ? "yes" : "no");
        std::printf("Leaving scope... (Hook should persist)\n");
    }

    std::printf("\nOutside scope (after release):\n");
    tether::emit(&e, message{"Message after release"});

    auto status = regular_id.unhook();
    std::printf("Unhook status: %s\n", tether::status_string(status));

    std::printf("\n=== Scenario 3: Handles outliving their event ===\n");
    tether::owned_hook survivor;
    {
        auto short_lived = std::make_unique<tether::event<message>>();
        survivor = tether::hook(short_lived.get(), [](const message&) {});
        std::printf("Event destroyed...\n");
    }

    std::printf("Unhook status after the event died: %s\n",
        tether::status_string(survivor.unhook()));

    std::printf("\n=== Summary ===\n");
    std::printf("owned_hook: Unhooks automatically when it is destroyed\n");
    std::printf(".release(): Transfers responsibility back to the user (stops RAII)\n");
    std::printf(".scoped(): Turns a regular hook_id back into an owned_hook\n");
    std::printf("Handles never fault, even after their event or property is gone\n\n");

    return 0;
}
