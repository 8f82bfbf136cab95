#define TETHER_DEBUG_LOG
#include <tether.h>

#include <cstdio>
#include <string>

struct user_action {
    std::string action;
};

int main() {
    std::printf("=== %s ===\n\n", __FILE__);

    tether::event<user_action> e;

    // The default logger is already set, but we can customize it
    std::printf("=== Scenario 1: Default Library Logger ===\n");

    auto id1 = tether::hook(&e, [](const user_action& a) {
        std::printf("  [Handler] User action: %s\n", a.action.c_str());
    });

    tether::emit(&e, user_action{"clicked button"});
    std::printf("Unhook status: %s\n", tether::status_string(id1.unhook()));

    std::printf("\n=== Scenario 2: Setting a Custom Logger ===\n");

    tether::set_logger([](tether::log_data data) {
        const char* level_str = "LOG";
        switch (data.level) {
            case tether::DEBUG:
                level_str = "DEBUG";
                break;
            case tether::INFO:
                level_str = "INFO";
                break;
            case tether::WARNING:
                level_str = "WARN";
                break;
            case tether::ERROR:
                level_str = "ERROR";
                break;
            case tether::FATAL:
                level_str = "FATAL";
                break;
        }

        std::printf("[CUSTOM] %-5s | %s\n", level_str, data.format().c_str());
    });

    // This hook will now be logged via our [CUSTOM] logger
    auto id2 = tether::hook(&e, [](const user_action& a) {
        std::printf("  [Handler] User action: %s\n", a.action.c_str());
    });

    tether::emit(&e, user_action{"submitted form"});

    std::printf("\n=== Scenario 3: Debugging stale handles ===\n");

    // Releasing gives us a plain id, unhooking it twice reports the second attempt
    auto plain = id2.release();
    std::printf("First unhook status: %s\n", tether::status_string(plain.unhook()));
    std::printf("Second unhook status: %s\n", tether::status_string(plain.unhook()));

    std::printf("\n=== Scenario 4: Silencing the logger ===\n");
    tether::set_logger(nullptr);
    tether::emit(&e, user_action{"nobody is listening"});
    std::printf("Nothing was logged\n");

    std::printf("\n=== Summary ===\n");
    std::printf(
        "TETHER_DEBUG_LOG: Must be defined before including <tether.h> for logging functionality "
        "to be present\n");
    std::printf("log_data: Contains level, the hook id and count, and the log message\n");
    std::printf(
        "set_logger: Allows providing your own logger, for custom logging, or logger system "
        "integration\n");
    std::printf("log_data.format(): formats log messages with the captured data for display\n\n");

    return 0;
}
