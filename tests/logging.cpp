#include <tether.h>

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

// captures every log record while alive, restores a silent logger afterwards
struct captured_log {
    std::vector<tether::log_data> records;

    captured_log() {
        tether::set_logger([this](tether::log_data data) { records.push_back(data); });
    }

    ~captured_log() { tether::set_logger(nullptr); }

    bool contains(tether::log_level level, const std::string& message) const {
        for (const auto& r : records) {
            if (r.level == level && message == r.message) {
                return true;
            }
        }
        return false;
    }
};

}  // namespace

TEST_CASE("hook lifecycle is logged at debug level", "[logging]") {
    captured_log log;
    tether::event<int> e;

    auto h = tether::hook(&e, [](const int&) {});
    REQUIRE(log.contains(tether::DEBUG, "hook added"));
    REQUIRE(log.records.back().id == h.id());
    REQUIRE(log.records.back().count == 1);

    REQUIRE(h.unhook() == tether::OK);
    REQUIRE(log.contains(tether::DEBUG, "hook removed"));
    REQUIRE(log.records.back().count == 0);

    tether::emit(&e, 0);
    REQUIRE(log.contains(tether::DEBUG, "notify with no hooks"));
}

TEST_CASE("stale handles are reported", "[logging]") {
    captured_log log;
    tether::hook_id id;

    {
        tether::event<int> e;
        id = tether::hook(&e, [](const int&) {}).release();
        REQUIRE(id.unhook() == tether::OK);
        REQUIRE(id.unhook() == tether::NO_HOOK_WITH_ID);
        REQUIRE(log.contains(tether::WARNING, "unhook of unknown id"));
    }

    REQUIRE(id.unhook() == tether::REGISTRY_EXPIRED);
    REQUIRE(log.contains(tether::WARNING, "unhook on expired registry"));
}

TEST_CASE("owned hooks whose registration is already gone only log at debug level", "[logging]") {
    captured_log log;

    {
        tether::event<int> e;
        auto o = tether::once(&e, [](const int&) {});
        tether::emit(&e, 0);
        REQUIRE(log.contains(tether::DEBUG, "once hook fired"));
    }
    REQUIRE(log.contains(tether::DEBUG, "unhook of unknown id"));

    {
        tether::event<int> e;
        auto h = tether::hook(&e, [](const int&) {});
        REQUIRE(tether::unhook_all(&e) == tether::OK);
        REQUIRE(h.unhook() == tether::NO_HOOK_WITH_ID);
    }

    tether::owned_hook outliving;
    {
        tether::event<int> e;
        outliving = tether::hook(&e, [](const int&) {});
    }
    REQUIRE(outliving.unhook() == tether::REGISTRY_EXPIRED);
    REQUIRE(log.contains(tether::DEBUG, "unhook on expired registry"));

    for (const auto& r : log.records) {
        REQUIRE(r.level != tether::WARNING);
    }
}

TEST_CASE("a throwing hook is logged before it propagates", "[logging]") {
    captured_log log;
    tether::event<int> e;

    auto h = tether::hook(&e, [](const int&) { throw std::runtime_error("boom"); });

    REQUIRE_THROWS_AS(tether::emit(&e, 0), std::runtime_error);
    REQUIRE(log.contains(tether::ERROR, "hook threw, notification pass aborted"));
    REQUIRE(log.records.back().id == h.id());
}

TEST_CASE("once hooks and unhook_all are logged", "[logging]") {
    captured_log log;
    tether::event<int> e;

    auto o = tether::once(&e, [](const int&) {});
    auto h = tether::hook(&e, [](const int&) {});
    REQUIRE(log.contains(tether::DEBUG, "once hook added"));

    tether::emit(&e, 0);
    REQUIRE(log.contains(tether::DEBUG, "once hook fired"));

    REQUIRE(tether::unhook_all(&e) == tether::OK);
    REQUIRE(log.contains(tether::INFO, "all hooks removed"));
}

TEST_CASE("a logger may query the instance it is logging about", "[logging]") {
    tether::event<int> e;
    std::vector<size_t> counts;

    tether::set_logger([&](tether::log_data) { counts.push_back(tether::hook_count(&e)); });

    auto a = tether::hook(&e, [](const int&) {});
    auto b = tether::once(&e, [](const int&) {});
    REQUIRE(a.unhook() == tether::OK);
    REQUIRE(tether::unhook_all(&e) == tether::OK);
    tether::set_logger(nullptr);

    REQUIRE(counts == std::vector<size_t>{1, 2, 1, 0});
}

TEST_CASE("log records format with their captured data", "[logging]") {
    tether::log_data with_id{tether::DEBUG, "hook added", 3, 4};
    tether::log_data without_id{tether::INFO, "all hooks removed", -1, 2};

    REQUIRE(with_id.format() == "hook added (id: 3, hooks: 4)");
    REQUIRE(without_id.format() == "all hooks removed (hooks: 2)");
    REQUIRE(std::string(tether::level_string(tether::WARNING)) == "WARN");
}

TEST_CASE("a null logger silences logging", "[logging]") {
    tether::set_logger(nullptr);
    tether::event<int> e;

    auto h = tether::hook(&e, [](const int&) {});
    REQUIRE_NOTHROW(tether::emit(&e, 0));
}
