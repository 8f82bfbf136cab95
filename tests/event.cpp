#include <tether.h>

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

TEST_CASE("hooks run in registration order", "[event]") {
    tether::event<int> e;
    std::vector<int> order;
    std::vector<tether::owned_hook> hooks;

    for (int i = 0; i < 16; ++i) {
        hooks.push_back(tether::hook(&e, [&order, i](const int&) { order.push_back(i); }));
    }

    tether::emit(&e, 0);

    REQUIRE(order.size() == 16);
    for (int i = 0; i < 16; ++i) {
        REQUIRE(order[i] == i);
    }
}

TEST_CASE("order survives removals from the middle", "[event]") {
    tether::event<int> e;
    std::vector<char> order;

    auto a = tether::hook(&e, [&](const int&) { order.push_back('a'); });
    auto b = tether::hook(&e, [&](const int&) { order.push_back('b'); });
    auto c = tether::hook(&e, [&](const int&) { order.push_back('c'); });

    REQUIRE(b.unhook() == tether::OK);
    auto d = tether::hook(&e, [&](const int&) { order.push_back('d'); });

    tether::emit(&e, 1);

    REQUIRE(order == std::vector<char>{'a', 'c', 'd'});
}

TEST_CASE("every hook receives the same payload", "[event]") {
    tether::event<std::string> e;
    std::string first, second;

    auto h1 = tether::hook(&e, [&](const std::string& s) { first = s; });
    auto h2 = tether::hook(&e, [&](const std::string& s) { second = s; });

    tether::emit(&e, "payload");

    REQUIRE(first == "payload");
    REQUIRE(second == "payload");
}

TEST_CASE("emit without hooks is a no-op", "[event]") {
    tether::event<int> e;

    REQUIRE_NOTHROW(tether::emit(&e, 42));
    REQUIRE(tether::hook_count(&e) == 0);
}

TEST_CASE("events carry several arguments or none", "[event]") {
    SECTION("several") {
        tether::event<int, std::string> e;
        int got_int = 0;
        std::string got_str;

        auto h = tether::hook(&e, [&](const int& i, const std::string& s) {
            got_int = i;
            got_str = s;
        });

        tether::emit(&e, 7, "seven");

        REQUIRE(got_int == 7);
        REQUIRE(got_str == "seven");
    }

    SECTION("none") {
        tether::event<> e;
        int calls = 0;

        auto h = tether::hook(&e, [&calls] { ++calls; });

        tether::emit(&e);
        tether::emit(&e);

        REQUIRE(calls == 2);
    }
}

TEST_CASE("payloads that cannot be copied are passed by reference", "[event]") {
    tether::event<std::unique_ptr<int>> e;
    int seen = 0;

    auto h = tether::hook(&e, [&seen](const std::unique_ptr<int>& p) { seen = *p; });

    auto payload = std::make_unique<int>(5);
    tether::emit(&e, payload);

    REQUIRE(seen == 5);
    REQUIRE(payload != nullptr);
}

TEST_CASE("hooks may own move-only state", "[event]") {
    tether::event<int> e;
    int total = 0;

    auto counter = std::make_unique<int>(0);
    auto h = tether::hook(&e, [&total, counter = std::move(counter)](const int& v) mutable {
        *counter += v;
        total = *counter;
    });

    tether::emit(&e, 2);
    tether::emit(&e, 3);

    REQUIRE(total == 5);
}

namespace {
std::vector<int> free_log;

void record_free(const int& v) { free_log.push_back(v); }
}  // namespace

TEST_CASE("free functions can be hooked", "[event]") {
    free_log.clear();
    tether::event<int> e;

    auto h = tether::hook(&e, record_free);
    tether::emit(&e, 9);

    REQUIRE(free_log == std::vector<int>{9});
}

TEST_CASE("once hooks fire a single time", "[event]") {
    tether::event<int> e;
    std::vector<int> got;

    auto h = tether::once(&e, [&got](const int& v) { got.push_back(v); });
    REQUIRE(tether::hook_count(&e) == 1);

    tether::emit(&e, 1);
    tether::emit(&e, 2);

    REQUIRE(got == std::vector<int>{1});
    REQUIRE(tether::hook_count(&e) == 0);
    REQUIRE(h.unhook() == tether::NO_HOOK_WITH_ID);
}

TEST_CASE("once hooks can be cancelled before they fire", "[event]") {
    tether::event<int> e;
    int calls = 0;

    auto h = tether::once(&e, [&calls](const int&) { ++calls; });
    REQUIRE(h.unhook() == tether::OK);

    tether::emit(&e, 1);

    REQUIRE(calls == 0);
}

TEST_CASE("unhook by id and unhook_all", "[event]") {
    tether::event<int> e;
    int calls = 0;

    auto a = tether::hook(&e, [&calls](const int&) { ++calls; });
    auto b = tether::hook(&e, [&calls](const int&) { ++calls; });
    auto c = tether::hook(&e, [&calls](const int&) { ++calls; });

    REQUIRE(tether::unhook(&e, a.id()) == tether::OK);
    REQUIRE(tether::unhook(&e, a.id()) == tether::NO_HOOK_WITH_ID);
    REQUIRE(tether::hook_count(&e) == 2);

    tether::emit(&e, 0);
    REQUIRE(calls == 2);

    REQUIRE(tether::unhook_all(&e) == tether::OK);
    REQUIRE(tether::hook_count(&e) == 0);

    tether::emit(&e, 0);
    REQUIRE(calls == 2);

    // the handles are stale now but releasing them stays harmless
    REQUIRE(b.unhook() == tether::NO_HOOK_WITH_ID);
    REQUIRE(c.unhook() == tether::NO_HOOK_WITH_ID);
}

TEST_CASE("member methods mirror the free functions", "[event]") {
    tether::event<int> e;
    std::vector<int> got;

    auto h = e.hook([&got](const int& v) { got.push_back(v); });
    auto o = e.once([&got](const int& v) { got.push_back(v * 10); });
    REQUIRE(e.hook_count() == 2);

    e.emit(1);
    e.emit(2);

    REQUIRE(got == std::vector<int>{1, 10, 2});
    REQUIRE(e.unhook(h.id()) == tether::OK);
    REQUIRE(e.unhook_all() == tether::OK);
    REQUIRE(e.hook_count() == 0);
}

TEST_CASE("moving an event keeps its hooks", "[event]") {
    tether::event<int> e;
    int calls = 0;

    auto h = tether::hook(&e, [&calls](const int&) { ++calls; });

    tether::event<int> moved = std::move(e);
    tether::emit(&moved, 1);

    REQUIRE(calls == 1);
    REQUIRE(h.unhook() == tether::OK);
    REQUIRE(tether::hook_count(&moved) == 0);
}
