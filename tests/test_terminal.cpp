#include <catch2/catch.hpp>
#include <app/terminal.hpp>

#include <deque>

using namespace termrast;

namespace {
// Feeds queued bytes as if they were already waiting on stdin
struct PendingBytes {
    std::deque<int> bytes;

    int operator()() {
        if (bytes.empty()) return -1;
        int b = bytes.front();
        bytes.pop_front();
        return b;
    }
};
}

TEST_CASE("Key decoding", "[terminal]") {
    PendingBytes pending;
    auto next = [&pending] { return pending(); };

    SECTION("Plain keys pass through") {
        pending.bytes = {'x'};
        REQUIRE(app::decode_key('w', next) == 'w');
        REQUIRE(pending.bytes.size() == 1);
    }

    SECTION("A lone escape stays escape") {
        REQUIRE(app::decode_key(app::KEY_ESCAPE, next) == app::KEY_ESCAPE);
    }

    SECTION("Arrow keys are consumed whole") {
        pending.bytes = {'[', 'A', 'w'};
        REQUIRE(app::decode_key(app::KEY_ESCAPE, next) == app::KEY_SEQUENCE);
        REQUIRE(pending.bytes.size() == 1);
        REQUIRE(pending.bytes.front() == 'w');
    }

    SECTION("Parameterised sequences run to the final byte") {
        // Delete key: ESC [ 3 ~
        pending.bytes = {'[', '3', '~', 'x'};
        REQUIRE(app::decode_key(app::KEY_ESCAPE, next) == app::KEY_SEQUENCE);
        REQUIRE(pending.bytes.size() == 1);
        REQUIRE(pending.bytes.front() == 'x');
    }

    SECTION("SS3 function keys take one more byte") {
        // F1: ESC O P
        pending.bytes = {'O', 'P', 'x'};
        REQUIRE(app::decode_key(app::KEY_ESCAPE, next) == app::KEY_SEQUENCE);
        REQUIRE(pending.bytes.size() == 1);
    }

    SECTION("Truncated sequences stop at the end of input") {
        pending.bytes = {'[', '1', ';'};
        REQUIRE(app::decode_key(app::KEY_ESCAPE, next) == app::KEY_SEQUENCE);
        REQUIRE(pending.bytes.empty());
    }
}
