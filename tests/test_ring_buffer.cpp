#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <cstdint>
#include <numeric>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer rb(cap);

    SECTION("WriteAndRead") {
        std::vector<int16_t> data(64);
        std::iota(data.begin(), data.end(), int16_t(-32));

        REQUIRE(rb.write(data) == 64);
        REQUIRE(rb.available() == 64);

        std::vector<int16_t> out(64);
        REQUIRE(rb.read(out) == 64);
        REQUIRE(out == data);
        REQUIRE(rb.available() == 0);
    }

    SECTION("Wraparound") {
        std::vector<int16_t> fill(200);
        std::iota(fill.begin(), fill.end(), int16_t(1));
        REQUIRE(rb.write(fill) == 200);

        std::vector<int16_t> sink(200);
        REQUIRE(rb.read(sink) == 200);

        // Positions are at 200; the next 128 samples cross the end of storage.
        std::vector<int16_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), int16_t(1000));
        REQUIRE(rb.write(wrap) == 128);

        std::vector<int16_t> out(128);
        REQUIRE(rb.read(out) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("OverflowDropsAndCounts") {
        std::vector<int16_t> big(cap + 100, 7);
        REQUIRE(rb.write(big) == cap);
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.dropped() == 100);

        std::vector<int16_t> more(10, 7);
        REQUIRE(rb.write(more) == 0);
        REQUIRE(rb.dropped() == 110);
    }

    SECTION("PartialRead") {
        std::vector<int16_t> data = {100, -200, 300, -400, 500};
        REQUIRE(rb.write(data) == 5);

        std::vector<int16_t> out(3);
        REQUIRE(rb.read(out) == 3);
        REQUIRE(out == std::vector<int16_t>{100, -200, 300});
        REQUIRE(rb.available() == 2);

        std::vector<int16_t> rest(10);
        REQUIRE(rb.read(rest) == 2);
        REQUIRE(rest[0] == -400);
        REQUIRE(rest[1] == 500);
    }

    SECTION("ReadEmpty") {
        std::vector<int16_t> out(16);
        REQUIRE(rb.read(out) == 0);
    }

    SECTION("Reset") {
        std::vector<int16_t> big(cap + 1, 1);
        rb.write(big);
        rb.reset();
        REQUIRE(rb.available() == 0);
        REQUIRE(rb.dropped() == 0);
        REQUIRE(rb.capacity() == cap);
    }
}
