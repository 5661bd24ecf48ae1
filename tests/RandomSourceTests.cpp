#include <catch2/catch_test_macros.hpp>
#include "TestUtils.hpp"
#include <set>

using tokenseal::test::ScriptedRandomSource;
using tokenseal::test::uniformBytes;

TEST_CASE("Uniform rejects draws that would bias the result", "[random]") {
    // 2^64 mod 3 == 1, so a raw value of 0 must be redrawn
    auto script = uniformBytes(0);
    const auto second = uniformBytes(5);
    script.insert(script.end(), second.begin(), second.end());
    ScriptedRandomSource source(script);

    REQUIRE(source.uniform(3) == 2);
    REQUIRE(source.remaining() == 0);
}

TEST_CASE("Uniform stays in range", "[random]") {
    tokenseal::SeededRandomSource source(7);

    for (int i = 0; i < 1000; ++i) {
        REQUIRE(source.uniform(10) < 10);
    }
    REQUIRE(source.uniform(1) == 0);
}

TEST_CASE("Uniform with a zero bound is rejected", "[random][validation]") {
    tokenseal::SeededRandomSource source(7);
    REQUIRE_THROWS_AS(source.uniform(0), tokenseal::InvalidParameterException);
}

TEST_CASE("Seeded source is reproducible", "[random]") {
    tokenseal::SeededRandomSource first(42);
    tokenseal::SeededRandomSource second(42);

    std::vector<uint8_t> a(32);
    std::vector<uint8_t> b(32);
    first.fill(a.data(), a.size());
    second.fill(b.data(), b.size());

    REQUIRE(a == b);
}

TEST_CASE("Secure source yields distinct buffers", "[random]") {
    const auto source = tokenseal::RandomSource::secure();
    REQUIRE(source == tokenseal::RandomSource::secure());

    std::set<std::vector<uint8_t>> seen;
    for (int i = 0; i < 16; ++i) {
        std::vector<uint8_t> buffer(16);
        source->fill(buffer.data(), buffer.size());
        seen.insert(buffer);
    }
    REQUIRE(seen.size() == 16);
}
