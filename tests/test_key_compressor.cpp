#include <catch2/catch_test_macros.hpp>
#include "codec/key_compressor.hpp"

#include <string>

using namespace vecture;

TEST_CASE("Compressed key data inflates back", "[compressor]") {
    std::string data;
    for (int i = 0; i < 200; ++i) {
        data += R"({"start":10,"end":20,"category":"Email","original":"a@b.io","rendered":"[REDACTED]"})";
    }

    const auto compressed = KeyCompressor::compress(data);
    REQUIRE(compressed.has_value());
    CHECK(compressed->size() < data.size());

    const auto inflated = KeyCompressor::decompress(*compressed);
    REQUIRE(inflated.has_value());
    CHECK(*inflated == data);
}

TEST_CASE("Empty input compresses", "[compressor]") {
    const auto compressed = KeyCompressor::compress("");
    REQUIRE(compressed.has_value());
    const auto inflated = KeyCompressor::decompress(*compressed);
    REQUIRE(inflated.has_value());
    CHECK(inflated->empty());
}

TEST_CASE("Garbage and truncated streams are rejected", "[compressor]") {
    CHECK_FALSE(KeyCompressor::decompress("definitely not zlib").has_value());

    const auto compressed = KeyCompressor::compress(std::string(4096, 'x'));
    REQUIRE(compressed.has_value());
    const std::string truncated = compressed->substr(0, compressed->size() / 2);
    CHECK_FALSE(KeyCompressor::decompress(truncated).has_value());
}

TEST_CASE("Inflation stops at the size limit", "[compressor]") {
    const auto compressed = KeyCompressor::compress(std::string(100000, 'a'));
    REQUIRE(compressed.has_value());
    CHECK_FALSE(KeyCompressor::decompress(*compressed, 1000).has_value());
    CHECK(KeyCompressor::decompress(*compressed, 100000).has_value());
}
