#include <catch2/catch_test_macros.hpp>
#include "core/displacement_renderer.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <set>

using namespace vecture;

namespace {

const std::string kExample = "Contact jane@example.com or 10.0.0.5 on 2024-01-05.";

const std::vector<Span> kExampleSpans = {
    Span(8, 24, Category::EMAIL),
    Span(28, 36, Category::IPV4),
    Span(40, 50, Category::DATE),
};

std::string glyphs(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) out += kBlackoutGlyph;
    return out;
}

} // anonymous namespace

TEST_CASE("CLASSIC replaces every span with the marker", "[renderer]") {
    auto result = DisplacementRenderer::render(kExample, kExampleSpans, RedactionStyle::CLASSIC);
    REQUIRE(result.is_ok());

    const auto& out = result.value();
    CHECK(out.sanitized == "Contact [REDACTED] or [REDACTED] on [REDACTED].");
    REQUIRE(out.records.size() == 3);
    CHECK(out.records[0].original == "jane@example.com");
    CHECK(out.records[1].original == "10.0.0.5");
    CHECK(out.records[2].original == "2024-01-05");
    for (const auto& rec : out.records) {
        CHECK(rec.rendered == "[REDACTED]");
    }
    CHECK(out.records[0].span == kExampleSpans[0]);
}

TEST_CASE("BLACKOUT emits one block per code point", "[renderer]") {
    auto result = DisplacementRenderer::render(kExample, kExampleSpans, RedactionStyle::BLACKOUT);
    REQUIRE(result.is_ok());

    const auto& out = result.value();
    CHECK(out.sanitized == "Contact " + glyphs(16) + " or " + glyphs(8) + " on " + glyphs(10) + ".");
    CHECK(utils::utf8_length(out.sanitized) == utils::utf8_length(kExample));
    REQUIRE(out.records.size() == 3);
    CHECK(utils::utf8_length(out.records[0].rendered) == 16);
    CHECK(utils::utf8_length(out.records[1].rendered) == 8);
    CHECK(utils::utf8_length(out.records[2].rendered) == 10);
}

TEST_CASE("BLACKOUT counts multi-byte characters once", "[renderer]") {
    const std::string text = "hi Zo\xC3\xAB!";   // "hi Zoë!"
    auto result = DisplacementRenderer::render(text, {Span(3, 7, Category::CUSTOM_TERM)},
                                               RedactionStyle::BLACKOUT);
    REQUIRE(result.is_ok());
    CHECK(result.value().sanitized == "hi " + glyphs(3) + "!");
}

TEST_CASE("NOISE preserves length with alphanumerics", "[renderer]") {
    auto result = DisplacementRenderer::render(kExample, kExampleSpans, RedactionStyle::NOISE, 42);
    REQUIRE(result.is_ok());

    const auto& out = result.value();
    CHECK(out.sanitized.size() == kExample.size());
    REQUIRE(out.records.size() == 3);
    for (const auto& rec : out.records) {
        CHECK(rec.rendered.size() == rec.original.size());
        for (const char c : rec.rendered) {
            CHECK(std::isalnum(static_cast<unsigned char>(c)));
        }
    }
    CHECK(out.sanitized.substr(0, 8) == "Contact ");
    CHECK(out.sanitized.back() == '.');
}

TEST_CASE("NOISE is deterministic for a fixed seed", "[renderer]") {
    auto a = DisplacementRenderer::render(kExample, kExampleSpans, RedactionStyle::NOISE, 7);
    auto b = DisplacementRenderer::render(kExample, kExampleSpans, RedactionStyle::NOISE, 7);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value().sanitized == b.value().sanitized);
}

TEST_CASE("NOISE reuses the rendering for a repeated original", "[renderer]") {
    const std::string text = "Orion and Orion and Vega!";
    auto result = DisplacementRenderer::render(text, {
        Span(0, 5, Category::CUSTOM_TERM),
        Span(10, 15, Category::CUSTOM_TERM),
        Span(20, 24, Category::CUSTOM_TERM),
    }, RedactionStyle::NOISE, 1);
    REQUIRE(result.is_ok());

    const auto& records = result.value().records;
    REQUIRE(records.size() == 3);
    CHECK(records[0].rendered == records[1].rendered);
    CHECK(records[2].rendered.size() == 4);
}

TEST_CASE("NOISE gives distinct originals distinct renderings", "[renderer]") {
    const std::string letters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmn";
    std::string text;
    std::vector<Span> spans;
    for (size_t i = 0; i < letters.size(); ++i) {
        spans.emplace_back(text.size(), text.size() + 1, Category::CUSTOM_TERM);
        text += letters[i];
        text += ' ';
    }

    auto result = DisplacementRenderer::render(text, spans, RedactionStyle::NOISE, 42);
    REQUIRE(result.is_ok());

    std::set<std::string> seen;
    for (const auto& rec : result.value().records) {
        CHECK(rec.rendered.size() == 1);
        seen.insert(rec.rendered);
    }
    CHECK(seen.size() == letters.size());
}

TEST_CASE("NOISE fills the whole alphabet before repeating", "[renderer]") {
    // 62 distinct one-character originals use up every one-character rendering
    const std::string originals =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    std::string text;
    std::vector<Span> spans;
    for (const char c : originals) {
        spans.emplace_back(text.size(), text.size() + 1, Category::CUSTOM_TERM);
        text += c;
        text += ' ';
    }

    for (const uint64_t seed : {1u, 7u, 1234u}) {
        auto result = DisplacementRenderer::render(text, spans, RedactionStyle::NOISE, seed);
        REQUIRE(result.is_ok());

        std::set<std::string> seen;
        for (const auto& rec : result.value().records) {
            seen.insert(rec.rendered);
        }
        CHECK(seen.size() == originals.size());
    }
}

TEST_CASE("Document without spans is copied verbatim", "[renderer]") {
    auto result = DisplacementRenderer::render("nothing here", {}, RedactionStyle::CLASSIC);
    REQUIRE(result.is_ok());
    CHECK(result.value().sanitized == "nothing here");
    CHECK(result.value().records.empty());
}

TEST_CASE("Span at document start and end", "[renderer]") {
    auto result = DisplacementRenderer::render("abcXYZdef", {
        Span(0, 3, Category::CUSTOM_TERM),
        Span(6, 9, Category::CUSTOM_TERM),
    }, RedactionStyle::CLASSIC);
    REQUIRE(result.is_ok());
    CHECK(result.value().sanitized == "[REDACTED]XYZ[REDACTED]");
}

TEST_CASE("Non-canonical spans are rejected", "[renderer]") {
    auto overlapping = DisplacementRenderer::render(kExample, {
        Span(0, 10, Category::EMAIL),
        Span(5, 12, Category::DATE),
    }, RedactionStyle::CLASSIC);
    REQUIRE(overlapping.is_error());
    CHECK(overlapping.error_code() == ErrorCode::INVALID_INPUT);

    auto past_end = DisplacementRenderer::render("short", {Span(2, 9, Category::DATE)},
                                                 RedactionStyle::CLASSIC);
    REQUIRE(past_end.is_error());
    CHECK(past_end.error_code() == ErrorCode::INVALID_INPUT);
}
