#include <catch2/catch_test_macros.hpp>
#include "core/redactor.hpp"
#include "core/utils.hpp"

using namespace vecture;

namespace {

const std::string kExample = "Contact jane@example.com or 10.0.0.5 on 2024-01-05.";

Redactor::Options base_options(RedactionStyle style = RedactionStyle::CLASSIC) {
    Redactor::Options options;
    options.style = style;
    options.noise_seed = 1234;
    return options;
}

} // anonymous namespace

TEST_CASE("Sever produces the classic sanitized document", "[redactor]") {
    const Redactor redactor(base_options());
    auto result = redactor.sever(kExample);
    REQUIRE(result.is_ok());

    CHECK(result.value().sanitized == "Contact [REDACTED] or [REDACTED] on [REDACTED].");
    CHECK(result.value().payload.records.size() == 3);
    CHECK(result.value().payload.style == RedactionStyle::CLASSIC);
    CHECK_FALSE(result.value().key_file.empty());
}

TEST_CASE("Sever then restore round trips for every style", "[redactor]") {
    for (const auto style : {RedactionStyle::CLASSIC, RedactionStyle::BLACKOUT, RedactionStyle::NOISE}) {
        const Redactor redactor(base_options(style));
        auto severed = redactor.sever(kExample);
        REQUIRE(severed.is_ok());

        auto restored = Redactor::restore(severed.value().sanitized, severed.value().key_file);
        REQUIRE(restored.is_ok());
        CHECK(restored.value() == kExample);
    }
}

TEST_CASE("Length-preserving styles keep the code point count", "[redactor]") {
    for (const auto style : {RedactionStyle::BLACKOUT, RedactionStyle::NOISE}) {
        const Redactor redactor(base_options(style));
        auto severed = redactor.sever(kExample);
        REQUIRE(severed.is_ok());
        CHECK(utils::utf8_length(severed.value().sanitized) == utils::utf8_length(kExample));
    }
}

TEST_CASE("Custom terms enable their class automatically", "[redactor]") {
    auto options = base_options();
    options.enabled_classes = {};
    options.custom_terms = {"Project Orion"};

    const Redactor redactor(options);
    auto severed = redactor.sever("Status of Project Orion: green.");
    REQUIRE(severed.is_ok());
    CHECK(severed.value().sanitized == "Status of [REDACTED]: green.");
    REQUIRE(severed.value().payload.records.size() == 1);
    CHECK(severed.value().payload.records[0].category() == Category::CUSTOM_TERM);
}

TEST_CASE("Term inside an email is absorbed by the email span", "[redactor]") {
    auto options = base_options();
    options.custom_terms = {"example"};

    const Redactor redactor(options);
    auto severed = redactor.sever(kExample);
    REQUIRE(severed.is_ok());
    CHECK(severed.value().sanitized == "Contact [REDACTED] or [REDACTED] on [REDACTED].");
    REQUIRE(severed.value().payload.records.size() == 3);
    CHECK(severed.value().payload.records[0].category() == Category::EMAIL);
}

TEST_CASE("Capitalized heuristic is opt-in", "[redactor]") {
    const std::string text = "We met Jane Doe today.";

    auto plain = Redactor(base_options()).sever(text);
    REQUIRE(plain.is_ok());
    CHECK(plain.value().sanitized == text);

    auto options = base_options();
    options.enabled_classes.push_back(Category::CAPITALIZED_HEURISTIC);
    auto flagged = Redactor(options).sever(text);
    REQUIRE(flagged.is_ok());
    CHECK(flagged.value().sanitized == "We met [REDACTED] today.");
}

TEST_CASE("Empty custom term fails the whole sever", "[redactor]") {
    auto options = base_options();
    options.custom_terms = {""};
    auto severed = Redactor(options).sever(kExample);
    REQUIRE(severed.is_error());
    CHECK(severed.error_code() == ErrorCode::INVALID_PATTERN);
}

TEST_CASE("Encrypted and obfuscated keys restore", "[redactor]") {
    SECTION("encrypted") {
        auto options = base_options();
        options.key.encoding = KeyEncoding::ENCRYPTED;
        options.key.passphrase = "hunter2";
        options.key.scrypt = {1024, 8, 1};

        auto severed = Redactor(options).sever(kExample);
        REQUIRE(severed.is_ok());

        auto restored = Redactor::restore(severed.value().sanitized, severed.value().key_file,
                                          std::string("hunter2"));
        REQUIRE(restored.is_ok());
        CHECK(restored.value() == kExample);

        auto wrong = Redactor::restore(severed.value().sanitized, severed.value().key_file,
                                       std::string("hunter3"));
        REQUIRE(wrong.is_error());
        CHECK(wrong.error_code() == ErrorCode::DECRYPTION_ERROR);
    }

    SECTION("obfuscated") {
        auto options = base_options(RedactionStyle::BLACKOUT);
        options.key.encoding = KeyEncoding::OBFUSCATED;

        auto severed = Redactor(options).sever(kExample);
        REQUIRE(severed.is_ok());
        CHECK(severed.value().key_file.starts_with(kObfuscatedPrefix));

        auto restored = Redactor::restore(severed.value().sanitized, severed.value().key_file);
        REQUIRE(restored.is_ok());
        CHECK(restored.value() == kExample);
    }
}

TEST_CASE("Restore refuses an edited sanitized document", "[redactor]") {
    auto severed = Redactor(base_options()).sever(kExample);
    REQUIRE(severed.is_ok());

    std::string edited = severed.value().sanitized;
    edited.replace(0, 7, "Contakt");

    auto restored = Redactor::restore(edited, severed.value().key_file);
    REQUIRE(restored.is_error());
    CHECK(restored.error_code() == ErrorCode::INTEGRITY_ERROR);
}

TEST_CASE("Restore with a foreign key file fails cleanly", "[redactor]") {
    auto restored = Redactor::restore("some text", "not a key");
    REQUIRE(restored.is_error());
    CHECK(restored.error_code() == ErrorCode::UNSUPPORTED_FORMAT);
}
