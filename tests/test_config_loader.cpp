#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace vecture;

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("Config: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.redaction.style == "CLASSIC");
    CHECK(result.config.redaction.classes == std::vector<std::string>{"ipv4", "date", "email"});
    CHECK_FALSE(result.config.redaction.capitals);
    CHECK_FALSE(result.config.key.encrypt);
    CHECK(result.config.key.scrypt_n == 32768);
}

TEST_CASE("Config: all sections are extracted", "[config]") {
    const std::string toml = R"(
[logging]
level = "warn"

[redaction]
style = "blackout"
classes = ["email", "ipv4"]
capitals = true
custom_terms = ["Project Orion", "Vega"]

[patterns]
date = '\b\d{4}/\d{2}\b'

[key]
encrypt = true
passphrase = "pw"
scrypt_n = 1024
scrypt_r = 4
scrypt_p = 2
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "warn");
    CHECK(cfg.redaction.style == "blackout");
    CHECK(cfg.redaction.classes == std::vector<std::string>{"email", "ipv4"});
    CHECK(cfg.redaction.capitals);
    CHECK(cfg.redaction.custom_terms.size() == 2);
    REQUIRE(cfg.patterns.contains("date"));
    CHECK(cfg.patterns.at("date") == R"(\b\d{4}/\d{2}\b)");
    CHECK(cfg.key.encrypt);
    CHECK(cfg.key.passphrase == "pw");
    CHECK(cfg.key.scrypt_n == 1024);
    CHECK(cfg.key.scrypt_r == 4);
    CHECK(cfg.key.scrypt_p == 2);
}

TEST_CASE("Config: passphrase expands from the environment", "[config][env]") {
    ::setenv("VECTURE_TEST_PASSPHRASE", "from-env", 1);

    const std::string toml = R"(
[key]
encrypt = true
passphrase = "${VECTURE_TEST_PASSPHRASE}"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.key.passphrase == "from-env");

    ::unsetenv("VECTURE_TEST_PASSPHRASE");
}

TEST_CASE("Config: unclosed ${ is a parse error", "[config][env]") {
    const std::string toml = R"(
[key]
passphrase = "${NOT_CLOSED"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("Config: malformed TOML fails", "[config]") {
    auto result = ConfigLoader::load_from_string("[redaction\nstyle = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("Config: missing file fails", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/vecture.toml");
    CHECK_FALSE(result.success);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: unknown style fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[redaction]\nstyle = \"sparkle\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("redaction.style") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown class fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[redaction]\nclasses = [\"email\", \"phone\"]\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("phone") != std::string::npos);
}

TEST_CASE("ConfigValidation: scrypt parameters are checked", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[key]\nscrypt_n = 1000\nscrypt_r = 0\nscrypt_p = 99\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("scrypt_n") != std::string::npos);
    CHECK(result.error_message.find("scrypt_r") != std::string::npos);
    CHECK(result.error_message.find("scrypt_p") != std::string::npos);
}

TEST_CASE("ConfigValidation: encrypt and obfuscate are exclusive", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[key]\nencrypt = true\nobfuscate = true\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("mutually exclusive") != std::string::npos);
}

TEST_CASE("ConfigValidation: bad pattern overrides fail", "[config][validation]") {
    auto unknown = ConfigLoader::load_from_string("[patterns]\nphone = '\\d+'\n");
    CHECK_FALSE(unknown.success);
    CHECK(unknown.error_message.find("patterns.phone") != std::string::npos);

    auto broken = ConfigLoader::load_from_string("[patterns]\nemail = '([a-z'\n");
    CHECK_FALSE(broken.success);
    CHECK(broken.error_message.find("patterns.email") != std::string::npos);
}

TEST_CASE("ConfigValidation: empty custom term fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[redaction]\ncustom_terms = [\"ok\", \"\"]\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("custom_terms[1]") != std::string::npos);
}

TEST_CASE("ConfigValidation: every problem is reported", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "loud"

[redaction]
style = "sparkle"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
    CHECK(result.error_message.find("redaction.style") != std::string::npos);
}

// ============================================================================
// Redactor options
// ============================================================================

TEST_CASE("Config maps onto redactor options", "[config][options]") {
    const std::string toml = R"(
[redaction]
style = "noise"
classes = ["email", "Email", "date"]
capitals = true
custom_terms = ["Vega"]

[patterns]
ipv4 = '\b10\.\d+\.\d+\.\d+\b'

[key]
obfuscate = true
)";
    auto loaded = ConfigLoader::load_from_string(toml);
    REQUIRE(loaded.success);

    auto options = ConfigLoader::to_redactor_options(loaded.config);
    REQUIRE(options.is_ok());

    const auto& opts = options.value();
    CHECK(opts.style == RedactionStyle::NOISE);
    CHECK(opts.enabled_classes == std::vector<Category>{
        Category::EMAIL, Category::DATE, Category::CAPITALIZED_HEURISTIC});
    CHECK(opts.custom_terms == std::vector<std::string>{"Vega"});
    CHECK(opts.pattern_overrides.contains(Category::IPV4));
    CHECK(opts.key.encoding == KeyEncoding::OBFUSCATED);
}

TEST_CASE("Terms file is read, trimmed and merged", "[config][options]") {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "vecture_test_terms.txt";
    {
        std::ofstream out(path);
        out << "  Project Orion  \n\n\tVega\n   \n";
    }

    auto terms = ConfigLoader::read_terms_file(path.string());
    REQUIRE(terms.is_ok());
    CHECK(terms.value() == std::vector<std::string>{"Project Orion", "Vega"});

    VectureConfig config;
    config.redaction.custom_terms = {"Sirius"};
    config.redaction.terms_file = path.string();
    auto options = ConfigLoader::to_redactor_options(config);
    REQUIRE(options.is_ok());
    CHECK(options.value().custom_terms == std::vector<std::string>{"Sirius", "Project Orion", "Vega"});

    fs::remove(path);
}

TEST_CASE("Missing terms file is invalid input", "[config][options]") {
    VectureConfig config;
    config.redaction.terms_file = "/nonexistent/terms.txt";
    auto options = ConfigLoader::to_redactor_options(config);
    REQUIRE(options.is_error());
    CHECK(options.error_code() == ErrorCode::INVALID_INPUT);
}

TEST_CASE("Log levels parse case-insensitively", "[config]") {
    CHECK(ConfigLoader::parse_log_level("INFO") == utils::log::Level::INFO);
    CHECK(ConfigLoader::parse_log_level("warn") == utils::log::Level::WARN);
    CHECK(ConfigLoader::parse_log_level("Error") == utils::log::Level::ERROR);
    CHECK_FALSE(ConfigLoader::parse_log_level("debug").has_value());
}
