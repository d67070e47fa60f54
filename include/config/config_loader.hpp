#pragma once

#include "core/error.hpp"
#include "core/redactor.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vecture {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct RedactionConfig {
    std::string style = "CLASSIC";
    std::vector<std::string> classes = {"ipv4", "date", "email"};
    bool capitals = false;
    std::vector<std::string> custom_terms;
    std::string terms_file;
};

struct KeyConfig {
    bool encrypt = false;
    bool obfuscate = false;
    std::string passphrase;
    int64_t scrypt_n = 32768;
    int64_t scrypt_r = 8;
    int64_t scrypt_p = 1;
};

/**
 * @brief Complete parsed configuration
 */
struct VectureConfig {
    LoggingConfig logging;
    RedactionConfig redaction;
    std::unordered_map<std::string, std::string> patterns;   // class name → regex
    KeyConfig key;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        VectureConfig config;

        static LoadResult ok(VectureConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to vecture.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /// Load config from TOML text
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Collect every validation problem (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const VectureConfig& config);

    /**
     * @brief Build Redactor options from a validated config
     *
     * Reads `redaction.terms_file` if set.
     * @return INVALID_INPUT if the terms file cannot be read
     */
    [[nodiscard]] static Result<Redactor::Options> to_redactor_options(const VectureConfig& config);

    /// Newline-delimited term list; lines trimmed, blank lines dropped
    [[nodiscard]] static Result<std::vector<std::string>> read_terms_file(const std::string& path);

    /// "info" | "warn" | "error" (case-insensitive)
    [[nodiscard]] static std::optional<utils::log::Level> parse_log_level(const std::string& level);

private:
    static VectureConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static RedactionConfig extract_redaction(const toml::table& root);
    static std::unordered_map<std::string, std::string> extract_patterns(const toml::table& root);
    static KeyConfig extract_key(const toml::table& root);

    static LoadResult validate_and_return(VectureConfig config);
};

} // namespace vecture
