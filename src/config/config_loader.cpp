#include "config/config_loader.hpp"
#include "locator/pattern_detectors.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std::string_literals;

namespace vecture {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

bool is_structural(Category category) {
    return category == Category::IPV4 || category == Category::DATE || category == Category::EMAIL;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<utils::log::Level> ConfigLoader::parse_log_level(const std::string& level) {
    const std::string lower = utils::to_lower(level);
    if (lower == "info") return utils::log::Level::INFO;
    if (lower == "warn" || lower == "warning") return utils::log::Level::WARN;
    if (lower == "error") return utils::log::Level::ERROR;
    return std::nullopt;
}

Result<std::vector<std::string>> ConfigLoader::read_terms_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<std::vector<std::string>>::error(ErrorCode::INVALID_INPUT,
            std::format("Cannot open terms file: {}", path));
    }

    std::vector<std::string> terms;
    std::string line;
    while (std::getline(file, line)) {
        auto term = utils::trim(line);
        if (!term.empty()) {
            terms.emplace_back(std::move(term));
        }
    }
    if (file.bad()) {
        return Result<std::vector<std::string>>::error(ErrorCode::INVALID_INPUT,
            std::format("Failed reading terms file: {}", path));
    }
    return Result<std::vector<std::string>>::ok(std::move(terms));
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

RedactionConfig ConfigLoader::extract_redaction(const toml::table& root) {
    RedactionConfig cfg;
    const auto* redaction = root["redaction"].as_table();
    if (!redaction) return cfg;
    const auto& r = *redaction;

    cfg.style = r["style"].value_or("CLASSIC"s);
    if (r["classes"].is_array()) {
        cfg.classes = toml_string_array(r, "classes");
    }
    cfg.capitals = r["capitals"].value_or(false);
    cfg.custom_terms = toml_string_array(r, "custom_terms");
    cfg.terms_file = r["terms_file"].value_or(""s);
    return cfg;
}

std::unordered_map<std::string, std::string> ConfigLoader::extract_patterns(const toml::table& root) {
    std::unordered_map<std::string, std::string> patterns;
    if (const auto* tbl = root["patterns"].as_table()) {
        for (const auto& [key, val] : *tbl) {
            if (const auto* s = val.as_string()) {
                patterns.emplace(std::string(key.str()), s->get());
            }
        }
    }
    return patterns;
}

KeyConfig ConfigLoader::extract_key(const toml::table& root) {
    KeyConfig cfg;
    const auto* key = root["key"].as_table();
    if (!key) return cfg;
    const auto& k = *key;

    cfg.encrypt = k["encrypt"].value_or(false);
    cfg.obfuscate = k["obfuscate"].value_or(false);
    cfg.passphrase = k["passphrase"].value_or(""s);
    cfg.scrypt_n = k["scrypt_n"].value_or(int64_t{32768});
    cfg.scrypt_r = k["scrypt_r"].value_or(int64_t{8});
    cfg.scrypt_p = k["scrypt_p"].value_or(int64_t{1});
    return cfg;
}

VectureConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    VectureConfig config;
    config.logging = extract_logging(root);
    config.redaction = extract_redaction(root);
    config.patterns = extract_patterns(root);
    config.key = extract_key(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(VectureConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const VectureConfig& config) {
    std::vector<std::string> errors;

    if (!parse_log_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
                                     config.logging.level));
    }

    if (!parse_style(config.redaction.style)) {
        errors.push_back(std::format("redaction.style must be CLASSIC, BLACKOUT or NOISE, got '{}'",
                                     config.redaction.style));
    }

    for (const auto& name : config.redaction.classes) {
        if (!parse_class_name(name)) {
            errors.push_back(std::format("redaction.classes: unknown class '{}'", name));
        }
    }

    for (size_t i = 0; i < config.redaction.custom_terms.size(); ++i) {
        if (config.redaction.custom_terms[i].empty()) {
            errors.push_back(std::format("redaction.custom_terms[{}] must not be empty", i));
        }
    }

    for (const auto& [name, pattern] : config.patterns) {
        const auto category = parse_class_name(name);
        if (!category || !is_structural(*category)) {
            errors.push_back(std::format("patterns.{}: only ipv4, date and email can be overridden", name));
            continue;
        }
        const auto compiled = RegexDetector::create(*category, pattern);
        if (compiled.is_error()) {
            errors.push_back(std::format("patterns.{}: {}", name, compiled.error_message()));
        }
    }

    const auto& key = config.key;
    if (key.encrypt && key.obfuscate) {
        errors.push_back("key.encrypt and key.obfuscate are mutually exclusive");
    }

    const bool n_ok = utils::in_range<2, (int64_t{1} << 20)>(key.scrypt_n) &&
                      (key.scrypt_n & (key.scrypt_n - 1)) == 0;
    if (!n_ok) {
        errors.push_back(std::format("key.scrypt_n must be a power of two in 2..1048576, got {}",
                                     key.scrypt_n));
    }
    if (!utils::in_range<1, 32>(key.scrypt_r)) {
        errors.push_back(std::format("key.scrypt_r must be 1-32, got {}", key.scrypt_r));
    }
    if (!utils::in_range<1, 16>(key.scrypt_p)) {
        errors.push_back(std::format("key.scrypt_p must be 1-16, got {}", key.scrypt_p));
    }

    return errors;
}

// ============================================================================
// Redactor options
// ============================================================================

Result<Redactor::Options> ConfigLoader::to_redactor_options(const VectureConfig& config) {
    Redactor::Options options;

    options.enabled_classes.clear();
    for (const auto& name : config.redaction.classes) {
        const auto category = parse_class_name(name);
        if (!category) {
            return Result<Redactor::Options>::error(ErrorCode::INVALID_PATTERN,
                std::format("Unknown class '{}'", name));
        }
        if (std::find(options.enabled_classes.begin(), options.enabled_classes.end(), *category)
                == options.enabled_classes.end()) {
            options.enabled_classes.push_back(*category);
        }
    }
    if (config.redaction.capitals &&
        std::find(options.enabled_classes.begin(), options.enabled_classes.end(),
                  Category::CAPITALIZED_HEURISTIC) == options.enabled_classes.end()) {
        options.enabled_classes.push_back(Category::CAPITALIZED_HEURISTIC);
    }

    options.custom_terms = config.redaction.custom_terms;
    if (!config.redaction.terms_file.empty()) {
        auto terms = read_terms_file(config.redaction.terms_file);
        if (terms.is_error()) {
            return Result<Redactor::Options>::forward_error(terms);
        }
        options.custom_terms.insert(options.custom_terms.end(),
            terms.value().begin(), terms.value().end());
    }

    for (const auto& [name, pattern] : config.patterns) {
        const auto category = parse_class_name(name);
        if (category && is_structural(*category)) {
            options.pattern_overrides[*category] = pattern;
        }
    }

    const auto style = parse_style(config.redaction.style);
    if (!style) {
        return Result<Redactor::Options>::error(ErrorCode::INVALID_INPUT,
            std::format("Unknown style '{}'", config.redaction.style));
    }
    options.style = *style;

    if (config.key.encrypt) {
        options.key.encoding = KeyEncoding::ENCRYPTED;
    } else if (config.key.obfuscate) {
        options.key.encoding = KeyEncoding::OBFUSCATED;
    }
    options.key.passphrase = config.key.passphrase;
    options.key.scrypt.n = static_cast<uint64_t>(config.key.scrypt_n);
    options.key.scrypt.r = static_cast<uint32_t>(config.key.scrypt_r);
    options.key.scrypt.p = static_cast<uint32_t>(config.key.scrypt_p);

    return Result<Redactor::Options>::ok(std::move(options));
}

} // namespace vecture
