#pragma once

#include "core/error.hpp"
#include "locator/entity_detector.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace vecture {

// Default structural patterns (ECMAScript grammar). Quantifiers stay bounded:
// std::regex recurses per repetition and an open-ended run overflows the stack.
inline constexpr std::string_view kDefaultIpv4Pattern =
    R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)";
inline constexpr std::string_view kDefaultDatePattern =
    R"(\b(?:\d{4}-\d{2}-\d{2}|\d{2}\.\d{2}\.\d{4}|\d{2}/\d{2}/\d{4})\b)";
inline constexpr std::string_view kDefaultEmailPattern =
    R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)";

/**
 * @brief Regex-backed detector for a structural class (IPv4, Date, Email)
 *
 * An optional validator runs on each regex hit to reject structurally
 * impossible values (e.g. IPv4 octets above 255).
 */
class RegexDetector : public IEntityDetector {
public:
    using Validator = std::function<bool(std::string_view)>;

    /**
     * @brief Compile a detector
     * @return INVALID_PATTERN if the pattern does not compile
     */
    [[nodiscard]] static Result<std::shared_ptr<RegexDetector>> create(
        Category category,
        std::string_view pattern,
        Validator validator = {});

    /// Default detector for IPV4 / DATE / EMAIL
    [[nodiscard]] static Result<std::shared_ptr<RegexDetector>> create_default(Category category);

    [[nodiscard]] Category category() const override { return category_; }
    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;

    RegexDetector(Category category, std::regex regex, Validator validator);

private:
    Category category_;
    std::regex regex_;
    Validator validator_;
};

/// All four dotted-quad octets in 0-255
[[nodiscard]] bool validate_ipv4(std::string_view candidate);

/**
 * @brief Case-sensitive exact substring matcher over a term list
 *
 * Every occurrence of every term is reported. Occurrences of the same term
 * never overlap each other; occurrences of different terms may, and are left
 * for the span resolver to merge.
 */
class CustomTermDetector : public IEntityDetector {
public:
    /**
     * @return INVALID_PATTERN if any term is empty
     */
    [[nodiscard]] static Result<std::shared_ptr<CustomTermDetector>> create(
        std::vector<std::string> terms);

    explicit CustomTermDetector(std::vector<std::string> terms);

    [[nodiscard]] Category category() const override { return Category::CUSTOM_TERM; }
    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;

private:
    std::vector<std::string> terms_;
};

/**
 * @brief Flags runs of capitalized words ("Jane Doe", "Acme Corp")
 *
 * A token is [A-Z][a-z]+ delimited by non-letters. Tokens separated by a
 * single space form one run. A run's sentence-initial token is dropped
 * unless skip_sentence_initial is false.
 */
class CapitalizedHeuristicDetector : public IEntityDetector {
public:
    struct Config {
        bool skip_sentence_initial = true;
    };

    CapitalizedHeuristicDetector() : CapitalizedHeuristicDetector(Config{}) {}
    explicit CapitalizedHeuristicDetector(const Config& config);

    [[nodiscard]] Category category() const override { return Category::CAPITALIZED_HEURISTIC; }
    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;

private:
    [[nodiscard]] static bool at_sentence_start(std::string_view text, size_t pos);

    Config config_;
};

} // namespace vecture
