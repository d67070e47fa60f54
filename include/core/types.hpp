#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vecture {

// ============================================================================
// Basic Enums
// ============================================================================

// Declaration order is the tie-break priority used by the span resolver:
// earlier entries win when two candidates start at the same offset.
enum class Category : uint8_t {
    IPV4,
    DATE,
    EMAIL,
    CUSTOM_TERM,
    CAPITALIZED_HEURISTIC
};

inline constexpr std::array<Category, 5> kAllCategories = {
    Category::IPV4,
    Category::DATE,
    Category::EMAIL,
    Category::CUSTOM_TERM,
    Category::CAPITALIZED_HEURISTIC,
};

enum class RedactionStyle : uint8_t {
    CLASSIC,    // fixed marker, length-changing
    BLACKOUT,   // block glyph run, length-preserving
    NOISE       // random alphanumerics, length-preserving
};

// ============================================================================
// Span / Displacement Record
// ============================================================================

/**
 * @brief Half-open byte range [start, end) into the original document
 */
struct Span {
    size_t start = 0;
    size_t end = 0;
    Category category = Category::IPV4;

    Span() = default;
    Span(size_t s, size_t e, Category c) : start(s), end(e), category(c) {}

    [[nodiscard]] size_t length() const { return end - start; }
    [[nodiscard]] bool empty() const { return end <= start; }

    bool operator==(const Span&) const = default;
};

/**
 * @brief Reversible mapping from one span's original text to its rendering
 *
 * `span` is in original-document coordinates. The position of `rendered`
 * in the sanitized document is implied by walking the record list in order.
 */
struct DisplacementRecord {
    Span span;
    std::string original;
    std::string rendered;

    DisplacementRecord() = default;
    DisplacementRecord(Span s, std::string orig, std::string rend)
        : span(s), original(std::move(orig)), rendered(std::move(rend)) {}

    [[nodiscard]] Category category() const { return span.category; }

    bool operator==(const DisplacementRecord&) const = default;
};

// ============================================================================
// Key Payload
// ============================================================================

inline constexpr uint32_t kKeyFormatVersion = 1;
inline constexpr size_t kDigestSize = 32;   // SHA-256

using Digest = std::array<uint8_t, kDigestSize>;

struct KeyPayload {
    uint32_t format_version = kKeyFormatVersion;
    RedactionStyle style = RedactionStyle::CLASSIC;
    Digest sanitized_digest{};
    std::vector<DisplacementRecord> records;

    bool operator==(const KeyPayload&) const = default;
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* category_to_string(Category category) {
    switch (category) {
        case Category::IPV4: return "IPv4";
        case Category::DATE: return "Date";
        case Category::EMAIL: return "Email";
        case Category::CUSTOM_TERM: return "CustomTerm";
        case Category::CAPITALIZED_HEURISTIC: return "CapitalizedHeuristic";
        default: return "Unknown";
    }
}

inline const char* style_to_string(RedactionStyle style) {
    switch (style) {
        case RedactionStyle::CLASSIC: return "CLASSIC";
        case RedactionStyle::BLACKOUT: return "BLACKOUT";
        case RedactionStyle::NOISE: return "NOISE";
        default: return "UNKNOWN";
    }
}

/// Inverse of category_to_string (exact, case-sensitive)
[[nodiscard]] std::optional<Category> parse_category(std::string_view name);

/// Case-insensitive class name used in config ("ipv4", "date", "email", ...)
[[nodiscard]] std::optional<Category> parse_class_name(std::string_view name);

/// Case-insensitive style name; accepts the legacy "VECTURE_NOISE" alias
[[nodiscard]] std::optional<RedactionStyle> parse_style(std::string_view name);

} // namespace vecture
