#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vecture {

inline constexpr std::string_view kClassicMarker = "[REDACTED]";
inline constexpr std::string_view kBlackoutGlyph = "\xE2\x96\x88";   // U+2588 FULL BLOCK

/**
 * @brief Displacement renderer - substitutes canonical spans in one pass
 *
 * Styles:
 * - CLASSIC:  fixed "[REDACTED]" marker regardless of original length
 * - BLACKOUT: one U+2588 per code point of the original
 * - NOISE:    random [A-Za-z0-9] string, one char per code point
 *
 * Walks the spans left to right, copying untouched text verbatim and
 * emitting one DisplacementRecord per span in encounter order.
 */
class DisplacementRenderer {
public:
    struct Output {
        std::string sanitized;
        std::vector<DisplacementRecord> records;
    };

    /**
     * @brief Render the sanitized document
     * @param text Original document
     * @param spans Canonical spans (see SpanResolver)
     * @param style Redaction style
     * @param noise_seed Fixed seed for NOISE (random_device when unset)
     * @return INVALID_INPUT if spans are not canonical or exceed the text
     */
    [[nodiscard]] static Result<Output> render(
        std::string_view text,
        const std::vector<Span>& spans,
        RedactionStyle style,
        std::optional<uint64_t> noise_seed = std::nullopt);

private:
    /**
     * @brief Per-run NOISE source
     *
     * Distinct originals get distinct renderings while the alphabet still
     * has room; repeated originals reuse their first rendering.
     */
    class NoiseGenerator {
    public:
        explicit NoiseGenerator(uint64_t seed) : rng_(seed) {}

        std::string next(std::string_view original, size_t length);

    private:
        std::string random_string(size_t length);
        std::string next_unused(std::string candidate) const;

        std::mt19937_64 rng_;
        std::unordered_map<std::string, std::string> by_original_;
        std::unordered_set<std::string> issued_;
    };

    static std::string blackout(size_t length);
};

} // namespace vecture
