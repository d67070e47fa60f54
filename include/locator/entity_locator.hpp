#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "locator/entity_detector.hpp"
#include "locator/pattern_detectors.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vecture {

/**
 * @brief Entity locator - runs the enabled detectors over a document
 *
 * Each detector scans independently; classes do not suppress each other at
 * this stage. The combined output is deduplicated and sorted by
 * (start, category, end). Overlaps between classes are left in place for
 * SpanResolver.
 */
class EntityLocator {
public:
    struct Config {
        std::vector<Category> enabled_classes;
        std::vector<std::string> custom_terms;
        // Replaces the default regex of a structural class
        std::unordered_map<Category, std::string> pattern_overrides;
        CapitalizedHeuristicDetector::Config heuristic;
    };

    /**
     * @brief Build a locator with one detector per enabled class
     * @return INVALID_PATTERN on an uncompilable pattern or empty term
     */
    [[nodiscard]] static Result<EntityLocator> create(const Config& config);

    /**
     * @brief One-shot convenience: build default detectors and scan
     */
    [[nodiscard]] static Result<std::vector<Span>> locate(
        std::string_view text,
        const std::vector<Category>& enabled_classes,
        const std::vector<std::string>& custom_terms);

    /// Add an extra detector (e.g. a caller-supplied heuristic)
    void register_detector(std::shared_ptr<const IEntityDetector> detector);

    [[nodiscard]] std::vector<Span> locate(std::string_view text) const;

    [[nodiscard]] size_t detector_count() const { return detectors_.size(); }

private:
    EntityLocator() = default;

    std::vector<std::shared_ptr<const IEntityDetector>> detectors_;
};

} // namespace vecture
