#include "locator/entity_locator.hpp"

#include <algorithm>
#include <unordered_set>

namespace vecture {

Result<EntityLocator> EntityLocator::create(const Config& config) {
    EntityLocator locator;

    // A class listed twice still gets one detector
    std::unordered_set<Category> seen;

    for (const auto category : config.enabled_classes) {
        if (!seen.insert(category).second) continue;

        switch (category) {
            case Category::IPV4:
            case Category::DATE:
            case Category::EMAIL: {
                const auto override_it = config.pattern_overrides.find(category);
                auto detector = (override_it != config.pattern_overrides.end())
                    ? RegexDetector::create(category, override_it->second,
                          category == Category::IPV4 ? RegexDetector::Validator(validate_ipv4)
                                                     : RegexDetector::Validator{})
                    : RegexDetector::create_default(category);
                if (detector.is_error()) {
                    return Result<EntityLocator>::forward_error(detector);
                }
                locator.detectors_.push_back(std::move(detector.value()));
                break;
            }

            case Category::CUSTOM_TERM: {
                if (config.custom_terms.empty()) break;
                auto detector = CustomTermDetector::create(config.custom_terms);
                if (detector.is_error()) {
                    return Result<EntityLocator>::forward_error(detector);
                }
                locator.detectors_.push_back(std::move(detector.value()));
                break;
            }

            case Category::CAPITALIZED_HEURISTIC:
                locator.detectors_.push_back(
                    std::make_shared<CapitalizedHeuristicDetector>(config.heuristic));
                break;
        }
    }

    return Result<EntityLocator>::ok(std::move(locator));
}

Result<std::vector<Span>> EntityLocator::locate(
    std::string_view text,
    const std::vector<Category>& enabled_classes,
    const std::vector<std::string>& custom_terms) {

    Config config;
    config.enabled_classes = enabled_classes;
    config.custom_terms = custom_terms;

    auto locator = create(config);
    if (locator.is_error()) {
        return Result<std::vector<Span>>::forward_error(locator);
    }
    return Result<std::vector<Span>>::ok(locator.value().locate(text));
}

void EntityLocator::register_detector(std::shared_ptr<const IEntityDetector> detector) {
    if (detector) {
        detectors_.push_back(std::move(detector));
    }
}

std::vector<Span> EntityLocator::locate(std::string_view text) const {
    std::vector<Span> candidates;
    if (text.empty()) return candidates;

    for (const auto& detector : detectors_) {
        auto spans = detector->detect(text);
        candidates.insert(candidates.end(), spans.begin(), spans.end());
    }

    std::sort(candidates.begin(), candidates.end(), [](const Span& a, const Span& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.category != b.category) return a.category < b.category;
        return a.end < b.end;
    });
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
    return candidates;
}

} // namespace vecture
