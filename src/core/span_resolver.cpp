#include "core/span_resolver.hpp"

#include <algorithm>

namespace vecture {

std::vector<Span> SpanResolver::resolve(std::vector<Span> candidates) {
    candidates.erase(
        std::remove_if(candidates.begin(), candidates.end(),
                       [](const Span& s) { return s.empty(); }),
        candidates.end());

    // Ordering within equal starts decides the surviving category
    std::sort(candidates.begin(), candidates.end(), [](const Span& a, const Span& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.category < b.category;
    });

    std::vector<Span> merged;
    merged.reserve(candidates.size());

    for (const auto& span : candidates) {
        if (!merged.empty() && span.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, span.end);
        } else {
            merged.push_back(span);
        }
    }
    return merged;
}

bool SpanResolver::is_canonical(const std::vector<Span>& spans) {
    for (size_t i = 0; i < spans.size(); ++i) {
        if (spans[i].empty()) return false;
        if (i > 0 && spans[i].start <= spans[i - 1].end) return false;
    }
    return true;
}

} // namespace vecture
