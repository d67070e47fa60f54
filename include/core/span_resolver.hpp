#pragma once

#include "core/types.hpp"

#include <vector>

namespace vecture {

/**
 * @brief Collapses candidate spans into the canonical span list
 *
 * Merge rule: spans that overlap, or touch with zero gap, become one span
 * covering both. The merged span keeps the category of the candidate that
 * started first; equal starts are broken by Category declaration order
 * (IPV4 > DATE > EMAIL > CUSTOM_TERM > CAPITALIZED_HEURISTIC).
 *
 * Output is sorted by start, non-overlapping and non-adjacent, so resolving
 * an already-canonical list returns it unchanged.
 */
class SpanResolver {
public:
    [[nodiscard]] static std::vector<Span> resolve(std::vector<Span> candidates);

    /// Sorted, non-empty, non-overlapping and non-adjacent
    [[nodiscard]] static bool is_canonical(const std::vector<Span>& spans);
};

} // namespace vecture
