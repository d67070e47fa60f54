#pragma once

#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace vecture {

/**
 * @brief Detection capability for one pattern class
 *
 * Implementations scan the whole document and return every non-overlapping
 * match of their own class, sorted by start offset. Detectors are stateless
 * after construction and may be shared across threads.
 */
class IEntityDetector {
public:
    virtual ~IEntityDetector() = default;

    [[nodiscard]] virtual Category category() const = 0;
    [[nodiscard]] virtual std::vector<Span> detect(std::string_view text) const = 0;
};

} // namespace vecture
