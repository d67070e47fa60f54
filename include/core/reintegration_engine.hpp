#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace vecture {

/**
 * @brief Reintegration engine - rebuilds the original from sanitized text + key
 *
 * Verifies the sanitized digest first, then replays the records in order.
 * Each rendered text is expected at the sanitized offset implied by the
 * previous record (cursor + gap in original coordinates); it is never
 * searched for.
 */
class ReintegrationEngine {
public:
    /**
     * @brief Restore the original document
     * @return INTEGRITY_ERROR if the sanitized bytes do not match the digest,
     *         RECORD_MISMATCH if the records are inconsistent with the document
     */
    [[nodiscard]] static Result<std::string> restore(
        std::string_view sanitized,
        const KeyPayload& payload);

    /// Digest check only
    [[nodiscard]] static bool verify(std::string_view sanitized, const KeyPayload& payload);
};

} // namespace vecture
