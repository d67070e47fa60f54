#include "core/reintegration_engine.hpp"
#include "security/crypto.hpp"

#include <format>

namespace vecture {

bool ReintegrationEngine::verify(std::string_view sanitized, const KeyPayload& payload) {
    return Crypto::digest_equal(Crypto::sha256(sanitized), payload.sanitized_digest);
}

Result<std::string> ReintegrationEngine::restore(
    std::string_view sanitized,
    const KeyPayload& payload) {

    if (!verify(sanitized, payload)) {
        return Result<std::string>::error(ErrorCode::INTEGRITY_ERROR,
            "sanitized document altered (digest mismatch)");
    }

    std::string restored;
    restored.reserve(sanitized.size());

    size_t cursor = 0;          // sanitized coordinates
    size_t prev_orig_end = 0;   // original coordinates

    for (size_t i = 0; i < payload.records.size(); ++i) {
        const auto& rec = payload.records[i];
        const auto& span = rec.span;

        if (span.empty() || span.start < prev_orig_end) {
            return Result<std::string>::error(ErrorCode::RECORD_MISMATCH,
                std::format("Record #{} span [{}, {}) is empty or out of order",
                            i, span.start, span.end));
        }
        if (rec.original.size() != span.length()) {
            return Result<std::string>::error(ErrorCode::RECORD_MISMATCH,
                std::format("Record #{} original length {} does not match span length {}",
                            i, rec.original.size(), span.length()));
        }

        const size_t gap = span.start - prev_orig_end;
        if (gap > sanitized.size() - cursor) {
            return Result<std::string>::error(ErrorCode::RECORD_MISMATCH,
                std::format("Record #{} starts past the end of the sanitized document", i));
        }
        const size_t expected_pos = cursor + gap;

        if (sanitized.substr(expected_pos, rec.rendered.size()) != rec.rendered) {
            return Result<std::string>::error(ErrorCode::RECORD_MISMATCH,
                std::format("Record #{} rendered text not found at sanitized offset {}",
                            i, expected_pos));
        }

        restored.append(sanitized.substr(cursor, gap));
        restored.append(rec.original);

        cursor = expected_pos + rec.rendered.size();
        prev_orig_end = span.end;
    }

    restored.append(sanitized.substr(cursor));
    return Result<std::string>::ok(std::move(restored));
}

} // namespace vecture
