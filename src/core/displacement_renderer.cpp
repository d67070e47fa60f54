#include "core/displacement_renderer.hpp"
#include "core/span_resolver.hpp"
#include "core/utils.hpp"

#include <format>

namespace vecture {

namespace {

constexpr std::string_view kNoiseAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

// Attempts at an unused NOISE string before accepting a repeat
constexpr int kMaxNoiseAttempts = 16;

} // anonymous namespace

std::string DisplacementRenderer::blackout(size_t length) {
    std::string result;
    result.reserve(length * kBlackoutGlyph.size());
    for (size_t i = 0; i < length; ++i) {
        result.append(kBlackoutGlyph);
    }
    return result;
}

std::string DisplacementRenderer::NoiseGenerator::random_string(size_t length) {
    std::uniform_int_distribution<size_t> dist(0, kNoiseAlphabet.size() - 1);
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += kNoiseAlphabet[dist(rng_)];
    }
    return result;
}

// Steps through the alphabet odometer-style from a colliding candidate. Within
// issued_.size() + 1 steps a free string turns up unless every string of this
// length is already taken, in which case the collision is accepted.
std::string DisplacementRenderer::NoiseGenerator::next_unused(std::string candidate) const {
    const std::string start = candidate;
    for (size_t step = 0; step <= issued_.size(); ++step) {
        size_t pos = candidate.size();
        while (pos > 0) {
            --pos;
            const size_t idx = kNoiseAlphabet.find(candidate[pos]);
            if (idx + 1 < kNoiseAlphabet.size()) {
                candidate[pos] = kNoiseAlphabet[idx + 1];
                break;
            }
            candidate[pos] = kNoiseAlphabet.front();
        }
        if (!issued_.contains(candidate)) return candidate;
        if (candidate == start) break;
    }
    return start;
}

std::string DisplacementRenderer::NoiseGenerator::next(std::string_view original, size_t length) {
    const std::string key(original);
    const auto cached = by_original_.find(key);
    if (cached != by_original_.end()) {
        return cached->second;
    }

    std::string candidate = random_string(length);
    for (int attempt = 1; attempt < kMaxNoiseAttempts && issued_.contains(candidate); ++attempt) {
        candidate = random_string(length);
    }
    if (issued_.contains(candidate)) {
        candidate = next_unused(std::move(candidate));
    }

    issued_.insert(candidate);
    by_original_.emplace(key, candidate);
    return candidate;
}

Result<DisplacementRenderer::Output> DisplacementRenderer::render(
    std::string_view text,
    const std::vector<Span>& spans,
    RedactionStyle style,
    std::optional<uint64_t> noise_seed) {

    if (!SpanResolver::is_canonical(spans)) {
        return Result<Output>::error(ErrorCode::INVALID_INPUT,
            "Spans must be sorted, non-empty and non-overlapping");
    }
    if (!spans.empty() && spans.back().end > text.size()) {
        return Result<Output>::error(ErrorCode::INVALID_INPUT,
            std::format("Span [{}, {}) exceeds document length {}",
                        spans.back().start, spans.back().end, text.size()));
    }

    std::optional<NoiseGenerator> noise;
    if (style == RedactionStyle::NOISE) {
        noise.emplace(noise_seed.value_or(std::random_device{}()));
    }

    Output out;
    out.sanitized.reserve(text.size());
    out.records.reserve(spans.size());

    size_t cursor = 0;
    for (const auto& span : spans) {
        out.sanitized.append(text.substr(cursor, span.start - cursor));

        const auto original = text.substr(span.start, span.length());
        std::string rendered;
        switch (style) {
            case RedactionStyle::CLASSIC:
                rendered = std::string(kClassicMarker);
                break;
            case RedactionStyle::BLACKOUT:
                rendered = blackout(utils::utf8_length(original));
                break;
            case RedactionStyle::NOISE:
                rendered = noise->next(original, utils::utf8_length(original));
                break;
        }

        out.sanitized.append(rendered);
        out.records.emplace_back(span, std::string(original), std::move(rendered));
        cursor = span.end;
    }
    out.sanitized.append(text.substr(cursor));

    return Result<Output>::ok(std::move(out));
}

} // namespace vecture
