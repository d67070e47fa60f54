#pragma once

#include "codec/key_codec.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "locator/entity_locator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vecture {

/**
 * @brief Redactor - sever and restore documents end to end
 *
 * sever:   locate → resolve → render → encode → serialize
 * restore: decode → reintegrate
 *
 * Both directions are all-or-nothing; a failure yields a typed error and
 * no partial output.
 */
class Redactor {
public:
    struct Options {
        std::vector<Category> enabled_classes = {
            Category::IPV4, Category::DATE, Category::EMAIL};
        std::vector<std::string> custom_terms;     // enables CUSTOM_TERM when non-empty
        std::unordered_map<Category, std::string> pattern_overrides;
        RedactionStyle style = RedactionStyle::CLASSIC;
        std::optional<uint64_t> noise_seed;        // deterministic NOISE (tests)
        KeyCodec::Options key;
    };

    struct SeverResult {
        std::string sanitized;
        KeyPayload payload;
        std::string key_file;      // serialized key artifact
    };

    explicit Redactor(Options options);

    [[nodiscard]] Result<SeverResult> sever(std::string_view text) const;

    /**
     * @brief Restore the original document
     * @param sanitized Sanitized document bytes
     * @param key_bytes Key artifact (plain, encrypted or obfuscated)
     * @param passphrase Required for encrypted keys
     */
    [[nodiscard]] static Result<std::string> restore(
        std::string_view sanitized,
        std::string_view key_bytes,
        const std::optional<std::string>& passphrase = std::nullopt);

    [[nodiscard]] const Options& options() const { return options_; }

private:
    [[nodiscard]] EntityLocator::Config locator_config() const;

    Options options_;
};

} // namespace vecture
