#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace vecture {

/**
 * @brief zlib (RFC 1950) deflate/inflate for obfuscated key files
 */
class KeyCompressor {
public:
    // Inflate refuses to grow past this many bytes
    static constexpr size_t kMaxInflatedSize = size_t{256} * 1024 * 1024;

    /// Returns compressed data, nullopt on zlib failure
    [[nodiscard]] static std::optional<std::string> compress(std::string_view data);

    /// Returns inflated data, nullopt on corrupt or oversized input
    [[nodiscard]] static std::optional<std::string> decompress(
        std::string_view data,
        size_t max_size = kMaxInflatedSize);
};

} // namespace vecture
