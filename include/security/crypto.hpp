#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vecture {

/**
 * @brief OpenSSL-backed primitives for the key codec
 *
 * - SHA-256 document digests
 * - scrypt passphrase derivation (memory-hard)
 * - AES-256-GCM authenticated encryption
 *
 * All functions are stateless and safe to call from multiple threads.
 */
class Crypto {
public:
    static constexpr size_t kKeyLen = 32;    // AES-256
    static constexpr size_t kNonceLen = 12;  // GCM IV
    static constexpr size_t kTagLen = 16;
    static constexpr size_t kSaltLen = 16;

    struct ScryptParams {
        uint64_t n = 32768;   // CPU/memory cost, power of two
        uint32_t r = 8;       // block size
        uint32_t p = 1;       // parallelism
    };

    // SHA-256 of the exact input bytes
    [[nodiscard]] static Digest sha256(std::string_view data);

    // Constant-time digest comparison
    [[nodiscard]] static bool digest_equal(const Digest& a, const Digest& b);

    // Cryptographically secure random bytes; throws std::runtime_error on RNG failure
    [[nodiscard]] static std::vector<uint8_t> random_bytes(size_t count);

    /**
     * @brief Derive a 256-bit key with scrypt
     * @return nullopt if OpenSSL rejects the parameters
     */
    [[nodiscard]] static std::optional<std::vector<uint8_t>> derive_key(
        std::string_view passphrase,
        const std::vector<uint8_t>& salt,
        const ScryptParams& params);

    /// derive_key on a worker task; the passphrase is copied into the task
    [[nodiscard]] static std::future<std::optional<std::vector<uint8_t>>> derive_key_async(
        std::string passphrase,
        std::vector<uint8_t> salt,
        ScryptParams params);

    struct Sealed {
        std::vector<uint8_t> nonce;
        std::vector<uint8_t> ciphertext;   // ciphertext || tag
    };

    /**
     * @brief AES-256-GCM encrypt with a fresh random nonce
     * @return nullopt on key size or OpenSSL failure
     */
    [[nodiscard]] static std::optional<Sealed> seal(
        const std::vector<uint8_t>& key,
        std::string_view plaintext,
        std::string_view aad);

    /**
     * @brief AES-256-GCM decrypt and verify
     * @return nullopt if authentication fails (wrong key, tampered data)
     */
    [[nodiscard]] static std::optional<std::string> open(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& ciphertext,
        std::string_view aad);

    // Valid scrypt parameters accepted by this build
    [[nodiscard]] static bool valid_scrypt_params(const ScryptParams& params);
};

} // namespace vecture
