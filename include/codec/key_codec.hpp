#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/types.hpp"
#include "security/crypto.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vecture {

inline constexpr std::string_view kKeyFormatName = "vecture-key";
inline constexpr uint32_t kEnvelopeVersion = 1;
inline constexpr std::string_view kObfuscatedPrefix = "VECTURE_KEY:";
inline constexpr std::string_view kKeyFileExtension = ".vecture";

enum class KeyEncoding {
    PLAIN,        // readable JSON envelope
    ENCRYPTED,    // scrypt + AES-256-GCM envelope
    OBFUSCATED    // "VECTURE_KEY:" + base64(zlib(envelope)); not a secrecy boundary
};

/**
 * @brief Key codec - KeyPayload <-> key-file bytes
 *
 * Envelope (JSON):
 *   {"format":"vecture-key","version":1,"encrypted":false,"payload":{...}}
 *   {"format":"vecture-key","version":1,"encrypted":true,
 *    "kdf":{"name":"scrypt","n":..,"r":..,"p":..,"salt":"<b64>"},
 *    "cipher":{"name":"aes-256-gcm","nonce":"<b64>"},
 *    "ciphertext":"<b64(ct || tag)>"}
 *
 * The envelope version is bound as GCM additional data. Decoding dispatches
 * once on (obfuscated prefix, encrypted flag) and shares payload parsing.
 *
 * Error mapping:
 * - unknown envelope/payload version, unparseable JSON → UNSUPPORTED_FORMAT
 * - missing passphrase, wrong passphrase, damaged crypto fields → DECRYPTION_ERROR
 */
class KeyCodec {
public:
    struct Options {
        KeyEncoding encoding = KeyEncoding::PLAIN;
        std::string passphrase;                 // required for ENCRYPTED
        Crypto::ScryptParams scrypt;
    };

    struct EnvelopeInfo {
        uint32_t version = 0;
        bool encrypted = false;
        bool obfuscated = false;
    };

    /**
     * @brief Build the payload for a freshly rendered document
     * @param records Displacement records in span order
     * @param sanitized Exact sanitized bytes (digest input)
     * @param style Style used to render
     */
    [[nodiscard]] static KeyPayload encode(
        std::vector<DisplacementRecord> records,
        std::string_view sanitized,
        RedactionStyle style);

    /// Serialize a payload into key-file bytes
    [[nodiscard]] static Result<std::string> serialize(
        const KeyPayload& payload,
        const Options& options);

    /**
     * @brief Parse key-file bytes back into a payload
     * @param bytes Key file contents
     * @param passphrase Needed only for encrypted keys
     */
    [[nodiscard]] static Result<KeyPayload> decode(
        std::string_view bytes,
        const std::optional<std::string>& passphrase = std::nullopt);

    /// Read envelope header fields without decrypting
    [[nodiscard]] static Result<EnvelopeInfo> inspect(std::string_view bytes);

    // Payload JSON (also the plaintext that gets encrypted)
    [[nodiscard]] static std::string payload_to_json(const KeyPayload& payload);
    [[nodiscard]] static Result<KeyPayload> payload_from_json(const JsonValue& node);

private:
    [[nodiscard]] static Result<std::string> unwrap_obfuscation(std::string_view bytes);
    [[nodiscard]] static Result<JsonValue> parse_envelope(const std::string& json);
    [[nodiscard]] static Result<KeyPayload> decrypt_envelope(
        const JsonValue& envelope,
        const std::optional<std::string>& passphrase);
    [[nodiscard]] static Result<std::string> build_encrypted_envelope(
        const std::string& payload_json,
        const Options& options);
};

} // namespace vecture
