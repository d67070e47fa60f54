#include "codec/key_codec.hpp"
#include "codec/key_compressor.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <stdexcept>

namespace vecture {

namespace {

constexpr std::string_view kKdfName = "scrypt";
constexpr std::string_view kCipherName = "aes-256-gcm";

std::string envelope_aad() {
    return std::format("{}/v{}", kKeyFormatName, kEnvelopeVersion);
}

Result<KeyPayload> unsupported(std::string message) {
    return Result<KeyPayload>::error(ErrorCode::UNSUPPORTED_FORMAT, std::move(message));
}

Result<KeyPayload> decryption_failed(std::string message) {
    return Result<KeyPayload>::error(ErrorCode::DECRYPTION_ERROR, std::move(message));
}

} // anonymous namespace

// ============================================================================
// Encoding
// ============================================================================

KeyPayload KeyCodec::encode(
    std::vector<DisplacementRecord> records,
    std::string_view sanitized,
    RedactionStyle style) {

    KeyPayload payload;
    payload.format_version = kKeyFormatVersion;
    payload.style = style;
    payload.sanitized_digest = Crypto::sha256(sanitized);
    payload.records = std::move(records);
    return payload;
}

std::string KeyCodec::payload_to_json(const KeyPayload& payload) {
    std::string out;
    out.reserve(128 + payload.records.size() * 96);

    out += std::format("{{\"format_version\":{},\"style\":\"{}\",\"digest\":\"{}\",\"records\":[",
        payload.format_version,
        style_to_string(payload.style),
        utils::bytes_to_hex(payload.sanitized_digest.data(), payload.sanitized_digest.size()));

    for (size_t i = 0; i < payload.records.size(); ++i) {
        const auto& rec = payload.records[i];
        out += (i == 0) ? "\n" : ",\n";
        out += std::format(
            "{{\"start\":{},\"end\":{},\"category\":\"{}\",\"original\":\"{}\",\"rendered\":\"{}\"}}",
            rec.span.start, rec.span.end,
            category_to_string(rec.category()),
            utils::escape_json(rec.original),
            utils::escape_json(rec.rendered));
    }
    if (!payload.records.empty()) out += '\n';
    out += "]}";
    return out;
}

Result<std::string> KeyCodec::build_encrypted_envelope(
    const std::string& payload_json,
    const Options& options) {

    if (options.passphrase.empty()) {
        return Result<std::string>::error(ErrorCode::INVALID_INPUT,
            "Encrypted key requested without a passphrase");
    }
    if (!Crypto::valid_scrypt_params(options.scrypt)) {
        return Result<std::string>::error(ErrorCode::INVALID_INPUT,
            std::format("Invalid scrypt parameters (n={}, r={}, p={})",
                        options.scrypt.n, options.scrypt.r, options.scrypt.p));
    }

    try {
        auto salt = Crypto::random_bytes(Crypto::kSaltLen);
        auto key = Crypto::derive_key_async(options.passphrase, salt, options.scrypt).get();
        if (!key) {
            return Result<std::string>::error(ErrorCode::INVALID_INPUT, "Key derivation failed");
        }

        const auto sealed = Crypto::seal(*key, payload_json, envelope_aad());
        if (!sealed) {
            return Result<std::string>::error(ErrorCode::INVALID_INPUT, "Payload encryption failed");
        }

        return Result<std::string>::ok(std::format(
            "{{\"format\":\"{}\",\"version\":{},\"encrypted\":true,"
            "\"kdf\":{{\"name\":\"{}\",\"n\":{},\"r\":{},\"p\":{},\"salt\":\"{}\"}},"
            "\"cipher\":{{\"name\":\"{}\",\"nonce\":\"{}\"}},"
            "\"ciphertext\":\"{}\"}}\n",
            kKeyFormatName, kEnvelopeVersion,
            kKdfName, options.scrypt.n, options.scrypt.r, options.scrypt.p,
            base64::encode(salt),
            kCipherName, base64::encode(sealed->nonce),
            base64::encode(sealed->ciphertext)));
    } catch (const std::exception& e) {
        return Result<std::string>::error(ErrorCode::INVALID_INPUT,
            std::format("Key encryption failed: {}", e.what()));
    }
}

Result<std::string> KeyCodec::serialize(const KeyPayload& payload, const Options& options) {
    const std::string payload_json = payload_to_json(payload);

    if (options.encoding == KeyEncoding::ENCRYPTED) {
        return build_encrypted_envelope(payload_json, options);
    }

    std::string envelope = std::format(
        "{{\"format\":\"{}\",\"version\":{},\"encrypted\":false,\"payload\":{}}}\n",
        kKeyFormatName, kEnvelopeVersion, payload_json);

    if (options.encoding == KeyEncoding::PLAIN) {
        return Result<std::string>::ok(std::move(envelope));
    }

    const auto compressed = KeyCompressor::compress(envelope);
    if (!compressed) {
        return Result<std::string>::error(ErrorCode::INVALID_INPUT, "Key compression failed");
    }
    std::string out(kObfuscatedPrefix);
    out += base64::encode(reinterpret_cast<const uint8_t*>(compressed->data()), compressed->size());
    out += '\n';
    return Result<std::string>::ok(std::move(out));
}

// ============================================================================
// Decoding
// ============================================================================

Result<std::string> KeyCodec::unwrap_obfuscation(std::string_view bytes) {
    std::string text = utils::trim(std::string(bytes));
    if (!text.starts_with(kObfuscatedPrefix)) {
        return Result<std::string>::ok(std::move(text));
    }

    const auto packed = base64::decode(std::string_view(text).substr(kObfuscatedPrefix.size()));
    if (!packed || packed->empty()) {
        return Result<std::string>::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Invalid obfuscated key: bad base64");
    }

    auto inflated = KeyCompressor::decompress(
        std::string_view(reinterpret_cast<const char*>(packed->data()), packed->size()));
    if (!inflated) {
        return Result<std::string>::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Invalid obfuscated key: bad compressed stream");
    }
    return Result<std::string>::ok(std::move(*inflated));
}

Result<JsonValue> KeyCodec::parse_envelope(const std::string& json) {
    JsonValue envelope;
    try {
        envelope = JsonValue::parse(json);
    } catch (const JsonValue::parse_error&) {
        return Result<JsonValue>::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Invalid key file: not a JSON key envelope");
    }

    if (!envelope.is_object() || envelope.string_at("format") != std::string(kKeyFormatName)) {
        return Result<JsonValue>::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Invalid key file: missing vecture-key format tag");
    }

    const auto version = envelope.uint_at("version");
    if (!version || *version != kEnvelopeVersion) {
        return Result<JsonValue>::error(ErrorCode::UNSUPPORTED_FORMAT,
            std::format("Unsupported key envelope version: {}",
                        version ? std::to_string(*version) : std::string("<missing>")));
    }

    if (!envelope.bool_at("encrypted")) {
        return Result<JsonValue>::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Invalid key file: missing encrypted flag");
    }
    return Result<JsonValue>::ok(std::move(envelope));
}

Result<KeyCodec::EnvelopeInfo> KeyCodec::inspect(std::string_view bytes) {
    auto text = unwrap_obfuscation(bytes);
    if (text.is_error()) return Result<EnvelopeInfo>::forward_error(text);

    auto envelope = parse_envelope(text.value());
    if (envelope.is_error()) return Result<EnvelopeInfo>::forward_error(envelope);

    EnvelopeInfo info;
    info.version = static_cast<uint32_t>(*envelope.value().uint_at("version"));
    info.encrypted = *envelope.value().bool_at("encrypted");
    info.obfuscated = utils::trim(std::string(bytes)).starts_with(kObfuscatedPrefix);
    return Result<EnvelopeInfo>::ok(info);
}

Result<KeyPayload> KeyCodec::decrypt_envelope(
    const JsonValue& envelope,
    const std::optional<std::string>& passphrase) {

    if (!passphrase || passphrase->empty()) {
        return decryption_failed("Key is encrypted and no passphrase was supplied");
    }

    const auto kdf = envelope["kdf"];
    const auto cipher = envelope["cipher"];

    if (kdf.string_at("name") != std::string(kKdfName) ||
        cipher.string_at("name") != std::string(kCipherName)) {
        return unsupported("Unsupported key encryption scheme");
    }

    const auto n = kdf.uint_at("n");
    const auto r = kdf.uint_at("r");
    const auto p = kdf.uint_at("p");
    const auto salt_b64 = kdf.string_at("salt");
    const auto nonce_b64 = cipher.string_at("nonce");
    const auto ct_b64 = envelope.string_at("ciphertext");
    if (!n || !r || !p || !salt_b64 || !nonce_b64 || !ct_b64) {
        return decryption_failed("Corrupted key envelope: missing encryption fields");
    }

    Crypto::ScryptParams params;
    params.n = *n;
    params.r = static_cast<uint32_t>(*r);
    params.p = static_cast<uint32_t>(*p);
    if (*r > UINT32_MAX || *p > UINT32_MAX || !Crypto::valid_scrypt_params(params)) {
        return decryption_failed("Corrupted key envelope: invalid KDF parameters");
    }

    const auto salt = base64::decode(*salt_b64);
    const auto nonce = base64::decode(*nonce_b64);
    const auto ciphertext = base64::decode(*ct_b64);
    if (!salt || !nonce || !ciphertext || salt->empty()) {
        return decryption_failed("Corrupted key envelope: bad base64 field");
    }

    std::optional<std::vector<uint8_t>> key;
    try {
        key = Crypto::derive_key_async(*passphrase, *salt, params).get();
    } catch (const std::exception& e) {
        return decryption_failed(std::format("Key derivation failed: {}", e.what()));
    }
    if (!key) {
        return decryption_failed("Key derivation failed");
    }

    const auto plaintext = Crypto::open(*key, *nonce, *ciphertext, envelope_aad());
    if (!plaintext) {
        return decryption_failed("Decryption failed: wrong passphrase or corrupted key");
    }

    JsonValue payload;
    try {
        payload = JsonValue::parse(*plaintext);
    } catch (const JsonValue::parse_error&) {
        return unsupported("Decrypted payload is not valid JSON");
    }
    return payload_from_json(payload);
}

Result<KeyPayload> KeyCodec::decode(
    std::string_view bytes,
    const std::optional<std::string>& passphrase) {

    auto text = unwrap_obfuscation(bytes);
    if (text.is_error()) return Result<KeyPayload>::forward_error(text);

    auto envelope = parse_envelope(text.value());
    if (envelope.is_error()) return Result<KeyPayload>::forward_error(envelope);

    const auto& env = envelope.value();
    if (*env.bool_at("encrypted")) {
        return decrypt_envelope(env, passphrase);
    }
    return payload_from_json(env["payload"]);
}

Result<KeyPayload> KeyCodec::payload_from_json(const JsonValue& node) {
    if (!node.is_object()) {
        return unsupported("Key payload missing");
    }

    const auto version = node.uint_at("format_version");
    if (!version || *version != kKeyFormatVersion) {
        return unsupported(std::format("Unsupported key payload version: {}",
            version ? std::to_string(*version) : std::string("<missing>")));
    }

    KeyPayload payload;
    payload.format_version = static_cast<uint32_t>(*version);

    const auto style_name = node.string_at("style");
    const auto style = style_name ? parse_style(*style_name) : std::nullopt;
    if (!style) {
        return unsupported(std::format("Unknown redaction style: {}", style_name.value_or("<missing>")));
    }
    payload.style = *style;

    const auto digest_hex = node.string_at("digest");
    const auto digest = digest_hex ? utils::hex_to_bytes(*digest_hex) : std::vector<uint8_t>{};
    if (digest.size() != kDigestSize) {
        return unsupported("Key payload digest must be 64 hex characters");
    }
    std::copy(digest.begin(), digest.end(), payload.sanitized_digest.begin());

    const auto records = node["records"];
    if (!records.is_array()) {
        return unsupported("Key payload records missing");
    }

    payload.records.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        const auto rec = records[i];
        const auto start = rec.uint_at("start");
        const auto end = rec.uint_at("end");
        const auto category_name = rec.string_at("category");
        auto original = rec.string_at("original");
        auto rendered = rec.string_at("rendered");
        const auto category = category_name ? parse_category(*category_name) : std::nullopt;

        if (!start || !end || !category || !original || !rendered) {
            return unsupported(std::format("Malformed displacement record #{}", i));
        }

        payload.records.emplace_back(
            Span(static_cast<size_t>(*start), static_cast<size_t>(*end), *category),
            std::move(*original), std::move(*rendered));
    }

    return Result<KeyPayload>::ok(std::move(payload));
}

} // namespace vecture
