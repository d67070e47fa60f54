#include "security/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <memory>
#include <stdexcept>

namespace vecture {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx make_ctx() {
    return CipherCtx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

// Bounds on KDF cost accepted from key files
constexpr uint64_t kMaxScryptN = uint64_t{1} << 20;
constexpr uint32_t kMaxScryptR = 32;
constexpr uint32_t kMaxScryptP = 16;

} // anonymous namespace

// ============================================================================
// Hashing
// ============================================================================

Digest Crypto::sha256(std::string_view data) {
    Digest digest{};
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
    return digest;
}

bool Crypto::digest_equal(const Digest& a, const Digest& b) {
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> Crypto::random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes;
}

// ============================================================================
// Key derivation
// ============================================================================

bool Crypto::valid_scrypt_params(const ScryptParams& params) {
    const bool n_pow2 = params.n > 1 && (params.n & (params.n - 1)) == 0;
    return n_pow2 && params.n <= kMaxScryptN &&
           params.r >= 1 && params.r <= kMaxScryptR &&
           params.p >= 1 && params.p <= kMaxScryptP;
}

std::optional<std::vector<uint8_t>> Crypto::derive_key(
    std::string_view passphrase,
    const std::vector<uint8_t>& salt,
    const ScryptParams& params) {

    if (!valid_scrypt_params(params)) {
        return std::nullopt;
    }

    // scrypt needs 128*r*(N+2) bytes for V plus 128*r*p for B
    const uint64_t maxmem = 128ULL * params.r * (params.n + 2) +
                            128ULL * params.r * params.p + (1ULL << 20);

    std::vector<uint8_t> key(kKeyLen);
    if (EVP_PBE_scrypt(passphrase.data(), passphrase.size(),
                       salt.data(), salt.size(),
                       params.n, params.r, params.p, maxmem,
                       key.data(), key.size()) != 1) {
        return std::nullopt;
    }
    return key;
}

std::future<std::optional<std::vector<uint8_t>>> Crypto::derive_key_async(
    std::string passphrase,
    std::vector<uint8_t> salt,
    ScryptParams params) {
    return std::async(std::launch::async,
        [pass = std::move(passphrase), s = std::move(salt), params]() {
            return derive_key(pass, s, params);
        });
}

// ============================================================================
// AES-256-GCM
// ============================================================================

std::optional<Crypto::Sealed> Crypto::seal(
    const std::vector<uint8_t>& key,
    std::string_view plaintext,
    std::string_view aad) {

    if (key.size() != kKeyLen) return std::nullopt;

    Sealed sealed;
    sealed.nonce = random_bytes(kNonceLen);

    auto ctx = make_ctx();
    if (!ctx) return std::nullopt;

    std::vector<uint8_t> out(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int out_len = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceLen), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.nonce.data()) != 1) {
        return std::nullopt;
    }

    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                          reinterpret_cast<const uint8_t*>(aad.data()),
                          static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }

    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                          reinterpret_cast<const uint8_t*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return std::nullopt;
    }
    out_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + out_len, &len) != 1) {
        return std::nullopt;
    }
    out_len += len;

    uint8_t tag[kTagLen];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLen), tag) != 1) {
        return std::nullopt;
    }

    // Pack: ciphertext + tag
    out.resize(static_cast<size_t>(out_len));
    out.insert(out.end(), tag, tag + kTagLen);
    sealed.ciphertext = std::move(out);
    return sealed;
}

std::optional<std::string> Crypto::open(
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& ciphertext,
    std::string_view aad) {

    if (key.size() != kKeyLen || nonce.size() != kNonceLen || ciphertext.size() < kTagLen) {
        return std::nullopt;
    }

    const size_t ct_len = ciphertext.size() - kTagLen;
    const uint8_t* tag = ciphertext.data() + ct_len;

    auto ctx = make_ctx();
    if (!ctx) return std::nullopt;

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceLen), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return std::nullopt;
    }

    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                          reinterpret_cast<const uint8_t*>(aad.data()),
                          static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          ciphertext.data(), static_cast<int>(ct_len)) != 1) {
        return std::nullopt;
    }
    plaintext_len = len;

    // Set expected tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLen),
                            const_cast<uint8_t*>(tag)) != 1) {
        return std::nullopt;
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) <= 0) {
        return std::nullopt; // Authentication failed
    }
    plaintext_len += len;

    return std::string(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<size_t>(plaintext_len));
}

} // namespace vecture
