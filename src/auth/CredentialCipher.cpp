#include "../../include/sitewatch/auth/CredentialCipher.h"
#include "../../include/sitewatch/common/Hashing.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>
#include <stdexcept>

namespace sitewatch::auth {

namespace {

constexpr int kIvLength = 12;
constexpr int kTagLength = 16;

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

const unsigned char* bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

unsigned char* bytes(std::string& s) {
    return reinterpret_cast<unsigned char*>(s.data());
}

} // namespace

CredentialCipher::CredentialCipher(const std::string& secret) {
    if (secret.empty()) {
        throw std::invalid_argument("Credential encryption secret must not be empty");
    }
    key_ = common::sha256Raw(secret);
}

CredentialCipher::~CredentialCipher() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

std::string CredentialCipher::encrypt(const std::string& plaintext) const {
    std::string iv(kIvLength, '\0');
    if (RAND_bytes(bytes(iv), kIvLength) != 1) {
        throw std::runtime_error("Failed to generate IV");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLength, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(iv)) != 1) {
        throw std::runtime_error("Failed to initialise AES-256-GCM encryption");
    }

    std::string out(plaintext.size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int len = 0;
    int total = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), bytes(out), &len, bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES-256-GCM encryption failed");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), bytes(out) + total, &len) != 1) {
        throw std::runtime_error("AES-256-GCM encryption failed");
    }
    total += len;
    out.resize(static_cast<size_t>(total));

    std::string tag(kTagLength, '\0');
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLength, bytes(tag)) != 1) {
        throw std::runtime_error("Failed to read GCM tag");
    }
    return common::base64Encode(iv + tag + out);
}

std::string CredentialCipher::decrypt(const std::string& ciphertext) const {
    const std::string raw = common::base64Decode(ciphertext);
    if (raw.size() < static_cast<size_t>(kIvLength + kTagLength)) {
        throw std::invalid_argument("Encrypted credential is too short");
    }
    const std::string iv = raw.substr(0, kIvLength);
    std::string tag = raw.substr(kIvLength, kTagLength);
    const std::string body = raw.substr(kIvLength + kTagLength);

    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLength, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(iv)) != 1) {
        throw std::runtime_error("Failed to initialise AES-256-GCM decryption");
    }

    std::string out(body.size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int len = 0;
    int total = 0;
    if (!body.empty() &&
        EVP_DecryptUpdate(ctx.get(), bytes(out), &len, bytes(body), static_cast<int>(body.size())) != 1) {
        throw std::runtime_error("AES-256-GCM decryption failed");
    }
    total = len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLength, bytes(tag)) != 1) {
        throw std::runtime_error("Failed to set GCM tag");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(out) + total, &len) != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        throw std::runtime_error("Credential decryption failed: wrong key or corrupted data");
    }
    total += len;
    out.resize(static_cast<size_t>(total));
    return out;
}

} // namespace sitewatch::auth
