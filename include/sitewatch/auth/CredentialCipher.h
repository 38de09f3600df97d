#pragma once

#include <string>

namespace sitewatch::auth {

// AES-256-GCM over credential payloads. The key is SHA-256 of the operator
// secret; ciphertext is base64(iv[12] | tag[16] | ciphertext).
class CredentialCipher {
public:
    // Throws std::invalid_argument for an empty secret.
    explicit CredentialCipher(const std::string& secret);
    ~CredentialCipher();

    CredentialCipher(const CredentialCipher&) = delete;
    CredentialCipher& operator=(const CredentialCipher&) = delete;

    // Throws std::runtime_error when OpenSSL fails.
    std::string encrypt(const std::string& plaintext) const;

    // Throws std::invalid_argument for malformed input and std::runtime_error
    // when authentication fails (wrong key or tampered data).
    std::string decrypt(const std::string& ciphertext) const;

private:
    std::string key_;
};

} // namespace sitewatch::auth
