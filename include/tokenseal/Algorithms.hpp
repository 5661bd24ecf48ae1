#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace tokenseal {

class AeadProvider;

enum class CipherType : uint8_t {
    AES_256_GCM = 0
};

enum class DigestType : uint8_t {
    SHA256 = 0
};

// Authenticated cipher that seals the token payload. One immutable instance per type,
// compared by address.
class Cipher {
public:
    [[nodiscard]] static const Cipher& fromType(CipherType type);

    Cipher(const Cipher&) = delete;
    Cipher& operator=(const Cipher&) = delete;

    [[nodiscard]] CipherType getType() const { return type_; }
    // Name passed to EVP_CIPHER_fetch
    [[nodiscard]] const std::string& getName() const { return name_; }
    [[nodiscard]] int getKeyLength() const { return keyLength_; }
    [[nodiscard]] int getNonceLength() const { return nonceLength_; }
    [[nodiscard]] int getTagLength() const { return tagLength_; }

    [[nodiscard]] std::unique_ptr<AeadProvider> createProvider() const;

private:
    Cipher(CipherType type, std::string name, int keyLength, int nonceLength, int tagLength);

    CipherType type_;
    std::string name_;
    int keyLength_;
    int nonceLength_;
    int tagLength_;
};

// PRF digest of the password-based key derivation.
class Digest {
public:
    [[nodiscard]] static const Digest& fromType(DigestType type);

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    [[nodiscard]] DigestType getType() const { return type_; }
    // Name passed as OSSL_KDF_PARAM_DIGEST
    [[nodiscard]] const std::string& getName() const { return name_; }
    [[nodiscard]] int getOutputLength() const { return outputLength_; }

private:
    Digest(DigestType type, std::string name, int outputLength);

    DigestType type_;
    std::string name_;
    int outputLength_;
};

}
