#pragma once

#include "tokenseal/Algorithms.hpp"
#include <cstddef>

namespace tokenseal {

// Algorithms and tunables of the token scheme. Immutable and threadsafe.
//
// None of these values is written into the token: a token can only be opened with
// the parameters it was sealed with.
class SealParameterSpec {
public:
    static constexpr int DEFAULT_KDF_ITERATIONS = 200000;
    static constexpr int SALT_LENGTH = 16;

    // AES-256-GCM keyed by PBKDF2-HMAC-SHA256 with 200000 iterations
    static const SealParameterSpec GCM256_SHA256;

    SealParameterSpec(const Cipher& cipher, const Digest& digest, int kdfIterations);

    [[nodiscard]] const Cipher& getCipher() const { return *cipher_; }
    [[nodiscard]] const Digest& getDigest() const { return *digest_; }
    [[nodiscard]] int getKdfIterations() const { return kdfIterations_; }
    [[nodiscard]] int getSaltLength() const { return SALT_LENGTH; }
    [[nodiscard]] int getNonceLength() const { return cipher_->getNonceLength(); }
    [[nodiscard]] int getAuthTagLength() const { return cipher_->getTagLength(); }

    // salt + nonce + tag, the decoded size of a token sealing an empty plaintext
    [[nodiscard]] size_t getMinimumTokenLength() const;

    [[nodiscard]] SealParameterSpec withKdfIterations(int kdfIterations) const;

private:
    const Cipher* cipher_;
    const Digest* digest_;
    int kdfIterations_;
};

}
