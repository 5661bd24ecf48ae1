#pragma once

#include "AeadProvider.hpp"
#include <openssl/evp.h>

namespace tokenseal {

class Cipher;

// AES-GCM through the OpenSSL EVP interface.
class GcmAead : public AeadProvider {
public:
    explicit GcmAead(const Cipher& cipher);

    [[nodiscard]] std::vector<uint8_t> seal(
        const DerivedKey& key, const Nonce& nonce, std::span<const uint8_t> plaintext) override;

    [[nodiscard]] std::vector<uint8_t> open(
        const DerivedKey& key, const Nonce& nonce, std::span<const uint8_t> sealed) override;

private:
    void checkInputs(const DerivedKey& key, const Nonce& nonce, const EVP_CIPHER* evpCipher) const;

    const Cipher& cipher_;
};

}
