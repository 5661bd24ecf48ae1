#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace tokenseal {

class DerivedKey;
class Nonce;

// One-shot authenticated encryption, no associated data.
class AeadProvider {
public:
    virtual ~AeadProvider() = default;

    // Returns ciphertext || tag.
    [[nodiscard]] virtual std::vector<uint8_t> seal(
        const DerivedKey& key, const Nonce& nonce, std::span<const uint8_t> plaintext) = 0;

    // Input is ciphertext || tag. Throws AuthenticationException unless the tag verifies;
    // no plaintext is released in that case.
    [[nodiscard]] virtual std::vector<uint8_t> open(
        const DerivedKey& key, const Nonce& nonce, std::span<const uint8_t> sealed) = 0;
};

}
