#pragma once

#include "tokenseal/SealParameterSpec.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tokenseal {

struct TokenParts {
    std::vector<uint8_t> salt;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertextWithTag;
};

// Token layout: base64url(salt || nonce || ciphertext || tag), padded.
//
// The split points are fixed offsets derived from the parameter spec. There is no
// version or algorithm prefix, so any change of salt or nonce size makes existing
// tokens unreadable.
class TokenCodec {
public:
    explicit TokenCodec(const SealParameterSpec& parameterSpec);

    [[nodiscard]] std::string pack(
        const std::vector<uint8_t>& salt,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& ciphertextWithTag) const;

    [[nodiscard]] std::string pack(const TokenParts& parts) const;

    // Throws FormatException on anything but strict padded base64url of at least
    // getMinimumTokenLength() bytes.
    [[nodiscard]] TokenParts unpack(std::string_view token) const;

    [[nodiscard]] static std::string encodeBase64Url(const std::vector<uint8_t>& data);
    [[nodiscard]] static std::vector<uint8_t> decodeBase64Url(std::string_view encoded);

private:
    SealParameterSpec parameterSpec_;
};

}
