#include "tokenseal/TokenCodec.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <openssl/evp.h>
#include <algorithm>

namespace tokenseal {

namespace {

bool isUrlSafeBase64Char(const char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

}

TokenCodec::TokenCodec(const SealParameterSpec& parameterSpec)
    : parameterSpec_(parameterSpec) {
}

std::string TokenCodec::pack(
    const std::vector<uint8_t>& salt,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& ciphertextWithTag) const {

    if (salt.size() != static_cast<size_t>(parameterSpec_.getSaltLength())) {
        throw InvalidParameterException("invalid salt length, expected " +
                                        std::to_string(parameterSpec_.getSaltLength()) +
                                        ", got " + std::to_string(salt.size()));
    }
    if (nonce.size() != static_cast<size_t>(parameterSpec_.getNonceLength())) {
        throw InvalidParameterException("invalid nonce length, expected " +
                                        std::to_string(parameterSpec_.getNonceLength()) +
                                        ", got " + std::to_string(nonce.size()));
    }
    if (ciphertextWithTag.size() < static_cast<size_t>(parameterSpec_.getAuthTagLength())) {
        throw InvalidParameterException("ciphertext shorter than the authentication tag");
    }

    std::vector<uint8_t> packed;
    packed.reserve(salt.size() + nonce.size() + ciphertextWithTag.size());
    packed.insert(packed.end(), salt.begin(), salt.end());
    packed.insert(packed.end(), nonce.begin(), nonce.end());
    packed.insert(packed.end(), ciphertextWithTag.begin(), ciphertextWithTag.end());

    return encodeBase64Url(packed);
}

std::string TokenCodec::pack(const TokenParts& parts) const {
    return pack(parts.salt, parts.nonce, parts.ciphertextWithTag);
}

TokenParts TokenCodec::unpack(const std::string_view token) const {
    const std::vector<uint8_t> packed = decodeBase64Url(token);

    if (packed.size() < parameterSpec_.getMinimumTokenLength()) {
        throw FormatException("token too short, expected at least " +
                              std::to_string(parameterSpec_.getMinimumTokenLength()) +
                              " bytes, got " + std::to_string(packed.size()));
    }

    const auto saltEnd = packed.begin() + parameterSpec_.getSaltLength();
    const auto nonceEnd = saltEnd + parameterSpec_.getNonceLength();

    return TokenParts{
        std::vector(packed.begin(), saltEnd),
        std::vector(saltEnd, nonceEnd),
        std::vector(nonceEnd, packed.end())
    };
}

std::string TokenCodec::encodeBase64Url(const std::vector<uint8_t>& data) {
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    if (!data.empty()) {
        const int written = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(encoded.data()), data.data(), static_cast<int>(data.size()));
        encoded.resize(static_cast<size_t>(written));
    }

    std::ranges::replace(encoded, '+', '-');
    std::ranges::replace(encoded, '/', '_');
    return encoded;
}

std::vector<uint8_t> TokenCodec::decodeBase64Url(const std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
        throw FormatException("token length is not a multiple of 4");
    }

    size_t padding = 0;
    while (padding < 2 && padding < encoded.size() && encoded[encoded.size() - 1 - padding] == '=') {
        ++padding;
    }

    std::string standard(encoded);
    for (size_t i = 0; i < standard.size() - padding; ++i) {
        const char c = standard[i];
        if (!isUrlSafeBase64Char(c)) {
            throw FormatException("invalid character in token at offset " + std::to_string(i));
        }
        if (c == '-') {
            standard[i] = '+';
        } else if (c == '_') {
            standard[i] = '/';
        }
    }

    if (standard.empty()) {
        return {};
    }

    std::vector<uint8_t> decoded(3 * (standard.size() / 4));
    const int written = EVP_DecodeBlock(
        decoded.data(), reinterpret_cast<const unsigned char*>(standard.data()), static_cast<int>(standard.size()));
    if (written < 0) {
        throw FormatException("token is not valid base64");
    }

    // EVP_DecodeBlock keeps the zero bytes that stand for the padding
    decoded.resize(static_cast<size_t>(written) - padding);
    return decoded;
}

}
