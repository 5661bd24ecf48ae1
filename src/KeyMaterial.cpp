#include "KeyMaterial.hpp"
#include "tokenseal/RandomSource.hpp"
#include <openssl/crypto.h>
#include <utility>

namespace tokenseal {

namespace {

std::vector<uint8_t> drawBytes(RandomSource& randomSource, const size_t length) {
    std::vector<uint8_t> bytes(length);
    randomSource.fill(bytes.data(), bytes.size());
    return bytes;
}

}

DerivedKey::DerivedKey(std::vector<uint8_t> bytes, const Cipher& cipher)
    : bytes_(std::move(bytes)),
      cipher_(&cipher) {
}

DerivedKey::~DerivedKey() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

Salt::Salt(const std::span<const uint8_t> bytes)
    : bytes_(bytes.begin(), bytes.end()) {
}

Salt Salt::random(RandomSource& randomSource, const size_t length) {
    return Salt(drawBytes(randomSource, length));
}

Nonce::Nonce(const std::span<const uint8_t> bytes)
    : bytes_(bytes.begin(), bytes.end()) {
}

Nonce Nonce::random(RandomSource& randomSource, const size_t length) {
    return Nonce(drawBytes(randomSource, length));
}

}
