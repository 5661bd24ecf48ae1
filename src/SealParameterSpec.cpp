#include "tokenseal/SealParameterSpec.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <string>

namespace tokenseal {

const SealParameterSpec SealParameterSpec::GCM256_SHA256 = SealParameterSpec(
    Cipher::fromType(CipherType::AES_256_GCM),
    Digest::fromType(DigestType::SHA256),
    DEFAULT_KDF_ITERATIONS
);

SealParameterSpec::SealParameterSpec(
    const Cipher& cipher,
    const Digest& digest,
    const int kdfIterations)
    : cipher_(&cipher),
      digest_(&digest),
      kdfIterations_(kdfIterations) {

    if (kdfIterations <= 0) {
        throw InvalidParameterException("kdfIterations must be > 0, got " + std::to_string(kdfIterations));
    }
}

size_t SealParameterSpec::getMinimumTokenLength() const {
    return static_cast<size_t>(SALT_LENGTH + getNonceLength() + getAuthTagLength());
}

SealParameterSpec SealParameterSpec::withKdfIterations(const int kdfIterations) const {
    return {*cipher_, *digest_, kdfIterations};
}

}
