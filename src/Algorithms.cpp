#include "tokenseal/Algorithms.hpp"
#include "tokenseal/TokenSealException.hpp"
#include "GcmAead.hpp"
#include <string>
#include <utility>

namespace tokenseal {

Cipher::Cipher(const CipherType type,
               std::string name,
               const int keyLength,
               const int nonceLength,
               const int tagLength)
    : type_(type),
      name_(std::move(name)),
      keyLength_(keyLength),
      nonceLength_(nonceLength),
      tagLength_(tagLength) {
}

const Cipher& Cipher::fromType(const CipherType type) {
    if (type == CipherType::AES_256_GCM) {
        static const Cipher aes256Gcm(type, "AES-256-GCM", 32, 12, 16);
        return aes256Gcm;
    }
    throw InvalidParameterException("unsupported cipher type " + std::to_string(static_cast<int>(type)));
}

std::unique_ptr<AeadProvider> Cipher::createProvider() const {
    return std::make_unique<GcmAead>(*this);
}

Digest::Digest(const DigestType type, std::string name, const int outputLength)
    : type_(type),
      name_(std::move(name)),
      outputLength_(outputLength) {
}

const Digest& Digest::fromType(const DigestType type) {
    if (type == DigestType::SHA256) {
        static const Digest sha256(type, "SHA256", 32);
        return sha256;
    }
    throw InvalidParameterException("unsupported digest type " + std::to_string(static_cast<int>(type)));
}

}
