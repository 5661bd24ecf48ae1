#include "KeyDerivator.hpp"
#include "tokenseal/SealParameterSpec.hpp"
#include "KeyMaterial.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/core_names.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tokenseal {

namespace {

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

}

KeyDerivator::KeyDerivator(const SealParameterSpec& parameterSpec)
    : parameterSpec_(parameterSpec) {
}

std::unique_ptr<DerivedKey> KeyDerivator::derive(
    const std::string_view password,
    const Salt& salt) const {

    return derive(password, salt, parameterSpec_.getKdfIterations());
}

std::unique_ptr<DerivedKey> KeyDerivator::derive(
    const std::string_view password,
    const Salt& salt,
    const int iterations) const {

    if (iterations <= 0) {
        throw InvalidParameterException("iterations must be > 0, got " + std::to_string(iterations));
    }
    if (salt.size() != static_cast<size_t>(parameterSpec_.getSaltLength())) {
        throw InvalidParameterException("invalid salt length, expected " +
                                        std::to_string(parameterSpec_.getSaltLength()) +
                                        ", got " + std::to_string(salt.size()));
    }

    const EvpKdfPtr kdf(EVP_KDF_fetch(nullptr, "PBKDF2", nullptr), EVP_KDF_free);
    if (!kdf) {
        throw TokenSealException("Failed to fetch PBKDF2 algorithm");
    }
    const EvpKdfCtxPtr ctx(EVP_KDF_CTX_new(kdf.get()), EVP_KDF_CTX_free);
    if (!ctx) {
        throw TokenSealException("Failed to create KDF context");
    }

    const std::string& digestName = parameterSpec_.getDigest().getName();
    auto iter = static_cast<uint64_t>(iterations);
    // Lower bound checks off: the iteration count is the caller's trade-off
    int pkcs5 = 1;
    const OSSL_PARAM params[] = {
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD,
                                          const_cast<char*>(password.data()), password.size()),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                          const_cast<uint8_t*>(salt.getBytes().data()), salt.getBytes().size()),
        OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_ITER, &iter),
        OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, const_cast<char*>(digestName.c_str()), digestName.size()),
        OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5),
        OSSL_PARAM_construct_end()
    };

    const Cipher& cipher = parameterSpec_.getCipher();
    std::vector<uint8_t> keyData(static_cast<size_t>(cipher.getKeyLength()));
    if (EVP_KDF_derive(ctx.get(), keyData.data(), keyData.size(), params) != 1) {
        OPENSSL_cleanse(keyData.data(), keyData.size());
        throw TokenSealException("PBKDF2 derivation failed");
    }

    return std::make_unique<DerivedKey>(std::move(keyData), cipher);
}

}
