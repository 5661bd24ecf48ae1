#include "tokenseal/TokenSeal.hpp"
#include "tokenseal/PassphraseGenerator.hpp"
#include "tokenseal/RandomSource.hpp"
#include "tokenseal/TokenSealException.hpp"
#include "AeadProvider.hpp"
#include "KeyDerivator.hpp"
#include "KeyMaterial.hpp"
#include <openssl/crypto.h>
#include <span>
#include <utility>
#include <vector>

namespace tokenseal {

TokenSeal::TokenSeal(const SealParameterSpec& parameterSpec)
    : TokenSeal(parameterSpec, RandomSource::secure()) {
}

TokenSeal::TokenSeal(const SealParameterSpec& parameterSpec, std::shared_ptr<RandomSource> randomSource)
    : parameterSpec_(parameterSpec),
      randomSource_(std::move(randomSource)),
      tokenCodec_(parameterSpec) {

    if (!randomSource_) {
        throw InvalidParameterException("randomSource cannot be null");
    }
    keyDerivator_ = std::make_unique<KeyDerivator>(parameterSpec_);
}

TokenSeal::~TokenSeal() = default;

std::string TokenSeal::encrypt(const std::string_view plaintext, const std::string_view password) const {
    const Salt salt = Salt::random(*randomSource_, parameterSpec_.getSaltLength());
    const std::unique_ptr<DerivedKey> key = keyDerivator_->derive(password, salt);
    const Nonce nonce = Nonce::random(*randomSource_, parameterSpec_.getNonceLength());

    const auto aeadProvider = parameterSpec_.getCipher().createProvider();
    const std::vector<uint8_t> ciphertextWithTag = aeadProvider->seal(
        *key, nonce, std::span(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()));

    return tokenCodec_.pack(salt.getBytes(), nonce.getBytes(), ciphertextWithTag);
}

std::string TokenSeal::decrypt(const std::string_view token, const std::string_view password) const {
    try {
        return openToken(token, password);
    } catch (const TokenSealException&) {
        throw DecryptionException();
    }
}

std::string TokenSeal::openToken(const std::string_view token, const std::string_view password) const {
    TokenParts parts;
    try {
        parts = tokenCodec_.unpack(token);
    } catch (const FormatException&) {
        // Derive anyway so a malformed token costs what a wrong password costs
        const std::vector<uint8_t> zeroSalt(parameterSpec_.getSaltLength(), 0);
        (void)keyDerivator_->derive(password, Salt(zeroSalt));
        throw;
    }

    const Salt salt(parts.salt);
    const std::unique_ptr<DerivedKey> key = keyDerivator_->derive(password, salt);
    const Nonce nonce(parts.nonce);

    const auto aeadProvider = parameterSpec_.getCipher().createProvider();
    std::vector<uint8_t> plaintext = aeadProvider->open(*key, nonce, parts.ciphertextWithTag);

    std::string result(plaintext.begin(), plaintext.end());
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return result;
}

std::string generatePassphrase(const WordList& wordList, const int count) {
    return PassphraseGenerator().generate(wordList, count);
}

StrengthReport estimateStrength(
    const std::string_view secret,
    const bool generated,
    const std::optional<GenerationParams> generationParams) {

    return StrengthEstimator::estimate(secret, generated, generationParams);
}

}
