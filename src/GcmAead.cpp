#include "GcmAead.hpp"
#include "KeyMaterial.hpp"
#include "tokenseal/Algorithms.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <openssl/crypto.h>
#include <climits>
#include <memory>
#include <string>

namespace tokenseal {

namespace {

using EvpCipherPtr = std::unique_ptr<EVP_CIPHER, decltype(&EVP_CIPHER_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

EvpCipherPtr fetchCipher(const std::string& name) {
    EvpCipherPtr evpCipher(EVP_CIPHER_fetch(nullptr, name.c_str(), nullptr), EVP_CIPHER_free);
    if (!evpCipher) {
        throw TokenSealException("Failed to fetch cipher " + name);
    }
    return evpCipher;
}

// Context with cipher, nonce length, key and nonce set, ready for update calls.
EvpCipherCtxPtr initContext(const EVP_CIPHER* evpCipher, const DerivedKey& key, const Nonce& nonce, const int enc) {
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw TokenSealException("Failed to create cipher context");
    }
    if (EVP_CipherInit_ex2(ctx.get(), evpCipher, nullptr, nullptr, enc, nullptr) != 1) {
        throw TokenSealException("Failed to initialize cipher");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1) {
        throw TokenSealException("Failed to set nonce length");
    }
    if (EVP_CipherInit_ex2(ctx.get(), nullptr, key.getBytes().data(), nonce.getBytes().data(), enc, nullptr) != 1) {
        throw TokenSealException("Failed to set key and nonce");
    }
    return ctx;
}

}

GcmAead::GcmAead(const Cipher& cipher)
    : cipher_(cipher) {
}

void GcmAead::checkInputs(const DerivedKey& key, const Nonce& nonce, const EVP_CIPHER* evpCipher) const {
    if (&key.getCipher() != &cipher_) {
        throw InvalidParameterException("key was derived for " + key.getCipher().getName() +
                                        ", not " + cipher_.getName());
    }
    if (key.getBytes().size() != static_cast<size_t>(EVP_CIPHER_get_key_length(evpCipher))) {
        throw InvalidParameterException("invalid key length " + std::to_string(key.getBytes().size()));
    }
    if (nonce.size() != static_cast<size_t>(cipher_.getNonceLength())) {
        throw InvalidParameterException("invalid nonce length " + std::to_string(nonce.size()));
    }
}

std::vector<uint8_t> GcmAead::seal(
    const DerivedKey& key,
    const Nonce& nonce,
    const std::span<const uint8_t> plaintext) {

    if (plaintext.size() > static_cast<size_t>(INT_MAX)) {
        throw InvalidParameterException("plaintext too long");
    }
    const EvpCipherPtr evpCipher = fetchCipher(cipher_.getName());
    checkInputs(key, nonce, evpCipher.get());
    const EvpCipherCtxPtr ctx = initContext(evpCipher.get(), key, nonce, 1);

    const auto tagLength = static_cast<size_t>(cipher_.getTagLength());
    std::vector<uint8_t> sealed(plaintext.size() + tagLength);

    int written = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), sealed.data(), &written,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        throw TokenSealException("Failed to encrypt data");
    }
    size_t ciphertextLength = static_cast<size_t>(written);

    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + ciphertextLength, &written) != 1) {
        throw TokenSealException("Failed to finalize encryption");
    }
    ciphertextLength += static_cast<size_t>(written);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, cipher_.getTagLength(),
                            sealed.data() + ciphertextLength) != 1) {
        throw TokenSealException("Failed to get authentication tag");
    }
    sealed.resize(ciphertextLength + tagLength);
    return sealed;
}

std::vector<uint8_t> GcmAead::open(
    const DerivedKey& key,
    const Nonce& nonce,
    const std::span<const uint8_t> sealed) {

    const auto tagLength = static_cast<size_t>(cipher_.getTagLength());
    if (sealed.size() < tagLength) {
        throw AuthenticationException("Sealed data shorter than the tag");
    }
    if (sealed.size() > static_cast<size_t>(INT_MAX)) {
        throw InvalidParameterException("sealed data too long");
    }
    const EvpCipherPtr evpCipher = fetchCipher(cipher_.getName());
    checkInputs(key, nonce, evpCipher.get());
    const EvpCipherCtxPtr ctx = initContext(evpCipher.get(), key, nonce, 0);

    const std::span<const uint8_t> ciphertext = sealed.first(sealed.size() - tagLength);
    // EVP_CTRL_AEAD_SET_TAG wants a mutable buffer
    std::vector<uint8_t> tag(sealed.end() - static_cast<std::ptrdiff_t>(tagLength), sealed.end());
    std::vector<uint8_t> plaintext(ciphertext.size());

    int written = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &written,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        throw TokenSealException("Failed to decrypt data");
    }
    size_t plaintextLength = static_cast<size_t>(written);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, cipher_.getTagLength(), tag.data()) != 1) {
        throw TokenSealException("Failed to set authentication tag");
    }
    // Tag comparison inside the provider is constant time
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLength, &written) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw AuthenticationException("Authentication failed");
    }
    plaintextLength += static_cast<size_t>(written);

    plaintext.resize(plaintextLength);
    return plaintext;
}

}
