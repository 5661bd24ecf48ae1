#pragma once

#include "tokenseal/SealParameterSpec.hpp"
#include "tokenseal/TokenCodec.hpp"
#include "tokenseal/StrengthEstimator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tokenseal {

class KeyDerivator;
class RandomSource;
class WordList;

// Password-based sealing of short texts into self-contained tokens.
//
// Every encrypt() draws a fresh salt, so every token is sealed under a fresh key and
// the random nonce is never reused under one key. Keys are never cached between calls.
// Threadsafe as long as the random source is.
class TokenSeal {
public:
    explicit TokenSeal(const SealParameterSpec& parameterSpec = SealParameterSpec::GCM256_SHA256);
    TokenSeal(const SealParameterSpec& parameterSpec, std::shared_ptr<RandomSource> randomSource);
    ~TokenSeal();

    TokenSeal(const TokenSeal&) = delete;
    TokenSeal& operator=(const TokenSeal&) = delete;

    [[nodiscard]] std::string encrypt(std::string_view plaintext, std::string_view password) const;

    // Throws DecryptionException, and nothing else, for a malformed token, a wrong
    // password or a corrupted ciphertext.
    [[nodiscard]] std::string decrypt(std::string_view token, std::string_view password) const;

    [[nodiscard]] const SealParameterSpec& getParameterSpec() const { return parameterSpec_; }

private:
    [[nodiscard]] std::string openToken(std::string_view token, std::string_view password) const;

    SealParameterSpec parameterSpec_;
    std::shared_ptr<RandomSource> randomSource_;
    std::unique_ptr<KeyDerivator> keyDerivator_;
    TokenCodec tokenCodec_;
};

[[nodiscard]] std::string generatePassphrase(const WordList& wordList, int count);

[[nodiscard]] StrengthReport estimateStrength(
    std::string_view secret,
    bool generated,
    std::optional<GenerationParams> generationParams = std::nullopt);

}
