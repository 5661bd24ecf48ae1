#include <catch2/catch_test_macros.hpp>
#include "TestUtils.hpp"
#include <tokenseal/TokenCodec.hpp>
#include <tokenseal/TokenSeal.hpp>
#include <algorithm>
#include <memory>
#include <typeinfo>

using tokenseal::TokenCodec;
using tokenseal::TokenSeal;
using tokenseal::test::createTestParameterSpec;
using tokenseal::test::createTestWordList;

namespace {

// The failure a caller sees, reduced to what it could branch on.
std::string failureSignature(const TokenSeal& seal, const std::string& token, const std::string& password) {
    try {
        (void)seal.decrypt(token, password);
    } catch (const std::exception& e) {
        return std::string(typeid(e).name()) + "|" + e.what();
    }
    return "no failure";
}

}

TEST_CASE("Round trip", "[seal]") {
    const TokenSeal seal(createTestParameterSpec());

    const std::vector<std::string> plaintexts = {
        "", "a", "Hello, world!", "caf\xc3\xa9 \xe2\x98\x95", std::string(1000, 'z')
    };
    for (const std::string& plaintext : plaintexts) {
        const std::string token = seal.encrypt(plaintext, "hunter2");
        REQUIRE(seal.decrypt(token, "hunter2") == plaintext);
    }
}

TEST_CASE("Round trip with an empty password", "[seal]") {
    const TokenSeal seal(createTestParameterSpec());
    REQUIRE(seal.decrypt(seal.encrypt("secret", ""), "") == "secret");
}

TEST_CASE("Token layout", "[seal]") {
    const auto spec = createTestParameterSpec();
    const TokenSeal seal(spec);

    const std::string token = seal.encrypt("0123456789", "pw");
    const auto decoded = TokenCodec::decodeBase64Url(token);

    REQUIRE(decoded.size() == 16 + 12 + 10 + 16);
    REQUIRE(token.find_first_of("+/\n") == std::string::npos);
}

TEST_CASE("Encrypting twice yields different tokens", "[seal]") {
    const auto spec = createTestParameterSpec();
    const TokenSeal seal(spec);
    const TokenCodec codec(spec);

    const std::string first = seal.encrypt("same text", "same password");
    const std::string second = seal.encrypt("same text", "same password");

    REQUIRE(first != second);
    REQUIRE(codec.unpack(first).salt != codec.unpack(second).salt);
    REQUIRE(codec.unpack(first).nonce != codec.unpack(second).nonce);
}

TEST_CASE("Injected random source drives salt and nonce", "[seal]") {
    const auto spec = createTestParameterSpec();
    const TokenSeal first(spec, std::make_shared<tokenseal::SeededRandomSource>(99));
    const TokenSeal second(spec, std::make_shared<tokenseal::SeededRandomSource>(99));

    const std::string token = first.encrypt("reproducible", "pw");
    REQUIRE(token == second.encrypt("reproducible", "pw"));
    REQUIRE(first.decrypt(token, "pw") == "reproducible");

    REQUIRE_THROWS_AS(TokenSeal(spec, nullptr), tokenseal::InvalidParameterException);
}

TEST_CASE("Any altered byte makes decryption fail", "[seal]") {
    const auto spec = createTestParameterSpec();
    const TokenSeal seal(spec);
    const std::string token = seal.encrypt("tamper me", "pw");
    const auto decoded = TokenCodec::decodeBase64Url(token);

    for (size_t i = 0; i < decoded.size(); ++i) {
        auto tampered = decoded;
        tampered[i] ^= 0x80;
        REQUIRE_THROWS_AS(seal.decrypt(TokenCodec::encodeBase64Url(tampered), "pw"),
                          tokenseal::DecryptionException);
    }
}

TEST_CASE("Wrong password is rejected", "[seal]") {
    const TokenSeal seal(createTestParameterSpec());
    const std::string token = seal.encrypt("top secret", "right");

    REQUIRE_THROWS_AS(seal.decrypt(token, "wrong"), tokenseal::DecryptionException);
    REQUIRE_THROWS_AS(seal.decrypt(token, "Right"), tokenseal::DecryptionException);
    REQUIRE_THROWS_AS(seal.decrypt(token, ""), tokenseal::DecryptionException);
}

TEST_CASE("Tokens only open under the iteration count they were sealed with", "[seal]") {
    const auto spec = createTestParameterSpec();
    const TokenSeal seal(spec);
    const TokenSeal other(spec.withKdfIterations(spec.getKdfIterations() + 1));

    REQUIRE_THROWS_AS(other.decrypt(seal.encrypt("text", "pw"), "pw"), tokenseal::DecryptionException);
}

TEST_CASE("Every decryption failure looks the same", "[seal]") {
    const TokenSeal seal(createTestParameterSpec());
    const std::string token = seal.encrypt("text", "pw");
    auto truncated = TokenCodec::decodeBase64Url(token);
    truncated.resize(43);

    const std::string malformed = failureSignature(seal, "not-valid-base64!!", "pw");
    const std::string tooShort = failureSignature(seal, TokenCodec::encodeBase64Url(truncated), "pw");
    const std::string wrongPassword = failureSignature(seal, token, "not pw");

    REQUIRE(malformed != "no failure");
    REQUIRE(malformed.ends_with("|decryption failed"));
    REQUIRE(malformed == tooShort);
    REQUIRE(malformed == wrongPassword);

    REQUIRE_THROWS_AS(seal.decrypt("not-valid-base64!!", "pw"), tokenseal::DecryptionException);
}

TEST_CASE("Facade helpers for passphrases and strength", "[seal]") {
    const auto wordList = createTestWordList();

    const std::string passphrase = tokenseal::generatePassphrase(wordList, 4);
    REQUIRE(std::count(passphrase.begin(), passphrase.end(), '-') == 3);

    const auto generated = tokenseal::estimateStrength(passphrase, true, tokenseal::GenerationParams{4, 4});
    REQUIRE(generated.bits == 8.0);
    REQUIRE(generated.rating.label == "VERY WEAK");

    const auto typed = tokenseal::estimateStrength("abcdefgh", false);
    REQUIRE(typed.rating.label == "Weak");
    REQUIRE(typed.rating.score == 25);
}
