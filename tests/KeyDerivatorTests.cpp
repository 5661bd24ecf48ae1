#include <catch2/catch_test_macros.hpp>
#include "TestUtils.hpp"
#include "KeyDerivator.hpp"
#include "KeyMaterial.hpp"
#include <openssl/evp.h>

using tokenseal::test::createTestParameterSpec;
using tokenseal::test::hexToBytes;

namespace {

tokenseal::Salt createTestSalt(const uint8_t fill = 0x5A) {
    return tokenseal::Salt(std::vector<uint8_t>(16, fill));
}

}

TEST_CASE("Derivation is deterministic", "[kdf]") {
    const auto spec = createTestParameterSpec();
    const tokenseal::KeyDerivator derivator(spec);
    const auto salt = createTestSalt();

    const auto first = derivator.derive("correct horse battery staple", salt);
    const auto second = derivator.derive("correct horse battery staple", salt);

    REQUIRE(first->getBytes() == second->getBytes());
    REQUIRE(first->getBytes().size() == 32);
    REQUIRE(&first->getCipher() == &spec.getCipher());
}

TEST_CASE("Derivation matches PKCS5_PBKDF2_HMAC with SHA-256", "[kdf]") {
    const auto spec = createTestParameterSpec();
    const tokenseal::KeyDerivator derivator(spec);
    const tokenseal::Salt salt(hexToBytes("000102030405060708090a0b0c0d0e0f"));
    const std::string password = "password";

    std::vector<uint8_t> expected(32);
    REQUIRE(PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                              salt.getBytes().data(), static_cast<int>(salt.getBytes().size()),
                              1234, EVP_sha256(),
                              static_cast<int>(expected.size()), expected.data()) == 1);

    const auto key = derivator.derive(password, salt, 1234);
    REQUIRE(key->getBytes() == expected);
}

TEST_CASE("Every input changes the key", "[kdf]") {
    const auto spec = createTestParameterSpec();
    const tokenseal::KeyDerivator derivator(spec);
    const auto reference = derivator.derive("password", createTestSalt());

    SECTION("password") {
        REQUIRE(derivator.derive("Password", createTestSalt())->getBytes() != reference->getBytes());
    }

    SECTION("salt") {
        REQUIRE(derivator.derive("password", createTestSalt(0x5B))->getBytes() != reference->getBytes());
    }

    SECTION("iterations") {
        REQUIRE(derivator.derive("password", createTestSalt(), 1001)->getBytes() != reference->getBytes());
    }
}

TEST_CASE("Default iteration count comes from the parameter spec", "[kdf]") {
    const auto spec = createTestParameterSpec();
    const tokenseal::KeyDerivator derivator(spec);

    REQUIRE(derivator.derive("pw", createTestSalt())->getBytes() ==
            derivator.derive("pw", createTestSalt(), spec.getKdfIterations())->getBytes());
    REQUIRE(tokenseal::SealParameterSpec::GCM256_SHA256.getKdfIterations() == 200000);
}

TEST_CASE("Key length does not depend on the password length", "[kdf]") {
    const auto spec = createTestParameterSpec();
    const tokenseal::KeyDerivator derivator(spec);

    REQUIRE(derivator.derive("", createTestSalt())->getBytes().size() == 32);
    REQUIRE(derivator.derive(std::string(1000, 'x'), createTestSalt())->getBytes().size() == 32);
}

TEST_CASE("Invalid derivation parameters are rejected", "[kdf][validation]") {
    const auto spec = createTestParameterSpec();
    const tokenseal::KeyDerivator derivator(spec);

    REQUIRE_THROWS_AS(derivator.derive("pw", createTestSalt(), 0), tokenseal::InvalidParameterException);
    REQUIRE_THROWS_AS(derivator.derive("pw", createTestSalt(), -5), tokenseal::InvalidParameterException);

    const tokenseal::Salt shortSalt(std::vector<uint8_t>(15, 0));
    REQUIRE_THROWS_AS(derivator.derive("pw", shortSalt), tokenseal::InvalidParameterException);

    const tokenseal::Salt longSalt(std::vector<uint8_t>(17, 0));
    REQUIRE_THROWS_AS(derivator.derive("pw", longSalt), tokenseal::InvalidParameterException);
}

TEST_CASE("Parameter spec rejects a non-positive iteration count", "[kdf][validation]") {
    REQUIRE_THROWS_AS(tokenseal::SealParameterSpec::GCM256_SHA256.withKdfIterations(0),
                      tokenseal::InvalidParameterException);
    REQUIRE_THROWS_AS(tokenseal::SealParameterSpec::GCM256_SHA256.withKdfIterations(-1),
                      tokenseal::InvalidParameterException);
    REQUIRE(tokenseal::SealParameterSpec::GCM256_SHA256.getMinimumTokenLength() == 44);
}

TEST_CASE("Repeated derivations on one derivator agree", "[kdf]") {
    const auto spec = createTestParameterSpec();
    const tokenseal::KeyDerivator derivator(spec);
    const auto reference = derivator.derive("pw", createTestSalt(), 1);

    for (int i = 0; i < 200; ++i) {
        const auto key = derivator.derive("pw", createTestSalt(), 1);
        REQUIRE(key->getBytes() == reference->getBytes());
        REQUIRE(&key->getCipher() == &spec.getCipher());
    }
}
