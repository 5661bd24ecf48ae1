#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#ifdef TOKENSEAL_TESTING
#include <random>
#endif

namespace tokenseal {

// Source of the random bytes used for salts, nonces and word draws.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual void fill(uint8_t* buffer, size_t length) = 0;

    // Uniform value in [0, upperBound), without modulo bias.
    [[nodiscard]] uint64_t uniform(uint64_t upperBound);

    // Process-wide cryptographically secure source. Threadsafe.
    [[nodiscard]] static std::shared_ptr<RandomSource> secure();
};

// OpenSSL RAND_bytes
class SecureRandomSource final : public RandomSource {
public:
    void fill(uint8_t* buffer, size_t length) override;
};

#ifdef TOKENSEAL_TESTING
// Reproducible source for tests. Never wired in production builds.
class SeededRandomSource final : public RandomSource {
public:
    explicit SeededRandomSource(const uint64_t seed) : engine_(seed) {}

    void fill(uint8_t* buffer, const size_t length) override {
        for (size_t i = 0; i < length; ++i) {
            buffer[i] = static_cast<uint8_t>(engine_() & 0xFF);
        }
    }

private:
    std::mt19937_64 engine_;
};
#endif

}
