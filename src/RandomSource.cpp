#include "tokenseal/RandomSource.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <climits>

namespace tokenseal {

uint64_t RandomSource::uniform(const uint64_t upperBound) {
    if (upperBound == 0) {
        throw InvalidParameterException("upperBound must be > 0");
    }

    // 2^64 mod upperBound; draws below it would favour the low residues
    const uint64_t threshold = (uint64_t{0} - upperBound) % upperBound;
    uint64_t value;
    do {
        uint8_t bytes[sizeof(uint64_t)];
        fill(bytes, sizeof(bytes));
        value = 0;
        for (const uint8_t b : bytes) {
            value = (value << CHAR_BIT) | b;
        }
    } while (value < threshold);

    return value % upperBound;
}

std::shared_ptr<RandomSource> RandomSource::secure() {
    static const std::shared_ptr<RandomSource> instance = std::make_shared<SecureRandomSource>();
    return instance;
}

void SecureRandomSource::fill(uint8_t* buffer, const size_t length) {
    size_t offset = 0;
    while (offset < length) {
        const size_t chunk = std::min<size_t>(length - offset, INT_MAX);
        if (RAND_bytes(buffer + offset, static_cast<int>(chunk)) != 1) {
            throw TokenSealException("Failed to generate random bytes");
        }
        offset += chunk;
    }
}

}
