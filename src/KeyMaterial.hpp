#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tokenseal {

class Cipher;
class RandomSource;

// Key derived from a password for a single token, bound to the cipher it was sized
// for. Zeroed on destruction and never copied.
class DerivedKey {
public:
    DerivedKey(std::vector<uint8_t> bytes, const Cipher& cipher);
    ~DerivedKey();

    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;
    DerivedKey(DerivedKey&&) = default;
    DerivedKey& operator=(DerivedKey&&) = delete;

    [[nodiscard]] const std::vector<uint8_t>& getBytes() const { return bytes_; }
    [[nodiscard]] const Cipher& getCipher() const { return *cipher_; }

private:
    std::vector<uint8_t> bytes_;
    const Cipher* cipher_;
};

// Salt and nonce travel in clear at the front of every token.
class Salt {
public:
    explicit Salt(std::span<const uint8_t> bytes);

    [[nodiscard]] static Salt random(RandomSource& randomSource, size_t length);

    [[nodiscard]] const std::vector<uint8_t>& getBytes() const { return bytes_; }
    [[nodiscard]] size_t size() const { return bytes_.size(); }

private:
    std::vector<uint8_t> bytes_;
};

class Nonce {
public:
    explicit Nonce(std::span<const uint8_t> bytes);

    [[nodiscard]] static Nonce random(RandomSource& randomSource, size_t length);

    [[nodiscard]] const std::vector<uint8_t>& getBytes() const { return bytes_; }
    [[nodiscard]] size_t size() const { return bytes_.size(); }

private:
    std::vector<uint8_t> bytes_;
};

}
