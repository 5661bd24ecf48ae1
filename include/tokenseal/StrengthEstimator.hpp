#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tokenseal {

struct StrengthRating {
    std::string label;
    int score;

    bool operator==(const StrengthRating&) const = default;
};

struct StrengthReport {
    StrengthRating rating;
    double bits;
};

// How a passphrase was generated: wordCount draws from a list of wordListSize words.
struct GenerationParams {
    int wordCount;
    size_t wordListSize;
};

// Heuristic entropy estimates for display. The numbers are a human-facing signal, not
// a cryptographic guarantee, and nothing in this library accepts or rejects a secret
// because of them.
class StrengthEstimator {
public:
    static constexpr int LOWERCASE_ALPHABET = 26;
    static constexpr int UPPERCASE_ALPHABET = 26;
    static constexpr int DIGIT_ALPHABET = 10;
    static constexpr int SYMBOL_ALPHABET = 32;

    static constexpr const char* ADVISORY_NOTE = "Note: this is only an estimate, not a guarantee.";

    // count * log2(wordListSize), assuming uniform independent draws. 0 unless
    // count > 0 and wordListSize > 1.
    [[nodiscard]] static double entropyOfGenerated(int count, size_t wordListSize);

    // length * log2(sum of the alphabets of the character classes present), length in
    // code points. Classes follow the Unicode properties of each code point: Lowercase,
    // Uppercase, digit, and symbol for anything that is neither a letter nor numeric.
    // A letter without case (e.g. CJK) adds to the length but to no class.
    [[nodiscard]] static double entropyOfTyped(std::string_view password);

    [[nodiscard]] static StrengthRating rate(double bits);

    // Throws InvalidParameterException when generated is set without parameters.
    [[nodiscard]] static StrengthReport estimate(
        std::string_view secret,
        bool generated,
        std::optional<GenerationParams> generationParams = std::nullopt);

    // "Estimated strength: Weak (~37.6 bits, score 25/100)"
    [[nodiscard]] static std::string describe(const StrengthReport& report);
};

}
