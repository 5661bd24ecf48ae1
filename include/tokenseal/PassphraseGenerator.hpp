#pragma once

#include <memory>
#include <string>

namespace tokenseal {

class RandomSource;
class WordList;

// Builds passphrases from independent uniform draws, with replacement, over a word
// list. The same word may appear twice in one passphrase.
class PassphraseGenerator {
public:
    static constexpr char SEPARATOR = '-';
    static constexpr int DEFAULT_WORD_COUNT = 6;
    static constexpr int MIN_WORD_COUNT = 4;
    static constexpr int MAX_WORD_COUNT = 20;

    explicit PassphraseGenerator(std::shared_ptr<RandomSource> randomSource = nullptr);

    // Throws InvalidParameterException when count <= 0.
    [[nodiscard]] std::string generate(const WordList& wordList, int count) const;

    // Below MIN_WORD_COUNT falls back to DEFAULT_WORD_COUNT, above MAX_WORD_COUNT is
    // capped.
    [[nodiscard]] static int clampWordCount(int requested);

private:
    std::shared_ptr<RandomSource> randomSource_;
};

}
