#include "tokenseal/PassphraseGenerator.hpp"
#include "tokenseal/RandomSource.hpp"
#include "tokenseal/TokenSealException.hpp"
#include "tokenseal/WordList.hpp"
#include <utility>

namespace tokenseal {

PassphraseGenerator::PassphraseGenerator(std::shared_ptr<RandomSource> randomSource)
    : randomSource_(randomSource ? std::move(randomSource) : RandomSource::secure()) {
}

std::string PassphraseGenerator::generate(const WordList& wordList, const int count) const {
    if (count <= 0) {
        throw InvalidParameterException("word count must be > 0, got " + std::to_string(count));
    }

    std::string passphrase;
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            passphrase += SEPARATOR;
        }
        passphrase += wordList.at(randomSource_->uniform(wordList.size()));
    }
    return passphrase;
}

int PassphraseGenerator::clampWordCount(const int requested) {
    if (requested < MIN_WORD_COUNT) {
        return DEFAULT_WORD_COUNT;
    }
    if (requested > MAX_WORD_COUNT) {
        return MAX_WORD_COUNT;
    }
    return requested;
}

}
