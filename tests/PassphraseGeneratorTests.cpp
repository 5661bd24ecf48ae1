#include <catch2/catch_test_macros.hpp>
#include "TestUtils.hpp"
#include <tokenseal/PassphraseGenerator.hpp>
#include <algorithm>
#include <map>
#include <memory>
#include <sstream>

using tokenseal::PassphraseGenerator;
using tokenseal::test::createTestWordList;
using tokenseal::test::ScriptedRandomSource;
using tokenseal::test::uniformBytes;

namespace {

std::vector<std::string> split(const std::string& passphrase) {
    std::vector<std::string> words;
    std::istringstream input(passphrase);
    std::string word;
    while (std::getline(input, word, PassphraseGenerator::SEPARATOR)) {
        words.push_back(word);
    }
    return words;
}

}

TEST_CASE("Passphrase is hyphen-joined words from the list", "[passphrase]") {
    const auto wordList = createTestWordList();
    const PassphraseGenerator generator;

    const std::string passphrase = generator.generate(wordList, 4);
    const auto words = split(passphrase);

    REQUIRE(words.size() == 4);
    for (const auto& word : words) {
        REQUIRE(std::ranges::find(wordList, word) != wordList.end());
    }
}

TEST_CASE("Words are picked by uniform draws", "[passphrase]") {
    const auto wordList = createTestWordList();
    std::vector<uint8_t> script;
    for (const uint64_t index : {2, 0, 3, 3}) {
        const auto bytes = uniformBytes(index);
        script.insert(script.end(), bytes.begin(), bytes.end());
    }
    const PassphraseGenerator generator(std::make_shared<ScriptedRandomSource>(script));

    REQUIRE(generator.generate(wordList, 4) == "gamma-alpha-delta-delta");
}

TEST_CASE("Single word list repeats its word", "[passphrase]") {
    const tokenseal::WordList wordList({"only"});
    const PassphraseGenerator generator(std::make_shared<tokenseal::SeededRandomSource>(1));

    REQUIRE(generator.generate(wordList, 3) == "only-only-only");
}

TEST_CASE("Seeded generators agree", "[passphrase]") {
    const auto wordList = createTestWordList();
    const PassphraseGenerator first(std::make_shared<tokenseal::SeededRandomSource>(5));
    const PassphraseGenerator second(std::make_shared<tokenseal::SeededRandomSource>(5));

    REQUIRE(first.generate(wordList, 12) == second.generate(wordList, 12));
}

TEST_CASE("Draws cover the list evenly", "[passphrase]") {
    const auto wordList = createTestWordList();
    const PassphraseGenerator generator(std::make_shared<tokenseal::SeededRandomSource>(2024));

    std::map<std::string, int> counts;
    for (const auto& word : split(generator.generate(wordList, 4000))) {
        counts[word]++;
    }

    REQUIRE(counts.size() == 4);
    for (const auto& [word, count] : counts) {
        INFO(word);
        REQUIRE(count > 800);
        REQUIRE(count < 1200);
    }
}

TEST_CASE("Non-positive word count is rejected", "[passphrase][validation]") {
    const auto wordList = createTestWordList();
    const PassphraseGenerator generator;

    REQUIRE_THROWS_AS(generator.generate(wordList, 0), tokenseal::InvalidParameterException);
    REQUIRE_THROWS_AS(generator.generate(wordList, -2), tokenseal::InvalidParameterException);
}

TEST_CASE("Requested word counts are clamped", "[passphrase]") {
    REQUIRE(PassphraseGenerator::clampWordCount(-1) == 6);
    REQUIRE(PassphraseGenerator::clampWordCount(3) == 6);
    REQUIRE(PassphraseGenerator::clampWordCount(4) == 4);
    REQUIRE(PassphraseGenerator::clampWordCount(12) == 12);
    REQUIRE(PassphraseGenerator::clampWordCount(20) == 20);
    REQUIRE(PassphraseGenerator::clampWordCount(21) == 20);
}
