#include "tokenseal/WordList.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <fstream>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace tokenseal {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

std::string_view trim(std::string_view line) {
    const size_t first = line.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const size_t last = line.find_last_not_of(WHITESPACE);
    return line.substr(first, last - first + 1);
}

}

WordList::WordList(std::vector<std::string> words)
    : words_(std::move(words)) {

    if (words_.empty()) {
        throw EmptyWordListException("word list is empty");
    }

    std::unordered_set<std::string_view> seen;
    for (const std::string& word : words_) {
        if (word.empty()) {
            throw InvalidParameterException("word list contains an empty word");
        }
        if (!seen.insert(word).second) {
            throw InvalidParameterException("word list contains a repeated word: " + word);
        }
    }
}

WordList WordList::fromStream(std::istream& input) {
    std::vector<std::string> words;
    std::unordered_set<std::string> seen;

    std::string line;
    while (std::getline(input, line)) {
        const std::string_view word = trim(line);
        if (word.empty() || word.front() == '#') {
            continue;
        }
        if (seen.emplace(word).second) {
            words.emplace_back(word);
        }
    }

    if (words.empty()) {
        throw EmptyWordListException("word list is empty, no usable line found");
    }
    return WordList(std::move(words));
}

WordList WordList::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TokenSealException("Failed to open word list: " + path);
    }
    return fromStream(file);
}

}
