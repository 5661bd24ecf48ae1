#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace tokenseal {

// Ordered, non-empty list of distinct non-empty words. Immutable once built.
class WordList {
public:
    // Throws EmptyWordListException when words is empty and
    // InvalidParameterException on an empty or repeated word.
    explicit WordList(std::vector<std::string> words);

    // One candidate per line, trimmed. Blank lines and lines starting with '#' are
    // skipped, and a repeated word keeps only its first occurrence.
    [[nodiscard]] static WordList fromStream(std::istream& input);
    [[nodiscard]] static WordList fromFile(const std::string& path);

    [[nodiscard]] size_t size() const { return words_.size(); }
    [[nodiscard]] const std::string& at(size_t index) const { return words_.at(index); }
    [[nodiscard]] const std::vector<std::string>& getWords() const { return words_; }

    [[nodiscard]] std::vector<std::string>::const_iterator begin() const { return words_.begin(); }
    [[nodiscard]] std::vector<std::string>::const_iterator end() const { return words_.end(); }

private:
    std::vector<std::string> words_;
};

}
