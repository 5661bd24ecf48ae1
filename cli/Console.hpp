#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace tokenseal::cli {

// Line without surrounding whitespace, or nullopt at end of input.
std::optional<std::string> readLine(std::istream& in, std::ostream& prompts, const std::string& prompt);

// Like readLine, with terminal echo turned off while reading when fd is a terminal.
// Falls back to readLine when the terminal settings of fd cannot be read.
std::optional<std::string> readSecret(int fd, std::istream& in, std::ostream& prompts, const std::string& prompt);

}
