#include "Console.hpp"
#include <cerrno>
#include <cstring>
#include <istream>
#include <ostream>
#include <termios.h>

namespace tokenseal::cli {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}

std::optional<std::string> readLine(std::istream& in, std::ostream& prompts, const std::string& prompt) {
    if (!prompt.empty()) {
        prompts << prompt << std::flush;
    }
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    return trim(line);
}

std::optional<std::string> readSecret(const int fd, std::istream& in, std::ostream& prompts, const std::string& prompt) {
    termios saved{};
    if (tcgetattr(fd, &saved) != 0) {
        return readLine(in, prompts, prompt);
    }

    termios hidden = saved;
    hidden.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    if (tcsetattr(fd, TCSANOW, &hidden) != 0) {
        prompts << "warning: cannot hide input: " << std::strerror(errno) << "\n";
        return readLine(in, prompts, prompt);
    }

    const auto line = readLine(in, prompts, prompt);

    if (tcsetattr(fd, TCSANOW, &saved) != 0) {
        prompts << "\nwarning: cannot restore terminal echo: " << std::strerror(errno);
    }
    prompts << "\n";
    return line;
}

}
