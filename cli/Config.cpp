#include "Config.hpp"
#include "tokenseal/SealParameterSpec.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

#ifndef TOKENSEAL_DEFAULT_WORDLIST
#define TOKENSEAL_DEFAULT_WORDLIST "wordlist.txt"
#endif

namespace tokenseal::cli {

namespace env {

namespace {

std::string toLower(std::string value) {
    std::ranges::transform(value, value.begin(),
                           [](const unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}

std::string get(const std::string_view name) {
    const std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return value;
}

bool isEnabled(const std::string_view name, const bool defaultValue) {
    std::string value = get(name);
    if (value.empty()) {
        return defaultValue;
    }
    value = toLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

}

Config Config::fromEnvironment() {
    Config config{TOKENSEAL_DEFAULT_WORDLIST, SealParameterSpec::DEFAULT_KDF_ITERATIONS, false};

    if (std::string path = env::get("TOKENSEAL_WORDLIST"); !path.empty()) {
        config.wordListPath = std::move(path);
    }

    if (const std::string iterations = env::get("TOKENSEAL_KDF_ITERATIONS"); !iterations.empty()) {
        int value = 0;
        const char* last = iterations.data() + iterations.size();
        const auto [ptr, ec] = std::from_chars(iterations.data(), last, value);
        if (ec != std::errc() || ptr != last || value <= 0) {
            throw InvalidParameterException("TOKENSEAL_KDF_ITERATIONS must be a positive integer, got '" +
                                            iterations + "'");
        }
        config.kdfIterations = value;
    }

    config.verbose = env::isEnabled("TOKENSEAL_VERBOSE");
    return config;
}

}
