#pragma once

#include <string>
#include <string_view>

namespace tokenseal::cli {

// Settings read once from the environment at start-up.
struct Config {
    std::string wordListPath;
    int kdfIterations;
    bool verbose;

    // TOKENSEAL_WORDLIST, TOKENSEAL_KDF_ITERATIONS, TOKENSEAL_VERBOSE.
    // Throws InvalidParameterException on a malformed iteration count.
    [[nodiscard]] static Config fromEnvironment();
};

namespace env {

std::string get(std::string_view name);
bool isEnabled(std::string_view name, bool defaultValue = false);

}

}
