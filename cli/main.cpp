#include "Config.hpp"
#include "Console.hpp"
#include "tokenseal/PassphraseGenerator.hpp"
#include "tokenseal/StrengthEstimator.hpp"
#include "tokenseal/TokenSeal.hpp"
#include "tokenseal/TokenSealException.hpp"
#include "tokenseal/WordList.hpp"
#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

using tokenseal::GenerationParams;
using tokenseal::PassphraseGenerator;
using tokenseal::SealParameterSpec;
using tokenseal::StrengthEstimator;
using tokenseal::TokenSeal;
using tokenseal::WordList;
using tokenseal::cli::Config;

// ── Exit codes ────────────────────────────────────────────────────────────────
static const int EXIT_OK      = 0;
static const int EXIT_USAGE   = 1;
static const int EXIT_CRYPTO  = 2;
static const int EXIT_IO      = 3;

// ── Usage ─────────────────────────────────────────────────────────────────────
static void print_usage(const char* prog) {
    std::cerr <<
        "Usage: " << prog << " [command] [options]\n"
        "\n"
        "Without a command, runs the interactive menu.\n"
        "\n"
        "Commands:\n"
        "  encrypt      Read a sentence, then a password, from stdin and print a token\n"
        "  decrypt      Read a token, then a password, from stdin and print the sentence\n"
        "  passphrase   Print a random passphrase and its estimated strength\n"
        "  strength     Read a password from stdin and print its estimated strength\n"
        "\n"
        "Options:\n"
        "  --passphrase <n>   encrypt: generate an n-word passphrase instead of reading one\n"
        "  --words <n>        passphrase: number of words (default: 6)\n"
        "  --wordlist <file>  Word list, one word per line (default: $TOKENSEAL_WORDLIST)\n"
        "\n"
        "Environment:\n"
        "  TOKENSEAL_WORDLIST        Word list path\n"
        "  TOKENSEAL_KDF_ITERATIONS  PBKDF2 iterations (default: 200000)\n"
        "  TOKENSEAL_VERBOSE         Report settings on stderr\n";
}

// ── Argument parser ───────────────────────────────────────────────────────────
struct Args {
    std::string command;
    std::optional<int> passphraseWords;
    int words = PassphraseGenerator::DEFAULT_WORD_COUNT;
    std::string wordListPath;
};

static bool parse_count(const std::string& text, int& out) {
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, out);
    return ec == std::errc() && ptr == last && out > 0;
}

static bool parse_args(int argc, char** argv, Args& args, const char* prog) {
    if (argc < 2) {
        return true;
    }
    args.command = argv[1];
    if (args.command == "--help" || args.command == "-h") {
        print_usage(prog);
        return false;
    }
    if (args.command != "encrypt" &&
        args.command != "decrypt" &&
        args.command != "passphrase" &&
        args.command != "strength") {
        std::cerr << "Unknown command: " << args.command << "\n\n";
        print_usage(prog);
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string opt = argv[i];
        auto need_val = [&]() -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Option " << opt << " requires a value\n";
                return false;
            }
            return true;
        };

        if (opt == "--passphrase" && args.command == "encrypt") {
            if (!need_val()) return false;
            int n = 0;
            if (!parse_count(argv[++i], n)) {
                std::cerr << "Invalid word count: " << argv[i] << "\n";
                return false;
            }
            args.passphraseWords = n;
        } else if (opt == "--words" && args.command == "passphrase") {
            if (!need_val()) return false;
            if (!parse_count(argv[++i], args.words)) {
                std::cerr << "Invalid word count: " << argv[i] << "\n";
                return false;
            }
        } else if (opt == "--wordlist") {
            if (!need_val()) return false;
            args.wordListPath = argv[++i];
        } else {
            std::cerr << "Unknown option: " << opt << "\n\n";
            print_usage(prog);
            return false;
        }
    }
    return true;
}

// ── Console helpers ───────────────────────────────────────────────────────────
static std::optional<std::string> read_line(const std::string& prompt) {
    return tokenseal::cli::readLine(std::cin, std::cerr, prompt);
}

static std::optional<std::string> read_secret(const std::string& prompt) {
    return tokenseal::cli::readSecret(STDIN_FILENO, std::cin, std::cerr, prompt);
}

static void print_strength(const tokenseal::StrengthReport& report, std::ostream& out) {
    out << StrengthEstimator::describe(report) << "\n"
        << StrengthEstimator::ADVISORY_NOTE << "\n";
}

static void print_decryption_failure() {
    std::cerr << "\n!! Decryption failed.\n"
                 "Possible reasons:\n"
                 "  - Wrong password or passphrase\n"
                 "  - Corrupted or incomplete token\n"
                 "  - Token was not created by this program\n\n";
}

static std::optional<WordList> load_word_list(const std::string& path, const Config& config) {
    try {
        WordList wordList = WordList::fromFile(path);
        if (config.verbose) {
            std::cerr << "[tokenseal] word list " << path << ": " << wordList.size() << " words\n";
        }
        return wordList;
    } catch (const tokenseal::TokenSealException& e) {
        std::cerr << "Word list error: " << e.what() << "\n";
        return std::nullopt;
    }
}

static std::string generate_and_show(const WordList& wordList, int count) {
    std::string passphrase = PassphraseGenerator().generate(wordList, count);
    const auto report = StrengthEstimator::estimate(
        passphrase, true, GenerationParams{count, wordList.size()});

    std::cerr << "\n=== GENERATED PASSPHRASE ===\n" << passphrase << "\n";
    print_strength(report, std::cerr);
    std::cerr << "!! IMPORTANT: Save this passphrase. You need it to decrypt later. !!\n\n";
    return passphrase;
}

// ── Interactive menu ──────────────────────────────────────────────────────────
static std::optional<std::string> ask_for_password_or_passphrase(const std::optional<WordList>& wordList) {
    std::cerr << "\nChoose password option:\n"
                 "  1) Type my own password\n"
                 "  2) Generate a random passphrase for me\n";
    const auto choice = read_line("Enter 1 or 2: ");
    if (!choice) return std::nullopt;

    if (*choice == "2" && !wordList) {
        std::cerr << "No word list available, please type a password instead.\n";
    } else if (*choice == "2") {
        const auto numText = read_line("How many words in the passphrase? (recommended: 6-12): ");
        if (!numText) return std::nullopt;

        int requested = 0;
        if (!parse_count(*numText, requested)) {
            std::cerr << "Invalid number, using " << PassphraseGenerator::DEFAULT_WORD_COUNT
                      << " words by default.\n";
            requested = PassphraseGenerator::DEFAULT_WORD_COUNT;
        }
        const int count = PassphraseGenerator::clampWordCount(requested);
        if (requested < PassphraseGenerator::MIN_WORD_COUNT) {
            std::cerr << "Too short, using " << count << " words for better security.\n";
        } else if (requested > PassphraseGenerator::MAX_WORD_COUNT) {
            std::cerr << "That's quite long. Limiting to " << count << " words.\n";
        }
        return generate_and_show(*wordList, count);
    }

    auto password = read_secret("Enter your password:\n> ");
    if (!password) return std::nullopt;
    std::cerr << "\n";
    print_strength(StrengthEstimator::estimate(*password, false), std::cerr);
    std::cerr << "\n";
    return password;
}

static void handle_encrypt(const TokenSeal& seal, const std::optional<WordList>& wordList) {
    const auto plaintext = read_line("\nEnter the sentence you want to ENCRYPT:\n> ");
    if (!plaintext || plaintext->empty()) {
        std::cerr << "Nothing to encrypt (empty input).\n";
        return;
    }

    const auto password = ask_for_password_or_passphrase(wordList);
    if (!password) return;

    const std::string token = seal.encrypt(*plaintext, *password);
    std::cout << "\n--- ENCRYPTION RESULT ---\n"
                 "Encrypted token (save this somewhere safe):\n"
              << token << "\n\n";
}

static void handle_decrypt(const TokenSeal& seal) {
    const auto token = read_line("\nEnter the encrypted token:\n> ");
    if (!token || token->empty()) {
        std::cerr << "No token provided.\n";
        return;
    }
    const auto password = read_secret("Enter the password or passphrase used for encryption:\n> ");
    if (!password) return;

    try {
        const std::string plaintext = seal.decrypt(*token, *password);
        std::cout << "\n--- DECRYPTION RESULT ---\n"
                     "Decrypted sentence:\n"
                  << plaintext << "\n\n";
    } catch (const tokenseal::DecryptionException&) {
        print_decryption_failure();
    }
}

static int run_menu(const TokenSeal& seal, const std::optional<WordList>& wordList) {
    while (true) {
        std::cerr << "=== AES-GCM Sentence Encryption Tool ===\n"
                     "  1) Encrypt a sentence\n"
                     "  2) Decrypt a sentence\n"
                     "  0) Exit\n";
        const auto choice = read_line("Enter your choice (0/1/2): ");
        if (!choice || *choice == "0") {
            std::cerr << "Goodbye!\n";
            return EXIT_OK;
        }
        if (*choice == "1") {
            handle_encrypt(seal, wordList);
        } else if (*choice == "2") {
            handle_decrypt(seal);
        } else {
            std::cerr << "Invalid choice. Please enter 0, 1, or 2.\n\n";
        }
    }
}

// ── Commands ──────────────────────────────────────────────────────────────────
static int cmd_encrypt(const Args& args, const Config& config, const TokenSeal& seal) {
    const auto plaintext = read_line("Sentence: ");
    if (!plaintext || plaintext->empty()) {
        std::cerr << "Nothing to encrypt (empty input).\n";
        return EXIT_USAGE;
    }

    std::string password;
    if (args.passphraseWords) {
        const auto wordList = load_word_list(args.wordListPath, config);
        if (!wordList) return EXIT_IO;
        password = generate_and_show(*wordList, *args.passphraseWords);
    } else {
        const auto typed = read_secret("Password: ");
        if (!typed) {
            std::cerr << "No password provided.\n";
            return EXIT_USAGE;
        }
        password = *typed;
        print_strength(StrengthEstimator::estimate(password, false), std::cerr);
    }

    std::cout << seal.encrypt(*plaintext, password) << "\n";
    return EXIT_OK;
}

static int cmd_decrypt(const TokenSeal& seal) {
    const auto token = read_line("Token: ");
    if (!token || token->empty()) {
        std::cerr << "No token provided.\n";
        return EXIT_USAGE;
    }
    const auto password = read_secret("Password: ");
    if (!password) {
        std::cerr << "No password provided.\n";
        return EXIT_USAGE;
    }

    try {
        std::cout << seal.decrypt(*token, *password) << "\n";
        return EXIT_OK;
    } catch (const tokenseal::DecryptionException&) {
        print_decryption_failure();
        return EXIT_CRYPTO;
    }
}

static int cmd_passphrase(const Args& args, const Config& config) {
    const auto wordList = load_word_list(args.wordListPath, config);
    if (!wordList) return EXIT_IO;

    const std::string passphrase = PassphraseGenerator().generate(*wordList, args.words);
    std::cout << passphrase << "\n";
    print_strength(StrengthEstimator::estimate(
        passphrase, true, GenerationParams{args.words, wordList->size()}), std::cerr);
    return EXIT_OK;
}

static int cmd_strength() {
    const auto password = read_secret("Password: ");
    if (!password) {
        std::cerr << "No password provided.\n";
        return EXIT_USAGE;
    }
    print_strength(StrengthEstimator::estimate(*password, false), std::cout);
    return EXIT_OK;
}

int main(int argc, char** argv) {
    const char* prog = argv[0];

    Args args;
    if (!parse_args(argc, argv, args, prog)) {
        return EXIT_USAGE;
    }

    Config config;
    try {
        config = Config::fromEnvironment();
    } catch (const tokenseal::InvalidParameterException& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    if (args.wordListPath.empty()) {
        args.wordListPath = config.wordListPath;
    }
    if (config.verbose) {
        std::cerr << "[tokenseal] PBKDF2 iterations: " << config.kdfIterations << "\n";
    }

    try {
        const TokenSeal seal(SealParameterSpec::GCM256_SHA256.withKdfIterations(config.kdfIterations));

        if (args.command.empty()) {
            return run_menu(seal, load_word_list(args.wordListPath, config));
        }
        if (args.command == "encrypt") return cmd_encrypt(args, config, seal);
        if (args.command == "decrypt") return cmd_decrypt(seal);
        if (args.command == "passphrase") return cmd_passphrase(args, config);
        return cmd_strength();
    } catch (const tokenseal::TokenSealException& e) {
        std::cerr << "Crypto error: " << e.what() << "\n";
        return EXIT_CRYPTO;
    }
}
