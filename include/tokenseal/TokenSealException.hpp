#pragma once

#include <exception>
#include <string>
#include <utility>

namespace tokenseal {

// Root of every error raised by the library.
class TokenSealException : public std::exception {
public:
    explicit TokenSealException(std::string message) : message_(std::move(message)) {}

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

// A caller-supplied argument violates its precondition.
class InvalidParameterException : public TokenSealException {
public:
    using TokenSealException::TokenSealException;
};

// The word-list source yielded no usable word.
class EmptyWordListException : public TokenSealException {
public:
    using TokenSealException::TokenSealException;
};

// Token is not padded URL-safe base64 or decodes too short.
class FormatException : public TokenSealException {
public:
    using TokenSealException::TokenSealException;
};

// AEAD tag verification failed.
class AuthenticationException : public TokenSealException {
public:
    using TokenSealException::TokenSealException;
};

// The only failure TokenSeal::decrypt reports, whatever went wrong underneath.
class DecryptionException : public TokenSealException {
public:
    DecryptionException() : TokenSealException("decryption failed") {}
};

}
