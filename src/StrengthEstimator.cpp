#include "tokenseal/StrengthEstimator.hpp"
#include "tokenseal/TokenSealException.hpp"
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace tokenseal {

namespace {

struct Threshold {
    double upperBound;
    const char* label;
    int score;
};

constexpr Threshold THRESHOLDS[] = {
    {30.0, "VERY WEAK", 10},
    {40.0, "Weak", 25},
    {60.0, "Okay", 40},
    {80.0, "Moderate", 60},
    {100.0, "Strong", 80},
};

constexpr const char* TOP_LABEL = "VERY STRONG";
constexpr int TOP_SCORE = 95;

// Decimal or other digit, e.g. '7' or superscript two
bool isDigit(const UChar32 c) {
    const auto numericType = u_getIntPropertyValue(c, UCHAR_NUMERIC_TYPE);
    return numericType == U_NT_DECIMAL || numericType == U_NT_DIGIT;
}

// Any letter or any character with a numeric value
bool isAlphanumeric(const UChar32 c) {
    return u_isalpha(c) || u_getIntPropertyValue(c, UCHAR_NUMERIC_TYPE) != U_NT_NONE;
}

}

double StrengthEstimator::entropyOfGenerated(const int count, const size_t wordListSize) {
    if (count <= 0 || wordListSize <= 1) {
        return 0.0;
    }
    return count * std::log2(static_cast<double>(wordListSize));
}

double StrengthEstimator::entropyOfTyped(const std::string_view password) {
    bool hasLower = false;
    bool hasUpper = false;
    bool hasDigit = false;
    bool hasSymbol = false;
    size_t length = 0;

    const auto* bytes = reinterpret_cast<const uint8_t*>(password.data());
    const auto byteCount = static_cast<int32_t>(password.size());
    int32_t offset = 0;
    while (offset < byteCount) {
        UChar32 c;
        U8_NEXT(bytes, offset, byteCount, c);
        ++length;
        // An ill-formed sequence counts as one symbol
        if (c < 0) {
            hasSymbol = true;
            continue;
        }
        hasLower = hasLower || u_isULowercase(c);
        hasUpper = hasUpper || u_isUUppercase(c);
        hasDigit = hasDigit || isDigit(c);
        hasSymbol = hasSymbol || !isAlphanumeric(c);
    }

    int charsetSize = 0;
    if (hasLower) {
        charsetSize += LOWERCASE_ALPHABET;
    }
    if (hasUpper) {
        charsetSize += UPPERCASE_ALPHABET;
    }
    if (hasDigit) {
        charsetSize += DIGIT_ALPHABET;
    }
    if (hasSymbol) {
        charsetSize += SYMBOL_ALPHABET;
    }

    if (length == 0 || charsetSize == 0) {
        return 0.0;
    }
    return static_cast<double>(length) * std::log2(static_cast<double>(charsetSize));
}

StrengthRating StrengthEstimator::rate(const double bits) {
    for (const Threshold& threshold : THRESHOLDS) {
        if (bits < threshold.upperBound) {
            return {threshold.label, threshold.score};
        }
    }
    return {TOP_LABEL, TOP_SCORE};
}

StrengthReport StrengthEstimator::estimate(
    const std::string_view secret,
    const bool generated,
    const std::optional<GenerationParams> generationParams) {

    double bits;
    if (generated) {
        if (!generationParams) {
            throw InvalidParameterException("generation parameters are required for a generated secret");
        }
        bits = entropyOfGenerated(generationParams->wordCount, generationParams->wordListSize);
    } else {
        bits = entropyOfTyped(secret);
    }
    return {rate(bits), bits};
}

std::string StrengthEstimator::describe(const StrengthReport& report) {
    std::ostringstream out;
    out << "Estimated strength: " << report.rating.label
        << " (~" << std::fixed << std::setprecision(1) << report.bits
        << " bits, score " << report.rating.score << "/100)";
    return out.str();
}

}
