/**
 * @file checksum_engine.cpp
 * @brief UVCI check character implementation
 */

#include "uvci/checksum_engine.h"
#include "uvci/grammar_parser.h"
#include <cstring>

namespace uvci {

namespace {

// Luhn mod N code points, in guideline order
constexpr const char* LUHN_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789/:";
constexpr int LUHN_MODULUS = 38;

// ISO 7064 values 0-35, '*' is the extra check-only symbol with value 36
constexpr const char* ISO7064_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ*";
constexpr int ISO7064_MODULUS = 37;
constexpr int ISO7064_RADIX = 36;

int luhnCodePoint(char c) {
    const char* pos = std::strchr(LUHN_ALPHABET, c);
    if (c == '\0' || !pos) {
        return -1;
    }
    return static_cast<int>(pos - LUHN_ALPHABET);
}

int iso7064Value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string checksumAlgorithmToString(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::LUHN_MOD_N:        return "luhn";
        case ChecksumAlgorithm::ISO7064_MOD_37_36: return "iso7064";
    }
    return "unknown";
}

std::optional<ChecksumAlgorithm> checksumAlgorithmFromString(const std::string& name) {
    if (name == "luhn") return ChecksumAlgorithm::LUHN_MOD_N;
    if (name == "iso7064") return ChecksumAlgorithm::ISO7064_MOD_37_36;
    return std::nullopt;
}

ChecksumEngine::ChecksumEngine(ChecksumAlgorithm algorithm)
    : algorithm_(algorithm) {}

std::optional<char> ChecksumEngine::compute(const std::string& body) const {
    switch (algorithm_) {
        case ChecksumAlgorithm::LUHN_MOD_N:
            // Member states compute over the full URN form, prefix included
            return computeLuhnModN(std::string(GrammarParser::URN_PREFIX) + body);
        case ChecksumAlgorithm::ISO7064_MOD_37_36:
            return computeIso7064(body);
    }
    return std::nullopt;
}

bool ChecksumEngine::verify(const std::string& body, char candidate) const {
    auto expected = compute(body);
    return expected.has_value() && *expected == candidate;
}

bool ChecksumEngine::isValidCheckCharacter(char c) const {
    if (c == '\0') {
        return false;
    }
    switch (algorithm_) {
        case ChecksumAlgorithm::LUHN_MOD_N:
            return luhnCodePoint(c) >= 0;
        case ChecksumAlgorithm::ISO7064_MOD_37_36:
            return std::strchr(ISO7064_ALPHABET, c) != nullptr;
    }
    return false;
}

std::optional<char> ChecksumEngine::computeLuhnModN(const std::string& text) const {
    int factor = 2;
    int sum = 0;

    // Rightmost symbol gets factor 2, since the check character will follow it
    for (auto it = text.rbegin(); it != text.rend(); ++it) {
        int codePoint = luhnCodePoint(*it);
        if (codePoint < 0) {
            return std::nullopt;
        }

        int addend = factor * codePoint;
        factor = (factor == 2) ? 1 : 2;
        sum += (addend / LUHN_MODULUS) + (addend % LUHN_MODULUS);
    }

    int remainder = sum % LUHN_MODULUS;
    int checkCodePoint = (LUHN_MODULUS - remainder) % LUHN_MODULUS;
    return LUHN_ALPHABET[checkCodePoint];
}

char ChecksumEngine::computeIso7064(const std::string& text) const {
    int remainder = ISO7064_RADIX;

    for (char c : text) {
        int value = iso7064Value(c);
        if (value < 0) {
            continue;  // ':' and '/' separators
        }

        int sum = (remainder + value) % ISO7064_MODULUS;
        if (sum == 0) {
            sum = ISO7064_MODULUS;
        }
        remainder = (sum * 2) % ISO7064_MODULUS;
    }

    int checkValue = (ISO7064_MODULUS + 1 - remainder) % ISO7064_MODULUS;
    return ISO7064_ALPHABET[checkValue];
}

} // namespace uvci
