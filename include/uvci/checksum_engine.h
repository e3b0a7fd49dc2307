/**
 * @file checksum_engine.h
 * @brief UVCI check character computation and verification
 *
 * The guideline appends an optional check character after '#'. Two
 * algorithms are provided:
 *   - LUHN_MOD_N: Luhn mod N (N = 38) over "A-Z0-9/:", computed on the full
 *     "URN:UVCI:"-prefixed identifier. Used by all issuing member states.
 *   - ISO7064_MOD_37_36: ISO/IEC 7064 style recurrence over "0-9A-Z" with '*'
 *     as value 36, computed on the prefix-stripped identifier. Separators
 *     are not part of the alphabet and are skipped.
 *
 * Pure functions, no I/O.
 */

#pragma once

#include <optional>
#include <string>

namespace uvci {

/// @brief Check character algorithm
enum class ChecksumAlgorithm {
    LUHN_MOD_N,
    ISO7064_MOD_37_36
};

/// @brief Convert ChecksumAlgorithm to its configuration name ("luhn", "iso7064")
std::string checksumAlgorithmToString(ChecksumAlgorithm algorithm);

/// @brief Parse a configuration name, std::nullopt for unknown names
std::optional<ChecksumAlgorithm> checksumAlgorithmFromString(const std::string& name);

/**
 * @brief Computes and verifies UVCI check characters
 */
class ChecksumEngine {
public:
    explicit ChecksumEngine(ChecksumAlgorithm algorithm = ChecksumAlgorithm::LUHN_MOD_N);

    /**
     * @brief Compute the check character
     *
     * @param body Normalized UVCI: uppercase, "URN:UVCI:" prefix stripped,
     *             without the '#' separator and check character
     * @return Check character, or std::nullopt if body contains a symbol
     *         the algorithm cannot encode
     */
    std::optional<char> compute(const std::string& body) const;

    /**
     * @brief Verify a check character against the normalized UVCI body
     * @return true only if compute(body) succeeds and equals candidate
     */
    bool verify(const std::string& body, char candidate) const;

    /**
     * @brief Check whether c can appear as check character for this algorithm
     */
    bool isValidCheckCharacter(char c) const;

    ChecksumAlgorithm algorithm() const { return algorithm_; }

private:
    std::optional<char> computeLuhnModN(const std::string& text) const;
    char computeIso7064(const std::string& text) const;

    ChecksumAlgorithm algorithm_;
};

} // namespace uvci
