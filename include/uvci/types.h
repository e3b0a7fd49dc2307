/**
 * @file types.h
 * @brief Common types for the UVCI parser library
 *
 * Shared enums and result structs used across all parsing modules.
 * eHealth Network "verifiable vaccination certificates - basic
 * interoperability elements" Release 2, Annex 2 (UVCI).
 */

#pragma once

#include <optional>
#include <string>

namespace uvci {

/// @brief UVCI payload grammar (schema option) of a parsed identifier
enum class SchemaOption {
    IDENTIFIER_WITH_SEMANTICS = 1,  ///< issuer/vaccine/unique-string
    SEMANTICS = 2,                  ///< single segment with fixed-position vaccine code
    OPAQUE_UNIQUE_STRING = 3        ///< single segment without decodable semantics
};

/// @brief Outcome of the optional trailing check character
enum class ChecksumVerification {
    VERIFIED,       ///< Check character present and correct
    MISMATCHED,     ///< Check character present but wrong
    NOT_APPLICABLE  ///< No "#<char>" suffix in the input
};

/// @brief Per-record parse failure
enum class ParseError {
    NONE,
    MALFORMED_STRUCTURE,        ///< version/country/issuer/payload skeleton not satisfied
    INVALID_CHECKSUM_CHARACTER  ///< "#" suffix present but not a single valid check symbol
};

/// @brief Estimated vaccination period, {0, 0} when not inferable
struct VaccinationDate {
    unsigned month = 0;  ///< 1-12
    unsigned year = 0;

    bool known() const { return month != 0 && year != 0; }

    bool operator==(const VaccinationDate& other) const {
        return month == other.month && year == other.year;
    }
    bool operator!=(const VaccinationDate& other) const { return !(*this == other); }
};

/// @brief Schema option number as printed in the guideline (1, 2 or 3)
inline int schemaOptionNumber(SchemaOption option) {
    return static_cast<int>(option);
}

/// @brief Human-readable schema option label
inline std::string schemaOptionDescription(SchemaOption option) {
    switch (option) {
        case SchemaOption::IDENTIFIER_WITH_SEMANTICS: return "identifier with semantics";
        case SchemaOption::SEMANTICS:                 return "semantics";
        case SchemaOption::OPAQUE_UNIQUE_STRING:      return "opaque unique string";
    }
    return "unknown";
}

/**
 * @brief Parsed UVCI
 *
 * Produced once per input by UvciParser::parse() and never modified by the
 * library afterwards.
 */
struct UvciRecord {
    unsigned version = 0;
    std::string country;              ///< ISO 3166-1 alpha-2
    SchemaOption schemaOption = SchemaOption::OPAQUE_UNIQUE_STRING;
    std::string issuingEntity;
    std::string vaccineId;            ///< Options 1 and 2 only
    std::string opaqueUniqueString;   ///< Options 1 and 3 only
    std::string opaqueId;             ///< Identifier segment of an option 3 payload
    std::string opaqueIssuance;       ///< Issuance segment of an option 3 payload
    unsigned opaqueVaccinationMonth = 0;
    unsigned opaqueVaccinationYear = 0;
    std::optional<char> checksum;
    ChecksumVerification checksumVerification = ChecksumVerification::NOT_APPLICABLE;

    int schemaOptionNumber() const { return uvci::schemaOptionNumber(schemaOption); }
    std::string schemaOptionDesc() const { return schemaOptionDescription(schemaOption); }
};

/// @brief Result of UvciParser::parse()
struct ParseResult {
    std::optional<UvciRecord> record;
    ParseError error = ParseError::NONE;
    std::string message;  ///< Error detail, empty on success

    bool ok() const { return record.has_value(); }

    static ParseResult success(UvciRecord rec) {
        ParseResult result;
        result.record = std::move(rec);
        return result;
    }

    static ParseResult failure(ParseError err, std::string msg) {
        ParseResult result;
        result.error = err;
        result.message = std::move(msg);
        return result;
    }
};

/// @brief Convert ChecksumVerification to string
inline std::string checksumVerificationToString(ChecksumVerification v) {
    switch (v) {
        case ChecksumVerification::VERIFIED:       return "VERIFIED";
        case ChecksumVerification::MISMATCHED:     return "MISMATCHED";
        case ChecksumVerification::NOT_APPLICABLE: return "NOT_APPLICABLE";
    }
    return "UNKNOWN";
}

/// @brief Convert ParseError to string
inline std::string parseErrorToString(ParseError e) {
    switch (e) {
        case ParseError::NONE:                       return "NONE";
        case ParseError::MALFORMED_STRUCTURE:        return "MALFORMED_STRUCTURE";
        case ParseError::INVALID_CHECKSUM_CHARACTER: return "INVALID_CHECKSUM_CHARACTER";
    }
    return "UNKNOWN";
}

} // namespace uvci
