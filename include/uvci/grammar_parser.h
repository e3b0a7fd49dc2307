/**
 * @file grammar_parser.h
 * @brief Structural split of a raw UVCI string
 *
 * Grammar:
 *   [URN:UVCI:]<version>:<country>:<issuer>/<payload>[#<checksum>]
 *
 * The payload is classified into one of the three schema options by shape.
 * Shapes that match neither option 1 nor option 2 are treated as opaque
 * (option 3) rather than rejected.
 */

#pragma once

#include "uvci/types.h"
#include <optional>
#include <regex>
#include <string>
#include <variant>

namespace uvci {

/// @brief Option 1 payload: "<vaccineId>/<uniqueString>"
struct IdentifierWithSemantics {
    std::string vaccineId;
    std::string uniqueString;
};

/// @brief Option 2 payload: two-letter marker + four-digit product code + serial
struct SemanticPayload {
    std::string vaccineId;  ///< Marker and product code (first six characters)
    std::string serial;     ///< Remainder, not carried into UvciRecord
};

/// @brief Option 3 payload: no decodable semantics
struct OpaquePayload {
    std::string uniqueString;
};

using Payload = std::variant<IdentifierWithSemantics, SemanticPayload, OpaquePayload>;

/// @brief Schema option carried by a payload variant
SchemaOption schemaOptionOf(const Payload& payload);

/// @brief Fields of a structurally valid UVCI
struct StructuralFields {
    std::string body;      ///< Uppercase, prefix stripped, without "#..." (checksummed text)
    unsigned version = 0;
    std::string country;
    std::string issuingEntity;
    Payload payload;
    std::optional<std::string> checksumText;  ///< Raw text after '#', if a '#' was present
};

/// @brief Result of GrammarParser::parseStructure()
struct StructureResult {
    std::optional<StructuralFields> fields;
    ParseError error = ParseError::NONE;
    std::string message;

    bool ok() const { return fields.has_value(); }
};

/**
 * @brief UVCI grammar parser
 *
 * Stateless apart from the compiled option 2 pattern; parseStructure() is
 * const and safe to call concurrently.
 */
class GrammarParser {
public:
    static constexpr const char* URN_PREFIX = "URN:UVCI:";
    static constexpr size_t MAX_LENGTH = 72;  ///< Guideline maximum, prefix included

    GrammarParser();

    /**
     * @brief Split a raw UVCI into its structural fields
     *
     * @param raw Candidate UVCI, already trimmed by the caller
     * @return Fields, or MALFORMED_STRUCTURE with a message
     */
    StructureResult parseStructure(const std::string& raw) const;

    /**
     * @brief Classify a non-empty payload into a schema option variant
     */
    Payload classifyPayload(const std::string& payload) const;

private:
    std::regex semanticPayloadPattern_;
};

} // namespace uvci
