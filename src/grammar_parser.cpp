/**
 * @file grammar_parser.cpp
 * @brief UVCI grammar parser implementation
 */

#include "uvci/grammar_parser.h"
#include "uvci/utils/string_utils.h"
#include <spdlog/spdlog.h>

namespace uvci {

namespace {

StructureResult malformed(const std::string& message) {
    StructureResult result;
    result.error = ParseError::MALFORMED_STRUCTURE;
    result.message = message;
    return result;
}

struct PayloadOptionVisitor {
    SchemaOption operator()(const IdentifierWithSemantics&) const {
        return SchemaOption::IDENTIFIER_WITH_SEMANTICS;
    }
    SchemaOption operator()(const SemanticPayload&) const {
        return SchemaOption::SEMANTICS;
    }
    SchemaOption operator()(const OpaquePayload&) const {
        return SchemaOption::OPAQUE_UNIQUE_STRING;
    }
};

} // namespace

SchemaOption schemaOptionOf(const Payload& payload) {
    return std::visit(PayloadOptionVisitor{}, payload);
}

GrammarParser::GrammarParser()
    : semanticPayloadPattern_("^[A-Z]{2}[0-9]{4}[A-Z0-9]+$") {}

StructureResult GrammarParser::parseStructure(const std::string& raw) const {
    if (raw.empty()) {
        return malformed("Empty UVCI");
    }
    if (raw.size() > MAX_LENGTH) {
        return malformed("UVCI exceeds " + std::to_string(MAX_LENGTH) + " characters");
    }

    // Only uppercase is allowed by the guideline; lowercase input is normalized
    std::string text = utils::toUpper(raw);
    if (utils::startsWithIgnoreCase(text, URN_PREFIX)) {
        text = text.substr(std::char_traits<char>::length(URN_PREFIX));
    }
    if (text.empty()) {
        return malformed("Empty UVCI after prefix");
    }

    StructuralFields fields;

    size_t hashPos = text.find('#');
    if (hashPos != std::string::npos) {
        fields.checksumText = text.substr(hashPos + 1);
        text = text.substr(0, hashPos);
    }
    fields.body = text;

    // <version>:<country>:<issuer>/<payload>
    size_t firstColon = text.find(':');
    if (firstColon == std::string::npos) {
        return malformed("Missing ':' after version");
    }
    size_t secondColon = text.find(':', firstColon + 1);
    if (secondColon == std::string::npos) {
        return malformed("Missing ':' after country");
    }

    std::string version = text.substr(0, firstColon);
    if (version.size() != 2 || !utils::isAllDigits(version)) {
        return malformed("Version must be two digits: '" + version + "'");
    }
    fields.version = static_cast<unsigned>(std::stoul(version));

    std::string country = text.substr(firstColon + 1, secondColon - firstColon - 1);
    if (country.size() != 2 || !utils::isAllUpperAlpha(country)) {
        return malformed("Country must be two letters: '" + country + "'");
    }
    fields.country = country;

    std::string rest = text.substr(secondColon + 1);
    size_t slashPos = rest.find('/');
    if (slashPos == std::string::npos) {
        return malformed("Missing '/' between issuing entity and payload");
    }

    fields.issuingEntity = rest.substr(0, slashPos);
    if (fields.issuingEntity.empty()) {
        return malformed("Empty issuing entity");
    }

    std::string payload = rest.substr(slashPos + 1);
    if (payload.empty()) {
        return malformed("Empty payload");
    }
    fields.payload = classifyPayload(payload);

    spdlog::trace("UVCI structure: version={}, country={}, issuer={}, option={}",
                  fields.version, fields.country, fields.issuingEntity,
                  schemaOptionNumber(schemaOptionOf(fields.payload)));

    StructureResult result;
    result.fields = std::move(fields);
    return result;
}

Payload GrammarParser::classifyPayload(const std::string& payload) const {
    // Option 1: <vaccineId>/<uniqueString>, one side may be empty
    size_t slashPos = payload.find('/');
    if (slashPos != std::string::npos && payload.size() > 1) {
        return IdentifierWithSemantics{payload.substr(0, slashPos), payload.substr(slashPos + 1)};
    }

    // Option 2: fixed-position vaccine code
    if (std::regex_match(payload, semanticPayloadPattern_)) {
        return SemanticPayload{payload.substr(0, 6), payload.substr(6)};
    }

    return OpaquePayload{payload};
}

} // namespace uvci
