/**
 * @file record_formatter.h
 * @brief Rendering of parsed UVCI records
 *
 * Text, CSV, JSON (jsoncpp) and Neo4j Cypher renderings. The parser has no
 * dependency on this module.
 */

#pragma once

#include "uvci/types.h"
#include <json/json.h>
#include <string>
#include <vector>

namespace uvci {
namespace output {

/**
 * @brief Aligned "key : value" lines, one per record field
 */
std::string toText(const UvciRecord& record);

/// @brief RFC 4180 quoting, applied only when value contains ',', '"' or a line break
std::string csvField(const std::string& value);

/// @brief CSV column names matching toCsv()
std::string csvHeader();

/**
 * @brief One CSV row (no trailing newline)
 *
 * Absent checksum is an empty column; checksum verification is
 * "true", "false" or empty when not applicable.
 */
std::string toCsv(const UvciRecord& record);

/// @brief JSON object with camelCase keys; "checksum" is null when absent
Json::Value toJson(const UvciRecord& record);

/// @brief Column names matching toCsv(input, result): input, record columns, error
std::string csvResultHeader();

/**
 * @brief One CSV row for a parse outcome (no trailing newline)
 *
 * Failed inputs leave the record columns empty and carry the ParseError name.
 */
std::string toCsv(const std::string& input, const ParseResult& result);

/**
 * @brief JSON object for a parse outcome
 *
 * {"input": ..., "record": {...}} on success,
 * {"input": ..., "error": "MALFORMED_STRUCTURE", "message": ...} on failure.
 */
Json::Value toJson(const std::string& input, const ParseResult& result);

/// @brief Serialize JSON with two-space indentation
std::string toJsonString(const Json::Value& value);

/**
 * @brief Cypher CREATE statements for one record
 *
 * Only Swedish E-hälsomyndigheten records (version 1, country SE, issuer
 * EHM, schema option 3) with a decoded opaque identifier produce output:
 *
 *   CREATE (SE:country {name:'Sweden'})-[:COUNTRY_OF {}]->(EHM:issuing_entity {name:'E-hälsomyndigheten'})
 *   CREATE (EHM)-[:ISSUER_OF {}]->(V12916227:opaque_id {name:'V12916227'})
 *   CREATE (d20218:vac_date {name:'Aug 2021'})
 *   CREATE (d20218)-[:VAC_DATE_OF {}]->(V12916227)
 *   CREATE (V12916227TFJJ:reissue_id {name:'TFJJ'})-[:REISSUE_OF {}]->(V12916227)
 *
 * The date statements are omitted when no date was estimated, the reissue
 * statement when the payload has no issuance segment. Variable names that
 * are not plain identifiers (e.g. "12916227") are backtick-quoted and
 * string values have ' and \ escaped.
 *
 * @return Newline-terminated statements, or "" for other records
 */
std::string toCypher(const UvciRecord& record);

/**
 * @brief Cypher script for many records
 *
 * Statements are de-duplicated (first occurrence wins) and the script ends
 * with "RETURN *".
 */
std::string toCypherBatch(const std::vector<UvciRecord>& records);

/// @brief Three-letter English month name, "Unknown" outside 1-12
std::string monthAbbreviation(unsigned month);

} // namespace output
} // namespace uvci
