/**
 * @file record_formatter.cpp
 * @brief Record formatter implementation
 */

#include "uvci/record_formatter.h"
#include "uvci/utils/string_utils.h"
#include <cctype>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>

namespace uvci {
namespace output {

namespace {

const char* const CSV_COLUMNS[] = {
    "version", "country", "schema_option_number", "schema_option_desc",
    "issuing_entity", "vaccine_id", "opaque_unique_string", "opaque_id",
    "opaque_issuance", "opaque_vaccination_month", "opaque_vaccination_year",
    "checksum", "checksum_verification"
};

std::string checksumText(const UvciRecord& record) {
    return record.checksum ? std::string(1, *record.checksum) : "";
}

std::string verificationText(ChecksumVerification v) {
    switch (v) {
        case ChecksumVerification::VERIFIED:       return "true";
        case ChecksumVerification::MISMATCHED:     return "false";
        case ChecksumVerification::NOT_APPLICABLE: return "";
    }
    return "";
}

std::vector<std::string> fieldValues(const UvciRecord& record) {
    return {
        std::to_string(record.version),
        record.country,
        std::to_string(record.schemaOptionNumber()),
        record.schemaOptionDesc(),
        record.issuingEntity,
        record.vaccineId,
        record.opaqueUniqueString,
        record.opaqueId,
        record.opaqueIssuance,
        std::to_string(record.opaqueVaccinationMonth),
        std::to_string(record.opaqueVaccinationYear),
        checksumText(record),
        verificationText(record.checksumVerification)
    };
}

bool isSwedishEhmOpaque(const UvciRecord& record) {
    return record.version == 1 &&
           record.country == "SE" &&
           record.issuingEntity == "EHM" &&
           record.schemaOption == SchemaOption::OPAQUE_UNIQUE_STRING &&
           !record.opaqueId.empty();
}

bool isCypherName(const std::string& name) {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

// Names that are not plain identifiers are backtick-quoted
std::string cypherVariable(const std::string& name) {
    if (isCypherName(name)) {
        return name;
    }
    std::string quoted = "`";
    for (char c : name) {
        if (c == '`') {
            quoted += '`';
        }
        quoted += c;
    }
    quoted += '`';
    return quoted;
}

std::string cypherString(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

} // namespace

std::string monthAbbreviation(unsigned month) {
    static const char* const names[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };
    if (month < 1 || month > 12) {
        return "Unknown";
    }
    return names[month - 1];
}

std::string toText(const UvciRecord& record) {
    auto values = fieldValues(record);
    // Text output spells out the not-applicable state
    if (record.checksumVerification == ChecksumVerification::NOT_APPLICABLE) {
        values.back() = "n/a";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        oss << std::left << std::setw(25) << CSV_COLUMNS[i] << ": " << values[i] << "\n";
    }
    return oss.str();
}

// RFC 4180 quoting
std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string csvHeader() {
    std::string header;
    for (const char* column : CSV_COLUMNS) {
        if (!header.empty()) header += ",";
        header += column;
    }
    return header;
}

std::string toCsv(const UvciRecord& record) {
    auto values = fieldValues(record);
    std::string row;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) row += ",";
        row += csvField(values[i]);
    }
    return row;
}

std::string csvResultHeader() {
    return "input," + csvHeader() + ",error";
}

std::string toCsv(const std::string& input, const ParseResult& result) {
    std::string row = csvField(input) + ",";
    if (result.ok()) {
        return row + toCsv(*result.record) + ",";
    }
    // Empty record columns
    row += std::string(std::size(CSV_COLUMNS) - 1, ',');
    return row + "," + parseErrorToString(result.error);
}

Json::Value toJson(const UvciRecord& record) {
    Json::Value json;
    json["version"] = record.version;
    json["country"] = record.country;
    json["schemaOptionNumber"] = record.schemaOptionNumber();
    json["schemaOptionDesc"] = record.schemaOptionDesc();
    json["issuingEntity"] = record.issuingEntity;
    json["vaccineId"] = record.vaccineId;
    json["opaqueUniqueString"] = record.opaqueUniqueString;
    json["opaqueId"] = record.opaqueId;
    json["opaqueIssuance"] = record.opaqueIssuance;
    json["opaqueVaccinationMonth"] = record.opaqueVaccinationMonth;
    json["opaqueVaccinationYear"] = record.opaqueVaccinationYear;
    json["checksum"] = record.checksum ? Json::Value(checksumText(record)) : Json::Value(Json::nullValue);
    json["checksumVerification"] = checksumVerificationToString(record.checksumVerification);
    return json;
}

Json::Value toJson(const std::string& input, const ParseResult& result) {
    Json::Value json;
    json["input"] = input;
    if (result.ok()) {
        json["record"] = toJson(*result.record);
    } else {
        json["error"] = parseErrorToString(result.error);
        json["message"] = result.message;
    }
    return json;
}

std::string toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

std::string toCypher(const UvciRecord& record) {
    if (!isSwedishEhmOpaque(record)) {
        return "";
    }

    const std::string country = cypherVariable(record.country);
    const std::string issuer = cypherVariable(record.issuingEntity);
    const std::string id = cypherVariable(record.opaqueId);

    std::ostringstream oss;
    oss << "CREATE (" << country << ":country {name:" << cypherString("Sweden")
        << "})-[:COUNTRY_OF {}]->(" << issuer
        << ":issuing_entity {name:" << cypherString("E-hälsomyndigheten") << "})\n";

    oss << "CREATE (" << issuer << ")-[:ISSUER_OF {}]->("
        << id << ":opaque_id {name:" << cypherString(record.opaqueId) << "})\n";

    if (record.opaqueVaccinationMonth != 0 && record.opaqueVaccinationYear != 0) {
        std::string dateNode = "d" + std::to_string(record.opaqueVaccinationYear) +
                               std::to_string(record.opaqueVaccinationMonth);
        oss << "CREATE (" << dateNode << ":vac_date {name:"
            << cypherString(monthAbbreviation(record.opaqueVaccinationMonth) + " " +
                            std::to_string(record.opaqueVaccinationYear))
            << "})\n";
        oss << "CREATE (" << dateNode << ")-[:VAC_DATE_OF {}]->(" << id << ")\n";
    }

    // Without an issuance segment the unique string is the identifier node itself
    if (!record.opaqueIssuance.empty()) {
        oss << "CREATE (" << cypherVariable(record.opaqueUniqueString)
            << ":reissue_id {name:" << cypherString(record.opaqueIssuance)
            << "})-[:REISSUE_OF {}]->(" << id << ")\n";
    }

    return oss.str();
}

std::string toCypherBatch(const std::vector<UvciRecord>& records) {
    std::set<std::string> seen;
    std::string script;

    for (const auto& record : records) {
        std::string statements = toCypher(record);
        if (statements.empty()) {
            continue;
        }
        statements.pop_back();  // trailing newline
        for (const auto& statement : utils::split(statements, '\n')) {
            if (seen.insert(statement).second) {
                script += statement + "\n";
            }
        }
    }

    script += "RETURN *\n";
    return script;
}

} // namespace output
} // namespace uvci
