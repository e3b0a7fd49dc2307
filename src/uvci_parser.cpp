/**
 * @file uvci_parser.cpp
 * @brief UVCI parsing facade implementation
 */

#include "uvci/uvci_parser.h"
#include "uvci/opaque_string_decoder.h"
#include <algorithm>
#include <future>
#include <spdlog/spdlog.h>

namespace uvci {

namespace {

struct RecordPayloadFiller {
    UvciRecord& record;

    void operator()(const IdentifierWithSemantics& payload) const {
        record.vaccineId = payload.vaccineId;
        record.opaqueUniqueString = payload.uniqueString;
    }
    void operator()(const SemanticPayload& payload) const {
        record.vaccineId = payload.vaccineId;
    }
    void operator()(const OpaquePayload& payload) const {
        record.opaqueUniqueString = payload.uniqueString;
    }
};

} // namespace

UvciParser::UvciParser(std::shared_ptr<const VaccinationStatisticsTable> table, ParserOptions options)
    : options_(std::move(options)),
      checksum_(options_.checksumAlgorithm),
      estimator_(std::move(table), options_.estimationCountry) {}

ParseResult UvciParser::parse(const std::string& raw) const {
    auto structure = grammar_.parseStructure(raw);
    if (!structure.ok()) {
        spdlog::debug("UVCI '{}' rejected: {}", raw, structure.message);
        return ParseResult::failure(structure.error, structure.message);
    }
    const StructuralFields& fields = *structure.fields;

    UvciRecord record;
    record.version = fields.version;
    record.country = fields.country;
    record.issuingEntity = fields.issuingEntity;
    record.schemaOption = schemaOptionOf(fields.payload);
    std::visit(RecordPayloadFiller{record}, fields.payload);

    if (fields.checksumText) {
        const std::string& text = *fields.checksumText;
        if (text.size() != 1 || !checksum_.isValidCheckCharacter(text[0])) {
            std::string message = "Invalid check character '" + text + "' for " +
                                  checksumAlgorithmToString(checksum_.algorithm());
            spdlog::debug("UVCI '{}' rejected: {}", raw, message);
            return ParseResult::failure(ParseError::INVALID_CHECKSUM_CHARACTER, message);
        }
        record.checksum = text[0];
        record.checksumVerification = checksum_.verify(fields.body, text[0])
            ? ChecksumVerification::VERIFIED
            : ChecksumVerification::MISMATCHED;
    }

    if (record.schemaOption == SchemaOption::OPAQUE_UNIQUE_STRING) {
        auto segments = decodeOpaqueString(record.opaqueUniqueString);
        record.opaqueId = segments.id;
        record.opaqueIssuance = segments.issuance;

        if (!record.opaqueId.empty()) {
            auto date = estimator_.estimate(record.country, record.opaqueId);
            record.opaqueVaccinationMonth = date.month;
            record.opaqueVaccinationYear = date.year;
        }
    }

    return ParseResult::success(std::move(record));
}

std::vector<ParseResult> UvciParser::parseBatch(const std::vector<std::string>& inputs,
                                                unsigned threads) const {
    std::vector<ParseResult> results(inputs.size());

    auto parseRange = [this, &inputs, &results](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            results[i] = parse(inputs[i]);
        }
    };

    if (threads < 2 || inputs.size() < 2) {
        parseRange(0, inputs.size());
        return results;
    }

    size_t workers = std::min<size_t>(threads, inputs.size());
    size_t chunk = (inputs.size() + workers - 1) / workers;

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t begin = 0; begin < inputs.size(); begin += chunk) {
        size_t end = std::min(begin + chunk, inputs.size());
        futures.push_back(std::async(std::launch::async, parseRange, begin, end));
    }
    for (auto& future : futures) {
        future.get();
    }

    spdlog::debug("Parsed {} UVCIs with {} workers", inputs.size(), futures.size());
    return results;
}

} // namespace uvci
