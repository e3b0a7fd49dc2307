/**
 * @file uvci_parser.h
 * @brief UVCI parsing facade
 *
 * Runs grammar split -> check character verification -> opaque string
 * decoding -> vaccination date estimation and produces one ParseResult per
 * input. Structure and check character errors are returned per record;
 * decoding and estimation never fail.
 *
 * @example
 * auto table = VaccinationStatisticsTable::loadFromCsv("se_vaccination_weekly.csv");
 * UvciParser parser(table ? std::make_shared<const VaccinationStatisticsTable>(*table) : nullptr);
 * auto result = parser.parse("URN:UVCI:01:SE:EHM/V12916227TFJJ#Q");
 * // result.record->opaqueId == "V12916227", checksumVerification == VERIFIED
 */

#pragma once

#include "uvci/checksum_engine.h"
#include "uvci/grammar_parser.h"
#include "uvci/types.h"
#include "uvci/vaccination_date_estimator.h"
#include "uvci/vaccination_statistics.h"
#include <memory>
#include <string>
#include <vector>

namespace uvci {

/// @brief Parser behaviour switches
struct ParserOptions {
    ChecksumAlgorithm checksumAlgorithm = ChecksumAlgorithm::LUHN_MOD_N;
    std::string estimationCountry = VaccinationDateEstimator::DEFAULT_COUNTRY;
};

/**
 * @brief UVCI parser
 *
 * All state is immutable after construction; parse() may be called
 * concurrently from any number of threads.
 */
class UvciParser {
public:
    /**
     * @param table Vaccination statistics for date estimation (nullptr disables it)
     * @param options Checksum algorithm and estimation country
     */
    explicit UvciParser(
        std::shared_ptr<const VaccinationStatisticsTable> table = nullptr,
        ParserOptions options = ParserOptions());

    /**
     * @brief Parse one UVCI
     * @param raw Candidate string, trimmed by the caller
     */
    ParseResult parse(const std::string& raw) const;

    /**
     * @brief Parse independent inputs, optionally in parallel
     * @param inputs Candidate strings
     * @param threads Worker count (values < 2 parse sequentially)
     * @return Results in input order
     */
    std::vector<ParseResult> parseBatch(const std::vector<std::string>& inputs,
                                        unsigned threads = 1) const;

    const ParserOptions& options() const { return options_; }

private:
    ParserOptions options_;
    GrammarParser grammar_;
    ChecksumEngine checksum_;
    VaccinationDateEstimator estimator_;
};

} // namespace uvci
