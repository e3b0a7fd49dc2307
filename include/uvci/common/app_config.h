#pragma once

/**
 * @file app_config.h
 * @brief uvci-tool configuration
 *
 * Loaded from environment variables at startup; command-line flags may
 * override individual fields before validate() is called.
 */

#include "uvci/uvci_parser.h"
#include <string>
#include <vector>

namespace uvci {
namespace common {

struct AppConfig {
    std::string logLevel = "info";
    std::string logFile;             ///< File sink enabled when non-empty
    std::string statisticsFile;      ///< Defaults to the installed reference table
    std::string estimationCountry = VaccinationDateEstimator::DEFAULT_COUNTRY;
    std::string checksumAlgorithm = "luhn";
    int threads = 1;

    static constexpr int MAX_THREADS = 64;

    /**
     * @brief Build configuration from UVCI_* environment variables
     * @throws ConfigException if a numeric variable is not a number
     */
    static AppConfig fromEnvironment();

    /**
     * @brief Check field values
     * @throws ConfigException on the first invalid field
     */
    void validate() const;

    /**
     * @brief Parser options for the configured algorithm and country
     * @throws ConfigException if checksumAlgorithm is unknown
     */
    ParserOptions toParserOptions() const;

    /**
     * @brief Strict integer parsing for settings ("4x" and "" are rejected)
     * @param name Setting name used in the error message
     * @throws ConfigException if value is not a whole integer
     */
    static int parseInteger(const std::string& name, const std::string& value);

    /// @brief Installed reference table, then the copy in the source tree
    static std::vector<std::string> statisticsFileCandidates();

    /**
     * @brief First existing statisticsFileCandidates() entry
     *
     * Falls back to the installed path when neither exists, so the
     * "cannot open" error names the expected install location.
     */
    static std::string defaultStatisticsFile();
};

} // namespace common
} // namespace uvci
