/**
 * @file app_config.cpp
 * @brief uvci-tool configuration implementation
 */

#include "uvci/common/app_config.h"
#include "uvci/common/exceptions.h"
#include "uvci/common/logger.h"
#include "uvci/utils/string_utils.h"
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <stdexcept>
#include <spdlog/spdlog.h>

#ifndef UVCI_DEFAULT_STATISTICS_FILE
#define UVCI_DEFAULT_STATISTICS_FILE "data/se_vaccination_weekly.csv"
#endif

#ifndef UVCI_SOURCE_STATISTICS_FILE
#define UVCI_SOURCE_STATISTICS_FILE "data/se_vaccination_weekly.csv"
#endif

namespace uvci {
namespace common {

int AppConfig::parseInteger(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigException(name + " must be an integer: '" + value + "'");
    }
}

std::vector<std::string> AppConfig::statisticsFileCandidates() {
    return {UVCI_DEFAULT_STATISTICS_FILE, UVCI_SOURCE_STATISTICS_FILE};
}

std::string AppConfig::defaultStatisticsFile() {
    auto candidates = statisticsFileCandidates();
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
    spdlog::debug("No vaccination statistics at {} or {}", candidates[0], candidates[1]);
    return candidates.front();
}

AppConfig AppConfig::fromEnvironment() {
    AppConfig config;
    config.statisticsFile = defaultStatisticsFile();

    if (auto val = std::getenv("UVCI_LOG_LEVEL")) config.logLevel = utils::toLower(val);
    if (auto val = std::getenv("UVCI_LOG_FILE")) config.logFile = val;
    if (auto val = std::getenv("UVCI_STATISTICS_FILE")) config.statisticsFile = val;
    if (auto val = std::getenv("UVCI_ESTIMATION_COUNTRY")) config.estimationCountry = utils::toUpper(val);
    if (auto val = std::getenv("UVCI_CHECKSUM_ALGORITHM")) config.checksumAlgorithm = utils::toLower(val);
    if (auto val = std::getenv("UVCI_THREADS")) config.threads = parseInteger("UVCI_THREADS", val);

    return config;
}

void AppConfig::validate() const {
    if (!Logger::isValidLevel(logLevel)) {
        throw ConfigException("unknown log level '" + logLevel + "'");
    }
    if (estimationCountry.size() != 2 || !utils::isAllUpperAlpha(estimationCountry)) {
        throw ConfigException("estimation country must be two uppercase letters: '" +
                              estimationCountry + "'");
    }
    if (!checksumAlgorithmFromString(checksumAlgorithm)) {
        throw ConfigException("unknown checksum algorithm '" + checksumAlgorithm +
                              "' (expected luhn or iso7064)");
    }
    if (threads < 1 || threads > MAX_THREADS) {
        throw ConfigException("threads must be between 1 and " + std::to_string(MAX_THREADS));
    }
    spdlog::debug("Configuration valid: algorithm={}, country={}, threads={}",
                  checksumAlgorithm, estimationCountry, threads);
}

ParserOptions AppConfig::toParserOptions() const {
    auto algorithm = checksumAlgorithmFromString(checksumAlgorithm);
    if (!algorithm) {
        throw ConfigException("unknown checksum algorithm '" + checksumAlgorithm + "'");
    }

    ParserOptions options;
    options.checksumAlgorithm = *algorithm;
    options.estimationCountry = estimationCountry;
    return options;
}

} // namespace common
} // namespace uvci
