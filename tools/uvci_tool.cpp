/**
 * @file uvci_tool.cpp
 * @brief Batch UVCI parser
 *
 * Reads one UVCI per line, parses all of them and writes the records in
 * the selected format.
 *
 * Usage:
 *   ./uvci-tool [--format text|csv|json|cypher] [--statistics FILE]
 *               [--country CC] [--algorithm luhn|iso7064] [--threads N]
 *               [--log-level LEVEL] <input-file> [output-file]
 *
 * Environment: UVCI_LOG_LEVEL, UVCI_LOG_FILE, UVCI_STATISTICS_FILE,
 * UVCI_ESTIMATION_COUNTRY, UVCI_CHECKSUM_ALGORITHM, UVCI_THREADS
 */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "uvci/common/app_config.h"
#include "uvci/common/exceptions.h"
#include "uvci/common/logger.h"
#include "uvci/input_reader.h"
#include "uvci/record_formatter.h"
#include "uvci/utils/string_utils.h"
#include "uvci/uvci_parser.h"

using uvci::common::AppConfig;
using uvci::common::ConfigException;
using uvci::common::IoException;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_IO = 2;

void printUsage() {
    std::cerr << "USAGE:\n"
              << "    uvci-tool [--format text|csv|json|cypher] [--statistics FILE]\n"
              << "              [--country CC] [--algorithm luhn|iso7064] [--threads N]\n"
              << "              [--log-level LEVEL] <input-file> [output-file]\n";
}

std::shared_ptr<const uvci::VaccinationStatisticsTable> loadStatistics(const std::string& path) {
    if (path.empty()) {
        return nullptr;
    }
    auto table = uvci::VaccinationStatisticsTable::loadFromCsv(path);
    if (!table) {
        spdlog::warn("Vaccination statistics unavailable ({}), date estimation disabled; "
                     "set UVCI_STATISTICS_FILE or --statistics", path);
        return nullptr;
    }
    spdlog::info("Vaccination statistics loaded: {} weeks from {}", table->size(), path);
    return std::make_shared<const uvci::VaccinationStatisticsTable>(std::move(*table));
}

std::string render(const std::string& format,
                   const std::vector<std::string>& inputs,
                   const std::vector<uvci::ParseResult>& results) {
    std::ostringstream out;

    if (format == "cypher") {
        std::vector<uvci::UvciRecord> records;
        for (const auto& result : results) {
            if (result.ok()) {
                records.push_back(*result.record);
            }
        }
        out << uvci::output::toCypherBatch(records);
        return out.str();
    }

    if (format == "json") {
        Json::Value array(Json::arrayValue);
        for (size_t i = 0; i < results.size(); ++i) {
            array.append(uvci::output::toJson(inputs[i], results[i]));
        }
        out << uvci::output::toJsonString(array) << "\n";
        return out.str();
    }

    if (format == "csv") {
        out << uvci::output::csvResultHeader() << "\n";
    }

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        if (format == "csv") {
            out << uvci::output::toCsv(inputs[i], result) << "\n";
        } else {
            out << inputs[i] << "\n";
            if (result.ok()) {
                out << uvci::output::toText(*result.record);
            } else {
                out << "error                    : " << uvci::parseErrorToString(result.error)
                    << " (" << result.message << ")\n";
            }
            out << "\n";
        }
    }
    return out.str();
}

} // namespace

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = AppConfig::fromEnvironment();
    } catch (const ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    }

    std::string format = "text";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--format" && i + 1 < argc) {
            format = uvci::utils::toLower(argv[++i]);
        } else if (arg == "--statistics" && i + 1 < argc) {
            config.statisticsFile = argv[++i];
        } else if (arg == "--country" && i + 1 < argc) {
            config.estimationCountry = uvci::utils::toUpper(argv[++i]);
        } else if (arg == "--algorithm" && i + 1 < argc) {
            config.checksumAlgorithm = uvci::utils::toLower(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            try {
                config.threads = AppConfig::parseInteger("--threads", argv[++i]);
            } catch (const ConfigException& e) {
                std::cerr << e.what() << std::endl;
                return EXIT_USAGE;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.logLevel = uvci::utils::toLower(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return EXIT_OK;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage();
            return EXIT_USAGE;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        printUsage();
        return EXIT_USAGE;
    }
    if (format != "text" && format != "csv" && format != "json" && format != "cypher") {
        std::cerr << "Unknown format: " << format << "\n";
        printUsage();
        return EXIT_USAGE;
    }

    uvci::ParserOptions options;
    try {
        config.validate();
        options = config.toParserOptions();
    } catch (const ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    }

    uvci::common::Logger::initialize("uvci-tool", config.logLevel,
                                     !config.logFile.empty(), config.logFile);

    std::vector<uvci::InputLine> lines;
    try {
        lines = uvci::readInputFile(positional[0]);
    } catch (const IoException& e) {
        spdlog::error("{}", e.what());
        return EXIT_IO;
    }
    spdlog::info("Read {} UVCIs from {}", lines.size(), positional[0]);

    std::vector<std::string> inputs;
    inputs.reserve(lines.size());
    for (const auto& line : lines) {
        inputs.push_back(line.text);
    }

    uvci::UvciParser parser(loadStatistics(config.statisticsFile), options);
    auto results = parser.parseBatch(inputs, static_cast<unsigned>(config.threads));

    size_t failures = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        if (!results[i].ok()) {
            ++failures;
            spdlog::warn("Line {}: {}: {}", lines[i].lineNumber,
                         uvci::parseErrorToString(results[i].error), results[i].message);
        }
    }

    std::string output = render(format, inputs, results);

    if (positional.size() == 2) {
        const std::string& outPath = positional[1];
        std::ofstream file(outPath);
        if (!file.is_open()) {
            spdlog::error("Cannot create output file {}", outPath);
            return EXIT_IO;
        }
        file << output;
        if (!file) {
            spdlog::error("Failed writing output file {}", outPath);
            return EXIT_IO;
        }
        spdlog::info("Wrote {} records to {}", results.size() - failures, outPath);
    } else {
        std::cout << output;
    }

    spdlog::info("Parsed {} UVCIs, {} rejected", results.size(), failures);
    uvci::common::Logger::flush();
    return EXIT_OK;
}
