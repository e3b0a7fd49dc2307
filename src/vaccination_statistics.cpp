/**
 * @file vaccination_statistics.cpp
 * @brief Vaccination statistics table loading and lookup
 */

#include "uvci/vaccination_statistics.h"
#include "uvci/utils/string_utils.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace uvci {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

std::string formatDate(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
    return buffer;
}

} // namespace

std::optional<CalendarDate> parseIsoDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (!utils::isAllDigits(text.substr(0, 4)) ||
        !utils::isAllDigits(text.substr(5, 2)) ||
        !utils::isAllDigits(text.substr(8, 2))) {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > daysInMonth(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    CalendarDate date;
    date.year = year;
    date.month = static_cast<unsigned>(month);
    date.day = static_cast<unsigned>(day);
    return date;
}

VaccinationStatisticsTable::VaccinationStatisticsTable(std::vector<WeeklyVaccinationCount> entries)
    : entries_(std::move(entries)) {}

std::optional<VaccinationStatisticsTable> VaccinationStatisticsTable::fromEntries(
    std::vector<WeeklyVaccinationCount> entries) {

    for (size_t i = 1; i < entries.size(); ++i) {
        const auto& prev = entries[i - 1];
        const auto& cur = entries[i];

        if (!(prev.weekEnding < cur.weekEnding)) {
            spdlog::error("Vaccination statistics rejected: week {} does not follow {}",
                          formatDate(cur.weekEnding), formatDate(prev.weekEnding));
            return std::nullopt;
        }
        if (cur.cumulativeDoses < prev.cumulativeDoses) {
            spdlog::error("Vaccination statistics rejected: cumulative doses decrease "
                          "from {} ({}) to {} ({})",
                          prev.cumulativeDoses, formatDate(prev.weekEnding),
                          cur.cumulativeDoses, formatDate(cur.weekEnding));
            return std::nullopt;
        }
    }

    return VaccinationStatisticsTable(std::move(entries));
}

std::optional<VaccinationStatisticsTable> VaccinationStatisticsTable::parseCsv(
    std::istream& in, const std::string& sourceName) {

    std::vector<WeeklyVaccinationCount> entries;
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto columns = utils::split(line, ',');
        if (columns.size() != 2) {
            spdlog::error("{}:{}: expected 2 columns, got {}", sourceName, lineNumber, columns.size());
            return std::nullopt;
        }

        std::string dateText = utils::trim(columns[0]);
        std::string countText = utils::trim(columns[1]);

        // Header row
        if (entries.empty() && utils::toLower(dateText) == "week_ending") {
            continue;
        }

        auto date = parseIsoDate(dateText);
        if (!date) {
            spdlog::error("{}:{}: invalid week-ending date '{}'", sourceName, lineNumber, dateText);
            return std::nullopt;
        }
        if (!utils::isAllDigits(countText)) {
            spdlog::error("{}:{}: invalid cumulative count '{}'", sourceName, lineNumber, countText);
            return std::nullopt;
        }

        WeeklyVaccinationCount entry;
        entry.weekEnding = *date;
        try {
            entry.cumulativeDoses = std::stoull(countText);
        } catch (const std::out_of_range&) {
            spdlog::error("{}:{}: cumulative count out of range '{}'", sourceName, lineNumber, countText);
            return std::nullopt;
        }
        entries.push_back(entry);
    }

    auto table = fromEntries(std::move(entries));
    if (table) {
        spdlog::debug("Loaded {} weekly vaccination counts from {}", table->size(), sourceName);
    }
    return table;
}

std::optional<VaccinationStatisticsTable> VaccinationStatisticsTable::loadFromCsv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open vaccination statistics file: {}", path);
        return std::nullopt;
    }
    return parseCsv(file, path);
}

uint64_t VaccinationStatisticsTable::maxCumulativeDoses() const {
    return entries_.empty() ? 0 : entries_.back().cumulativeDoses;
}

std::optional<size_t> VaccinationStatisticsTable::findFirstAtLeast(uint64_t doses) const {
    auto it = std::lower_bound(entries_.begin(), entries_.end(), doses,
        [](const WeeklyVaccinationCount& entry, uint64_t value) {
            return entry.cumulativeDoses < value;
        });

    if (it == entries_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(entries_.begin(), it));
}

} // namespace uvci
