/**
 * @file vaccination_statistics.h
 * @brief Weekly cumulative vaccination counts used for date estimation
 *
 * The table is validated once when it is built and is immutable afterwards.
 * Share it as std::shared_ptr<const VaccinationStatisticsTable>.
 *
 * CSV format (header line optional, '#' comments and blank lines ignored):
 *   week_ending,cumulative_doses
 *   2020-12-27,125948
 */

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace uvci {

/// @brief Calendar date without time zone
struct CalendarDate {
    int year = 0;
    unsigned month = 0;  ///< 1-12
    unsigned day = 0;    ///< 1-31

    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

/**
 * @brief Parse "YYYY-MM-DD"
 * @return Date, or std::nullopt if malformed or not a valid calendar day
 */
std::optional<CalendarDate> parseIsoDate(const std::string& text);

/// @brief One table row
struct WeeklyVaccinationCount {
    CalendarDate weekEnding;
    uint64_t cumulativeDoses = 0;
};

/**
 * @brief Ordered (week ending, cumulative doses) reference table
 */
class VaccinationStatisticsTable {
public:
    /// @brief Empty table; every lookup misses
    VaccinationStatisticsTable() = default;

    /**
     * @brief Build a table from rows
     *
     * Rejects the data set if week-ending dates are not strictly increasing
     * or cumulative counts ever decrease.
     *
     * @return Table, or std::nullopt (logged) if validation fails
     */
    static std::optional<VaccinationStatisticsTable> fromEntries(
        std::vector<WeeklyVaccinationCount> entries);

    /**
     * @brief Parse CSV rows from a stream and validate them
     * @param in Input stream
     * @param sourceName Name used in log messages
     * @return Table, or std::nullopt (logged) on malformed rows or failed validation
     */
    static std::optional<VaccinationStatisticsTable> parseCsv(
        std::istream& in, const std::string& sourceName = "<stream>");

    /**
     * @brief Load and validate a CSV file
     * @return Table, or std::nullopt (logged) if unreadable or invalid
     */
    static std::optional<VaccinationStatisticsTable> loadFromCsv(const std::string& path);

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const WeeklyVaccinationCount& at(size_t index) const { return entries_.at(index); }
    const std::vector<WeeklyVaccinationCount>& entries() const { return entries_; }

    /// @brief Largest cumulative count, 0 for an empty table
    uint64_t maxCumulativeDoses() const;

    /**
     * @brief Index of the earliest row whose cumulative count is >= doses
     * @return Row index, or std::nullopt if doses exceeds the table
     */
    std::optional<size_t> findFirstAtLeast(uint64_t doses) const;

private:
    explicit VaccinationStatisticsTable(std::vector<WeeklyVaccinationCount> entries);

    std::vector<WeeklyVaccinationCount> entries_;
};

} // namespace uvci
