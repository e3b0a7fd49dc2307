/**
 * @file vaccination_date_estimator.h
 * @brief Statistical vaccination month/year inference from opaque identifiers
 *
 * Swedish identifiers are issued sequentially, so the numeric part of an
 * opaque identifier approximates the national cumulative dose count at the
 * time of vaccination. Looking that count up in the weekly statistics table
 * gives the vaccination month to within about one month; the order of
 * vaccinations within a week cannot be recovered.
 *
 * Experimental, only active for a single issuing country.
 */

#pragma once

#include "uvci/types.h"
#include "uvci/vaccination_statistics.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace uvci {

/**
 * @brief Maps opaque identifiers to estimated vaccination dates
 */
class VaccinationDateEstimator {
public:
    static constexpr const char* DEFAULT_COUNTRY = "SE";

    /**
     * @param table Reference table; nullptr behaves like an empty table
     * @param supportedCountry Only identifiers of this country are estimated
     */
    explicit VaccinationDateEstimator(
        std::shared_ptr<const VaccinationStatisticsTable> table,
        std::string supportedCountry = DEFAULT_COUNTRY);

    /**
     * @brief Estimate using the owned table
     * @return {month, year}, or {0, 0} when not inferable
     */
    VaccinationDate estimate(const std::string& country, const std::string& opaqueId) const;

    /**
     * @brief Estimate against an explicit table
     *
     * {0, 0} for other countries, a non-numeric identifier, an empty table or
     * an identifier beyond the table's last cumulative count.
     */
    static VaccinationDate estimate(
        const std::string& country,
        const std::string& opaqueId,
        const VaccinationStatisticsTable& table,
        const std::string& supportedCountry = DEFAULT_COUNTRY);

    /**
     * @brief Numeric part of an opaque identifier ("V12916227" -> 12916227)
     * @return Value, or std::nullopt if not an optional letter plus digits or out of range
     */
    static std::optional<uint64_t> numericPortion(const std::string& opaqueId);

    const std::string& supportedCountry() const { return supportedCountry_; }
    const VaccinationStatisticsTable& table() const { return *table_; }

private:
    std::shared_ptr<const VaccinationStatisticsTable> table_;
    std::string supportedCountry_;
};

} // namespace uvci
