/**
 * @file vaccination_date_estimator.cpp
 * @brief Vaccination date estimator implementation
 */

#include "uvci/vaccination_date_estimator.h"
#include "uvci/utils/string_utils.h"
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace uvci {

VaccinationDateEstimator::VaccinationDateEstimator(
    std::shared_ptr<const VaccinationStatisticsTable> table,
    std::string supportedCountry)
    : table_(table ? std::move(table) : std::make_shared<const VaccinationStatisticsTable>()),
      supportedCountry_(std::move(supportedCountry)) {}

VaccinationDate VaccinationDateEstimator::estimate(
    const std::string& country, const std::string& opaqueId) const {
    return estimate(country, opaqueId, *table_, supportedCountry_);
}

VaccinationDate VaccinationDateEstimator::estimate(
    const std::string& country,
    const std::string& opaqueId,
    const VaccinationStatisticsTable& table,
    const std::string& supportedCountry) {

    if (country != supportedCountry || table.empty()) {
        return {};
    }

    auto doses = numericPortion(opaqueId);
    if (!doses) {
        return {};
    }

    auto index = table.findFirstAtLeast(*doses);
    if (!index) {
        spdlog::debug("Opaque identifier {} beyond statistics table ({} doses)",
                      opaqueId, table.maxCumulativeDoses());
        return {};
    }

    const auto& week = table.at(*index).weekEnding;
    VaccinationDate date;
    date.month = week.month;
    date.year = static_cast<unsigned>(week.year);
    return date;
}

std::optional<uint64_t> VaccinationDateEstimator::numericPortion(const std::string& opaqueId) {
    std::string digits = opaqueId;
    if (!digits.empty() && std::isalpha(static_cast<unsigned char>(digits[0]))) {
        digits = digits.substr(1);
    }
    if (!utils::isAllDigits(digits)) {
        return std::nullopt;
    }

    try {
        return static_cast<uint64_t>(std::stoull(digits));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace uvci
