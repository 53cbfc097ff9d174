#pragma once
/**
 * @file report.hpp
 * @brief Human-readable budget report and plan runner.
 * @details Each plan entry is projected independently; a failing product is
 *          reported and skipped without affecting the others.
 */

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include "tmrate/budget/estimator.hpp"
#include "tmrate/config/config_loader.hpp"
#include "tmrate/obs/observability.hpp"

namespace tmrate::report {

/**
 * @struct ProductLine
 * @brief Result of one plan entry.
 */
struct ProductLine {
    std::string                           key;      ///< Short product key, e.g. "lc"
    std::string                           name;     ///< Display name
    std::optional<budget::PackingOutcome> outcome;  ///< Set on success
    std::optional<budget::EstimateError>  error;    ///< Set on failure
};

/**
 * @struct BudgetSummary
 * @brief Per-product results plus the aggregate mean downlink rate.
 */
struct BudgetSummary {
    std::vector<ProductLine> lines;
    double   total_bits_per_second{0.0}; ///< Sum of successful products' mean rates
    uint32_t failed{0};                  ///< Entries that returned an error
};

/// One line: packet size, fixed, remaining, record size, records/packet, free, packets/day.
std::string format_outcome(std::string_view name, const budget::PackingOutcome& o);

/// One line naming the product and the failure condition.
std::string format_error(std::string_view name, budget::EstimateError e);

/**
 * @brief Project every plan entry.
 * @param cfg Envelope and plan.
 * @param observer Optional sink; receives one event per entry.
 */
BudgetSummary run_plan(const config::BudgetConfig& cfg, obs::Observer* observer = nullptr);

/// Full text report: one block per product, mean rates, aggregate.
std::string render(const BudgetSummary& s);

} // namespace tmrate::report
