#pragma once
/**
 * @file config_loader.hpp
 * @brief Budget configuration: packet envelope plus the list of products to project.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <chrono>
#include <vector>
#include "tmrate/budget/estimator.hpp"
#include "tmrate/catalog/product.hpp"

namespace tmrate::config {

    /** @struct PlanEntry
     *  @brief One product projection: what to size and how often a record is produced.
     */
    struct PlanEntry {
        catalog::Product          product{catalog::Product::LightCurve}; ///< Product to size
        catalog::StructuralParams params;                  ///< Record axis is overridden to 1
        std::chrono::milliseconds cadence{4000};           ///< Integration period
        bool                      xray_user_header{false}; ///< Add bulk X-ray user header (X-ray levels only)
    };

    /** @struct BudgetConfig
     *  @brief Aggregate consumed by the report driver.
     */
    struct BudgetConfig {
        budget::PacketCapacity capacity;  ///< Packet envelope
        std::vector<PlanEntry> plan;      ///< Products in report order
    };

    /** @class Loader
     *  @brief Source of budget configuration.
     */
    class Loader {
    public:
        /**
         * @brief ICD example plan: the seven quicklook products at their nominal cadences.
         * @return BudgetConfig with the default envelope and plan.
         */
        static BudgetConfig defaults();
    };

} // namespace tmrate::config
