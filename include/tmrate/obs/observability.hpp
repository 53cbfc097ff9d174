#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: estimate events + counters.
 * @details The default sink prints one JSON-ish line per event on stdout.
 */

#include <string>
#include <optional>
#include <cstdint>
#include "tmrate/budget/estimator.hpp"

namespace tmrate::obs {

    /** @struct Counters
     *  @brief Process-level counters for budget projections.
     */
    struct Counters {
        uint64_t estimates{0};            ///< Total projections recorded
        uint64_t failures{0};             ///< Projections that returned an error
        double   total_bits_per_day{0.0}; ///< Sum over successful projections
    };

    /** @struct EstimateEvent
     *  @brief Payload describing a single product projection.
     */
    struct EstimateEvent {
        std::string product;                                   ///< Product display name
        uint64_t    cadence_ms{0};                             ///< Integration period used
        std::optional<budget::PackingOutcome> outcome;         ///< Set on success
        std::optional<budget::EstimateError>  error;           ///< Set on failure
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single projection event.
        virtual void record(const EstimateEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    // Process-wide printf-backed sink (implemented in .cpp)
    Observer* make_simple_observer();

} // namespace tmrate::obs
