/**
 * @file config_loader.cpp
 * @brief Default budget plan built from named constants.
 */
#include "tmrate/config/config_loader.hpp"
#include "tmrate/config/constants.hpp"

namespace tmrate::config {
    using namespace tmrate::catalog;
    using namespace tmrate::config::constants;
    using std::chrono::milliseconds;

    static PlanEntry ql_entry(Product p, uint32_t energies, uint32_t cadence_ms) {
        PlanEntry e;
        e.product = p;
        e.params.num_energies = energies;
        e.params.num_samples  = 1;
        e.cadence = milliseconds{cadence_ms};
        return e;
    }

    BudgetConfig Loader::defaults() {
        BudgetConfig bc;
        bc.capacity = budget::PacketCapacity{}; // envelope defaults from constants
        bc.plan = {
            ql_entry(Product::LightCurve,         PLAN_LIGHT_CURVE_ENERGIES, PLAN_LIGHT_CURVE_CADENCE_MS),
            ql_entry(Product::Background,         PLAN_BACKGROUND_ENERGIES,  PLAN_BACKGROUND_CADENCE_MS),
            ql_entry(Product::Spectra,            PLAN_SPECTRA_ENERGIES,     PLAN_SPECTRA_CADENCE_MS),
            ql_entry(Product::Variance,           0,                         PLAN_VARIANCE_CADENCE_MS),
            ql_entry(Product::FlareFlagLocation,  0,                         PLAN_FLARE_FLAG_CADENCE_MS),
            ql_entry(Product::FlareListTmMgmt,    0,                         PLAN_FLARE_LIST_CADENCE_MS),
            ql_entry(Product::CalibrationSpectra, PLAN_CALIBRATION_ENERGIES, PLAN_CALIBRATION_CADENCE_MS),
        };
        return bc;
    }

} // namespace tmrate::config
