/**
 * @file bulk_science.cpp
 * @brief Field-width sums for bulk science packets.
 */
#include "tmrate/catalog/bulk_science.hpp"
#include "tmrate/config/constants.hpp"

namespace tmrate::catalog {
    using namespace tmrate::config::constants;

    namespace {
        // Spare + 12-bit pixel mask, repeated wherever a pixel mask appears.
        constexpr uint64_t kPixelMaskField = 4 + 12;
        // Spare + E1 low bound + spare + E2 high bound.
        constexpr uint64_t kEnergyBoundsField = 3 + 5 + 3 + 5;
        constexpr uint64_t kTriggerAccumulatorBits = TRIGGER_ACCUMULATORS * 8;
    }

    uint64_t xray_user_header_bits() noexcept {
        return SSID_BITS                    // SSID (20..24)
             + 16                           // Reference to user TC packet ID
             + 16                           // Reference to user TC packet sequence control
             + 32                           // Unique data request number
             + 1 + COMPRESSION_SCHEMA_BITS  // Spare + accumulator schema S/K/M
             + 1 + COMPRESSION_SCHEMA_BITS  // Spare + trigger schema S/K/M
             + 48                           // SCET of first data sample
             + 16;                          // Number of samples N
    }

    SizeResult with_xray_user_header(SizeResult s) noexcept {
        s.fixed_bits += xray_user_header_bits();
        return s;
    }

    SizeResult xray_level0(uint32_t num_samples) noexcept {
        const uint64_t fixed =
              2 * 8                    // Starting time
            + 1 * 8                    // RCR
            + 2 * 8                    // Integration time
            + kPixelMaskField          // Spare + pixel mask
            + 32                       // Detector mask
            + kTriggerAccumulatorBits  // Trigger accumulators
            + 2 * 8;                   // Number of samples M

        const uint64_t per_sample =
              4                        // Pixel ID
            + 5                        // Detector index
            + 5                        // Energy ID
            + 2                        // Continuation bits
            + WORST_CASE_COUNT_BITS;   // Counts, worst case 2 octets

        return {fixed, uint64_t{num_samples} * per_sample};
    }

    SizeResult xray_level1(uint32_t num_pixel_sets,
                           uint32_t num_energy_groups,
                           uint32_t num_detector_masks) noexcept {
        const uint64_t fixed =
              2 * 8                                      // Starting time
            + 1 * 8                                      // RCR
            + 1 * 8                                      // Number of pixel sets P
            + uint64_t{num_pixel_sets} * kPixelMaskField // Spare + pixel mask per set
            + 32                                         // Detector masks
            + 2 * 8                                      // Integration time
            + kTriggerAccumulatorBits                    // Trigger accumulators
            + 1 * 8;                                     // Number of energies

        const uint64_t per_energy =
              kEnergyBoundsField
            + 16                                         // Number of data elements
            + uint64_t{num_pixel_sets} * num_detector_masks * 8; // Compressed counts

        return {fixed, uint64_t{num_energy_groups} * per_energy};
    }

    SizeResult xray_level2(uint32_t num_pixel_sets,
                           uint32_t num_energy_groups,
                           uint32_t num_detector_masks) noexcept {
        return xray_level1(num_pixel_sets, num_energy_groups, num_detector_masks);
    }

    SizeResult xray_level3(uint32_t /*num_pixel_sets*/,
                           uint32_t num_energy_groups,
                           uint32_t num_detector_masks) noexcept {
        const uint64_t fixed =
              2 * 8                    // Starting time
            + 1 * 8                    // RCR
            + 1 * 8                    // Duration
            + 5 * kPixelMaskField      // Pixel masks 1..5
            + 32                       // Detector mask
            + kTriggerAccumulatorBits  // Trigger accumulators
            + 1 * 8;                   // Number of energy groups

        const uint64_t per_detector =
              8                        // Detector ID
            + 8                        // Real visibility component
            + 8;                       // Imaginary visibility component

        const uint64_t per_energy =
              kEnergyBoundsField
            + 8                        // Flux
            + 8                        // Number of detectors N
            + uint64_t{num_detector_masks} * per_detector;

        return {fixed, uint64_t{num_energy_groups} * per_energy};
    }

    SizeResult spectrogram(uint32_t num_samples, uint32_t num_energies) noexcept {
        const uint64_t fixed =
              kPixelMaskField          // Spare + pixel mask
            + 4 * 8                    // Detector mask
            + 1 * 8                    // RCR
            + 1                        // Spare
            + 5                        // Emin
            + 5                        // Emax
            + 5                        // E unit
            + 2 * 8                    // Number of samples N
            + 2 * 8;                   // Closing time offset

        const uint64_t per_sample =
              2 * 8                    // Delta time
            + 1 * 8                    // Compressed combined trigger count
            + 1 * 8                    // Number of energies M
            + uint64_t{num_energies} * 8;

        return {fixed, uint64_t{num_samples} * per_sample};
    }

    SizeResult aspect(uint32_t num_samples) noexcept {
        const uint64_t fixed =
              SSID_BITS
            + SCET_COARSE_BITS
            + SCET_FINE_BITS
            + 1 * 8                    // Summing value
            + 2 * 8;                   // Number of samples N

        const uint64_t per_sample =
              2 * 8                    // ChA diode 0 voltage
            + 2 * 8                    // ChA diode 1 voltage
            + 2 * 8                    // ChB diode 0 voltage
            + 2 * 8;                   // ChB diode 1 voltage

        return {fixed, uint64_t{num_samples} * per_sample};
    }

} // namespace tmrate::catalog
