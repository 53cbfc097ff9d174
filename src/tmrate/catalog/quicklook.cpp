/**
 * @file quicklook.cpp
 * @brief Field-width sums for quicklook packets.
 */
#include "tmrate/catalog/quicklook.hpp"
#include "tmrate/config/constants.hpp"

namespace tmrate::catalog {
    using namespace tmrate::config::constants;

    namespace {
        // SSID + SCET coarse/fine + integration time: common QL preamble.
        constexpr uint64_t kQlPreamble = SSID_BITS + SCET_COARSE_BITS + SCET_FINE_BITS + 2 * 8;
        // Energy-bin mask: upper boundary bit + 32 lower boundary bits.
        constexpr uint64_t kEnergyBinMask = 1 + 4 * 8;
    }

    SizeResult light_curve(uint32_t num_energies, uint32_t num_samples) noexcept {
        const uint64_t fixed =
              kQlPreamble
            + 4 * 8                          // Detector mask
            + 4 + 12                         // Spare + pixel mask
            + 1                              // Spare
            + COMPRESSION_SCHEMA_BITS        // Light curve schema S/K/M
            + COMPRESSION_SCHEMA_BITS        // Trigger schema S/K/M
            + kEnergyBinMask
            + 1 * 8                          // Number of energies
            + uint64_t{num_energies} * 2 * 8 // Data points per energy
            + 2 * 8                          // Number of trigger data points
            + 2 * 8;                         // Number of RCR data points

        const uint64_t variable =
              uint64_t{num_energies} * num_samples * 8  // Compressed light curves
            + uint64_t{num_samples} * 8                 // Compressed triggers
            + uint64_t{num_samples} * 8;                // RCR

        return {fixed, variable};
    }

    SizeResult background(uint32_t num_energies, uint32_t num_samples) noexcept {
        const uint64_t fixed =
              kQlPreamble
            + COMPRESSION_SCHEMA_BITS        // Background schema S/K/M
            + COMPRESSION_SCHEMA_BITS        // Trigger schema S/K/M
            + kEnergyBinMask
            + 1                              // Spare
            + 1 * 8                          // Number of energies
            + uint64_t{num_energies} * 2 * 8 // Data points per energy
            + 2 * 8;                         // Number of trigger data points

        const uint64_t variable =
              uint64_t{num_energies} * num_samples * 8  // Compressed background
            + uint64_t{num_samples} * 8;                // Compressed triggers

        return {fixed, variable};
    }

    SizeResult variance(uint32_t /*num_energies*/, uint32_t num_samples) noexcept {
        const uint64_t fixed =
              kQlPreamble
            + 1 * 8                          // Samples per variance
            + 4 * 8                          // Detector mask
            + 4 * 8                          // Energy mask
            + 4 + 12                         // Spare + pixel mask
            + 1                              // Spare
            + COMPRESSION_SCHEMA_BITS        // Variance schema S/K/M
            + 2 * 8;                         // Number of data points

        return {fixed, uint64_t{num_samples} * 8};
    }

    SizeResult spectra(uint32_t /*num_energies*/, uint32_t num_samples) noexcept {
        constexpr uint64_t kChannels = 32;

        const uint64_t fixed =
              kQlPreamble
            + 1 + COMPRESSION_SCHEMA_BITS    // Spare + spectra schema S/K/M
            + 1 + COMPRESSION_SCHEMA_BITS    // Spare + trigger schema S/K/M
            + 4 + 12                         // Spare + pixel mask
            + 2 * 8;                         // Number of data samples

        const uint64_t per_sample =
              1 * 8                          // Detector index
            + kChannels * 8                  // Spectrum
            + 1 * 8                          // Trigger
            + 1 * 8;                         // Number of integrations

        return {fixed, uint64_t{num_samples} * per_sample};
    }

    SizeResult flare_flag_location(uint32_t /*num_energies*/, uint32_t num_samples) noexcept {
        const uint64_t fixed = kQlPreamble + 2 * 8;  // + number of data samples

        const uint64_t per_sample =
              1 * 8                          // Flare flag
            + 1 * 8                          // Location z (arcmin)
            + 1 * 8;                         // Location y (arcmin)

        return {fixed, uint64_t{num_samples} * per_sample};
    }

    SizeResult flare_list_tm_mgmt(uint32_t /*num_energies*/, uint32_t num_flares) noexcept {
        const uint64_t fixed =
              SSID_BITS
            + 4 * 8                          // UBSD counter
            + 4 * 8                          // PALD counter
            + 2 * 8;                         // Number of flares

        const uint64_t per_flare =
              4 * 8                          // Start time
            + 4 * 8                          // End time
            + 1 * 8                          // Highest flare flag
            + 4 * 8                          // TM byte volume
            + 1 * 8                          // Average z location
            + 1 * 8                          // Average y location
            + 1 * 8;                         // Processing status

        return {fixed, uint64_t{num_flares} * per_flare};
    }

    SizeResult calibration_spectra(uint32_t num_energies, uint32_t num_samples) noexcept {
        constexpr uint64_t kSubSpectra = 8;
        constexpr uint64_t kSubSpectrumDescriptor =
              2                              // Spare
            + 10                             // Number of spectral points
            + 10                             // Summed channels per spectral point
            + 10;                            // Lowest channel in sub-spectrum

        const uint64_t fixed =
              SSID_BITS
            + SCET_COARSE_BITS
            + 4 * 8                          // Duration
            + 2 * 8                          // Quiet time
            + 4 * 8                          // Live time
            + 2 * 8                          // Average temperature
            + 1 + COMPRESSION_SCHEMA_BITS    // Spare + accumulator schema S/K/M
            + 4 * 8                          // Detector mask
            + 4 + 12                         // Spare + pixel mask
            + 1 * 8                          // Sub-spectrum mask
            + 2                              // Spare
            + kSubSpectra * kSubSpectrumDescriptor
            + 2 * 8;                         // Number of structures

        const uint64_t per_structure =
              4                              // Spare
            + 5                              // Detector ID
            + 4                              // Pixel ID
            + 3                              // Sub-spectrum ID
            + 16                             // Number of compressed spectral points
            + uint64_t{num_energies} * 8;    // Compressed spectral points

        return {fixed, uint64_t{num_samples} * per_structure};
    }

} // namespace tmrate::catalog
