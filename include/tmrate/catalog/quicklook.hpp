#pragma once
/**
 * @file quicklook.hpp
 * @brief Quicklook (QL) TM packet sizes.
 * @details Every QL size function takes (energies, samples) so the estimator
 *          can treat them uniformly. Products that have no energy axis ignore
 *          the first argument. Sizes are in bits (STIX-ICD-0812-ESC).
 */

#include <cstdint>
#include "tmrate/catalog/product.hpp"

namespace tmrate::catalog {

/// QL light curves: per (energy, sample) one compressed octet plus trigger and RCR.
SizeResult light_curve(uint32_t num_energies, uint32_t num_samples) noexcept;

/// QL background: per (energy, sample) one compressed octet plus trigger.
SizeResult background(uint32_t num_energies, uint32_t num_samples) noexcept;

/// QL variance. Energies are selected by mask; @p num_energies is ignored.
SizeResult variance(uint32_t num_energies, uint32_t num_samples) noexcept;

/// QL spectra: fixed 32-channel spectrum per detector sample.
SizeResult spectra(uint32_t num_energies, uint32_t num_samples) noexcept;

/// QL flare flag and location. @p num_energies is ignored.
SizeResult flare_flag_location(uint32_t num_energies, uint32_t num_samples) noexcept;

/**
 * @brief QL flare list and TM management status.
 * @param num_energies Ignored.
 * @param num_flares Flares listed; one record each.
 */
SizeResult flare_list_tm_mgmt(uint32_t num_energies, uint32_t num_flares) noexcept;

/**
 * @brief QL energy calibration spectra.
 * @param num_energies Compressed spectral points per structure.
 * @param num_samples Sub-spectrum structures in the packet.
 */
SizeResult calibration_spectra(uint32_t num_energies, uint32_t num_samples) noexcept;

} // namespace tmrate::catalog
