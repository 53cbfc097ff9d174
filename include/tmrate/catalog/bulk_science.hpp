#pragma once
/**
 * @file bulk_science.hpp
 * @brief Bulk science TM packet sizes: X-ray levels 0-3, spectrogram, aspect.
 *
 * Compression per level:
 *  - L0: none, worst case 2 octets per count
 *  - L1: triggers and pixel-set summed counts compressed to 1 octet
 *  - L2: triggers and total pixel counts compressed to 1 octet (L1 structure)
 *  - L3: counts transformed to visibilities
 *
 * All sizes are in bits and follow the field tables of STIX-ICD-0812-ESC.
 */

#include <cstdint>
#include "tmrate/catalog/product.hpp"

namespace tmrate::catalog {

/**
 * @brief Common user-request header carried by every bulk X-ray packet.
 * @details SSID, TC reference, request number, two compression schemas,
 *          first-sample SCET and sample count. Not part of the per-level
 *          fixed terms below.
 */
uint64_t xray_user_header_bits() noexcept;

/// Return @p s with the bulk X-ray user header added to its fixed term.
SizeResult with_xray_user_header(SizeResult s) noexcept;

/**
 * @brief Level 0 X-ray data.
 * @param num_samples Number of event samples.
 */
SizeResult xray_level0(uint32_t num_samples) noexcept;

/**
 * @brief Level 1 X-ray data.
 * @param num_pixel_sets Pixel sets P (each carries its own pixel mask).
 * @param num_energy_groups Energy groups; one variable record each.
 * @param num_detector_masks Detector masks M.
 */
SizeResult xray_level1(uint32_t num_pixel_sets,
                       uint32_t num_energy_groups,
                       uint32_t num_detector_masks) noexcept;

/// Level 2 shares the level 1 wire structure.
SizeResult xray_level2(uint32_t num_pixel_sets,
                       uint32_t num_energy_groups,
                       uint32_t num_detector_masks) noexcept;

/**
 * @brief Level 3 X-ray data (visibilities).
 * @param num_pixel_sets Accepted for a uniform X-ray signature; level 3 always
 *        carries five pixel masks.
 * @param num_energy_groups Energy groups; one variable record each.
 * @param num_detector_masks Detectors N contributing visibilities.
 */
SizeResult xray_level3(uint32_t num_pixel_sets,
                       uint32_t num_energy_groups,
                       uint32_t num_detector_masks) noexcept;

/**
 * @brief Spectrogram.
 * @param num_samples Time samples.
 * @param num_energies Energies M per sample.
 */
SizeResult spectrogram(uint32_t num_samples, uint32_t num_energies) noexcept;

/// Aspect: per sample two channels x two diode voltages.
SizeResult aspect(uint32_t num_samples) noexcept;

} // namespace tmrate::catalog
