#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for packet sizing and budget projection.
 * @details These values eliminate magic numbers from the codebase. The packet
 *          envelope sizes and example plan come from the STIX TM/TC ICD.
 */

#include <cstdint>

namespace tmrate::config::constants {

// =====================
// Packet envelope (bits)
// Source packet header + PUS data-field header + maximum application data.
// =====================
inline constexpr uint32_t PACKET_HEADER_BITS      = 6 * 8;     ///< CCSDS primary header
inline constexpr uint32_t PACKET_DATA_HEADER_BITS = 10 * 8;    ///< PUS TM data-field header
inline constexpr uint32_t PACKET_MAX_PAYLOAD_BITS = 4096 * 8;  ///< Max application data field

// =====================
// Time base
// =====================
inline constexpr uint32_t SECONDS_PER_DAY = 24 * 60 * 60;           ///< 86400
inline constexpr uint64_t MS_PER_DAY      = SECONDS_PER_DAY * 1000ULL;

// =====================
// ICD field widths shared by several products (bits)
// =====================
inline constexpr uint32_t SSID_BITS               = 8;   ///< Structure ID
inline constexpr uint32_t SCET_COARSE_BITS        = 32;  ///< SCET coarse time
inline constexpr uint32_t SCET_FINE_BITS          = 16;  ///< SCET fine time
inline constexpr uint32_t COMPRESSION_SCHEMA_BITS = 1 + 3 + 3; ///< S, K, M
inline constexpr uint32_t TRIGGER_ACCUMULATORS    = 15;  ///< Trigger accumulators per packet
inline constexpr uint32_t WORST_CASE_COUNT_BITS   = 2 * 8; ///< Uncompressed count, worst case

// =====================
// Default budget plan (ICD example cadences)
// Cadence units: milliseconds; 56.25 s is not representable in whole seconds.
// =====================
inline constexpr uint32_t PLAN_LIGHT_CURVE_ENERGIES    = 5;
inline constexpr uint32_t PLAN_LIGHT_CURVE_CADENCE_MS  = 4000;
inline constexpr uint32_t PLAN_BACKGROUND_ENERGIES     = 5;
inline constexpr uint32_t PLAN_BACKGROUND_CADENCE_MS   = 8000;
inline constexpr uint32_t PLAN_SPECTRA_ENERGIES        = 32;
inline constexpr uint32_t PLAN_SPECTRA_CADENCE_MS      = 32000;
inline constexpr uint32_t PLAN_VARIANCE_CADENCE_MS     = 4000;
inline constexpr uint32_t PLAN_FLARE_FLAG_CADENCE_MS   = 8000;
inline constexpr uint32_t PLAN_FLARE_LIST_CADENCE_MS   = 288000;
inline constexpr uint32_t PLAN_CALIBRATION_ENERGIES    = 64;
inline constexpr uint32_t PLAN_CALIBRATION_CADENCE_MS  = 56250;

} // namespace tmrate::config::constants
