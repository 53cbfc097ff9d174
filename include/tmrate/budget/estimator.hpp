/**
 * @file estimator.hpp
 * @brief Packing and daily rate projection for one telemetry product.
 *
 * Pipeline:
 *  - records_per_day(): how many records the cadence produces over one day.
 *  - pack(): how many records fit into the payload next to the fixed header.
 *  - estimate(): packets per day (average rate) and total bits per day.
 *
 * All operations are pure and return expected<T, EstimateError>; no partial
 * results are produced on failure.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>

#include "tmrate/compat/expected.hpp"  // tmrate_detail::expected / unexpected
#include "tmrate/config/constants.hpp"
#include "tmrate/catalog/product.hpp"

namespace tmrate::budget {

/**
 * @brief Caller-input errors reported by the estimator.
 */
enum class EstimateError : std::uint8_t {
  NonDivisibleCadence = 1,   ///< Cadence is zero or does not tile 86400 s exactly
  DegenerateRecordSize,      ///< Record is zero bits or larger than the free payload
  OverflowingFixedOverhead   ///< Fixed header leaves no payload for records
};

/// Stable label for an error (used by reports and observers).
std::string_view to_string(EstimateError e) noexcept;

/**
 * @struct PacketCapacity
 * @brief Packet envelope sizes in bits. Only the payload bounds packing.
 */
struct PacketCapacity {
  std::uint32_t header_bits{config::constants::PACKET_HEADER_BITS};
  std::uint32_t data_header_bits{config::constants::PACKET_DATA_HEADER_BITS};
  std::uint32_t max_payload_bits{config::constants::PACKET_MAX_PAYLOAD_BITS};

  /// Full packet size including both headers.
  std::uint64_t envelope_bits() const noexcept {
    return std::uint64_t{header_bits} + data_header_bits + max_payload_bits;
  }
};

/**
 * @struct PacketSplit
 * @brief Result of packing records into one payload.
 * @note Identity: records_per_packet * variable_bits + remainder_bits == available_bits.
 */
struct PacketSplit {
  std::uint64_t available_bits{0};      ///< Payload left after the fixed header
  std::uint64_t records_per_packet{0};  ///< floor(available / variable), always >= 1
  std::uint64_t remainder_bits{0};      ///< available mod variable
};

/**
 * @struct PackingOutcome
 * @brief Every intermediate and final figure of one projection.
 */
struct PackingOutcome {
  std::uint64_t capacity_bits{0};       ///< Max payload used for packing
  std::uint64_t fixed_bits{0};          ///< Fixed header of the product
  std::uint64_t available_bits{0};      ///< capacity - fixed
  std::uint64_t variable_bits{0};       ///< Size of exactly one record
  std::uint64_t records_per_packet{0};
  std::uint64_t remainder_bits{0};      ///< Unused bits in a full packet
  std::uint64_t records_per_day{0};     ///< 86400 s / cadence, exact
  /// Average packets needed per day. A rate, not a dispatchable packet count.
  double        packets_per_day{0.0};
  double        total_bits_per_day{0.0};

  /// Mean downlink rate in bits per second.
  double mean_bits_per_second() const noexcept {
    return total_bits_per_day / static_cast<double>(config::constants::SECONDS_PER_DAY);
  }
};

/**
 * @brief Records produced per day at @p cadence.
 * @return Exact record count, or NonDivisibleCadence when the cadence is not
 *         positive or does not divide one day.
 */
tmrate_detail::expected<std::uint64_t, EstimateError>
records_per_day(std::chrono::milliseconds cadence) noexcept;

/**
 * @brief Split the payload into whole records plus remainder.
 * @param size Fixed bits and the bits of exactly one record.
 * @param cap Packet envelope.
 */
tmrate_detail::expected<PacketSplit, EstimateError>
pack(const catalog::SizeResult& size, const PacketCapacity& cap) noexcept;

/**
 * @brief Project packets and bits per day for one record size.
 * @param size Fixed bits and the bits of exactly one record.
 * @param cadence Integration period of one record.
 * @param cap Packet envelope.
 */
tmrate_detail::expected<PackingOutcome, EstimateError>
estimate(const catalog::SizeResult& size,
         std::chrono::milliseconds cadence,
         const PacketCapacity& cap = {}) noexcept;

/**
 * @brief Project a catalog product. The product's record axis is forced to
 *        one record before sizing; the other parameters are used as given.
 */
tmrate_detail::expected<PackingOutcome, EstimateError>
estimate(catalog::Product product,
         const catalog::StructuralParams& params,
         std::chrono::milliseconds cadence,
         const PacketCapacity& cap = {}) noexcept;

/**
 * @brief Project an arbitrary size function.
 * @tparam SizeFn Callable as SizeResult(const StructuralParams&).
 * @param params Must describe exactly one record; passed through unchanged.
 */
template <class SizeFn>
inline tmrate_detail::expected<PackingOutcome, EstimateError>
estimate_with(SizeFn&& fn,
              const catalog::StructuralParams& params,
              std::chrono::milliseconds cadence,
              const PacketCapacity& cap = {}) {
  static_assert(std::is_invocable_r_v<catalog::SizeResult, SizeFn&, const catalog::StructuralParams&>,
                "SizeFn must be callable as SizeResult(const StructuralParams&)");
  return estimate(std::forward<SizeFn>(fn)(params), cadence, cap);
}

} // namespace tmrate::budget
