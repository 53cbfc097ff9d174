/**
 * @file estimator.cpp
 * @brief Implementation of packing and daily rate projection.
 */
#include "tmrate/budget/estimator.hpp"

namespace tmrate::budget {

using tmrate_detail::expected;
using tmrate_detail::unexpected;
using namespace tmrate::config::constants;

std::string_view to_string(EstimateError e) noexcept {
  switch (e) {
    case EstimateError::NonDivisibleCadence:      return "non_divisible_cadence";
    case EstimateError::DegenerateRecordSize:     return "degenerate_record_size";
    case EstimateError::OverflowingFixedOverhead: return "overflowing_fixed_overhead";
  }
  return "unknown";
}

expected<std::uint64_t, EstimateError>
records_per_day(std::chrono::milliseconds cadence) noexcept {
  if (cadence.count() <= 0) {
    return unexpected(EstimateError::NonDivisibleCadence);
  }
  const auto period = static_cast<std::uint64_t>(cadence.count());
  if (MS_PER_DAY % period != 0) {
    return unexpected(EstimateError::NonDivisibleCadence);
  }
  return MS_PER_DAY / period;
}

expected<PacketSplit, EstimateError>
pack(const catalog::SizeResult& size, const PacketCapacity& cap) noexcept {
  if (size.fixed_bits >= cap.max_payload_bits) {
    return unexpected(EstimateError::OverflowingFixedOverhead);
  }
  if (size.variable_bits == 0) {
    return unexpected(EstimateError::DegenerateRecordSize);
  }

  PacketSplit split;
  split.available_bits     = cap.max_payload_bits - size.fixed_bits;
  split.records_per_packet = split.available_bits / size.variable_bits;
  split.remainder_bits     = split.available_bits % size.variable_bits;

  // Record larger than the free payload: nothing can ever be sent.
  if (split.records_per_packet == 0) {
    return unexpected(EstimateError::DegenerateRecordSize);
  }
  return split;
}

expected<PackingOutcome, EstimateError>
estimate(const catalog::SizeResult& size,
         std::chrono::milliseconds cadence,
         const PacketCapacity& cap) noexcept {
  const auto per_day = records_per_day(cadence);
  if (!per_day) return unexpected(per_day.error());

  const auto split = pack(size, cap);
  if (!split) return unexpected(split.error());

  PackingOutcome out;
  out.capacity_bits      = cap.max_payload_bits;
  out.fixed_bits         = size.fixed_bits;
  out.available_bits     = split->available_bits;
  out.variable_bits      = size.variable_bits;
  out.records_per_packet = split->records_per_packet;
  out.remainder_bits     = split->remainder_bits;
  out.records_per_day    = *per_day;

  // Average rate: a partially filled last packet is not rounded up.
  out.packets_per_day = static_cast<double>(out.records_per_day) /
                        static_cast<double>(out.records_per_packet);

  const std::uint64_t full_packet_bits = out.fixed_bits + out.records_per_packet * out.variable_bits;
  out.total_bits_per_day = out.packets_per_day * static_cast<double>(full_packet_bits);
  return out;
}

expected<PackingOutcome, EstimateError>
estimate(catalog::Product product,
         const catalog::StructuralParams& params,
         std::chrono::milliseconds cadence,
         const PacketCapacity& cap) noexcept {
  const auto one_record = catalog::with_records(product, params, 1);
  return estimate(catalog::size_of(product, one_record), cadence, cap);
}

} // namespace tmrate::budget
