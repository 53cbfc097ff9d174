/**
 * @file test_estimator.cpp
 * @brief Tests for packing and daily rate projection.
 *
 * Validates:
 *  - Packing identity: records * variable + remainder == capacity - fixed
 *  - Rate identity: total == packets * (fixed + records * variable)
 *  - Cadence tiling (5 s ok, 7 s rejected, 56.25 s ok)
 *  - Degenerate record / overflowing header failures
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <cstdint>

#include "tmrate/budget/estimator.hpp"
#include "tmrate/catalog/product.hpp"
#include "tmrate/catalog/quicklook.hpp"

using namespace std::chrono_literals;
using tmrate::budget::EstimateError;
using tmrate::budget::PacketCapacity;
using tmrate::budget::estimate;
using tmrate::budget::estimate_with;
using tmrate::budget::pack;
using tmrate::budget::records_per_day;
using tmrate::catalog::Product;
using tmrate::catalog::SizeResult;
using tmrate::catalog::StructuralParams;

// --------------------------- Cadence ---------------------------------------

TEST(RecordsPerDay, DivisibleCadence) {
  auto five = records_per_day(5s);
  ASSERT_TRUE(five);
  EXPECT_EQ(*five, 17280u);

  auto cal = records_per_day(56250ms);
  ASSERT_TRUE(cal);
  EXPECT_EQ(*cal, 1536u);
}

TEST(RecordsPerDay, NonDivisibleCadence) {
  auto seven = records_per_day(7s);
  ASSERT_FALSE(seven);
  EXPECT_EQ(seven.error(), EstimateError::NonDivisibleCadence);

  EXPECT_FALSE(records_per_day(0ms));
  EXPECT_FALSE(records_per_day(-4s));
}

TEST(Estimate, CadenceSevenSeconds_Fails) {
  auto r = estimate(Product::LightCurve, StructuralParams{.num_energies = 5}, 7s);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), EstimateError::NonDivisibleCadence);

  auto ok = estimate(Product::LightCurve, StructuralParams{.num_energies = 5}, 5s);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->records_per_day, 17280u);
}

// --------------------------- Packing ---------------------------------------

TEST(Pack, Identity_HoldsOverGrid) {
  const PacketCapacity cap{};
  for (uint64_t fixed : {0u, 88u, 474u, 20000u, 32000u}) {
    for (uint64_t variable : {1u, 7u, 8u, 56u, 544u, 768u}) {
      const auto r = pack(SizeResult{fixed, variable}, cap);
      ASSERT_TRUE(r) << fixed << "/" << variable;
      EXPECT_EQ(r->available_bits, cap.max_payload_bits - fixed);
      EXPECT_EQ(r->records_per_packet * variable + r->remainder_bits, r->available_bits);
      EXPECT_LT(r->remainder_bits, variable);
      EXPECT_GE(r->records_per_packet, 1u);
    }
  }
}

TEST(Pack, ZeroVariable_Degenerate) {
  auto r = pack(SizeResult{100, 0}, PacketCapacity{});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), EstimateError::DegenerateRecordSize);
}

TEST(Pack, RecordLargerThanPayload_Degenerate) {
  auto r = pack(SizeResult{32000, 769}, PacketCapacity{});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), EstimateError::DegenerateRecordSize);

  auto exact = pack(SizeResult{32000, 768}, PacketCapacity{});
  ASSERT_TRUE(exact);
  EXPECT_EQ(exact->records_per_packet, 1u);
  EXPECT_EQ(exact->remainder_bits, 0u);
}

TEST(Pack, FixedFillsPayload_Overflow) {
  auto eq = pack(SizeResult{32768, 8}, PacketCapacity{});
  ASSERT_FALSE(eq);
  EXPECT_EQ(eq.error(), EstimateError::OverflowingFixedOverhead);

  auto over = pack(SizeResult{40000, 8}, PacketCapacity{});
  ASSERT_FALSE(over);
  EXPECT_EQ(over.error(), EstimateError::OverflowingFixedOverhead);
}

TEST(Pack, SmallerPayload) {
  PacketCapacity cap;
  cap.max_payload_bits = 1024;
  auto r = pack(SizeResult{24, 100}, cap);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->records_per_packet, 10u);
  EXPECT_EQ(r->remainder_bits, 0u);
}

// --------------------------- Scenarios -------------------------------------

/**
 * @test Estimate_LightCurve_FiveEnergies
 * @brief 5 energies at 4 s: 580 records per packet, 21600 records per day.
 */
TEST(Estimate, LightCurve_FiveEnergies) {
  auto r = estimate(Product::LightCurve, StructuralParams{.num_energies = 5}, 4s);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->capacity_bits, 32768u);
  EXPECT_EQ(r->fixed_bits, 288u);
  EXPECT_EQ(r->available_bits, 32480u);
  EXPECT_EQ(r->variable_bits, 56u);
  EXPECT_EQ(r->records_per_packet, 580u);
  EXPECT_EQ(r->remainder_bits, 0u);
  EXPECT_EQ(r->records_per_day, 21600u);
  EXPECT_NEAR(r->packets_per_day, 21600.0 / 580.0, 1e-9);
  EXPECT_GT(r->total_bits_per_day, 0.0);
  EXPECT_TRUE(std::isfinite(r->total_bits_per_day));
  EXPECT_NEAR(r->total_bits_per_day, (21600.0 / 580.0) * 32768.0, 1e-6);
}

/**
 * @test Estimate_Variance
 * @brief Energy parameter unused; 8 bits per sample.
 */
TEST(Estimate, Variance_EightBitsPerSample) {
  auto r = estimate(Product::Variance, StructuralParams{.num_energies = 99}, 4s);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->variable_bits, 8u);
  EXPECT_EQ(r->fixed_bits, 184u);
  EXPECT_EQ(r->records_per_packet, (32768u - r->fixed_bits) / 8u);
  EXPECT_EQ(r->records_per_packet, 4073u);
}

TEST(Estimate, RecordAxisForcedToOne) {
  // Caller-supplied sample count is replaced by exactly one record.
  auto many = estimate(Product::Background, StructuralParams{.num_samples = 50, .num_energies = 5}, 8s);
  auto one  = estimate(Product::Background, StructuralParams{.num_samples = 1,  .num_energies = 5}, 8s);
  ASSERT_TRUE(many);
  ASSERT_TRUE(one);
  EXPECT_EQ(many->variable_bits, one->variable_bits);
  EXPECT_EQ(one->records_per_packet, 678u);

  // Level 1 packs energy groups, not samples.
  auto l1 = estimate(Product::XrayLevel1,
                     StructuralParams{.num_energies = 32, .num_pixel_sets = 2, .num_detector_masks = 32}, 20s);
  ASSERT_TRUE(l1);
  EXPECT_EQ(l1->variable_bits, 32u + 2u * 32u * 8u);
}

TEST(Estimate, RateIdentity_AllDefaultProducts) {
  const struct { Product p; uint32_t energies; std::chrono::milliseconds cadence; } plan[] = {
    {Product::LightCurve, 5, 4s},          {Product::Background, 5, 8s},
    {Product::Spectra, 32, 32s},           {Product::Variance, 0, 4s},
    {Product::FlareFlagLocation, 0, 8s},   {Product::FlareListTmMgmt, 0, 288s},
    {Product::CalibrationSpectra, 64, 56250ms},
  };
  for (const auto& e : plan) {
    auto r = estimate(e.p, StructuralParams{.num_energies = e.energies}, e.cadence);
    ASSERT_TRUE(r) << static_cast<int>(e.p);
    const double full = static_cast<double>(r->fixed_bits + r->records_per_packet * r->variable_bits);
    EXPECT_NEAR(r->total_bits_per_day, r->packets_per_day * full, 1e-6);
    EXPECT_NEAR(r->packets_per_day * static_cast<double>(r->records_per_packet),
                static_cast<double>(r->records_per_day), 1e-6);
    EXPECT_EQ(r->records_per_packet * r->variable_bits + r->remainder_bits, r->available_bits);
  }
}

TEST(Estimate, CalibrationSpectra_FractionalCadence) {
  auto r = estimate(Product::CalibrationSpectra, StructuralParams{.num_energies = 64}, 56250ms);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->fixed_bits, 474u);
  EXPECT_EQ(r->variable_bits, 544u);
  EXPECT_EQ(r->records_per_packet, 59u);
  EXPECT_EQ(r->remainder_bits, 198u);
  EXPECT_EQ(r->records_per_day, 1536u);
}

// --------------------------- Synthetic products ----------------------------

/**
 * @test Estimate_ZeroVariable
 * @brief A product without a repeated part must fail, never divide by zero.
 */
TEST(Estimate, SyntheticZeroVariable_Fails) {
  auto empty_record = [](const StructuralParams&) { return SizeResult{256, 0}; };
  auto r = estimate_with(empty_record, StructuralParams{}, 4s);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), EstimateError::DegenerateRecordSize);
}

TEST(Estimate, SyntheticHugeHeader_Fails) {
  auto r = estimate_with([](const StructuralParams&) { return SizeResult{1u << 20, 8}; },
                         StructuralParams{}, 4s);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), EstimateError::OverflowingFixedOverhead);
}

TEST(Estimate, CadenceCheckedBeforePacking) {
  auto r = estimate(SizeResult{32768, 0}, 7s);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), EstimateError::NonDivisibleCadence);
}

TEST(Estimate, EstimateWith_CatalogFunction) {
  auto fn = [](const StructuralParams& sp) {
    return tmrate::catalog::flare_list_tm_mgmt(sp.num_energies, sp.num_samples);
  };
  auto r = estimate_with(fn, StructuralParams{.num_samples = 1}, 288s);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->records_per_packet, 255u);
  EXPECT_EQ(r->remainder_bits, 40u);
  EXPECT_EQ(r->records_per_day, 300u);
}

TEST(Estimate, MeanBitsPerSecond) {
  auto r = estimate(SizeResult{0, 32768}, 1s);
  ASSERT_TRUE(r);
  EXPECT_DOUBLE_EQ(r->packets_per_day, 86400.0);
  EXPECT_DOUBLE_EQ(r->mean_bits_per_second(), 32768.0);
}

TEST(EstimateErrorLabel, StableNames) {
  EXPECT_EQ(tmrate::budget::to_string(EstimateError::NonDivisibleCadence), "non_divisible_cadence");
  EXPECT_EQ(tmrate::budget::to_string(EstimateError::DegenerateRecordSize), "degenerate_record_size");
  EXPECT_EQ(tmrate::budget::to_string(EstimateError::OverflowingFixedOverhead), "overflowing_fixed_overhead");
}
