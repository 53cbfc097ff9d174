#pragma once
/**
 * @file product.hpp
 * @brief Telemetry product identifiers, structural parameters and size results.
 * @details Shared model for the size catalog and the budget estimator. Each
 *          product maps to exactly one pure size function; dispatch is a
 *          switch over the enum.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tmrate::catalog {

/**
 * @enum Product
 * @brief Telemetry products with an ICD-defined packet layout.
 */
enum class Product : uint8_t {
    XrayLevel0 = 0,     ///< Bulk X-ray, uncompressed events
    XrayLevel1,         ///< Bulk X-ray, pixel-set summed compressed counts
    XrayLevel2,         ///< Same wire structure as level 1
    XrayLevel3,         ///< Bulk X-ray, visibilities
    Spectrogram,        ///< Bulk spectrogram
    Aspect,             ///< Bulk aspect (diode voltages)
    LightCurve,         ///< QL light curves
    Background,         ///< QL background
    Variance,           ///< QL variance
    Spectra,            ///< QL spectra
    FlareFlagLocation,  ///< QL flare flag and location
    FlareListTmMgmt,    ///< QL flare list and TM management status
    CalibrationSpectra  ///< QL energy calibration spectra
};

/// Number of Product enumerators.
inline constexpr std::size_t kProductCount = 13;

/**
 * @enum Family
 * @brief Telemetry service the product belongs to.
 */
enum class Family : uint8_t { BulkScience, Quicklook };

/**
 * @enum RecordAxis
 * @brief Structural parameter that counts the repeated record of a product.
 */
enum class RecordAxis : uint8_t {
    Samples,       ///< One record per time sample / flare / structure
    EnergyGroups   ///< One record per energy group (X-ray levels 1-3)
};

/**
 * @struct StructuralParams
 * @brief Per-call structural inputs. Products ignore the fields they do not use.
 */
struct StructuralParams {
    uint32_t num_samples{0};         ///< Time samples, flares or structures
    uint32_t num_energies{0};        ///< Energy bins / groups
    uint32_t num_pixel_sets{0};      ///< Pixel sets (X-ray levels 1-3)
    uint32_t num_detector_masks{0};  ///< Detector masks / detectors (X-ray levels 1-3)

    bool operator==(const StructuralParams&) const = default;
};

/**
 * @struct SizeResult
 * @brief Fixed header size and variable size in bits for one parameter set.
 */
struct SizeResult {
    uint64_t fixed_bits{0};     ///< Constant part of the packet data field
    uint64_t variable_bits{0};  ///< Repeated part for the requested records

    bool operator==(const SizeResult&) const = default;
};

/**
 * @struct ProductInfo
 * @brief Static descriptor used by drivers and reports.
 */
struct ProductInfo {
    Product          product;
    std::string_view name;  ///< Display name, e.g. "light_curve"
    std::string_view key;   ///< Short CLI key, e.g. "lc"
    Family           family;
    RecordAxis       axis;
};

/**
 * @brief Size a product for a parameter set (tagged dispatch).
 * @param p Product to size.
 * @param params Structural parameters; unused fields are ignored.
 * @return Fixed and variable bit counts.
 */
SizeResult size_of(Product p, const StructuralParams& params) noexcept;

/// Descriptor for a product.
const ProductInfo& product_info(Product p) noexcept;

/// All products in enum order.
std::span<const ProductInfo> all_products() noexcept;

/**
 * @brief Lookup a product by short key or display name.
 * @return The product, or std::nullopt when the key is unknown.
 */
std::optional<Product> find_product(std::string_view key) noexcept;

/**
 * @brief Copy of @p params with the product's record axis set to @p records.
 * @details The estimator sizes exactly one record per call through this.
 */
StructuralParams with_records(Product p, StructuralParams params, uint32_t records) noexcept;

} // namespace tmrate::catalog
