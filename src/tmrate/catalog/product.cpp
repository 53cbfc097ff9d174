/**
 * @file product.cpp
 * @brief Product descriptor table and tagged size dispatch.
 */
#include "tmrate/catalog/product.hpp"
#include "tmrate/catalog/bulk_science.hpp"
#include "tmrate/catalog/quicklook.hpp"
#include <array>

namespace tmrate::catalog {

namespace {

constexpr std::array<ProductInfo, kProductCount> kProducts{{
    {Product::XrayLevel0,         "xray_level0",         "l0",  Family::BulkScience, RecordAxis::Samples},
    {Product::XrayLevel1,         "xray_level1",         "l1",  Family::BulkScience, RecordAxis::EnergyGroups},
    {Product::XrayLevel2,         "xray_level2",         "l2",  Family::BulkScience, RecordAxis::EnergyGroups},
    {Product::XrayLevel3,         "xray_level3",         "l3",  Family::BulkScience, RecordAxis::EnergyGroups},
    {Product::Spectrogram,        "spectrogram",         "sg",  Family::BulkScience, RecordAxis::Samples},
    {Product::Aspect,             "aspect",              "asp", Family::BulkScience, RecordAxis::Samples},
    {Product::LightCurve,         "light_curve",         "lc",  Family::Quicklook,   RecordAxis::Samples},
    {Product::Background,         "background",          "bg",  Family::Quicklook,   RecordAxis::Samples},
    {Product::Variance,           "variance",            "var", Family::Quicklook,   RecordAxis::Samples},
    {Product::Spectra,            "spectra",             "sp",  Family::Quicklook,   RecordAxis::Samples},
    {Product::FlareFlagLocation,  "flare_flag_location", "ff",  Family::Quicklook,   RecordAxis::Samples},
    {Product::FlareListTmMgmt,    "flare_list_tm_mgmt",  "ftm", Family::Quicklook,   RecordAxis::Samples},
    {Product::CalibrationSpectra, "calibration_spectra", "cal", Family::Quicklook,   RecordAxis::Samples},
}};

} // namespace

SizeResult size_of(Product p, const StructuralParams& sp) noexcept {
    switch (p) {
        case Product::XrayLevel0:         return xray_level0(sp.num_samples);
        case Product::XrayLevel1:         return xray_level1(sp.num_pixel_sets, sp.num_energies, sp.num_detector_masks);
        case Product::XrayLevel2:         return xray_level2(sp.num_pixel_sets, sp.num_energies, sp.num_detector_masks);
        case Product::XrayLevel3:         return xray_level3(sp.num_pixel_sets, sp.num_energies, sp.num_detector_masks);
        case Product::Spectrogram:        return spectrogram(sp.num_samples, sp.num_energies);
        case Product::Aspect:             return aspect(sp.num_samples);
        case Product::LightCurve:         return light_curve(sp.num_energies, sp.num_samples);
        case Product::Background:         return background(sp.num_energies, sp.num_samples);
        case Product::Variance:           return variance(sp.num_energies, sp.num_samples);
        case Product::Spectra:            return spectra(sp.num_energies, sp.num_samples);
        case Product::FlareFlagLocation:  return flare_flag_location(sp.num_energies, sp.num_samples);
        case Product::FlareListTmMgmt:    return flare_list_tm_mgmt(sp.num_energies, sp.num_samples);
        case Product::CalibrationSpectra: return calibration_spectra(sp.num_energies, sp.num_samples);
    }
    return {};
}

const ProductInfo& product_info(Product p) noexcept {
    return kProducts[static_cast<std::size_t>(p)];
}

std::span<const ProductInfo> all_products() noexcept {
    return {kProducts.data(), kProducts.size()};
}

std::optional<Product> find_product(std::string_view key) noexcept {
    for (const auto& info : kProducts) {
        if (info.key == key || info.name == key) return info.product;
    }
    return std::nullopt;
}

StructuralParams with_records(Product p, StructuralParams params, uint32_t records) noexcept {
    if (product_info(p).axis == RecordAxis::EnergyGroups) {
        params.num_energies = records;
    } else {
        params.num_samples = records;
    }
    return params;
}

} // namespace tmrate::catalog
