/**
 * @file cli_args.cpp
 * @brief Exact decimal parsing for tmrate_app arguments.
 */
#include "tmrate/config/cli_args.hpp"
#include "tmrate/catalog/product.hpp"
#include <limits>

namespace tmrate::config {

using tmrate_detail::expected;
using tmrate_detail::unexpected;

namespace {

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

// Accumulate a run of digits into @p out; false on overflow past @p limit.
bool accumulate(std::string_view digits, uint64_t limit, uint64_t& out) noexcept {
    for (char c : digits) {
        out = out * 10 + static_cast<uint64_t>(c - '0');
        if (out > limit) return false;
    }
    return true;
}

} // namespace

std::string_view to_string(ArgError e) noexcept {
    switch (e) {
        case ArgError::MissingArgument:  return "missing_argument";
        case ArgError::TooManyArguments: return "too_many_arguments";
        case ArgError::UnknownProduct:   return "unknown_product";
        case ArgError::InvalidCount:     return "invalid_count";
        case ArgError::InvalidCadence:   return "invalid_cadence";
    }
    return "unknown";
}

expected<uint32_t, ArgError> parse_count(std::string_view text) noexcept {
    if (text.empty()) return unexpected(ArgError::InvalidCount);
    for (char c : text) {
        if (!is_digit(c)) return unexpected(ArgError::InvalidCount);
    }
    uint64_t value = 0;
    if (!accumulate(text, std::numeric_limits<uint32_t>::max(), value)) {
        return unexpected(ArgError::InvalidCount);
    }
    return static_cast<uint32_t>(value);
}

expected<std::chrono::milliseconds, ArgError> parse_cadence(std::string_view text) noexcept {
    constexpr std::size_t kMsDigits = 3;
    // Longer than one day is never divisible; the bound only guards overflow.
    constexpr uint64_t kMaxMs = uint64_t{std::numeric_limits<uint32_t>::max()} * 1000;

    const auto dot = text.find('.');
    const std::string_view whole = text.substr(0, dot);
    const std::string_view frac  = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    if (whole.empty() && frac.empty()) return unexpected(ArgError::InvalidCadence);
    if (dot != std::string_view::npos && frac.empty()) return unexpected(ArgError::InvalidCadence);
    for (char c : whole) if (!is_digit(c)) return unexpected(ArgError::InvalidCadence);
    for (char c : frac)  if (!is_digit(c)) return unexpected(ArgError::InvalidCadence);

    // Sub-millisecond digits must be zero: no silent rounding.
    for (std::size_t i = kMsDigits; i < frac.size(); ++i) {
        if (frac[i] != '0') return unexpected(ArgError::InvalidCadence);
    }

    uint64_t ms = 0;
    if (!accumulate(whole, kMaxMs / 1000, ms)) return unexpected(ArgError::InvalidCadence);
    for (std::size_t i = 0; i < kMsDigits; ++i) {
        ms = ms * 10 + (i < frac.size() ? static_cast<uint64_t>(frac[i] - '0') : 0);
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(ms)};
}

expected<PlanEntry, ArgError>
parse_plan_entry(const std::vector<std::string>& args, bool xray_user_header) {
    if (args.size() < 3) return unexpected(ArgError::MissingArgument);
    if (args.size() > 5) return unexpected(ArgError::TooManyArguments);

    const auto product = catalog::find_product(args[0]);
    if (!product) return unexpected(ArgError::UnknownProduct);

    PlanEntry entry;
    entry.product = *product;
    entry.xray_user_header = xray_user_header;

    const auto energies = parse_count(args[1]);
    if (!energies) return unexpected(energies.error());
    entry.params.num_energies = *energies;

    const auto cadence = parse_cadence(args[2]);
    if (!cadence) return unexpected(cadence.error());
    entry.cadence = *cadence;

    if (args.size() > 3) {
        const auto sets = parse_count(args[3]);
        if (!sets) return unexpected(sets.error());
        entry.params.num_pixel_sets = *sets;
    }
    if (args.size() > 4) {
        const auto masks = parse_count(args[4]);
        if (!masks) return unexpected(masks.error());
        entry.params.num_detector_masks = *masks;
    }
    return entry;
}

} // namespace tmrate::config
