#pragma once
/**
 * @file cli_args.hpp
 * @brief Strict parsing of tmrate_app positional arguments into a PlanEntry.
 * @details Inputs are parsed exactly: no sign, no rounding, no wrap-around.
 *          A value that cannot be represented as given is rejected.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tmrate/compat/expected.hpp"
#include "tmrate/config/config_loader.hpp"

namespace tmrate::config {

    /** @enum ArgError
     *  @brief Reasons a command-line argument is rejected.
     */
    enum class ArgError : uint8_t {
        MissingArgument = 1,   ///< Fewer than <key> <energies> <cadence_s>
        TooManyArguments,      ///< More than two optional counts
        UnknownProduct,        ///< Key/name not in the catalog
        InvalidCount,          ///< Not a plain decimal integer within uint32_t
        InvalidCadence         ///< Not a plain decimal with at most millisecond resolution
    };

    /// Stable label for an argument error.
    std::string_view to_string(ArgError e) noexcept;

    /**
     * @brief Parse a non-negative count ("0".."4294967295").
     * @return The count, or InvalidCount for signs, blanks, junk or overflow.
     */
    tmrate_detail::expected<uint32_t, ArgError> parse_count(std::string_view text) noexcept;

    /**
     * @brief Parse a cadence in seconds, e.g. "4", "56.25", "0.5".
     * @details Digits beyond the third decimal place must be zero; "4.0004" is
     *          rejected instead of being rounded to 4000 ms.
     * @return Cadence in milliseconds, or InvalidCadence.
     */
    tmrate_detail::expected<std::chrono::milliseconds, ArgError>
    parse_cadence(std::string_view text) noexcept;

    /**
     * @brief Build a plan entry from "<key> <energies> <cadence_s> [pixel_sets] [detector_masks]".
     * @param args Positional arguments, options already removed.
     * @param xray_user_header Value for PlanEntry::xray_user_header.
     */
    tmrate_detail::expected<PlanEntry, ArgError>
    parse_plan_entry(const std::vector<std::string>& args, bool xray_user_header);

} // namespace tmrate::config
