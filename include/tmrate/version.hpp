#ifndef TMRATE_VERSION_HPP
#define TMRATE_VERSION_HPP

#pragma once

namespace tmrate {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 2;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.2.0")
    inline constexpr const char* version_string = "0.2.0";

    /// Interface control document the field widths are taken from
    inline constexpr const char* icd_reference = "STIX-ICD-0812-ESC I4R1 (2019-09-17)";

} // namespace tmrate

#endif // TMRATE_VERSION_HPP
