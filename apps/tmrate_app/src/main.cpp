// apps/tmrate_app/src/main.cpp
// tmrate — downlink budget report
// Purpose: project packets/day and mean bit rate for STIX TM products.
//
// Usage:
//   ./tmrate_app                                   default quicklook plan
//   ./tmrate_app <key> <energies> <cadence_s> [pixel_sets] [detector_masks]
//   ./tmrate_app --user-header l1 4 20 2 32        X-ray level with user header
//   ./tmrate_app --list                            catalog keys
//
// One record is sized per projection: the sample count (energy groups for
// l1/l2/l3, so <energies> has no effect there) is forced to 1.
// Cadence is exact decimal seconds with at most millisecond resolution
// (e.g. 56.25); it must divide one day.

#include <iostream>
#include <string>
#include <vector>

#include "tmrate/version.hpp"
#include "tmrate/catalog/product.hpp"
#include "tmrate/config/cli_args.hpp"
#include "tmrate/config/config_loader.hpp"
#include "tmrate/obs/observability.hpp"
#include "tmrate/report/report.hpp"

namespace {

void print_catalog() {
    for (const auto& info : tmrate::catalog::all_products()) {
        std::cout << info.key << "\t" << info.name << "\t"
                  << (info.family == tmrate::catalog::Family::BulkScience ? "bulk" : "quicklook")
                  << "\n";
    }
}

int usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--list] [--user-header] "
              << "[<key> <energies> <cadence_s> [pixel_sets] [detector_masks]]\n"
              << "  one record is sized: samples (energy groups for l1/l2/l3) forced to 1\n"
              << "  cadence_s: decimal seconds, millisecond resolution, must divide 86400\n";
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool user_header = false;
    if (!args.empty() && args.front() == "--list") {
        print_catalog();
        return 0;
    }
    if (!args.empty() && args.front() == "--user-header") {
        user_header = true;
        args.erase(args.begin());
    }

    auto cfg = tmrate::config::Loader::defaults();

    if (!args.empty()) {
        const auto entry = tmrate::config::parse_plan_entry(args, user_header);
        if (!entry) {
            std::cerr << "invalid arguments: " << tmrate::config::to_string(entry.error()) << "\n";
            return usage(argv[0]);
        }
        cfg.plan = {*entry};
    }

    std::cout << "tmrate " << tmrate::version_string
              << " (" << tmrate::icd_reference << ")\n"
              << "Packet envelope: " << cfg.capacity.envelope_bits() << " bits\n";

    auto* observer = tmrate::obs::make_simple_observer();
    const auto summary = tmrate::report::run_plan(cfg, observer);
    std::cout << tmrate::report::render(summary);

    return summary.failed == 0 ? 0 : 1;
}
