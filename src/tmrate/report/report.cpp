/**
 * @file report.cpp
 * @brief Plan runner and text formatting.
 */
#include "tmrate/report/report.hpp"
#include "tmrate/catalog/bulk_science.hpp"
#include <cstdio>
#include <utility>

namespace tmrate::report {

using budget::EstimateError;
using budget::PackingOutcome;

namespace {

bool is_xray_level(catalog::Product p) noexcept {
    return p == catalog::Product::XrayLevel0 || p == catalog::Product::XrayLevel1 ||
           p == catalog::Product::XrayLevel2 || p == catalog::Product::XrayLevel3;
}

// Size exactly one record, optionally with the bulk X-ray user header.
catalog::SizeResult size_entry(const config::PlanEntry& e) noexcept {
    auto size = catalog::size_of(e.product, catalog::with_records(e.product, e.params, 1));
    if (e.xray_user_header && is_xray_level(e.product)) {
        size = catalog::with_xray_user_header(size);
    }
    return size;
}

} // namespace

std::string format_outcome(std::string_view name, const PackingOutcome& o) {
    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "%.*s: Packet Size: %llu, Fixed Header: %llu, Remaining: %llu, "
                  "Sample size %llu, Samples per packet: %llu, Free %llu, No. packets %.4f",
                  static_cast<int>(name.size()), name.data(),
                  static_cast<unsigned long long>(o.capacity_bits),
                  static_cast<unsigned long long>(o.fixed_bits),
                  static_cast<unsigned long long>(o.available_bits),
                  static_cast<unsigned long long>(o.variable_bits),
                  static_cast<unsigned long long>(o.records_per_packet),
                  static_cast<unsigned long long>(o.remainder_bits),
                  o.packets_per_day);
    return buf;
}

std::string format_error(std::string_view name, EstimateError e) {
    std::string out{name};
    out += ": FAILED (";
    out += budget::to_string(e);
    out += ")";
    return out;
}

BudgetSummary run_plan(const config::BudgetConfig& cfg, obs::Observer* observer) {
    BudgetSummary s;
    s.lines.reserve(cfg.plan.size());

    for (const auto& entry : cfg.plan) {
        const auto& info = catalog::product_info(entry.product);
        ProductLine line{std::string{info.key}, std::string{info.name}, std::nullopt, std::nullopt};

        const auto res = budget::estimate(size_entry(entry), entry.cadence, cfg.capacity);
        if (res) {
            line.outcome = *res;
            s.total_bits_per_second += res->mean_bits_per_second();
        } else {
            line.error = res.error();
            s.failed++;
        }

        if (observer) {
            observer->record(obs::EstimateEvent{line.name,
                                                static_cast<uint64_t>(entry.cadence.count()),
                                                line.outcome, line.error});
        }
        s.lines.push_back(std::move(line));
    }
    return s;
}

std::string render(const BudgetSummary& s) {
    std::string out;
    for (const auto& l : s.lines) {
        out += l.outcome ? format_outcome(l.name, *l.outcome) : format_error(l.name, *l.error);
        out += '\n';
    }
    char buf[128];
    for (const auto& l : s.lines) {
        if (!l.outcome) continue;
        std::snprintf(buf, sizeof(buf), "%s %.3f\n", l.key.c_str(), l.outcome->mean_bits_per_second());
        out += buf;
    }
    std::snprintf(buf, sizeof(buf), "total %.3f bit/s\n", s.total_bits_per_second);
    out += buf;
    return out;
}

} // namespace tmrate::report
