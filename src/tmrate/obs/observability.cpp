/**
 * @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "tmrate/obs/observability.hpp"
#include <mutex>
#include <cstdio>
#include <string>

namespace tmrate::obs {

    class SimpleObserver : public Observer {
    public:
        void record(const EstimateEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.estimates++;
            if (e.error) {
                ctr_.failures++;
                const std::string err{budget::to_string(*e.error)};
                std::printf(
                  R"({"product":"%s","cadence_ms":%llu,"error":"%s"})" "\n",
                  e.product.c_str(), static_cast<unsigned long long>(e.cadence_ms), err.c_str());
            } else if (e.outcome) {
                ctr_.total_bits_per_day += e.outcome->total_bits_per_day;
                std::printf(
                  R"({"product":"%s","cadence_ms":%llu,"records_per_packet":%llu,"packets_per_day":%.3f,"bits_per_day":%.1f})" "\n",
                  e.product.c_str(), static_cast<unsigned long long>(e.cadence_ms),
                  static_cast<unsigned long long>(e.outcome->records_per_packet),
                  e.outcome->packets_per_day, e.outcome->total_bits_per_day);
            }
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace tmrate::obs
