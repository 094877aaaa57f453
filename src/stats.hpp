#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace geosite_probe {

class PatternCache;

struct ScanStats {
    std::atomic<uint64_t> hosts_total{0};
    std::atomic<uint64_t> hosts_matched{0};
    std::atomic<uint64_t> hosts_unmatched{0};
    std::atomic<uint64_t> normalize_errors{0};
    std::atomic<uint64_t> selectors_emitted{0};
};

using StatsPtr = std::shared_ptr<ScanStats>;

StatsPtr make_stats();

// Prometheus text exposition, one "geosite_probe_<name> <value>" per line.
std::string render_stats(const ScanStats& stats, const PatternCache& cache);

} // namespace geosite_probe
