#include "stats.hpp"

#include "pattern_cache.hpp"

#include <sstream>

namespace geosite_probe {

StatsPtr make_stats() {
    return std::make_shared<ScanStats>();
}

std::string render_stats(const ScanStats& stats, const PatternCache& cache) {
    std::ostringstream os;
    os << "geosite_probe_hosts_total " << stats.hosts_total.load() << "\n";
    os << "geosite_probe_hosts_matched " << stats.hosts_matched.load() << "\n";
    os << "geosite_probe_hosts_unmatched " << stats.hosts_unmatched.load() << "\n";
    os << "geosite_probe_normalize_errors " << stats.normalize_errors.load() << "\n";
    os << "geosite_probe_selectors_emitted " << stats.selectors_emitted.load() << "\n";
    os << "geosite_probe_pattern_cache_entries " << cache.size() << "\n";
    os << "geosite_probe_pattern_cache_failures " << cache.failures() << "\n";
    return os.str();
}

} // namespace geosite_probe
