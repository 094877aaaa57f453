#pragma once

#include "catalog.hpp"
#include "pattern_cache.hpp"

#include <string_view>

namespace geosite_probe {

struct RuleVerdict {
    bool matched = false;
    std::string_view strategy; // plain, domain, full, regex or unknown
};

// Evaluate one rule against a normalized host. Regex rules go through the
// shared cache, which compiles the pattern on first use.
RuleVerdict match_rule(std::string_view host, const Rule& rule, PatternCache& cache);

} // namespace geosite_probe
