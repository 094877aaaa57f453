#pragma once

#include "catalog.hpp"
#include "catalog_index.hpp"
#include "pattern_cache.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace geosite_probe {

struct Match {
    std::string selector;   // <prefix><tag> or <prefix><tag>@<attr>
    std::string tag;
    std::string attribute;  // empty for the base selector
    std::size_t group_size = 0;
    std::string strategy;   // strategy of the first rule that hit
    std::string rule_value; // raw value of that rule
};

// Scans the whole catalog for one normalized host. Every rule is evaluated;
// the first rule to hit a selector is the one recorded for it.
class Scanner {
public:
    Scanner(const Catalog& catalog, const CatalogIndex& index, PatternCache& cache,
            std::string selector_prefix = "geosite:");

    // Unordered: one record per distinct selector.
    std::vector<Match> scan(std::string_view host) const;

    const std::string& selector_prefix() const { return prefix_; }

private:
    const Catalog& catalog_;
    const CatalogIndex& index_;
    PatternCache& cache_;
    std::string prefix_;
};

// Ascending group size, then selector.
void rank_matches(std::vector<Match>& matches);

} // namespace geosite_probe
