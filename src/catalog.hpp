#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace geosite_probe {

enum class MatchType {
    Plain,
    DomainSuffix,
    Full,
    Regex,
    Unknown
};

struct Rule {
    MatchType type = MatchType::Plain;
    std::string value;
    std::vector<std::string> attributes;
    int32_t type_code = 0; // raw code from the catalog, kept for diagnostics
};

struct Category {
    std::string tag;
    std::vector<Rule> rules;
};

using Catalog = std::vector<Category>;

class CatalogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// geosite.dat codes: Plain=0, Regex=1, RootDomain=2, Full=3. Anything else
// maps to Unknown and is matched by exact equality only.
MatchType match_type_from_code(int32_t code);

// Strategy label reported with a match: plain, domain, full, regex, unknown.
std::string_view strategy_name(MatchType type);

// Decode a serialized GeoSiteList. Throws CatalogError on malformed input.
Catalog decode_catalog(std::string_view bytes);

// Read and decode a geosite.dat file. Throws CatalogError when the file
// cannot be read or decoded.
Catalog load_catalog(const std::string& path, std::ostream& log);

std::size_t total_rules(const Catalog& catalog);

} // namespace geosite_probe
