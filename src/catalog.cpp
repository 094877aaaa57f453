#include "catalog.hpp"

#include "geosite.pb.h"

#include <fstream>
#include <iterator>
#include <limits>

namespace geosite_probe {

namespace {

Rule convert_rule(const wire::Domain& domain) {
    Rule rule;
    rule.type_code = static_cast<int32_t>(domain.type());
    rule.type = match_type_from_code(rule.type_code);
    rule.value = domain.value();
    rule.attributes.reserve(static_cast<std::size_t>(domain.attribute_size()));
    for (const auto& attr : domain.attribute()) {
        if (attr.key().empty()) continue;
        rule.attributes.push_back(attr.key());
    }
    return rule;
}

} // namespace

MatchType match_type_from_code(int32_t code) {
    switch (code) {
        case wire::Domain::Plain: return MatchType::Plain;
        case wire::Domain::Regex: return MatchType::Regex;
        case wire::Domain::RootDomain: return MatchType::DomainSuffix;
        case wire::Domain::Full: return MatchType::Full;
        default: return MatchType::Unknown;
    }
}

std::string_view strategy_name(MatchType type) {
    switch (type) {
        case MatchType::Plain: return "plain";
        case MatchType::DomainSuffix: return "domain";
        case MatchType::Full: return "full";
        case MatchType::Regex: return "regex";
        case MatchType::Unknown: break;
    }
    return "unknown";
}

Catalog decode_catalog(std::string_view bytes) {
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw CatalogError("catalog too large to decode (" + std::to_string(bytes.size()) + " bytes)");
    }

    wire::GeoSiteList list;
    if (!list.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        throw CatalogError("proto unmarshal geosite list failed");
    }

    Catalog catalog;
    catalog.reserve(static_cast<std::size_t>(list.entry_size()));
    for (const auto& site : list.entry()) {
        Category category;
        category.tag = site.country_code();
        category.rules.reserve(static_cast<std::size_t>(site.domain_size()));
        for (const auto& domain : site.domain()) {
            category.rules.push_back(convert_rule(domain));
        }
        catalog.push_back(std::move(category));
    }
    return catalog;
}

Catalog load_catalog(const std::string& path, std::ostream& log) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CatalogError("cannot open catalog file at " + path);
    }
    std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw CatalogError("failed to read catalog file at " + path);
    }

    Catalog catalog;
    try {
        catalog = decode_catalog(bytes);
    } catch (const CatalogError& ex) {
        throw CatalogError(std::string(ex.what()) + " (" + path + ")");
    }

    if (catalog.empty()) {
        log << "[catalog] " << path << " contains no categories.\n";
    } else {
        log << "[catalog] Loaded " << catalog.size() << " categories, "
            << total_rules(catalog) << " rules from " << path << "\n";
    }
    return catalog;
}

std::size_t total_rules(const Catalog& catalog) {
    std::size_t n = 0;
    for (const auto& category : catalog) n += category.rules.size();
    return n;
}

} // namespace geosite_probe
