#include "matcher.hpp"

#include "host.hpp"

namespace geosite_probe {

namespace {

bool ends_with_label(std::string_view host, std::string_view value) {
    // host == value, or host == "<anything>." + value
    if (host.size() == value.size()) return host == value;
    if (host.size() < value.size() + 1) return false;
    auto tail = host.substr(host.size() - value.size());
    return tail == value && host[host.size() - value.size() - 1] == '.';
}

} // namespace

RuleVerdict match_rule(std::string_view host, const Rule& rule, PatternCache& cache) {
    const auto strategy = strategy_name(rule.type);
    const auto value = canonical_value(rule.value);
    if (value.empty()) return RuleVerdict{false, strategy};

    switch (rule.type) {
        case MatchType::Plain:
            return RuleVerdict{host.find(value) != std::string_view::npos, strategy};
        case MatchType::DomainSuffix:
            return RuleVerdict{ends_with_label(host, value), strategy};
        case MatchType::Full:
            return RuleVerdict{host == value, strategy};
        case MatchType::Regex:
            return RuleVerdict{cache.search(value, host), strategy};
        case MatchType::Unknown:
            // Codes this build does not know: exact equality only.
            return RuleVerdict{host == value, strategy};
    }
    return RuleVerdict{false, strategy};
}

} // namespace geosite_probe
