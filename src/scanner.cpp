#include "scanner.hpp"

#include "matcher.hpp"

#include <algorithm>
#include <unordered_map>

namespace geosite_probe {

Scanner::Scanner(const Catalog& catalog, const CatalogIndex& index, PatternCache& cache,
                 std::string selector_prefix)
    : catalog_(catalog),
      index_(index),
      cache_(cache),
      prefix_(std::move(selector_prefix)) {}

std::vector<Match> Scanner::scan(std::string_view host) const {
    struct Hit {
        const std::string* tag;
        const std::string* attribute;
        std::string_view strategy;
        const std::string* rule_value;
    };
    static const std::string kNoAttribute;

    // Write-once: try_emplace keeps the first justification per selector.
    std::unordered_map<std::string, Hit> hits;

    for (const auto& category : catalog_) {
        const std::string base = prefix_ + category.tag;
        for (const auto& rule : category.rules) {
            const auto verdict = match_rule(host, rule, cache_);
            if (!verdict.matched) continue;

            hits.try_emplace(base, Hit{&category.tag, &kNoAttribute, verdict.strategy, &rule.value});
            for (const auto& key : rule.attributes) {
                if (key.empty()) continue;
                hits.try_emplace(base + "@" + key, Hit{&category.tag, &key, verdict.strategy, &rule.value});
            }
        }
    }

    std::vector<Match> out;
    out.reserve(hits.size());
    for (auto& [selector, hit] : hits) {
        Match m;
        m.selector = selector;
        m.tag = *hit.tag;
        m.attribute = *hit.attribute;
        m.group_size = m.attribute.empty() ? index_.base_size(m.tag)
                                           : index_.attribute_size(m.tag, m.attribute);
        m.strategy = std::string(hit.strategy);
        m.rule_value = *hit.rule_value;
        out.push_back(std::move(m));
    }
    return out;
}

void rank_matches(std::vector<Match>& matches) {
    std::sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
        if (a.group_size != b.group_size) return a.group_size < b.group_size;
        return a.selector < b.selector;
    });
}

} // namespace geosite_probe
