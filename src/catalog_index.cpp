#include "catalog_index.hpp"

#include <unordered_set>

namespace geosite_probe {

CatalogIndex::CatalogIndex(const Catalog& catalog) {
    std::unordered_set<std::string> seen;
    for (const auto& category : catalog) {
        // Records sharing a tag accumulate into one group.
        base_[category.tag] += category.rules.size();
        auto& counts = attrs_[category.tag];
        for (const auto& rule : category.rules) {
            seen.clear();
            for (const auto& key : rule.attributes) {
                if (key.empty() || !seen.insert(key).second) continue;
                ++counts[key];
            }
        }
    }
}

std::size_t CatalogIndex::base_size(const std::string& tag) const {
    auto it = base_.find(tag);
    return it == base_.end() ? 0 : it->second;
}

std::size_t CatalogIndex::attribute_size(const std::string& tag, const std::string& attr) const {
    auto it = attrs_.find(tag);
    if (it == attrs_.end()) return 0;
    auto a = it->second.find(attr);
    return a == it->second.end() ? 0 : a->second;
}

} // namespace geosite_probe
