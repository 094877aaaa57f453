#pragma once

#include "catalog.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace geosite_probe {

// Group sizes derived once from the catalog. Immutable after construction.
class CatalogIndex {
public:
    explicit CatalogIndex(const Catalog& catalog);

    // Number of rules under tag, duplicates included. 0 for unknown tags.
    std::size_t base_size(const std::string& tag) const;

    // Number of rules under tag carrying attr at least once. 0 when absent.
    std::size_t attribute_size(const std::string& tag, const std::string& attr) const;

    std::size_t category_count() const { return base_.size(); }

private:
    using AttrCounts = std::unordered_map<std::string, std::size_t>;

    std::unordered_map<std::string, std::size_t> base_;
    std::unordered_map<std::string, AttrCounts> attrs_;
};

} // namespace geosite_probe
