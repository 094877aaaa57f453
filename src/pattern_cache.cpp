#include "pattern_cache.hpp"

#include <re2/re2.h>

#include <mutex>

namespace geosite_probe {

PatternCache::PatternCache(std::ostream& log) : log_(log) {}

PatternCache::~PatternCache() = default;

PatternCache::Compiled PatternCache::compile(const std::string& pattern, std::string& error) const {
    RE2::Options options;
    options.set_log_errors(false);
    auto re = std::make_shared<const re2::RE2>(pattern, options);
    if (!re->ok()) {
        error = re->error();
        return nullptr;
    }
    return re;
}

PatternCache::Compiled PatternCache::get(const std::string& pattern) {
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        auto it = entries_.find(pattern);
        if (it != entries_.end()) return it->second;
    }

    // Compile outside the lock; if another thread got there first, its
    // entry wins and this result is dropped.
    std::string error;
    auto compiled = compile(pattern, error);

    std::unique_lock<std::shared_mutex> lock(mu_);
    auto [it, inserted] = entries_.emplace(pattern, compiled);
    if (inserted && !compiled) {
        ++failures_;
        log_ << "[pattern] Invalid regex '" << pattern << "': " << error
             << ". Rule disabled for this run.\n";
    }
    return it->second;
}

bool PatternCache::search(const std::string& pattern, std::string_view text) {
    auto re = get(pattern);
    if (!re) return false;
    return RE2::PartialMatch(re2::StringPiece(text.data(), text.size()), *re);
}

std::size_t PatternCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return entries_.size();
}

} // namespace geosite_probe
