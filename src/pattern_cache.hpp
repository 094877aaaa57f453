#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace re2 {
class RE2;
}

namespace geosite_probe {

// Run-scoped cache of compiled regex rules, keyed by the canonical rule value.
// Entries are never evicted. A pattern that fails to compile is stored as a
// null entry so it is reported once and never matches afterwards.
// get() is safe to call from several scanning threads at once.
class PatternCache {
public:
    using Compiled = std::shared_ptr<const re2::RE2>;

    explicit PatternCache(std::ostream& log);
    ~PatternCache();

    PatternCache(const PatternCache&) = delete;
    PatternCache& operator=(const PatternCache&) = delete;

    // Returns the compiled pattern, compiling on first use. Null when the
    // pattern is invalid.
    Compiled get(const std::string& pattern);

    // Unanchored search of text with pattern. False for invalid patterns.
    bool search(const std::string& pattern, std::string_view text);

    std::size_t size() const;
    std::size_t failures() const { return failures_.load(); }

private:
    Compiled compile(const std::string& pattern, std::string& error) const;

    std::ostream& log_;
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Compiled> entries_;
    std::atomic<std::size_t> failures_{0};
};

} // namespace geosite_probe
