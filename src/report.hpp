#pragma once

#include "scanner.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace geosite_probe {

// Outcome for one input line. Either error is set, or host is set and
// matches holds the ranked selectors (possibly none).
struct LineReport {
    std::string raw;
    std::string host;
    std::string error;
    std::vector<Match> matches;

    bool ok() const { return error.empty(); }
};

struct ReportOptions {
    bool show_why = true;
    std::size_t selector_width = 42;
    std::string selector_prefix = "geosite:";
};

// "(no geosite match found)" for "geosite:", "(no match found)" when the
// prefix names nothing.
std::string no_match_line(const std::string& selector_prefix);

void write_report(std::ostream& out, const LineReport& report, const ReportOptions& options);

} // namespace geosite_probe
