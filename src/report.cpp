#include "report.hpp"

#include <iomanip>

namespace geosite_probe {

std::string no_match_line(const std::string& selector_prefix) {
    std::string name = selector_prefix;
    while (!name.empty() && (name.back() == ':' || name.back() == '@')) name.pop_back();
    if (name.empty()) return "(no match found)";
    return "(no " + name + " match found)";
}

void write_report(std::ostream& out, const LineReport& report, const ReportOptions& options) {
    if (!report.ok()) {
        out << report.raw << "\tERROR\t" << report.error << "\n";
        return;
    }

    out << "== " << report.host << " ==\n";
    if (report.matches.empty()) {
        out << no_match_line(options.selector_prefix) << "\n\n";
        return;
    }

    const auto width = static_cast<int>(options.selector_width);
    for (const auto& m : report.matches) {
        out << std::left << std::setw(width) << m.selector << " size=";
        if (options.show_why) {
            out << std::setw(6) << m.group_size << " via=" << m.strategy << ":" << m.rule_value;
        } else {
            out << m.group_size;
        }
        out << std::right << "\n";
    }
    out << "\n";
}

} // namespace geosite_probe
