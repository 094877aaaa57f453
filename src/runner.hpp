#pragma once

#include "report.hpp"
#include "scanner.hpp"
#include "stats.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace geosite_probe {

class BatchRunner {
public:
    BatchRunner(const Scanner& scanner, std::size_t workers, std::ostream& log, StatsPtr stats = nullptr);

    // Normalize, scan and rank a single raw line.
    LineReport process_line(const std::string& raw) const;

    // Reports come back in input order regardless of the worker count.
    std::vector<LineReport> run(const std::vector<std::string>& lines) const;

    // run() and write every report to out.
    void run_and_write(const std::vector<std::string>& lines, std::ostream& out,
                       const ReportOptions& options) const;

    std::size_t workers() const { return workers_; }

private:
    const Scanner& scanner_;
    std::size_t workers_;
    std::ostream& log_;
    StatsPtr stats_;
};

} // namespace geosite_probe
