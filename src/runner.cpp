#include "runner.hpp"

#include "host.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>

namespace geosite_probe {

BatchRunner::BatchRunner(const Scanner& scanner, std::size_t workers, std::ostream& log, StatsPtr stats)
    : scanner_(scanner),
      workers_(std::max<std::size_t>(1, workers)),
      log_(log),
      stats_(std::move(stats)) {}

LineReport BatchRunner::process_line(const std::string& raw) const {
    LineReport report;
    report.raw = raw;
    if (stats_) ++stats_->hosts_total;

    auto normalized = normalize_host(raw);
    if (!normalized.ok()) {
        report.error = std::move(normalized.error);
        if (stats_) ++stats_->normalize_errors;
        return report;
    }

    report.host = std::move(normalized.host);
    report.matches = scanner_.scan(report.host);
    rank_matches(report.matches);

    if (stats_) {
        if (report.matches.empty()) {
            ++stats_->hosts_unmatched;
        } else {
            ++stats_->hosts_matched;
            stats_->selectors_emitted += report.matches.size();
        }
    }
    return report;
}

std::vector<LineReport> BatchRunner::run(const std::vector<std::string>& lines) const {
    std::vector<LineReport> reports(lines.size());
    if (workers_ == 1 || lines.size() < 2) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            reports[i] = process_line(lines[i]);
        }
        return reports;
    }

    // Each task owns one slot of reports; hosts are independent so only the
    // pattern cache is shared.
    const auto threads = std::min(workers_, lines.size());
    log_ << "[runner] Scanning " << lines.size() << " hosts on " << threads << " workers.\n";
    boost::asio::thread_pool pool(threads);
    std::atomic<std::size_t> next{0};
    std::mutex error_mu;
    std::exception_ptr first_error;

    for (std::size_t t = 0; t < threads; ++t) {
        boost::asio::post(pool, [&]() {
            try {
                for (auto i = next++; i < lines.size(); i = next++) {
                    reports[i] = process_line(lines[i]);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mu);
                if (!first_error) first_error = std::current_exception();
            }
        });
    }
    pool.join();

    if (first_error) std::rethrow_exception(first_error);
    return reports;
}

void BatchRunner::run_and_write(const std::vector<std::string>& lines, std::ostream& out,
                                const ReportOptions& options) const {
    for (const auto& report : run(lines)) {
        write_report(out, report, options);
    }
}

} // namespace geosite_probe
