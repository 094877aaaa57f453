#include "catalog.hpp"
#include "catalog_index.hpp"
#include "config.hpp"
#include "input.hpp"
#include "pattern_cache.hpp"
#include "runner.hpp"
#include "scanner.hpp"
#include "stats.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace geosite_probe;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [-c|--config path] [--geosite path] [--domains path]"
                 " [--why|--no-why] [-j|--workers n] [--stats]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
        }

        auto config = load_config(config_path, std::cerr);

        // Flags override the file.
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                ++i;
            } else if (arg == "--geosite" && i + 1 < argc) {
                config.catalog_path = argv[++i];
            } else if (arg == "--domains" && i + 1 < argc) {
                config.domains_path = argv[++i];
            } else if (arg == "--why") {
                config.output.show_why = true;
            } else if (arg == "--no-why") {
                config.output.show_why = false;
            } else if ((arg == "-j" || arg == "--workers") && i + 1 < argc) {
                const std::string value = argv[++i];
                if (!parse_workers(value, config.workers)) {
                    std::cerr << "[fatal] invalid --workers value '" << value << "'\n";
                    return 1;
                }
            } else if (arg == "--stats") {
                config.output.stats = true;
            } else {
                std::cerr << "[fatal] unknown or incomplete argument '" << arg << "'\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        clamp_config(config);

        const Catalog catalog = load_catalog(config.catalog_path, std::cerr);
        const std::vector<std::string> lines = read_domain_list(config.domains_path);

        const CatalogIndex index(catalog);
        PatternCache cache(std::cerr);
        Scanner scanner(catalog, index, cache, config.selector_prefix);
        auto stats = make_stats();
        BatchRunner runner(scanner, config.workers, std::cerr, stats);

        runner.run_and_write(lines, std::cout,
                             ReportOptions{config.output.show_why, config.output.selector_width,
                                           config.selector_prefix});

        if (config.output.stats) {
            std::cerr << render_stats(*stats, cache);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
