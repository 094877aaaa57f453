#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace geosite_probe {

struct AppConfig {
    std::string catalog_path = "dlc.dat";
    std::string domains_path = "domains.txt";
    std::string selector_prefix = "geosite:";
    std::size_t workers = 1;
    struct Output {
        bool show_why = true;
        std::size_t selector_width = 42;
        bool stats = false;
    } output;
};

// Load configuration from JSON, or return defaults when the file is missing/invalid.
AppConfig load_config(const std::string& config_path, std::ostream& log);

AppConfig make_default_config();

// Strict decimal worker count: digits only, no sign, no trailing text.
bool parse_workers(std::string_view text, std::size_t& workers);

// Keep tunables inside their supported ranges.
void clamp_config(AppConfig& config);

} // namespace geosite_probe
