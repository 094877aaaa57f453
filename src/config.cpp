#include "config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>

namespace pt = boost::property_tree;

namespace geosite_probe {

namespace {

constexpr std::size_t kMaxWorkers = 64;
constexpr std::size_t kMinSelectorWidth = 8;
constexpr std::size_t kMaxSelectorWidth = 128;

AppConfig::Output parse_output(const pt::ptree& node, const AppConfig::Output& fallback) {
    AppConfig::Output out = fallback;
    out.show_why = node.get<bool>("show_why", out.show_why);
    out.selector_width = node.get<std::size_t>("selector_width", out.selector_width);
    out.stats = node.get<bool>("stats", out.stats);
    return out;
}

} // namespace

AppConfig make_default_config() {
    return AppConfig{};
}

bool parse_workers(std::string_view text, std::size_t& workers) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    std::size_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) return false;
    workers = value;
    return true;
}

void clamp_config(AppConfig& config) {
    config.workers = std::max<std::size_t>(1, std::min(config.workers, kMaxWorkers));
    config.output.selector_width =
        std::max(kMinSelectorWidth, std::min(config.output.selector_width, kMaxSelectorWidth));
}

AppConfig load_config(const std::string& config_path, std::ostream& log) {
    if (config_path.empty()) {
        return make_default_config();
    }

    std::ifstream in(config_path);
    if (!in) {
        log << "[config] Cannot open config file at " << config_path << ". Using defaults.\n";
        return make_default_config();
    }

    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& ex) {
        log << "[config] Failed to parse JSON: " << ex.what() << ". Using defaults.\n";
        return make_default_config();
    }

    AppConfig config = make_default_config();
    try {
        config.catalog_path = tree.get<std::string>("catalog", config.catalog_path);
        config.domains_path = tree.get<std::string>("domains", config.domains_path);
        config.selector_prefix = tree.get<std::string>("selector_prefix", config.selector_prefix);
        if (auto workers = tree.get_optional<std::string>("workers")) {
            if (!parse_workers(*workers, config.workers)) {
                log << "[config] Invalid workers value '" << *workers << "', keeping "
                    << config.workers << ".\n";
            }
        }
        if (auto output_node = tree.get_child_optional("output")) {
            config.output = parse_output(*output_node, config.output);
        }
    } catch (const pt::ptree_bad_data& ex) {
        log << "[config] Invalid value: " << ex.what() << ". Using defaults.\n";
        return make_default_config();
    }

    if (config.selector_prefix.empty()) {
        log << "[config] Empty selector_prefix, keeping 'geosite:'.\n";
        config.selector_prefix = make_default_config().selector_prefix;
    }
    clamp_config(config);
    return config;
}

} // namespace geosite_probe
