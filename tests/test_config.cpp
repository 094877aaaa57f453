#include "config.hpp"
#include "test_common.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace geosite_probe;

namespace {

std::string write_temp(const std::string& name, const std::string& body) {
    namespace fs = std::filesystem;
    fs::path tmp = fs::temp_directory_path() / name;
    std::ofstream out(tmp);
    out << body;
    return tmp.string();
}

} // namespace

int main() {
    auto test_default_config = [] {
        auto cfg = make_default_config();
        EXPECT_EQ(cfg.catalog_path, std::string("dlc.dat"));
        EXPECT_EQ(cfg.domains_path, std::string("domains.txt"));
        EXPECT_EQ(cfg.selector_prefix, std::string("geosite:"));
        EXPECT_EQ(cfg.workers, 1u);
        EXPECT_TRUE(cfg.output.show_why);
        EXPECT_EQ(cfg.output.selector_width, 42u);
        EXPECT_FALSE(cfg.output.stats);
    };

    auto test_load_config_missing = [] {
        std::stringstream log;
        auto cfg = load_config("this_file_does_not_exist.json", log);
        EXPECT_CONTAINS(log.str(), "Cannot open config");
        EXPECT_EQ(cfg.catalog_path, make_default_config().catalog_path);
    };

    auto test_load_config_empty_path = [] {
        std::stringstream log;
        auto cfg = load_config("", log);
        EXPECT_TRUE(log.str().empty());
        EXPECT_EQ(cfg.workers, 1u);
    };

    auto test_load_config_json = [] {
        auto path = write_temp("geosite_probe_config_test.json", R"({
            "catalog": "/var/lib/v2ray/geosite.dat",
            "domains": "hosts.txt",
            "selector_prefix": "category:",
            "workers": 500,
            "output": {"show_why": false, "selector_width": 2, "stats": true}
        })");

        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_EQ(cfg.catalog_path, std::string("/var/lib/v2ray/geosite.dat"));
        EXPECT_EQ(cfg.domains_path, std::string("hosts.txt"));
        EXPECT_EQ(cfg.selector_prefix, std::string("category:"));
        EXPECT_EQ(cfg.workers, 64u);               // clamped maximum
        EXPECT_FALSE(cfg.output.show_why);
        EXPECT_EQ(cfg.output.selector_width, 8u);  // clamped minimum
        EXPECT_TRUE(cfg.output.stats);
        std::filesystem::remove(path);
    };

    auto test_load_config_malformed = [] {
        auto path = write_temp("geosite_probe_config_bad.json", "{\"catalog\": ");
        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_CONTAINS(log.str(), "Failed to parse JSON");
        EXPECT_EQ(cfg.catalog_path, std::string("dlc.dat"));
        std::filesystem::remove(path);
    };

    auto test_load_config_bad_value = [] {
        auto path = write_temp("geosite_probe_config_value.json",
                               R"({"catalog": "x.dat", "output": {"show_why": "sometimes"}})");
        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_CONTAINS(log.str(), "Invalid value");
        EXPECT_EQ(cfg.catalog_path, std::string("dlc.dat"));
        std::filesystem::remove(path);
    };

    auto test_parse_workers = [] {
        std::size_t workers = 3;
        EXPECT_TRUE(parse_workers("8", workers));
        EXPECT_EQ(workers, 8u);
        EXPECT_FALSE(parse_workers("-1", workers));
        EXPECT_FALSE(parse_workers("+2", workers));
        EXPECT_FALSE(parse_workers("abc", workers));
        EXPECT_FALSE(parse_workers("4x", workers));
        EXPECT_FALSE(parse_workers("", workers));
        EXPECT_FALSE(parse_workers("99999999999999999999999", workers));
        EXPECT_EQ(workers, 8u);
    };

    auto test_negative_workers_in_json = [] {
        auto path = write_temp("geosite_probe_config_workers.json", R"({"workers": -1, "domains": "d.txt"})");
        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_CONTAINS(log.str(), "[config] Invalid workers value '-1'");
        EXPECT_EQ(cfg.workers, 1u);
        EXPECT_EQ(cfg.domains_path, std::string("d.txt"));
        std::filesystem::remove(path);
    };

    auto test_empty_prefix_kept_default = [] {
        auto path = write_temp("geosite_probe_config_prefix.json", R"({"selector_prefix": ""})");
        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_EQ(cfg.selector_prefix, std::string("geosite:"));
        EXPECT_CONTAINS(log.str(), "Empty selector_prefix");
        std::filesystem::remove(path);
    };

    return run_tests({
        {"default_config", test_default_config},
        {"load_config_missing", test_load_config_missing},
        {"load_config_empty_path", test_load_config_empty_path},
        {"load_config_json", test_load_config_json},
        {"load_config_malformed", test_load_config_malformed},
        {"load_config_bad_value", test_load_config_bad_value},
        {"parse_workers", test_parse_workers},
        {"negative_workers_in_json", test_negative_workers_in_json},
        {"empty_prefix_kept_default", test_empty_prefix_kept_default},
    });
}
