#include "input.hpp"

#include <fstream>

namespace geosite_probe {

std::vector<std::string> parse_domain_list(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r\n\f\v");
        if (start == std::string::npos) continue;
        auto end = line.find_last_not_of(" \t\r\n\f\v");
        if (line[start] == '#') continue;
        lines.push_back(line.substr(start, end - start + 1));
    }
    return lines;
}

std::vector<std::string> read_domain_list(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InputError("cannot open domain list at " + path);
    }
    auto lines = parse_domain_list(in);
    if (in.bad()) {
        throw InputError("failed to read domain list at " + path);
    }
    return lines;
}

} // namespace geosite_probe
