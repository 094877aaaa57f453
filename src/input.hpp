#pragma once

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace geosite_probe {

class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Trimmed, non-blank lines that do not start with '#', in file order.
std::vector<std::string> parse_domain_list(std::istream& in);

// Throws InputError when the file cannot be opened or read.
std::vector<std::string> read_domain_list(const std::string& path);

} // namespace geosite_probe
