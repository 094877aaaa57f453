#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace geosite_probe {

struct HostNormalization {
    std::string host;
    std::string error;

    bool ok() const { return error.empty(); }
};

// Accepts a bare host, host:port, or a URL (with or without scheme) and
// returns the lowercase host without a trailing dot.
HostNormalization normalize_host(std::string_view input);

// Lowercase, trim and drop one trailing dot. Used on both sides of a rule
// comparison so hosts and rule values compare in the same form.
std::string canonical_value(std::string_view value);

// Split "host:port" or "[v6]:port". The port is not validated; fails when
// there is no port separator or the host part has stray colons/brackets.
bool split_host_port(std::string_view hostport, std::string& host, std::string& port);

// Authority host (port included) of an absolute URL, or nullopt when the
// text does not parse as one.
std::optional<std::string> url_authority_host(std::string_view url);

} // namespace geosite_probe
