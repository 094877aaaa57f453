#include "host.hpp"

#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/generator.hpp>

#include <algorithm>
#include <cctype>
#include <locale>

namespace geosite_probe {

namespace {

constexpr std::string_view kSchemeSeparator = "://";
constexpr std::string_view kDefaultScheme = "http://";

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string ascii_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const std::locale& utf8_locale() {
    static const std::locale loc = boost::locale::generator{}("en_US.UTF-8");
    return loc;
}

// Full Unicode lowercase for UTF-8 text (IDN hosts such as .рф); pure ASCII
// stays on the byte path.
std::string to_lower(std::string_view s) {
    const bool ascii = std::all_of(s.begin(), s.end(),
                                   [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    if (ascii) return ascii_lower(s);
    try {
        return boost::locale::to_lower(s.data(), s.data() + s.size(), utf8_locale());
    } catch (const boost::locale::conv::conversion_error&) {
        // Not valid UTF-8: only the ASCII letters can be folded.
        return ascii_lower(s);
    }
}

bool valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) return false;
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

bool valid_optional_port(std::string_view port) {
    if (port.empty()) return true;
    if (port.front() != ':') return false;
    port.remove_prefix(1);
    return std::all_of(port.begin(), port.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

bool has_control_or_space(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return u < 0x20 || u == 0x7f || c == ' ';
    });
}

std::string strip_port(const std::string& hostport) {
    std::string host, port;
    if (split_host_port(hostport, host, port)) return host;
    return hostport;
}

HostNormalization clean_host(std::string_view raw) {
    HostNormalization result;
    result.host = canonical_value(raw);
    if (result.host.empty()) {
        result.error = "empty host after normalization";
        return result;
    }
    if (std::any_of(result.host.begin(), result.host.end(), is_space)) {
        result.error = "invalid host: \"" + result.host + "\"";
        result.host.clear();
    }
    return result;
}

} // namespace

std::string canonical_value(std::string_view value) {
    value = trim(value);
    if (!value.empty() && value.back() == '.') value.remove_suffix(1);
    return to_lower(value);
}

bool split_host_port(std::string_view hostport, std::string& host, std::string& port) {
    std::string_view h;
    std::size_t colon = 0;
    if (!hostport.empty() && hostport.front() == '[') {
        auto close = hostport.find(']');
        if (close == std::string_view::npos) return false;
        // "[host]:port" only; "[host]" alone or trailing junk is rejected.
        if (close + 1 >= hostport.size() || hostport[close + 1] != ':') return false;
        h = hostport.substr(1, close - 1);
        colon = close + 1;
    } else {
        colon = hostport.rfind(':');
        if (colon == std::string_view::npos) return false;
        h = hostport.substr(0, colon);
        if (h.find(':') != std::string_view::npos) return false;
    }
    auto p = hostport.substr(colon + 1);
    if (h.find_first_of("[]") != std::string_view::npos ||
        p.find_first_of("[]") != std::string_view::npos) {
        return false;
    }
    host.assign(h);
    port.assign(p);
    return true;
}

std::optional<std::string> url_authority_host(std::string_view url) {
    auto sep = url.find(kSchemeSeparator);
    if (sep == std::string_view::npos || !valid_scheme(url.substr(0, sep))) return std::nullopt;

    auto rest = url.substr(sep + kSchemeSeparator.size());
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) authority.remove_prefix(at + 1);
    if (authority.empty() || has_control_or_space(authority)) return std::nullopt;

    std::string_view port_part;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        port_part = authority.substr(close + 1);
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) port_part = authority.substr(colon);
    }
    if (!valid_optional_port(port_part)) return std::nullopt;
    return std::string(authority);
}

HostNormalization normalize_host(std::string_view input) {
    auto s = trim(input);
    if (s.empty()) {
        return HostNormalization{{}, "empty"};
    }

    const bool has_scheme = s.find(kSchemeSeparator) != std::string_view::npos;
    if (has_scheme) {
        if (auto host = url_authority_host(s)) return clean_host(strip_port(*host));
    }

    // Path or query without a scheme: retry as an http URL.
    if (!has_scheme && s.find_first_of("/?") != std::string_view::npos) {
        std::string with_scheme(kDefaultScheme);
        with_scheme.append(s);
        if (auto host = url_authority_host(with_scheme)) return clean_host(strip_port(*host));
    }

    std::string host, port;
    if (split_host_port(s, host, port)) return clean_host(host);

    return clean_host(s);
}

} // namespace geosite_probe
