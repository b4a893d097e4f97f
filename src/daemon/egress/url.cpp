#include "egress/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool valid_host_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_';
}

} // namespace

std::optional<Url> parse_url(std::string_view text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;

    Url url;
    url.scheme = lower(text.substr(0, scheme_end));
    if (url.scheme == "http") {
        url.port = 80;
    } else if (url.scheme == "https") {
        url.port = 443;
    } else {
        return std::nullopt;
    }

    auto rest = text.substr(scheme_end + 3);
    auto auth_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, auth_end);
    url.path = auth_end == std::string_view::npos ? "/" : std::string(rest.substr(auth_end));
    if (!url.path.empty() && url.path[0] != '/') url.path.insert(0, "/");

    // Drop userinfo.
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') return std::nullopt;
            port = after.substr(1);
        }
        if (host.empty()) return std::nullopt;
        for (char c : host) {
            if (!std::isxdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.') {
                return std::nullopt;
            }
        }
    } else {
        if (auto colon = authority.find(':'); colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
        if (host.empty() || !std::all_of(host.begin(), host.end(), valid_host_char)) {
            return std::nullopt;
        }
    }

    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 || value > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<uint16_t>(value);
    }

    url.host = lower(host);
    while (!url.host.empty() && url.host.back() == '.') url.host.pop_back();
    if (url.host.empty()) return std::nullopt;
    return url;
}

bool host_matches(std::string_view host, std::string_view domain) {
    if (domain.empty() || host.empty()) return false;
    if (host.size() == domain.size()) return host == domain;
    if (host.size() < domain.size() + 1) return false;
    return host.ends_with(domain) && host[host.size() - domain.size() - 1] == '.';
}
