#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct Url {
    std::string scheme; // lowercase
    std::string host;   // lowercase, brackets stripped for IPv6
    uint16_t port = 0;
    std::string path;   // "/" when absent
};

// Accepts absolute http(s) URLs only.
std::optional<Url> parse_url(std::string_view text);

// True if host equals domain or is a subdomain of it ("api.openai.com" matches "openai.com").
bool host_matches(std::string_view host, std::string_view domain);
