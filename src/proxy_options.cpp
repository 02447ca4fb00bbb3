#include "proxy_options.hpp"

#include <algorithm>
#include <cctype>

namespace craftgate {

std::optional<ProxyKind> parse_proxy_kind(std::string_view tag) {
    std::string lowered(tag);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered.empty() || lowered == "tcp") return ProxyKind::Tcp;
    if (lowered == "udp") return ProxyKind::Udp;
    if (lowered == "http") return ProxyKind::Http;
    if (lowered == "minecraft") return ProxyKind::Handshake;
    return std::nullopt;
}

const char* to_string(ProxyKind kind) {
    switch (kind) {
    case ProxyKind::Tcp:
        return "tcp";
    case ProxyKind::Udp:
        return "udp";
    case ProxyKind::Http:
        return "http";
    case ProxyKind::Handshake:
        return "minecraft";
    }
    return "unknown";
}

} // namespace craftgate
