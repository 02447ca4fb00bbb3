#pragma once

#include "metrics.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace craftgate {

enum class ProxyKind {
    Tcp,
    Udp,
    Http,
    Handshake
};

// Protocol tags used by listener and module port records. An empty tag means tcp.
std::optional<ProxyKind> parse_proxy_kind(std::string_view tag);
const char* to_string(ProxyKind kind);

// Per-instance knobs shared by every forwarder kind.
struct ProxyOptions {
    std::string listen_address = "0.0.0.0";
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds dial_timeout{5000};
    std::chrono::milliseconds http_read_timeout{30000};
    std::chrono::milliseconds udp_idle_timeout{300000};
    std::chrono::milliseconds udp_sweep_interval{30000};
    MetricsPtr metrics; // may be null
};

} // namespace craftgate
