#pragma once

#include "metrics.hpp"
#include "proxy_options.hpp"

#include <cstdint>
#include <map>
#include <ostream>
#include <string>

namespace craftgate {

inline constexpr uint16_t kDefaultBackendPort = 25565;

struct ProxyConfig {
    bool enabled = true;
    std::string listen_address = "0.0.0.0";
    std::string base_url; // generated hostnames become <slug>.<base_url>
    std::string network_name = "discopanel-network";
    uint16_t backend_port = kDefaultBackendPort;
    uint16_t port_range_min = 25565;
    uint16_t port_range_max = 25665;
    uint32_t handshake_timeout_ms = 10000;
    uint32_t dial_timeout_ms = 5000;
    uint32_t http_read_timeout_ms = 30000;
    uint32_t refresh_interval_s = 0; // 0 disables periodic refresh
};

struct AppConfig {
    ProxyConfig proxy;
    struct Udp {
        uint32_t idle_timeout_s = 300;
        uint32_t sweep_interval_s = 30;
    } udp;
    struct Docker {
        bool enable = true;
        std::string socket = "/var/run/docker.sock";
    } docker;
    // Static container id -> IP table. When non-empty it replaces the Docker lookup.
    std::map<std::string, std::string> containers;
    struct Metrics {
        bool enable = false;
        uint16_t port = 0; // 0 means disabled
    } metrics;
    std::string state_file;
    unsigned int threads = 0; // 0 means max(2, hardware threads)
};

// Load configuration from JSON or return defaults when the file is missing/invalid.
AppConfig load_config(const std::string& config_path, std::ostream& log);

AppConfig make_default_config();

// Forwarder knobs derived from the proxy and udp blocks.
ProxyOptions make_proxy_options(const AppConfig& config, MetricsPtr metrics);

} // namespace craftgate
