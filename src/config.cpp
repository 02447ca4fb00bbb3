#include "config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>

namespace pt = boost::property_tree;

namespace craftgate {

namespace {

ProxyConfig parse_proxy(const pt::ptree& node, const ProxyConfig& fallback) {
    ProxyConfig proxy = fallback;
    proxy.enabled = node.get<bool>("enabled", proxy.enabled);
    proxy.listen_address = node.get<std::string>("listen_address", proxy.listen_address);
    proxy.base_url = node.get<std::string>("base_url", proxy.base_url);
    proxy.network_name = node.get<std::string>("network_name", proxy.network_name);
    proxy.backend_port = node.get<uint16_t>("backend_port", proxy.backend_port);
    proxy.port_range_min = node.get<uint16_t>("port_range_min", proxy.port_range_min);
    proxy.port_range_max = node.get<uint16_t>("port_range_max", proxy.port_range_max);
    proxy.handshake_timeout_ms = node.get<uint32_t>("handshake_timeout_ms", proxy.handshake_timeout_ms);
    proxy.dial_timeout_ms = node.get<uint32_t>("dial_timeout_ms", proxy.dial_timeout_ms);
    proxy.http_read_timeout_ms = node.get<uint32_t>("http_read_timeout_ms", proxy.http_read_timeout_ms);
    proxy.refresh_interval_s = node.get<uint32_t>("refresh_interval_s", proxy.refresh_interval_s);
    return proxy;
}

void validate(AppConfig& config, std::ostream& log) {
    const auto defaults = make_default_config();
    if (config.proxy.port_range_min > config.proxy.port_range_max) {
        log << "[config] proxy.port_range_min " << config.proxy.port_range_min << " is above port_range_max "
            << config.proxy.port_range_max << ", using " << defaults.proxy.port_range_min << "-"
            << defaults.proxy.port_range_max << ".\n";
        config.proxy.port_range_min = defaults.proxy.port_range_min;
        config.proxy.port_range_max = defaults.proxy.port_range_max;
    }
    if (config.proxy.backend_port == 0) {
        log << "[config] proxy.backend_port must not be 0, using " << defaults.proxy.backend_port << ".\n";
        config.proxy.backend_port = defaults.proxy.backend_port;
    }
    if (config.proxy.handshake_timeout_ms == 0) config.proxy.handshake_timeout_ms = defaults.proxy.handshake_timeout_ms;
    if (config.proxy.dial_timeout_ms == 0) config.proxy.dial_timeout_ms = defaults.proxy.dial_timeout_ms;
    if (config.proxy.http_read_timeout_ms == 0) config.proxy.http_read_timeout_ms = defaults.proxy.http_read_timeout_ms;
    if (config.udp.idle_timeout_s == 0) config.udp.idle_timeout_s = defaults.udp.idle_timeout_s;
    if (config.udp.sweep_interval_s == 0) config.udp.sweep_interval_s = defaults.udp.sweep_interval_s;
}

} // namespace

AppConfig make_default_config() {
    return AppConfig{};
}

AppConfig load_config(const std::string& config_path, std::ostream& log) {
    AppConfig config = make_default_config();
    if (config_path.empty()) {
        log << "[config] No config path provided, using defaults.\n";
        return config;
    }

    std::ifstream file(config_path);
    if (!file.good()) {
        log << "[config] Cannot open config file at " << config_path << ". Using defaults.\n";
        return config;
    }

    pt::ptree tree;
    try {
        pt::read_json(file, tree);
    } catch (const std::exception& ex) {
        log << "[config] Failed to parse JSON config: " << ex.what() << ". Using defaults.\n";
        return config;
    }

    try {
        if (auto proxy = tree.get_child_optional("proxy")) {
            config.proxy = parse_proxy(*proxy, config.proxy);
        }
        config.udp.idle_timeout_s = tree.get<uint32_t>("udp.idle_timeout_s", config.udp.idle_timeout_s);
        config.udp.sweep_interval_s = tree.get<uint32_t>("udp.sweep_interval_s", config.udp.sweep_interval_s);
        config.docker.enable = tree.get<bool>("docker.enable", config.docker.enable);
        config.docker.socket = tree.get<std::string>("docker.socket", config.docker.socket);
        if (auto containers = tree.get_child_optional("containers")) {
            for (const auto& item : *containers) {
                const auto address = item.second.get_value<std::string>();
                if (!item.first.empty() && !address.empty()) config.containers[item.first] = address;
            }
        }
        config.metrics.enable = tree.get<bool>("metrics.enable", config.metrics.enable);
        config.metrics.port = tree.get<uint16_t>("metrics.port", config.metrics.port);
        config.state_file = tree.get<std::string>("state_file", config.state_file);
        config.threads = tree.get<unsigned int>("threads", config.threads);
    } catch (const std::exception& ex) {
        log << "[config] Invalid value in " << config_path << ": " << ex.what() << ". Using defaults.\n";
        return make_default_config();
    }

    validate(config, log);
    return config;
}

ProxyOptions make_proxy_options(const AppConfig& config, MetricsPtr metrics) {
    ProxyOptions options;
    options.listen_address = config.proxy.listen_address;
    options.handshake_timeout = std::chrono::milliseconds(config.proxy.handshake_timeout_ms);
    options.dial_timeout = std::chrono::milliseconds(config.proxy.dial_timeout_ms);
    options.http_read_timeout = std::chrono::milliseconds(config.proxy.http_read_timeout_ms);
    options.udp_idle_timeout = std::chrono::seconds(config.udp.idle_timeout_s);
    options.udp_sweep_interval = std::chrono::seconds(config.udp.sweep_interval_s);
    options.metrics = std::move(metrics);
    return options;
}

} // namespace craftgate
