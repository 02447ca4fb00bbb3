#include "config.hpp"
#include "container_resolver.hpp"
#include "errors.hpp"
#include "store.hpp"
#include "test_common.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>

using namespace craftgate;

namespace {

std::string write_temp(const std::string& name, const std::string& content) {
    namespace fs = std::filesystem;
    fs::path tmp = fs::temp_directory_path() / name;
    std::ofstream out(tmp);
    out << content;
    return tmp.string();
}

} // namespace

int main() {
    auto test_default_config = [] {
        auto cfg = make_default_config();
        EXPECT_TRUE(cfg.proxy.enabled);
        EXPECT_EQ(cfg.proxy.listen_address, "0.0.0.0");
        EXPECT_EQ(cfg.proxy.network_name, "discopanel-network");
        EXPECT_EQ(cfg.proxy.backend_port, 25565);
        EXPECT_EQ(cfg.proxy.port_range_min, 25565);
        EXPECT_EQ(cfg.proxy.port_range_max, 25665);
        EXPECT_EQ(cfg.proxy.handshake_timeout_ms, 10000u);
        EXPECT_EQ(cfg.proxy.dial_timeout_ms, 5000u);
        EXPECT_EQ(cfg.udp.idle_timeout_s, 300u);
        EXPECT_EQ(cfg.udp.sweep_interval_s, 30u);
        EXPECT_EQ(cfg.docker.socket, "/var/run/docker.sock");
        EXPECT_FALSE(cfg.metrics.enable);
        EXPECT_TRUE(cfg.containers.empty());
    };

    auto test_load_config_missing = [] {
        std::stringstream log;
        auto cfg = load_config("this_file_does_not_exist.json", log);
        EXPECT_TRUE(log.str().find("Cannot open config") != std::string::npos);
        EXPECT_EQ(cfg.proxy.backend_port, make_default_config().proxy.backend_port);
    };

    auto test_load_config_invalid_json = [] {
        const auto path = write_temp("craftgate_config_invalid.json", "{ not json");
        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_TRUE(log.str().find("Failed to parse JSON config") != std::string::npos);
        EXPECT_EQ(cfg.proxy.port_range_max, 25665);
    };

    auto test_load_config_json = [] {
        const auto path = write_temp("craftgate_config_test.json", R"({
            "proxy": {
                "enabled": true,
                "listen_address": "127.0.0.1",
                "base_url": "mc.example.com",
                "network_name": "games",
                "backend_port": 25566,
                "port_range_min": 30000,
                "port_range_max": 30010,
                "handshake_timeout_ms": 2000,
                "dial_timeout_ms": 1500,
                "refresh_interval_s": 60
            },
            "udp": {"idle_timeout_s": 120, "sweep_interval_s": 10},
            "docker": {"socket": "/tmp/docker.sock"},
            "containers": {"abc": "172.18.0.2", "def": "172.18.0.3"},
            "metrics": {"enable": true, "port": 10001},
            "state_file": "/var/lib/craftgate/state.json",
            "threads": 4
        })");

        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_EQ(cfg.proxy.listen_address, "127.0.0.1");
        EXPECT_EQ(cfg.proxy.base_url, "mc.example.com");
        EXPECT_EQ(cfg.proxy.network_name, "games");
        EXPECT_EQ(cfg.proxy.backend_port, 25566);
        EXPECT_EQ(cfg.proxy.port_range_min, 30000);
        EXPECT_EQ(cfg.proxy.port_range_max, 30010);
        EXPECT_EQ(cfg.proxy.handshake_timeout_ms, 2000u);
        EXPECT_EQ(cfg.proxy.dial_timeout_ms, 1500u);
        EXPECT_EQ(cfg.proxy.refresh_interval_s, 60u);
        EXPECT_EQ(cfg.udp.idle_timeout_s, 120u);
        EXPECT_EQ(cfg.udp.sweep_interval_s, 10u);
        EXPECT_EQ(cfg.docker.socket, "/tmp/docker.sock");
        EXPECT_EQ(cfg.containers.size(), 2u);
        EXPECT_EQ(cfg.containers.at("def"), "172.18.0.3");
        EXPECT_TRUE(cfg.metrics.enable);
        EXPECT_EQ(cfg.metrics.port, 10001);
        EXPECT_EQ(cfg.state_file, "/var/lib/craftgate/state.json");
        EXPECT_EQ(cfg.threads, 4u);

        const auto options = make_proxy_options(cfg, nullptr);
        EXPECT_EQ(options.listen_address, "127.0.0.1");
        EXPECT_TRUE(options.handshake_timeout == std::chrono::milliseconds(2000));
        EXPECT_TRUE(options.udp_idle_timeout == std::chrono::seconds(120));
        EXPECT_TRUE(options.udp_sweep_interval == std::chrono::seconds(10));
    };

    auto test_port_range_validation = [] {
        const auto path = write_temp("craftgate_config_range.json",
                                     R"({"proxy": {"port_range_min": 40000, "port_range_max": 30000}})");
        std::stringstream log;
        auto cfg = load_config(path, log);
        EXPECT_TRUE(log.str().find("port_range_min") != std::string::npos);
        EXPECT_EQ(cfg.proxy.port_range_min, 25565);
        EXPECT_EQ(cfg.proxy.port_range_max, 25665);
    };

    auto test_load_state = [] {
        const auto path = write_temp("craftgate_state_test.json", R"({
            "listeners": [
                {"id": "l1", "port": 25565, "name": "default", "enabled": true, "is_default": true},
                {"id": "l2", "port": 25570, "name": "spare", "enabled": false}
            ],
            "servers": [
                {"id": "s1", "name": "Survival", "container_id": "abc", "status": "running",
                 "proxy_hostname": "survival.example.com", "proxy_listener_id": "l1", "proxy_port": 25565},
                {"id": "s2", "name": "Creative", "status": "weird"}
            ],
            "modules": [
                {"id": "m1", "name": "geyser", "server_id": "s1", "container_id": "def", "status": "starting",
                 "ports": [{"name": "bedrock", "container_port": 19132, "host_port": 19132,
                            "protocol": "udp", "proxy_enabled": true}]}
            ]
        })");

        MemoryStore store;
        std::stringstream log;
        load_state(path, store, log);
        EXPECT_TRUE(log.str().find("Loaded 2 listener(s), 2 server(s), 1 module(s)") != std::string::npos);
        EXPECT_TRUE(log.str().find("Unknown status 'weird'") != std::string::npos);

        const auto listener = store.find_listener_by_port(25570);
        EXPECT_TRUE(listener.has_value());
        EXPECT_FALSE(listener->enabled);

        const auto server = store.find_server("s1");
        EXPECT_TRUE(server.has_value());
        EXPECT_TRUE(server->status == ServerStatus::Running);
        EXPECT_EQ(server->proxy_hostname, "survival.example.com");
        EXPECT_TRUE(store.find_server("s2")->status == ServerStatus::Stopped);

        const auto module = store.find_module("m1");
        EXPECT_TRUE(module.has_value());
        EXPECT_EQ(module->ports.size(), 1u);
        EXPECT_EQ(module->ports[0].protocol, "udp");
        EXPECT_TRUE(module->ports[0].proxy_enabled);
    };

    auto test_delete_listener_in_use = [] {
        MemoryStore store;
        store.save_listener(ListenerRecord{"l1", 25565, "default", "", true, true});
        ServerRecord server;
        server.id = "s1";
        server.proxy_listener_id = "l1";
        store.save_server(server);

        EXPECT_THROW(ListenerInUseError, store.delete_listener("l1"));
        EXPECT_TRUE(store.find_listener("l1").has_value());

        server.proxy_listener_id.clear();
        store.save_server(server);
        store.delete_listener("l1");
        EXPECT_FALSE(store.find_listener("l1").has_value());
    };

    auto test_pick_container_ip = [] {
        std::istringstream json(R"({"NetworkSettings": {"Networks": {
            "bridge": {"IPAddress": "172.17.0.5"},
            "discopanel-network": {"IPAddress": "172.20.0.7"},
            "empty": {"IPAddress": ""}
        }}})");
        boost::property_tree::ptree inspect;
        boost::property_tree::read_json(json, inspect);

        EXPECT_EQ(pick_container_ip(inspect, "discopanel-network"), "172.20.0.7");
        EXPECT_EQ(pick_container_ip(inspect, "missing"), "172.17.0.5");

        boost::property_tree::ptree bare;
        EXPECT_THROW(ResolveError, pick_container_ip(bare, "bridge"));
    };

    auto test_static_resolver = [] {
        StaticResolver resolver(std::map<std::string, std::string>{{"abc", "10.0.0.2"}});
        EXPECT_EQ(resolver.resolve("abc", "any"), "10.0.0.2");
        EXPECT_THROW(ResolveError, resolver.resolve("nope", "any"));
    };

    return run_tests({
        {"default_config", test_default_config},
        {"load_config_missing", test_load_config_missing},
        {"load_config_invalid_json", test_load_config_invalid_json},
        {"load_config_json", test_load_config_json},
        {"port_range_validation", test_port_range_validation},
        {"load_state", test_load_state},
        {"delete_listener_in_use", test_delete_listener_in_use},
        {"pick_container_ip", test_pick_container_ip},
        {"static_resolver", test_static_resolver},
    });
}
