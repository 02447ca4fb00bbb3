#pragma once

#include "config.hpp"
#include "container_resolver.hpp"
#include "proxy.hpp"
#include "store.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

namespace craftgate {

// Lowercase with spaces turned into dashes ("My Server" -> "my-server").
std::string slugify(std::string_view name);

// Explicit proxy hostname, else "<slug>.<base_url>", else "server-<id>.minecraft.mc".
std::string generate_hostname(const ServerRecord& server, const std::string& base_url);

// Owns every listening instance, keyed by port, and keeps their routes in line
// with listener, server and module records. All operations are serialized by
// one mutex.
class ProxyManager {
public:
    ProxyManager(boost::asio::io_context& io,
                 std::shared_ptr<Store> store,
                 std::shared_ptr<ContainerResolver> resolver,
                 ProxyConfig config,
                 ProxyOptions options);

    // Starts a handshake instance per enabled listener and routes the servers
    // assigned to them. A listener that fails to start stops the instances
    // started so far and the error is rethrown.
    void start();
    void stop();

    void update_server_route(const ServerRecord& server);
    void remove_server_route(const std::string& server_id);
    void remove_route_by_hostname(const std::string& hostname, const std::optional<std::string>& listener_id = std::nullopt);

    // Throws LifecycleError when the port already has an instance.
    void add_listener(const ListenerRecord& listener);
    // Deletes the listener record (the store refuses listeners in use), then
    // stops the instance on `port`.
    void remove_listener(uint16_t port);

    void add_module_route(const ModuleRecord& module, const ServerRecord& server);
    void update_module_route(const ModuleRecord& module, const ServerRecord& server);
    void remove_module_route(const std::string& module_id);

    // Lowest port in the configured range not taken by another server.
    uint16_t allocate_proxy_port(const std::string& server_id) const;

    void refresh_routes();

    RouteMap get_routes() const;
    bool is_running() const;
    std::vector<uint16_t> listener_ports() const;
    std::optional<Proxy> find_instance(uint16_t port) const;

    std::string generate_hostname(const ServerRecord& server) const;

private:
    struct ModuleRouteEntry {
        uint16_t port = 0;
        std::string key;
    };

    Proxy create_instance_locked(ProxyKind kind, uint16_t port);
    void start_listener_locked(const ListenerRecord& listener);
    void add_server_routes_locked(const std::vector<ListenerRecord>& listeners, bool running_only);
    void add_running_module_routes_locked();
    void add_module_routes_locked(const ModuleRecord& module, const ServerRecord& server);
    void remove_module_routes_locked(const std::string& module_id);
    void evict_idle_module_instances_locked();

    boost::asio::io_context& io_;
    std::shared_ptr<Store> store_;
    std::shared_ptr<ContainerResolver> resolver_;
    ProxyConfig config_;
    ProxyOptions options_;

    mutable std::mutex mutex_;
    std::map<uint16_t, Proxy> instances_;
    std::map<std::string, std::vector<ModuleRouteEntry>> module_routes_;
    std::set<uint16_t> module_ports_;
};

} // namespace craftgate
