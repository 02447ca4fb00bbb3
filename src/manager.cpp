#include "manager.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace craftgate {

namespace {

bool routes_by_hostname(ProxyKind kind) {
    return kind == ProxyKind::Handshake || kind == ProxyKind::Http;
}

std::optional<ListenerRecord> find_by_id(const std::vector<ListenerRecord>& listeners, const std::string& id) {
    for (const auto& listener : listeners) {
        if (listener.id == id) return listener;
    }
    return std::nullopt;
}

} // namespace

std::string slugify(std::string_view name) {
    std::string slug;
    slug.reserve(name.size());
    for (const unsigned char c : name) {
        slug.push_back(c == ' ' ? '-' : static_cast<char>(std::tolower(c)));
    }
    return slug;
}

std::string generate_hostname(const ServerRecord& server, const std::string& base_url) {
    if (!server.proxy_hostname.empty()) return server.proxy_hostname;
    if (!base_url.empty()) return slugify(server.name) + "." + base_url;
    return "server-" + server.id + ".minecraft.mc";
}

ProxyManager::ProxyManager(boost::asio::io_context& io,
                           std::shared_ptr<Store> store,
                           std::shared_ptr<ContainerResolver> resolver,
                           ProxyConfig config,
                           ProxyOptions options)
    : io_(io),
      store_(std::move(store)),
      resolver_(std::move(resolver)),
      config_(std::move(config)),
      options_(std::move(options)) {}

void ProxyManager::start() {
    std::lock_guard lock(mutex_);
    if (!config_.enabled) {
        std::cout << "[manager] Proxy is disabled in configuration\n";
        return;
    }

    const auto listeners = store_->list_listeners();
    std::vector<uint16_t> started;
    try {
        for (const auto& listener : listeners) {
            if (!listener.enabled || instances_.count(listener.port) != 0) continue;
            start_listener_locked(listener);
            started.push_back(listener.port);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[manager] Failed to start listeners: " << ex.what() << "\n";
        for (const auto port : started) {
            instances_.at(port).stop();
            instances_.erase(port);
        }
        throw;
    }

    add_server_routes_locked(listeners, false);
    add_running_module_routes_locked();
    std::cout << "[manager] Proxy manager started with " << instances_.size() << " instance(s)\n";
}

void ProxyManager::stop() {
    std::lock_guard lock(mutex_);
    for (auto& [port, proxy] : instances_) {
        proxy.stop();
    }
    instances_.clear();
    module_routes_.clear();
    module_ports_.clear();
    std::cout << "[manager] Proxy manager stopped\n";
}

void ProxyManager::update_server_route(const ServerRecord& server) {
    std::lock_guard lock(mutex_);
    if (!config_.enabled || server.proxy_listener_id.empty()) return;

    const auto listener = store_->find_listener(server.proxy_listener_id);
    if (!listener) {
        throw StoreError("proxy listener " + server.proxy_listener_id + " not found");
    }
    if (!listener->enabled) return;

    auto it = instances_.find(listener->port);
    if (it == instances_.end()) {
        throw LifecycleError("no proxy instance for port " + std::to_string(listener->port));
    }
    auto& proxy = it->second;
    const auto hostname = generate_hostname(server);

    if (is_routable(server.status) && !server.proxy_hostname.empty()) {
        if (server.container_id.empty()) {
            throw ResolveError("server " + server.name + " has no container");
        }
        const auto address = resolver_->resolve(server.container_id, config_.network_name);
        if (proxy.get_routes().count(normalize_hostname(hostname)) != 0) {
            proxy.update_route(hostname, address, config_.backend_port);
        } else {
            proxy.add_route(server.id, hostname, address, config_.backend_port);
        }
        std::cout << "[manager] Updated route for server " << server.name << " on port " << listener->port << "\n";
    } else if (server.status == ServerStatus::Stopped || server.status == ServerStatus::Stopping) {
        proxy.remove_route(hostname);
    }
}

void ProxyManager::remove_server_route(const std::string& server_id) {
    std::lock_guard lock(mutex_);
    if (!config_.enabled) return;

    const auto server = store_->find_server(server_id);
    if (!server) {
        throw StoreError("server " + server_id + " not found");
    }
    const auto hostname = generate_hostname(*server);
    for (auto& [port, proxy] : instances_) {
        if (routes_by_hostname(proxy.kind())) proxy.remove_route(hostname);
    }
}

void ProxyManager::remove_route_by_hostname(const std::string& hostname, const std::optional<std::string>& listener_id) {
    std::lock_guard lock(mutex_);
    if (!config_.enabled) return;

    if (listener_id) {
        const auto listener = store_->find_listener(*listener_id);
        if (!listener) {
            throw StoreError("proxy listener " + *listener_id + " not found");
        }
        if (auto it = instances_.find(listener->port); it != instances_.end()) {
            it->second.remove_route(hostname);
        }
        return;
    }

    for (auto& [port, proxy] : instances_) {
        if (routes_by_hostname(proxy.kind())) proxy.remove_route(hostname);
    }
}

void ProxyManager::add_listener(const ListenerRecord& listener) {
    std::lock_guard lock(mutex_);
    if (instances_.count(listener.port) != 0) {
        throw LifecycleError("proxy already exists for port " + std::to_string(listener.port));
    }

    store_->save_listener(listener);
    if (!config_.enabled || !listener.enabled) return;
    start_listener_locked(listener);
}

void ProxyManager::remove_listener(uint16_t port) {
    std::lock_guard lock(mutex_);
    if (const auto record = store_->find_listener_by_port(port)) {
        store_->delete_listener(record->id);
    }

    auto it = instances_.find(port);
    if (it == instances_.end()) return;
    it->second.stop();
    instances_.erase(it);
    module_ports_.erase(port);
    std::cout << "[manager] Removed proxy for port " << port << "\n";
}

void ProxyManager::add_module_route(const ModuleRecord& module, const ServerRecord& server) {
    std::lock_guard lock(mutex_);
    if (!config_.enabled) return;
    add_module_routes_locked(module, server);
}

void ProxyManager::update_module_route(const ModuleRecord& module, const ServerRecord& server) {
    std::lock_guard lock(mutex_);
    if (!config_.enabled) return;
    remove_module_routes_locked(module.id);
    if (is_routable(module.status)) {
        add_module_routes_locked(module, server);
    }
    evict_idle_module_instances_locked();
}

void ProxyManager::remove_module_route(const std::string& module_id) {
    std::lock_guard lock(mutex_);
    if (!config_.enabled) return;
    remove_module_routes_locked(module_id);
    evict_idle_module_instances_locked();
}

uint16_t ProxyManager::allocate_proxy_port(const std::string& server_id) const {
    std::set<uint16_t> used;
    for (const auto& server : store_->list_servers()) {
        if (server.proxy_port > 0 && server.id != server_id) used.insert(server.proxy_port);
    }

    for (uint32_t port = config_.port_range_min; port <= config_.port_range_max; ++port) {
        if (used.count(static_cast<uint16_t>(port)) == 0) return static_cast<uint16_t>(port);
    }
    throw LifecycleError("no available proxy ports in range " + std::to_string(config_.port_range_min) + "-" +
                         std::to_string(config_.port_range_max));
}

void ProxyManager::refresh_routes() {
    std::lock_guard lock(mutex_);
    if (!config_.enabled) return;

    for (auto& [port, proxy] : instances_) {
        for (const auto& [key, route] : proxy.get_routes()) {
            proxy.remove_route(key);
        }
    }
    module_routes_.clear();

    const auto listeners = store_->list_listeners();
    std::set<uint16_t> wanted;
    for (const auto& listener : listeners) {
        if (!listener.enabled) continue;
        wanted.insert(listener.port);
        if (instances_.count(listener.port) != 0) continue;
        try {
            start_listener_locked(listener);
        } catch (const std::exception& ex) {
            std::cerr << "[manager] Failed to start listener " << listener.name << " on port " << listener.port
                      << ": " << ex.what() << "\n";
        }
    }
    for (auto it = instances_.begin(); it != instances_.end();) {
        if (module_ports_.count(it->first) == 0 && wanted.count(it->first) == 0) {
            std::cout << "[manager] Listener on port " << it->first << " is gone or disabled, stopping it\n";
            it->second.stop();
            it = instances_.erase(it);
        } else {
            ++it;
        }
    }

    add_server_routes_locked(listeners, true);
    add_running_module_routes_locked();
    evict_idle_module_instances_locked();
}

RouteMap ProxyManager::get_routes() const {
    std::lock_guard lock(mutex_);
    RouteMap merged;
    for (const auto& [port, proxy] : instances_) {
        for (auto& [key, route] : proxy.get_routes()) {
            merged[key] = route;
        }
    }
    return merged;
}

bool ProxyManager::is_running() const {
    std::lock_guard lock(mutex_);
    return std::any_of(instances_.begin(), instances_.end(), [](const auto& entry) {
        return entry.second.is_running();
    });
}

std::vector<uint16_t> ProxyManager::listener_ports() const {
    std::lock_guard lock(mutex_);
    std::vector<uint16_t> ports;
    ports.reserve(instances_.size());
    for (const auto& [port, proxy] : instances_) ports.push_back(port);
    return ports;
}

std::optional<Proxy> ProxyManager::find_instance(uint16_t port) const {
    std::lock_guard lock(mutex_);
    auto it = instances_.find(port);
    if (it == instances_.end()) return std::nullopt;
    return it->second;
}

std::string ProxyManager::generate_hostname(const ServerRecord& server) const {
    return craftgate::generate_hostname(server, config_.base_url);
}

Proxy ProxyManager::create_instance_locked(ProxyKind kind, uint16_t port) {
    auto proxy = make_proxy(kind, io_, port, options_);
    proxy.start();
    instances_.emplace(port, proxy);
    return proxy;
}

void ProxyManager::start_listener_locked(const ListenerRecord& listener) {
    create_instance_locked(ProxyKind::Handshake, listener.port);
    std::cout << "[manager] Started proxy for listener " << listener.name << " on port " << listener.port << "\n";
}

void ProxyManager::add_server_routes_locked(const std::vector<ListenerRecord>& listeners, bool running_only) {
    for (const auto& server : store_->list_servers()) {
        if (server.proxy_hostname.empty() || server.container_id.empty() || server.proxy_listener_id.empty()) continue;
        if (running_only && !is_routable(server.status)) continue;

        const auto listener = find_by_id(listeners, server.proxy_listener_id);
        if (!listener || !listener->enabled) {
            std::cerr << "[manager] Server " << server.name << " has invalid or disabled listener "
                      << server.proxy_listener_id << "\n";
            continue;
        }
        auto it = instances_.find(listener->port);
        if (it == instances_.end()) {
            std::cerr << "[manager] No proxy instance for port " << listener->port << "\n";
            continue;
        }

        std::string address;
        try {
            address = resolver_->resolve(server.container_id, config_.network_name);
        } catch (const ResolveError& ex) {
            std::cerr << "[manager] Failed to get container IP for server " << server.name << ": " << ex.what() << "\n";
            continue;
        }
        it->second.add_route(server.id, server.proxy_hostname, address, config_.backend_port);
    }
}

void ProxyManager::add_running_module_routes_locked() {
    for (const auto& record : store_->list_modules()) {
        if (!is_routable(record.status)) continue;
        const auto server = store_->find_server(record.server_id);
        if (!server) {
            std::cerr << "[manager] Module " << record.name << " references unknown server " << record.server_id << "\n";
            continue;
        }
        try {
            add_module_routes_locked(record, *server);
        } catch (const std::exception& ex) {
            std::cerr << "[manager] Failed to route module " << record.name << ": " << ex.what() << "\n";
        }
    }
}

void ProxyManager::add_module_routes_locked(const ModuleRecord& module, const ServerRecord& server) {
    std::vector<std::pair<const ModulePort*, ProxyKind>> ports;
    for (const auto& port : module.ports) {
        if (!port.proxy_enabled || port.host_port == 0) continue;
        const auto kind = parse_proxy_kind(port.protocol);
        if (!kind) {
            throw std::invalid_argument("unknown protocol '" + port.protocol + "' on module port " + port.name);
        }
        if (auto it = instances_.find(port.host_port); it != instances_.end()) {
            if (it->second.kind() != *kind) {
                throw LifecycleError("port " + std::to_string(port.host_port) + " is already served by a " +
                                     to_string(it->second.kind()) + " proxy");
            }
            // listener routes are keyed by the same hostnames module routes use
            if (module_ports_.count(port.host_port) == 0) {
                throw LifecycleError("port " + std::to_string(port.host_port) + " belongs to a proxy listener");
            }
        }
        ports.emplace_back(&port, *kind);
    }
    if (ports.empty()) return;

    if (module.container_id.empty()) {
        throw ResolveError("module " + module.name + " has no container");
    }
    const auto address = resolver_->resolve(module.container_id, config_.network_name);
    const auto hostname = generate_hostname(server);

    auto& entries = module_routes_[module.id];
    for (const auto& [port, kind] : ports) {
        auto it = instances_.find(port->host_port);
        if (it == instances_.end()) {
            create_instance_locked(kind, port->host_port);
            module_ports_.insert(port->host_port);
            it = instances_.find(port->host_port);
            std::cout << "[manager] Started " << to_string(kind) << " proxy on port " << port->host_port
                      << " for module " << module.name << "\n";
        } else if (it->second.kind() != kind) {
            throw LifecycleError("port " + std::to_string(port->host_port) + " is already served by a " +
                                 to_string(it->second.kind()) + " proxy");
        }
        it->second.add_route(module.id, hostname, address, port->container_port);
        entries.push_back({port->host_port, hostname});
    }
}

void ProxyManager::remove_module_routes_locked(const std::string& module_id) {
    auto entries = module_routes_.find(module_id);
    if (entries == module_routes_.end()) return;
    for (const auto& entry : entries->second) {
        if (auto it = instances_.find(entry.port); it != instances_.end()) {
            it->second.remove_route(entry.key);
        }
    }
    module_routes_.erase(entries);
}

void ProxyManager::evict_idle_module_instances_locked() {
    for (auto port_it = module_ports_.begin(); port_it != module_ports_.end();) {
        auto it = instances_.find(*port_it);
        if (it == instances_.end()) {
            port_it = module_ports_.erase(port_it);
            continue;
        }
        if (!it->second.get_routes().empty()) {
            ++port_it;
            continue;
        }
        it->second.stop();
        instances_.erase(it);
        std::cout << "[manager] Stopped idle module proxy on port " << *port_it << "\n";
        port_it = module_ports_.erase(port_it);
    }
}

} // namespace craftgate
