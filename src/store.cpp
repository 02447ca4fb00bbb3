#include "store.hpp"

#include "errors.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>

namespace pt = boost::property_tree;

namespace craftgate {

namespace {

ServerStatus read_status(const pt::ptree& node, const std::string& owner, std::ostream& log) {
    const auto raw = node.get<std::string>("status", "stopped");
    if (auto status = parse_server_status(raw)) return *status;
    log << "[state] Unknown status '" << raw << "' for " << owner << ", treating as stopped.\n";
    return ServerStatus::Stopped;
}

ListenerRecord parse_listener(const pt::ptree& node) {
    ListenerRecord listener;
    listener.port = node.get<uint16_t>("port", 0);
    listener.id = node.get<std::string>("id", "listener-" + std::to_string(listener.port));
    listener.name = node.get<std::string>("name", "");
    listener.description = node.get<std::string>("description", "");
    listener.enabled = node.get<bool>("enabled", listener.enabled);
    listener.is_default = node.get<bool>("is_default", listener.is_default);
    return listener;
}

ServerRecord parse_server(const pt::ptree& node, std::ostream& log) {
    ServerRecord server;
    server.id = node.get<std::string>("id", "");
    server.name = node.get<std::string>("name", "");
    server.container_id = node.get<std::string>("container_id", "");
    server.status = read_status(node, "server " + server.id, log);
    server.proxy_hostname = node.get<std::string>("proxy_hostname", "");
    server.proxy_listener_id = node.get<std::string>("proxy_listener_id", "");
    server.proxy_port = node.get<uint16_t>("proxy_port", 0);
    return server;
}

ModuleRecord parse_module(const pt::ptree& node, std::ostream& log) {
    ModuleRecord record;
    record.id = node.get<std::string>("id", "");
    record.name = node.get<std::string>("name", "");
    record.server_id = node.get<std::string>("server_id", "");
    record.container_id = node.get<std::string>("container_id", "");
    record.status = read_status(node, "module " + record.id, log);
    if (auto ports = node.get_child_optional("ports")) {
        for (const auto& item : *ports) {
            ModulePort port;
            port.name = item.second.get<std::string>("name", "");
            port.container_port = item.second.get<uint16_t>("container_port", 0);
            port.host_port = item.second.get<uint16_t>("host_port", 0);
            port.protocol = item.second.get<std::string>("protocol", "");
            port.proxy_enabled = item.second.get<bool>("proxy_enabled", false);
            record.ports.push_back(std::move(port));
        }
    }
    return record;
}

} // namespace

std::optional<ServerStatus> parse_server_status(std::string_view value) {
    if (value == "stopped") return ServerStatus::Stopped;
    if (value == "starting") return ServerStatus::Starting;
    if (value == "running") return ServerStatus::Running;
    if (value == "stopping") return ServerStatus::Stopping;
    if (value == "error") return ServerStatus::Error;
    if (value == "unhealthy") return ServerStatus::Unhealthy;
    if (value == "creating") return ServerStatus::Creating;
    return std::nullopt;
}

const char* to_string(ServerStatus status) {
    switch (status) {
    case ServerStatus::Stopped:
        return "stopped";
    case ServerStatus::Starting:
        return "starting";
    case ServerStatus::Running:
        return "running";
    case ServerStatus::Stopping:
        return "stopping";
    case ServerStatus::Error:
        return "error";
    case ServerStatus::Unhealthy:
        return "unhealthy";
    case ServerStatus::Creating:
        return "creating";
    }
    return "unknown";
}

bool is_routable(ServerStatus status) {
    return status == ServerStatus::Running || status == ServerStatus::Starting;
}

std::vector<ListenerRecord> MemoryStore::list_listeners() const {
    std::lock_guard lock(mutex_);
    std::vector<ListenerRecord> result;
    result.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) result.push_back(listener);
    return result;
}

std::optional<ListenerRecord> MemoryStore::find_listener(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = listeners_.find(id);
    if (it == listeners_.end()) return std::nullopt;
    return it->second;
}

std::optional<ListenerRecord> MemoryStore::find_listener_by_port(uint16_t port) const {
    std::lock_guard lock(mutex_);
    for (const auto& [id, listener] : listeners_) {
        if (listener.port == port) return listener;
    }
    return std::nullopt;
}

void MemoryStore::save_listener(const ListenerRecord& listener) {
    if (listener.id.empty()) {
        throw StoreError("listener id must not be empty");
    }
    std::lock_guard lock(mutex_);
    listeners_[listener.id] = listener;
}

void MemoryStore::delete_listener(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (listeners_.find(id) == listeners_.end()) {
        throw StoreError("listener " + id + " not found");
    }
    for (const auto& [server_id, server] : servers_) {
        if (server.proxy_listener_id == id) {
            throw ListenerInUseError("listener " + id + " is in use by server " + server_id);
        }
    }
    listeners_.erase(id);
}

std::vector<ServerRecord> MemoryStore::list_servers() const {
    std::lock_guard lock(mutex_);
    std::vector<ServerRecord> result;
    result.reserve(servers_.size());
    for (const auto& [id, server] : servers_) result.push_back(server);
    return result;
}

std::optional<ServerRecord> MemoryStore::find_server(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::save_server(const ServerRecord& server) {
    if (server.id.empty()) {
        throw StoreError("server id must not be empty");
    }
    std::lock_guard lock(mutex_);
    servers_[server.id] = server;
}

std::vector<ModuleRecord> MemoryStore::list_modules() const {
    std::lock_guard lock(mutex_);
    std::vector<ModuleRecord> result;
    result.reserve(modules_.size());
    for (const auto& [id, record] : modules_) result.push_back(record);
    return result;
}

std::optional<ModuleRecord> MemoryStore::find_module(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = modules_.find(id);
    if (it == modules_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::save_module(const ModuleRecord& record) {
    if (record.id.empty()) {
        throw StoreError("module id must not be empty");
    }
    std::lock_guard lock(mutex_);
    modules_[record.id] = record;
}

void load_state(const std::string& state_path, MemoryStore& store, std::ostream& log) {
    if (state_path.empty()) {
        log << "[state] No state file configured, starting with an empty store.\n";
        return;
    }

    std::ifstream file(state_path);
    if (!file.good()) {
        log << "[state] Cannot open state file at " << state_path << ". Starting with an empty store.\n";
        return;
    }

    pt::ptree tree;
    try {
        pt::read_json(file, tree);
    } catch (const std::exception& ex) {
        log << "[state] Failed to parse state file: " << ex.what() << ". Starting with an empty store.\n";
        return;
    }

    std::size_t listeners = 0;
    std::size_t servers = 0;
    std::size_t modules = 0;
    try {
        if (auto nodes = tree.get_child_optional("listeners")) {
            for (const auto& item : *nodes) {
                store.save_listener(parse_listener(item.second));
                ++listeners;
            }
        }
        if (auto nodes = tree.get_child_optional("servers")) {
            for (const auto& item : *nodes) {
                store.save_server(parse_server(item.second, log));
                ++servers;
            }
        }
        if (auto nodes = tree.get_child_optional("modules")) {
            for (const auto& item : *nodes) {
                store.save_module(parse_module(item.second, log));
                ++modules;
            }
        }
    } catch (const std::exception& ex) {
        log << "[state] Invalid record in " << state_path << ": " << ex.what() << "\n";
    }

    log << "[state] Loaded " << listeners << " listener(s), " << servers << " server(s), " << modules
        << " module(s) from " << state_path << "\n";
}

} // namespace craftgate
