#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace craftgate {

enum class ServerStatus {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
    Unhealthy,
    Creating
};

// Modules share the server lifecycle states.
using ModuleStatus = ServerStatus;

std::optional<ServerStatus> parse_server_status(std::string_view value);
const char* to_string(ServerStatus status);
// Running or starting: the entity should be reachable through the proxy.
bool is_routable(ServerStatus status);

struct ListenerRecord {
    std::string id;
    uint16_t port = 0;
    std::string name;
    std::string description;
    bool enabled = true;
    bool is_default = false;
};

struct ServerRecord {
    std::string id;
    std::string name;
    std::string container_id;
    ServerStatus status = ServerStatus::Stopped;
    std::string proxy_hostname;
    std::string proxy_listener_id;
    uint16_t proxy_port = 0;
};

struct ModulePort {
    std::string name;
    uint16_t container_port = 0;
    uint16_t host_port = 0;
    std::string protocol;
    bool proxy_enabled = false;
};

struct ModuleRecord {
    std::string id;
    std::string name;
    std::string server_id;
    std::string container_id;
    ModuleStatus status = ModuleStatus::Stopped;
    std::vector<ModulePort> ports;
};

// Persisted listener/server/module records as seen by the proxy manager.
class Store {
public:
    virtual ~Store() = default;

    virtual std::vector<ListenerRecord> list_listeners() const = 0;
    virtual std::optional<ListenerRecord> find_listener(const std::string& id) const = 0;
    virtual std::optional<ListenerRecord> find_listener_by_port(uint16_t port) const = 0;
    virtual void save_listener(const ListenerRecord& listener) = 0;
    // Throws ListenerInUseError when a server still references the listener.
    virtual void delete_listener(const std::string& id) = 0;

    virtual std::vector<ServerRecord> list_servers() const = 0;
    virtual std::optional<ServerRecord> find_server(const std::string& id) const = 0;
    virtual void save_server(const ServerRecord& server) = 0;

    virtual std::vector<ModuleRecord> list_modules() const = 0;
    virtual std::optional<ModuleRecord> find_module(const std::string& id) const = 0;
    virtual void save_module(const ModuleRecord& record) = 0;
};

class MemoryStore : public Store {
public:
    std::vector<ListenerRecord> list_listeners() const override;
    std::optional<ListenerRecord> find_listener(const std::string& id) const override;
    std::optional<ListenerRecord> find_listener_by_port(uint16_t port) const override;
    void save_listener(const ListenerRecord& listener) override;
    void delete_listener(const std::string& id) override;

    std::vector<ServerRecord> list_servers() const override;
    std::optional<ServerRecord> find_server(const std::string& id) const override;
    void save_server(const ServerRecord& server) override;

    std::vector<ModuleRecord> list_modules() const override;
    std::optional<ModuleRecord> find_module(const std::string& id) const override;
    void save_module(const ModuleRecord& record) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ListenerRecord> listeners_;
    std::map<std::string, ServerRecord> servers_;
    std::map<std::string, ModuleRecord> modules_;
};

// Seeds `store` from a JSON document with "listeners", "servers" and "modules"
// arrays. A missing or unparsable file leaves the store empty and is logged.
void load_state(const std::string& state_path, MemoryStore& store, std::ostream& log);

} // namespace craftgate
