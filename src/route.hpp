#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace craftgate {

struct Route {
    std::string owner_id;
    std::string routing_key;
    std::string backend_host;
    uint16_t backend_port = 0;
    bool active = true;
};

using RouteMap = std::map<std::string, Route>;

// Keys used by proxies without virtual hosting (one backend per port).
inline constexpr std::string_view kTcpRouteKey = "tcp";
inline constexpr std::string_view kUdpRouteKey = "udp";

// Lowercase, with any ":port" suffix removed ("Play.Example.com:25565" -> "play.example.com").
std::string normalize_hostname(std::string_view host);

// Route storage owned by one proxy instance. Writers take the lock exclusively;
// lookups copy the route out under a shared lock.
class RouteTable {
public:
    Route add(std::string owner_id, std::string_view key, std::string backend_host, uint16_t backend_port);
    bool remove(std::string_view key);
    bool update(std::string_view key, std::string backend_host, uint16_t backend_port);
    bool set_active(std::string_view key, bool active);
    void clear();

    // Active route for the key, if any.
    std::optional<Route> lookup(std::string_view key) const;
    RouteMap snapshot() const;
    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Route, std::less<>> routes_;
};

} // namespace craftgate
