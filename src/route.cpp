#include "route.hpp"

#include <cctype>
#include <mutex>

namespace craftgate {

std::string normalize_hostname(std::string_view host) {
    std::string_view name = host;
    if (!name.empty() && name.front() == '[') {
        // bracketed IPv6 literal, keep up to the closing bracket
        const auto close = name.find(']');
        if (close != std::string_view::npos) name = name.substr(0, close + 1);
    } else {
        name = name.substr(0, name.find(':'));
    }

    std::string normalized;
    normalized.reserve(name.size());
    for (char c : name) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized;
}

Route RouteTable::add(std::string owner_id, std::string_view key, std::string backend_host, uint16_t backend_port) {
    Route route;
    route.owner_id = std::move(owner_id);
    route.routing_key = normalize_hostname(key);
    route.backend_host = std::move(backend_host);
    route.backend_port = backend_port;
    route.active = true;

    std::unique_lock lock(mutex_);
    routes_[route.routing_key] = route;
    return route;
}

bool RouteTable::remove(std::string_view key) {
    const auto normalized = normalize_hostname(key);
    std::unique_lock lock(mutex_);
    return routes_.erase(normalized) > 0;
}

bool RouteTable::update(std::string_view key, std::string backend_host, uint16_t backend_port) {
    const auto normalized = normalize_hostname(key);
    std::unique_lock lock(mutex_);
    auto it = routes_.find(normalized);
    if (it == routes_.end()) return false;
    it->second.backend_host = std::move(backend_host);
    it->second.backend_port = backend_port;
    return true;
}

bool RouteTable::set_active(std::string_view key, bool active) {
    const auto normalized = normalize_hostname(key);
    std::unique_lock lock(mutex_);
    auto it = routes_.find(normalized);
    if (it == routes_.end()) return false;
    it->second.active = active;
    return true;
}

void RouteTable::clear() {
    std::unique_lock lock(mutex_);
    routes_.clear();
}

std::optional<Route> RouteTable::lookup(std::string_view key) const {
    const auto normalized = normalize_hostname(key);
    std::shared_lock lock(mutex_);
    auto it = routes_.find(normalized);
    if (it == routes_.end() || !it->second.active) return std::nullopt;
    return it->second;
}

RouteMap RouteTable::snapshot() const {
    std::shared_lock lock(mutex_);
    return RouteMap(routes_.begin(), routes_.end());
}

std::size_t RouteTable::size() const {
    std::shared_lock lock(mutex_);
    return routes_.size();
}

} // namespace craftgate
