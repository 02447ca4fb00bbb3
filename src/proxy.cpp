#include "proxy.hpp"

#include <stdexcept>

namespace craftgate {

Proxy::Proxy(Variant impl)
    : impl_(std::move(impl)) {}

ProxyKind Proxy::kind() const {
    return static_cast<ProxyKind>(impl_.index());
}

void Proxy::start() {
    std::visit([](const auto& proxy) { proxy->start(); }, impl_);
}

void Proxy::stop() {
    std::visit([](const auto& proxy) { proxy->stop(); }, impl_);
}

bool Proxy::is_running() const {
    return std::visit([](const auto& proxy) { return proxy->is_running(); }, impl_);
}

uint16_t Proxy::port() const {
    return std::visit([](const auto& proxy) { return proxy->port(); }, impl_);
}

void Proxy::add_route(const std::string& owner_id, std::string_view key, const std::string& backend_host, uint16_t backend_port) {
    std::visit([&](const auto& proxy) { proxy->add_route(owner_id, key, backend_host, backend_port); }, impl_);
}

void Proxy::remove_route(std::string_view key) {
    std::visit([&](const auto& proxy) { proxy->remove_route(key); }, impl_);
}

void Proxy::update_route(std::string_view key, const std::string& backend_host, uint16_t backend_port) {
    std::visit([&](const auto& proxy) { proxy->update_route(key, backend_host, backend_port); }, impl_);
}

void Proxy::set_route_active(std::string_view key, bool active) {
    std::visit([&](const auto& proxy) { proxy->set_route_active(key, active); }, impl_);
}

RouteMap Proxy::get_routes() const {
    return std::visit([](const auto& proxy) { return proxy->get_routes(); }, impl_);
}

Proxy make_proxy(ProxyKind kind, boost::asio::io_context& io, uint16_t port, const ProxyOptions& options) {
    switch (kind) {
    case ProxyKind::Tcp:
        return Proxy(TcpProxy::create(io, port, options));
    case ProxyKind::Udp:
        return Proxy(UdpProxy::create(io, port, options));
    case ProxyKind::Http:
        return Proxy(HttpProxy::create(io, port, options));
    case ProxyKind::Handshake:
        return Proxy(HandshakeProxy::create(io, port, options));
    }
    throw std::invalid_argument("unknown proxy kind");
}

} // namespace craftgate
