#include "tcp_proxy.hpp"

#include "tunnel.hpp"

#include <iostream>

namespace craftgate {

std::shared_ptr<TcpProxy> TcpProxy::create(boost::asio::io_context& io, uint16_t port, ProxyOptions options) {
    auto proxy = std::make_shared<TcpProxy>(std::move(options));
    std::weak_ptr<TcpProxy> weak = proxy;
    proxy->server_ = std::make_shared<Server>(
        io, proxy->options_.listen_address, port, "tcp", [weak](tcp::socket socket) {
            if (auto self = weak.lock()) {
                self->handle_connection(std::move(socket));
            }
        });
    return proxy;
}

TcpProxy::TcpProxy(ProxyOptions options)
    : options_(std::move(options)) {}

void TcpProxy::start() {
    server_->start();
}

void TcpProxy::stop() {
    server_->stop();
}

bool TcpProxy::is_running() const {
    return server_->is_running();
}

uint16_t TcpProxy::port() const {
    return server_->port();
}

void TcpProxy::add_route(const std::string& owner_id, std::string_view, const std::string& backend_host, uint16_t backend_port) {
    routes_.add(owner_id, kTcpRouteKey, backend_host, backend_port);
    std::cout << "[tcp] Port " << port() << " now forwards to " << backend_host << ":" << backend_port << "\n";
}

void TcpProxy::remove_route(std::string_view) {
    if (routes_.remove(kTcpRouteKey)) {
        std::cout << "[tcp] Port " << port() << " backend removed\n";
    }
}

void TcpProxy::update_route(std::string_view, const std::string& backend_host, uint16_t backend_port) {
    routes_.update(kTcpRouteKey, backend_host, backend_port);
}

void TcpProxy::set_route_active(std::string_view, bool active) {
    routes_.set_active(kTcpRouteKey, active);
}

RouteMap TcpProxy::get_routes() const {
    return routes_.snapshot();
}

void TcpProxy::handle_connection(tcp::socket socket) {
    const auto& metrics = options_.metrics;
    if (metrics) metrics->total_connections.fetch_add(1, std::memory_order_relaxed);

    auto route = routes_.lookup(kTcpRouteKey);
    if (!route) {
        if (metrics) metrics->unrouted_drops.fetch_add(1, std::memory_order_relaxed);
        boost::system::error_code ignored;
        socket.close(ignored);
        return;
    }

    auto client = std::make_shared<tcp::socket>(std::move(socket));
    auto label = remote_label(*client);
    connect_backend(
        client->get_executor(),
        route->backend_host,
        route->backend_port,
        options_.dial_timeout,
        [client, metrics, label, route](const boost::system::error_code& ec, tcp::socket backend) {
            if (ec) {
                std::cerr << "[tcp] Failed to connect " << label << " to backend " << route->backend_host << ":"
                          << route->backend_port << ": " << ec.message() << "\n";
                if (metrics) metrics->dial_errors.fetch_add(1, std::memory_order_relaxed);
                boost::system::error_code ignored;
                client->close(ignored);
                return;
            }
            std::make_shared<Tunnel>(std::move(*client), std::move(backend), metrics, label)->start();
        });
}

} // namespace craftgate
