#pragma once

#include "proxy_options.hpp"
#include "route.hpp"
#include "server.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio.hpp>

namespace craftgate {

inline constexpr std::string_view kBackendAddressReplacement = "localhost";

// Hostname-multiplexing forwarder for the game protocol. Each connection is
// routed by the server address of its handshake packet; the handshake is then
// rewritten for the backend and the rest of the stream is relayed untouched.
// Connections for unknown hostnames are closed without a response.
class HandshakeProxy {
public:
    static std::shared_ptr<HandshakeProxy> create(boost::asio::io_context& io, uint16_t port, ProxyOptions options);

    explicit HandshakeProxy(ProxyOptions options);

    void start();
    void stop();
    bool is_running() const;
    uint16_t port() const;

    void add_route(const std::string& owner_id, std::string_view hostname, const std::string& backend_host, uint16_t backend_port);
    void remove_route(std::string_view hostname);
    void update_route(std::string_view hostname, const std::string& backend_host, uint16_t backend_port);
    void set_route_active(std::string_view hostname, bool active);
    RouteMap get_routes() const;

private:
    ProxyOptions options_;
    std::shared_ptr<RouteTable> routes_;
    std::shared_ptr<Server> server_;
};

} // namespace craftgate
