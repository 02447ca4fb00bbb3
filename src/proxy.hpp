#pragma once

#include "handshake_proxy.hpp"
#include "http_proxy.hpp"
#include "proxy_options.hpp"
#include "route.hpp"
#include "tcp_proxy.hpp"
#include "udp_proxy.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include <utility>
#include <boost/asio.hpp>

namespace craftgate {

// Value handle over one listening instance of any kind. The kind is fixed when
// the handle is made; every call forwards to the concrete forwarder.
class Proxy {
public:
    using Variant = std::variant<std::shared_ptr<TcpProxy>,
                                 std::shared_ptr<UdpProxy>,
                                 std::shared_ptr<HttpProxy>,
                                 std::shared_ptr<HandshakeProxy>>;

    explicit Proxy(Variant impl);

    ProxyKind kind() const;

    void start();
    void stop();
    bool is_running() const;
    uint16_t port() const;

    void add_route(const std::string& owner_id, std::string_view key, const std::string& backend_host, uint16_t backend_port);
    void remove_route(std::string_view key);
    void update_route(std::string_view key, const std::string& backend_host, uint16_t backend_port);
    void set_route_active(std::string_view key, bool active);
    RouteMap get_routes() const;

    const Variant& impl() const { return impl_; }

private:
    Variant impl_;
};

Proxy make_proxy(ProxyKind kind, boost::asio::io_context& io, uint16_t port, const ProxyOptions& options);

} // namespace craftgate
