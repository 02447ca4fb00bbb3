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

// Raw TCP forwarder with a single backend. The route key is ignored; the backend
// is stored and reported under kTcpRouteKey.
class TcpProxy {
public:
    static std::shared_ptr<TcpProxy> create(boost::asio::io_context& io, uint16_t port, ProxyOptions options);

    explicit TcpProxy(ProxyOptions options);

    void start();
    void stop();
    bool is_running() const;
    uint16_t port() const;

    void add_route(const std::string& owner_id, std::string_view key, const std::string& backend_host, uint16_t backend_port);
    void remove_route(std::string_view key);
    void update_route(std::string_view key, const std::string& backend_host, uint16_t backend_port);
    void set_route_active(std::string_view key, bool active);
    RouteMap get_routes() const;

private:
    using tcp = boost::asio::ip::tcp;

    void handle_connection(tcp::socket socket);

    ProxyOptions options_;
    RouteTable routes_;
    std::shared_ptr<Server> server_;
};

} // namespace craftgate
