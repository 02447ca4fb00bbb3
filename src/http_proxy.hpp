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

// Host-header virtual hosting for HTTP/1.x. Ordinary requests are relayed one at
// a time to the routed backend; WebSocket upgrades take over the raw socket and
// become a byte tunnel. Unknown hosts and backend failures get 502.
class HttpProxy {
public:
    static std::shared_ptr<HttpProxy> create(boost::asio::io_context& io, uint16_t port, ProxyOptions options);

    explicit HttpProxy(ProxyOptions options);

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
