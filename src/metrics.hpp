#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <utility>
#include <boost/asio.hpp>

namespace craftgate {

class Server;

struct MetricsRegistry {
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> active_connections{0};
    std::atomic<uint64_t> bytes_upstream{0};
    std::atomic<uint64_t> bytes_downstream{0};
    std::atomic<uint64_t> udp_sessions_active{0};
    std::atomic<uint64_t> udp_datagrams{0};
    std::atomic<uint64_t> handshake_errors{0};
    std::atomic<uint64_t> unrouted_drops{0};
    std::atomic<uint64_t> dial_errors{0};
};

using MetricsPtr = std::shared_ptr<MetricsRegistry>;

MetricsPtr make_metrics();

// Plain-text exposition of a registry, one "craftgate_<name> <value>" line per counter.
std::string render_metrics(const MetricsRegistry& metrics);

// Answers GET / and GET /metrics with the exposition page; anything else is 404.
class MetricsServer {
public:
    MetricsServer(boost::asio::io_context& io, MetricsPtr metrics, std::string address, uint16_t port);

    void start();
    void stop();
    uint16_t bound_port() const;

private:
    MetricsPtr metrics_;
    std::shared_ptr<Server> server_;
};

} // namespace craftgate
