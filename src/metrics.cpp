#include "metrics.hpp"

#include "server.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace craftgate {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

struct Counter {
    const char* name;
    std::atomic<uint64_t> MetricsRegistry::*field;
};

constexpr Counter kCounters[] = {
    {"total_connections", &MetricsRegistry::total_connections},
    {"active_connections", &MetricsRegistry::active_connections},
    {"bytes_upstream", &MetricsRegistry::bytes_upstream},
    {"bytes_downstream", &MetricsRegistry::bytes_downstream},
    {"udp_sessions_active", &MetricsRegistry::udp_sessions_active},
    {"udp_datagrams", &MetricsRegistry::udp_datagrams},
    {"handshake_errors", &MetricsRegistry::handshake_errors},
    {"unrouted_drops", &MetricsRegistry::unrouted_drops},
    {"dial_errors", &MetricsRegistry::dial_errors},
};

constexpr std::chrono::seconds kScrapeTimeout{5};

// One request, one response, then close.
class ScrapeSession : public std::enable_shared_from_this<ScrapeSession> {
public:
    ScrapeSession(tcp::socket socket, MetricsPtr metrics)
        : stream_(std::move(socket)),
          metrics_(std::move(metrics)) {}

    void start() {
        stream_.expires_after(kScrapeTimeout);
        http::async_read(stream_, buffer_, request_, beast::bind_front_handler(&ScrapeSession::on_read, shared_from_this()));
    }

private:
    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != http::error::end_of_stream && ec != beast::error::timeout) {
                std::cerr << "[metrics] Bad scrape request: " << ec.message() << "\n";
            }
            close();
            return;
        }

        response_.version(request_.version());
        response_.keep_alive(false);
        const auto target = request_.target();
        if (request_.method() == http::verb::get && (target == "/" || target == "/metrics")) {
            response_.result(http::status::ok);
            response_.set(http::field::content_type, "text/plain; version=0.0.4");
            response_.body() = render_metrics(*metrics_);
        } else {
            response_.result(http::status::not_found);
            response_.set(http::field::content_type, "text/plain");
            response_.body() = "Not Found\n";
        }
        response_.prepare_payload();
        http::async_write(stream_, response_, beast::bind_front_handler(&ScrapeSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code, std::size_t) {
        close();
    }

    void close() {
        boost::system::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    MetricsPtr metrics_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;
};

} // namespace

MetricsPtr make_metrics() {
    return std::make_shared<MetricsRegistry>();
}

std::string render_metrics(const MetricsRegistry& metrics) {
    std::ostringstream os;
    for (const auto& counter : kCounters) {
        os << "craftgate_" << counter.name << " " << (metrics.*counter.field).load(std::memory_order_relaxed) << "\n";
    }
    return os.str();
}

MetricsServer::MetricsServer(boost::asio::io_context& io, MetricsPtr metrics, std::string address, uint16_t port)
    : metrics_(std::move(metrics)) {
    server_ = std::make_shared<Server>(io, std::move(address), port, "metrics", [metrics = metrics_](tcp::socket socket) {
        std::make_shared<ScrapeSession>(std::move(socket), metrics)->start();
    });
}

void MetricsServer::start() {
    server_->start();
}

void MetricsServer::stop() {
    server_->stop();
}

uint16_t MetricsServer::bound_port() const {
    return server_->port();
}

} // namespace craftgate
