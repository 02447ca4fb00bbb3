#include "handshake_proxy.hpp"

#include "protocol.hpp"
#include "tunnel.hpp"

#include <array>
#include <iostream>

#include <utility>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace craftgate {

namespace {

using boost::asio::ip::tcp;

// Reads one handshake under a deadline, resolves its hostname and hands the
// connection to a Tunnel once the backend is connected. The deadline covers the
// read only; the dial is bounded by its own timeout.
class HandshakeSession : public std::enable_shared_from_this<HandshakeSession> {
public:
    HandshakeSession(tcp::socket socket, std::shared_ptr<const RouteTable> routes, const ProxyOptions& options)
        : strand_(boost::asio::make_strand(socket.get_executor())),
          socket_(std::move(socket)),
          timer_(strand_),
          routes_(std::move(routes)),
          metrics_(options.metrics),
          handshake_timeout_(options.handshake_timeout),
          dial_timeout_(options.dial_timeout),
          label_(remote_label(socket_)) {}

    void start() {
        boost::asio::post(strand_, [self = shared_from_this()]() {
            self->timer_.expires_after(self->handshake_timeout_);
            self->timer_.async_wait(boost::asio::bind_executor(self->strand_, [self](auto ec) {
                if (ec == boost::asio::error::operation_aborted || self->decoded_) return;
                self->timed_out_ = true;
                boost::system::error_code ignored;
                self->socket_.close(ignored);
            }));
            self->do_read();
        });
    }

private:
    void do_read() {
        socket_.async_read_some(
            boost::asio::buffer(chunk_),
            boost::asio::bind_executor(strand_, [self = shared_from_this()](auto ec, auto length) {
                self->on_read(ec, length);
            }));
    }

    void on_read(const boost::system::error_code& ec, std::size_t length) {
        if (ec) {
            if (timed_out_) {
                std::cerr << "[handshake] Timed out waiting for handshake from " << label_ << "\n";
                count_error();
            } else if (ec != boost::asio::error::eof && ec != boost::asio::error::connection_reset) {
                std::cerr << "[handshake] Read from " << label_ << " failed: " << ec.message() << "\n";
            }
            close();
            return;
        }

        buffered_.append(chunk_.data(), length);
        try {
            const auto frame_size = handshake_frame_size(buffered_);
            if (!frame_size || buffered_.size() < *frame_size) {
                do_read();
                return;
            }
            auto handshake = decode_handshake(std::string_view(buffered_).substr(0, *frame_size));
            buffered_.erase(0, *frame_size);
            dispatch(std::move(handshake));
        } catch (const ProtocolError& ex) {
            std::cerr << "[handshake] Invalid handshake from " << label_ << ": " << ex.what() << "\n";
            count_error();
            close();
        }
    }

    void dispatch(Handshake handshake) {
        decoded_ = true;
        timer_.cancel();

        const auto hostname = normalize_hostname(handshake_hostname(handshake.server_address));
        auto target = routes_->lookup(hostname);
        if (!target) {
            std::cout << "[handshake] No route for '" << hostname << "' from " << label_ << ", dropping\n";
            if (metrics_) metrics_->unrouted_drops.fetch_add(1, std::memory_order_relaxed);
            close();
            return;
        }

        handshake.server_address = rewrite_server_address(handshake.server_address, kBackendAddressReplacement);
        handshake.server_port = target->backend_port;
        connect_backend(
            socket_.get_executor(),
            target->backend_host,
            target->backend_port,
            dial_timeout_,
            [self = shared_from_this(), handshake = std::move(handshake), route = *target](
                const boost::system::error_code& ec, tcp::socket backend) mutable {
                auto backend_ptr = std::make_shared<tcp::socket>(std::move(backend));
                boost::asio::post(self->strand_, [self, ec, backend_ptr, handshake, route]() {
                    self->on_connect(ec, std::move(*backend_ptr), handshake, route);
                });
            });
    }

    void on_connect(const boost::system::error_code& ec, tcp::socket backend, const Handshake& handshake, const Route& route) {
        if (ec) {
            std::cerr << "[handshake] Failed to connect " << label_ << " (" << route.routing_key << ") to "
                      << route.backend_host << ":" << route.backend_port << ": " << ec.message() << "\n";
            if (metrics_) metrics_->dial_errors.fetch_add(1, std::memory_order_relaxed);
            close();
            return;
        }

        auto initial = encode_handshake(handshake);
        initial.append(buffered_);
        std::make_shared<Tunnel>(std::move(socket_), std::move(backend), metrics_, label_)->start(std::move(initial));
    }

    void count_error() {
        if (metrics_) metrics_->handshake_errors.fetch_add(1, std::memory_order_relaxed);
    }

    void close() {
        timer_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    tcp::socket socket_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<const RouteTable> routes_;
    MetricsPtr metrics_;
    std::chrono::milliseconds handshake_timeout_;
    std::chrono::milliseconds dial_timeout_;
    std::string label_;

    std::array<char, 512> chunk_{};
    std::string buffered_;
    bool timed_out_ = false;
    bool decoded_ = false;
};

} // namespace

std::shared_ptr<HandshakeProxy> HandshakeProxy::create(boost::asio::io_context& io, uint16_t port, ProxyOptions options) {
    auto proxy = std::make_shared<HandshakeProxy>(std::move(options));
    std::weak_ptr<HandshakeProxy> weak = proxy;
    proxy->server_ = std::make_shared<Server>(
        io, proxy->options_.listen_address, port, "handshake", [weak](tcp::socket socket) {
            auto self = weak.lock();
            if (!self) return;
            if (self->options_.metrics) {
                self->options_.metrics->total_connections.fetch_add(1, std::memory_order_relaxed);
            }
            std::make_shared<HandshakeSession>(std::move(socket), self->routes_, self->options_)->start();
        });
    return proxy;
}

HandshakeProxy::HandshakeProxy(ProxyOptions options)
    : options_(std::move(options)),
      routes_(std::make_shared<RouteTable>()) {}

void HandshakeProxy::start() {
    server_->start();
}

void HandshakeProxy::stop() {
    server_->stop();
}

bool HandshakeProxy::is_running() const {
    return server_->is_running();
}

uint16_t HandshakeProxy::port() const {
    return server_->port();
}

void HandshakeProxy::add_route(const std::string& owner_id, std::string_view hostname, const std::string& backend_host, uint16_t backend_port) {
    const auto route = routes_->add(owner_id, normalize_hostname(hostname), backend_host, backend_port);
    std::cout << "[handshake] Route " << route.routing_key << " -> " << backend_host << ":" << backend_port
              << " on port " << port() << "\n";
}

void HandshakeProxy::remove_route(std::string_view hostname) {
    const auto key = normalize_hostname(hostname);
    if (routes_->remove(key)) {
        std::cout << "[handshake] Removed route " << key << " on port " << port() << "\n";
    }
}

void HandshakeProxy::update_route(std::string_view hostname, const std::string& backend_host, uint16_t backend_port) {
    routes_->update(normalize_hostname(hostname), backend_host, backend_port);
}

void HandshakeProxy::set_route_active(std::string_view hostname, bool active) {
    routes_->set_active(normalize_hostname(hostname), active);
}

RouteMap HandshakeProxy::get_routes() const {
    return routes_->snapshot();
}

} // namespace craftgate
