#include "tunnel.hpp"

#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <iostream>

namespace craftgate {

namespace {

using boost::asio::ip::tcp;

class BackendConnector : public std::enable_shared_from_this<BackendConnector> {
public:
    BackendConnector(const boost::asio::any_io_executor& executor,
                     std::string host,
                     uint16_t port,
                     ConnectHandler handler)
        : strand_(boost::asio::make_strand(executor)),
          resolver_(strand_),
          socket_(strand_),
          timer_(strand_),
          host_(std::move(host)),
          port_(port),
          handler_(std::move(handler)) {}

    void start(std::chrono::milliseconds timeout) {
        timer_.expires_after(timeout);
        timer_.async_wait(boost::asio::bind_executor(strand_, [self = shared_from_this()](auto ec) {
            if (ec == boost::asio::error::operation_aborted || self->finished_) return;
            self->timed_out_ = true;
            self->resolver_.cancel();
            boost::system::error_code ignored;
            self->socket_.close(ignored);
        }));

        resolver_.async_resolve(
            host_,
            std::to_string(port_),
            boost::asio::bind_executor(strand_, [self = shared_from_this()](auto ec, auto endpoints) {
                self->on_resolve(ec, endpoints);
            }));
    }

private:
    void on_resolve(const boost::system::error_code& ec, const tcp::resolver::results_type& endpoints) {
        if (timed_out_) {
            finish(boost::asio::error::timed_out);
            return;
        }
        if (ec) {
            finish(ec);
            return;
        }
        if (endpoints.empty()) {
            finish(boost::asio::error::host_not_found);
            return;
        }
        boost::asio::async_connect(
            socket_,
            endpoints,
            boost::asio::bind_executor(strand_, [self = shared_from_this()](auto connect_ec, auto) {
                self->finish(self->timed_out_ ? boost::system::error_code(boost::asio::error::timed_out) : connect_ec);
            }));
    }

    void finish(const boost::system::error_code& ec) {
        if (finished_) return;
        finished_ = true;
        timer_.cancel();
        if (ec) {
            boost::system::error_code ignored;
            socket_.close(ignored);
        }
        handler_(ec, std::move(socket_));
    }

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    boost::asio::steady_timer timer_;
    std::string host_;
    uint16_t port_;
    ConnectHandler handler_;
    bool timed_out_ = false;
    bool finished_ = false;
};

} // namespace

std::string remote_label(const tcp::socket& socket) {
    boost::system::error_code ec;
    const auto endpoint = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void connect_backend(const boost::asio::any_io_executor& executor,
                     std::string host,
                     uint16_t port,
                     std::chrono::milliseconds timeout,
                     ConnectHandler handler) {
    std::make_shared<BackendConnector>(executor, std::move(host), port, std::move(handler))->start(timeout);
}

Tunnel::Tunnel(tcp::socket client_socket,
               tcp::socket backend_socket,
               MetricsPtr metrics,
               std::string label)
    : strand_(std::make_shared<Strand>(client_socket.get_executor())),
      client_socket_(std::move(client_socket)),
      backend_socket_(std::move(backend_socket)),
      metrics_(std::move(metrics)),
      label_(std::move(label)) {
    if (metrics_) {
        metrics_->active_connections.fetch_add(1, std::memory_order_relaxed);
    }
}

void Tunnel::start(std::string initial_upstream) {
    if (initial_upstream.empty()) {
        boost::asio::post(*strand_, [self = shared_from_this()]() {
            self->do_read_from_client();
            self->do_read_from_backend();
        });
        return;
    }

    initial_upstream_ = std::move(initial_upstream);
    boost::asio::async_write(
        backend_socket_,
        boost::asio::buffer(initial_upstream_),
        boost::asio::bind_executor(*strand_, [self = shared_from_this()](auto ec, auto length) {
            if (ec) {
                std::cerr << "[tunnel] Initial write to backend failed for " << self->label_ << ": "
                          << ec.message() << "\n";
                self->close_sockets(ec);
                return;
            }
            if (self->metrics_) {
                self->metrics_->bytes_upstream.fetch_add(length, std::memory_order_relaxed);
            }
            self->do_read_from_client();
            self->do_read_from_backend();
        }));
}

void Tunnel::do_read_from_client() {
    client_socket_.async_read_some(
        boost::asio::buffer(client_buffer_),
        boost::asio::bind_executor(*strand_, [self = shared_from_this()](auto ec, auto len) {
            if (!ec) {
                self->do_write_to_backend(len);
            } else {
                self->close_sockets(ec);
            }
        }));
}

void Tunnel::do_write_to_backend(std::size_t length) {
    boost::asio::async_write(
        backend_socket_,
        boost::asio::buffer(client_buffer_.data(), length),
        boost::asio::bind_executor(*strand_, [self = shared_from_this(), length](auto ec, auto) {
            if (!ec) {
                self->do_read_from_client();
                if (self->metrics_) {
                    self->metrics_->bytes_upstream.fetch_add(length, std::memory_order_relaxed);
                }
            } else {
                self->close_sockets(ec);
            }
        }));
}

void Tunnel::do_read_from_backend() {
    backend_socket_.async_read_some(
        boost::asio::buffer(backend_buffer_),
        boost::asio::bind_executor(*strand_, [self = shared_from_this()](auto ec, auto len) {
            if (!ec) {
                self->do_write_to_client(len);
            } else {
                self->close_sockets(ec);
            }
        }));
}

void Tunnel::do_write_to_client(std::size_t length) {
    boost::asio::async_write(
        client_socket_,
        boost::asio::buffer(backend_buffer_.data(), length),
        boost::asio::bind_executor(*strand_, [self = shared_from_this(), length](auto ec, auto) {
            if (!ec) {
                self->do_read_from_backend();
                if (self->metrics_) {
                    self->metrics_->bytes_downstream.fetch_add(length, std::memory_order_relaxed);
                }
            } else {
                self->close_sockets(ec);
            }
        }));
}

void Tunnel::close_sockets(const boost::system::error_code& ec) {
    auto self = shared_from_this();
    boost::asio::post(*strand_, [self, ec]() {
        if (self->closed_.exchange(true)) return;
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted &&
            ec != boost::asio::error::connection_reset) {
            std::cerr << "[tunnel] Closing " << self->label_ << ": " << ec.message() << "\n";
        }

        boost::system::error_code ignored;
        if (self->client_socket_.is_open()) {
            self->client_socket_.shutdown(tcp::socket::shutdown_both, ignored);
            self->client_socket_.close(ignored);
        }
        if (self->backend_socket_.is_open()) {
            self->backend_socket_.shutdown(tcp::socket::shutdown_both, ignored);
            self->backend_socket_.close(ignored);
        }

        if (self->metrics_) {
            self->metrics_->active_connections.fetch_sub(1, std::memory_order_relaxed);
        }
    });
}

} // namespace craftgate
