#include "http_proxy.hpp"

#include "tunnel.hpp"

#include <array>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace craftgate {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline constexpr std::uint64_t kMaxBodyBytes = 64 * 1024 * 1024;

std::string_view to_std(beast::string_view value) {
    return {value.data(), value.size()};
}

std::string trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    const auto last = value.find_last_not_of(" \t");
    return std::string(value.substr(first, last - first + 1));
}

// Removes headers that describe the client<->proxy hop, including any header
// named by the Connection field.
template <class Fields>
void strip_hop_by_hop(Fields& fields) {
    std::vector<std::string> named;
    const auto connection = to_std(fields[http::field::connection]);
    std::size_t start = 0;
    while (start <= connection.size()) {
        const auto comma = connection.find(',', start);
        const auto token = trim(connection.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
        if (!token.empty()) named.push_back(token);
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    for (const auto& name : named) {
        fields.erase(name);
    }

    for (const auto field : {http::field::connection,
                             http::field::keep_alive,
                             http::field::proxy_connection,
                             http::field::te,
                             http::field::trailer,
                             http::field::transfer_encoding,
                             http::field::upgrade,
                             http::field::proxy_authenticate,
                             http::field::proxy_authorization}) {
        fields.erase(field);
    }
}

bool is_websocket_upgrade(const Request& request) {
    return beast::iequals(request[http::field::upgrade], "websocket");
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, std::shared_ptr<const RouteTable> routes, const ProxyOptions& options)
        : stream_(std::move(socket)),
          routes_(std::move(routes)),
          metrics_(options.metrics),
          read_timeout_(options.http_read_timeout),
          dial_timeout_(options.dial_timeout),
          label_(remote_label(stream_.socket())) {
        boost::system::error_code ec;
        const auto peer = stream_.socket().remote_endpoint(ec);
        if (!ec) client_ip_ = peer.address().to_string();
    }

    void start() {
        do_read();
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(kMaxBodyBytes);
        stream_.expires_after(read_timeout_);
        http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != boost::asio::error::connection_reset &&
                ec != boost::asio::error::eof) {
                std::cerr << "[http] Read from " << label_ << " failed: " << ec.message() << "\n";
            }
            close();
            return;
        }

        request_ = parser_->release();
        const auto host = normalize_hostname(to_std(request_[http::field::host]));
        auto target = routes_->lookup(host);
        if (!target) {
            std::cout << "[http] No route for host '" << host << "' from " << label_ << "\n";
            if (metrics_) metrics_->unrouted_drops.fetch_add(1, std::memory_order_relaxed);
            send_bad_gateway();
            return;
        }

        if (is_websocket_upgrade(request_)) {
            tunnel_upgrade(*target);
        } else {
            forward(*target);
        }
    }

    void forward(const Route& route) {
        outbound_ = request_;
        strip_hop_by_hop(outbound_);
        outbound_.set(http::field::host, request_[http::field::host]);

        const auto prior = to_std(outbound_["X-Forwarded-For"]);
        outbound_.set("X-Forwarded-For", prior.empty() ? client_ip_ : std::string(prior) + ", " + client_ip_);
        outbound_.set("X-Forwarded-Host", request_[http::field::host]);
        outbound_.set("X-Forwarded-Proto", "http");
        outbound_.keep_alive(false);
        outbound_.prepare_payload();

        stream_.expires_never();
        connect_backend(
            stream_.get_executor(),
            route.backend_host,
            route.backend_port,
            dial_timeout_,
            [self = shared_from_this(), route](const boost::system::error_code& ec, tcp::socket backend) {
                self->on_backend_connect(route, ec, std::move(backend));
            });
    }

    void on_backend_connect(const Route& route, const boost::system::error_code& ec, tcp::socket backend) {
        if (ec) {
            std::cerr << "[http] Failed to connect to backend " << route.backend_host << ":" << route.backend_port
                      << " for " << route.routing_key << ": " << ec.message() << "\n";
            if (metrics_) metrics_->dial_errors.fetch_add(1, std::memory_order_relaxed);
            send_bad_gateway();
            return;
        }

        backend_.emplace(std::move(backend));
        http::async_write(*backend_, outbound_, beast::bind_front_handler(&HttpSession::on_backend_write, shared_from_this()));
    }

    void on_backend_write(beast::error_code ec, std::size_t) {
        if (ec) {
            backend_failed(ec);
            return;
        }

        backend_buffer_.consume(backend_buffer_.size());
        response_parser_.emplace();
        response_parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
        if (request_.method() == http::verb::head) {
            response_parser_->skip(true);
        }
        http::async_read_header(*backend_, backend_buffer_, *response_parser_,
                                beast::bind_front_handler(&HttpSession::on_backend_header, shared_from_this()));
    }

    // The header goes out as soon as it is parsed; the body follows chunk by
    // chunk so streamed responses reach the client while the backend writes.
    void on_backend_header(beast::error_code ec, std::size_t) {
        if (ec) {
            backend_failed(ec);
            return;
        }

        auto& response = response_parser_->get();
        const auto length = response_parser_->content_length();
        strip_hop_by_hop(response);
        response.version(request_.version());

        const auto status = response.result_int();
        expects_body_ = request_.method() != http::verb::head && status != 204 && status != 304 && status >= 200;
        bool keep_alive = request_.keep_alive();
        if (expects_body_ && !length) {
            if (request_.version() >= 11) {
                response.chunked(true);
            } else {
                keep_alive = false;
            }
        }
        response.keep_alive(keep_alive);
        relay_keep_alive_ = keep_alive;

        serializer_.emplace(response);
        stream_.expires_never();
        http::async_write_header(stream_, *serializer_,
                                 beast::bind_front_handler(&HttpSession::on_header_written, shared_from_this()));
    }

    void on_header_written(beast::error_code ec, std::size_t) {
        if (ec) {
            relay_failed("Write to " + label_, ec);
            return;
        }
        if (!expects_body_) {
            finish_relay();
            return;
        }
        relay_body();
    }

    void relay_body() {
        if (serializer_->is_done()) {
            finish_relay();
            return;
        }

        auto& body = response_parser_->get().body();
        if (response_parser_->is_done()) {
            body.data = nullptr;
            body.size = 0;
            body.more = false;
            write_body();
            return;
        }

        body.data = relay_buffer_.data();
        body.size = relay_buffer_.size();
        http::async_read_some(*backend_, backend_buffer_, *response_parser_,
                              beast::bind_front_handler(&HttpSession::on_body_read, shared_from_this()));
    }

    void on_body_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::need_buffer) ec = {};
        if (ec) {
            relay_failed("Backend body for " + label_, ec);
            return;
        }

        auto& body = response_parser_->get().body();
        const auto produced = relay_buffer_.size() - body.size;
        body.data = relay_buffer_.data();
        body.size = produced;
        body.more = !response_parser_->is_done();
        if (metrics_) metrics_->bytes_downstream.fetch_add(produced, std::memory_order_relaxed);
        write_body();
    }

    void write_body() {
        http::async_write(stream_, *serializer_, beast::bind_front_handler(&HttpSession::on_body_written, shared_from_this()));
    }

    void on_body_written(beast::error_code ec, std::size_t) {
        if (ec == http::error::need_buffer) ec = {};
        if (ec) {
            relay_failed("Write to " + label_, ec);
            return;
        }
        relay_body();
    }

    void finish_relay() {
        close_backend();
        serializer_.reset();
        response_parser_.reset();
        if (!relay_keep_alive_) {
            close();
            return;
        }
        do_read();
    }

    // Part of the response is already on the wire, so a 502 is no longer possible.
    void relay_failed(const std::string& what, const beast::error_code& ec) {
        std::cerr << "[http] " << what << " failed: " << ec.message() << "\n";
        close_backend();
        serializer_.reset();
        response_parser_.reset();
        close();
    }

    void backend_failed(const beast::error_code& ec) {
        std::cerr << "[http] Backend exchange for " << label_ << " failed: " << ec.message() << "\n";
        close_backend();
        send_bad_gateway();
    }

    void tunnel_upgrade(const Route& route) {
        stream_.expires_never();
        std::ostringstream replay;
        replay << request_;
        auto initial = std::make_shared<std::string>(replay.str() + beast::buffers_to_string(buffer_.data()));
        auto client = std::make_shared<tcp::socket>(stream_.release_socket());

        connect_backend(
            client->get_executor(),
            route.backend_host,
            route.backend_port,
            dial_timeout_,
            [client, initial, route, metrics = metrics_, label = label_](const boost::system::error_code& ec, tcp::socket backend) {
                if (ec) {
                    std::cerr << "[http] Upgrade dial to " << route.backend_host << ":" << route.backend_port
                              << " failed: " << ec.message() << "\n";
                    if (metrics) metrics->dial_errors.fetch_add(1, std::memory_order_relaxed);
                    auto reply = std::make_shared<std::string>("HTTP/1.1 502 Bad Gateway\r\n\r\n");
                    boost::asio::async_write(*client, boost::asio::buffer(*reply), [client, reply](auto, auto) {
                        boost::system::error_code ignored;
                        client->shutdown(tcp::socket::shutdown_both, ignored);
                        client->close(ignored);
                    });
                    return;
                }
                std::make_shared<Tunnel>(std::move(*client), std::move(backend), metrics, label)->start(*initial);
            });
    }

    void send_bad_gateway() {
        response_ = Response{};
        response_.result(http::status::bad_gateway);
        response_.version(request_.version());
        response_.set(http::field::content_type, "text/plain");
        response_.body() = "Bad Gateway\n";
        response_.keep_alive(request_.keep_alive());
        response_.prepare_payload();
        write_response();
    }

    void write_response() {
        stream_.expires_after(read_timeout_);
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), response_.keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t) {
        if (ec) {
            std::cerr << "[http] Write to " << label_ << " failed: " << ec.message() << "\n";
            close();
            return;
        }
        if (!keep_alive) {
            close();
            return;
        }
        do_read();
    }

    void close_backend() {
        if (!backend_) return;
        boost::system::error_code ignored;
        backend_->socket().shutdown(tcp::socket::shutdown_both, ignored);
        backend_->close();
        backend_.reset();
    }

    void close() {
        boost::system::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
        stream_.close();
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<const RouteTable> routes_;
    MetricsPtr metrics_;
    std::chrono::milliseconds read_timeout_;
    std::chrono::milliseconds dial_timeout_;
    std::string label_;
    std::string client_ip_;

    std::optional<http::request_parser<http::string_body>> parser_;
    Request request_;
    Request outbound_;
    Response response_;

    std::optional<beast::tcp_stream> backend_;
    beast::flat_buffer backend_buffer_;
    std::optional<http::response_parser<http::buffer_body>> response_parser_;
    std::optional<http::response_serializer<http::buffer_body>> serializer_;
    std::array<char, 16 * 1024> relay_buffer_{};
    bool expects_body_ = false;
    bool relay_keep_alive_ = false;
};

} // namespace

std::shared_ptr<HttpProxy> HttpProxy::create(boost::asio::io_context& io, uint16_t port, ProxyOptions options) {
    auto proxy = std::make_shared<HttpProxy>(std::move(options));
    std::weak_ptr<HttpProxy> weak = proxy;
    proxy->server_ = std::make_shared<Server>(
        io, proxy->options_.listen_address, port, "http", [weak](tcp::socket socket) {
            auto self = weak.lock();
            if (!self) return;
            if (self->options_.metrics) {
                self->options_.metrics->total_connections.fetch_add(1, std::memory_order_relaxed);
            }
            std::make_shared<HttpSession>(std::move(socket), self->routes_, self->options_)->start();
        });
    return proxy;
}

HttpProxy::HttpProxy(ProxyOptions options)
    : options_(std::move(options)),
      routes_(std::make_shared<RouteTable>()) {}

void HttpProxy::start() {
    server_->start();
}

void HttpProxy::stop() {
    server_->stop();
}

bool HttpProxy::is_running() const {
    return server_->is_running();
}

uint16_t HttpProxy::port() const {
    return server_->port();
}

void HttpProxy::add_route(const std::string& owner_id, std::string_view hostname, const std::string& backend_host, uint16_t backend_port) {
    const auto route = routes_->add(owner_id, normalize_hostname(hostname), backend_host, backend_port);
    std::cout << "[http] Route " << route.routing_key << " -> " << backend_host << ":" << backend_port << " on port "
              << port() << "\n";
}

void HttpProxy::remove_route(std::string_view hostname) {
    const auto key = normalize_hostname(hostname);
    if (routes_->remove(key)) {
        std::cout << "[http] Removed route " << key << " on port " << port() << "\n";
    }
}

void HttpProxy::update_route(std::string_view hostname, const std::string& backend_host, uint16_t backend_port) {
    routes_->update(normalize_hostname(hostname), backend_host, backend_port);
}

void HttpProxy::set_route_active(std::string_view hostname, bool active) {
    routes_->set_active(normalize_hostname(hostname), active);
}

RouteMap HttpProxy::get_routes() const {
    return routes_->snapshot();
}

} // namespace craftgate
