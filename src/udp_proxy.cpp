#include "udp_proxy.hpp"

#include "errors.hpp"

#include <iostream>

namespace craftgate {

namespace {

std::string endpoint_label(const boost::asio::ip::udp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

UdpProxy::Session::Session(boost::asio::io_context& io, uint64_t id, udp::endpoint client, udp::endpoint backend)
    : id(id),
      client(std::move(client)),
      backend(std::move(backend)),
      socket(io),
      last_active(Clock::now().time_since_epoch().count()) {}

void UdpProxy::Session::touch() {
    last_active.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
}

std::shared_ptr<UdpProxy> UdpProxy::create(boost::asio::io_context& io, uint16_t port, ProxyOptions options) {
    return std::make_shared<UdpProxy>(io, port, std::move(options));
}

UdpProxy::UdpProxy(boost::asio::io_context& io, uint16_t port, ProxyOptions options)
    : io_(io),
      port_(port),
      options_(std::move(options)),
      socket_(io),
      sweep_timer_(io) {}

void UdpProxy::start() {
    std::lock_guard lock(socket_mutex_);
    if (running_) {
        throw LifecycleError("udp proxy already running on port " + std::to_string(port_));
    }

    const udp::endpoint endpoint(boost::asio::ip::make_address(options_.listen_address), port_);
    udp::socket socket(io_);
    socket.open(endpoint.protocol());
    socket.bind(endpoint);

    socket_ = std::move(socket);
    port_ = socket_.local_endpoint().port();
    running_ = true;
    ++generation_;
    {
        std::lock_guard sessions_lock(sessions_mutex_);
        accepting_ = true;
    }
    std::cout << "[udp] Listening on " << options_.listen_address << ":" << port_ << "\n";
    do_receive_locked();
    schedule_sweep_locked();
}

void UdpProxy::stop() {
    std::lock_guard lock(socket_mutex_);
    if (!running_) return;
    running_ = false;

    {
        std::lock_guard sessions_lock(sessions_mutex_);
        accepting_ = false;
        for (auto& [client, session] : sessions_) {
            close_session_locked(*session, "proxy stopped");
        }
        sessions_.clear();
    }

    sweep_timer_.cancel();
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        std::cerr << "[udp] Failed to close listener on port " << port_ << ": " << ec.message() << "\n";
    }
    std::cout << "[udp] Stopped listening on port " << port_ << "\n";
}

bool UdpProxy::is_running() const {
    std::lock_guard lock(socket_mutex_);
    return running_;
}

uint16_t UdpProxy::port() const {
    std::lock_guard lock(socket_mutex_);
    return port_;
}

void UdpProxy::add_route(const std::string& owner_id, std::string_view, const std::string& backend_host, uint16_t backend_port) {
    const auto backend = resolve_backend(backend_host, backend_port);
    {
        std::lock_guard lock(sessions_mutex_);
        backend_ = backend;
    }
    routes_.add(owner_id, kUdpRouteKey, backend_host, backend_port);
    std::cout << "[udp] Port " << port() << " now forwards to " << backend_host << ":" << backend_port << "\n";
}

void UdpProxy::remove_route(std::string_view) {
    const bool removed = routes_.remove(kUdpRouteKey);
    {
        std::lock_guard lock(sessions_mutex_);
        backend_.reset();
    }
    if (removed) {
        std::cout << "[udp] Port " << port() << " backend removed\n";
    }
}

void UdpProxy::update_route(std::string_view, const std::string& backend_host, uint16_t backend_port) {
    if (routes_.size() == 0) return;
    const auto backend = resolve_backend(backend_host, backend_port);
    {
        std::lock_guard lock(sessions_mutex_);
        backend_ = backend;
    }
    routes_.update(kUdpRouteKey, backend_host, backend_port);
}

void UdpProxy::set_route_active(std::string_view, bool active) {
    routes_.set_active(kUdpRouteKey, active);
}

RouteMap UdpProxy::get_routes() const {
    return routes_.snapshot();
}

std::size_t UdpProxy::session_count() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size();
}

std::optional<uint64_t> UdpProxy::session_id(const udp::endpoint& client) const {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(client);
    if (it == sessions_.end()) return std::nullopt;
    return it->second->id;
}

std::size_t UdpProxy::sweep_idle() {
    const auto cutoff = Clock::now() - options_.udp_idle_timeout;
    std::size_t removed = 0;

    std::lock_guard lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const Clock::time_point last_active{Clock::duration{it->second->last_active.load(std::memory_order_relaxed)}};
        if (last_active < cutoff) {
            close_session_locked(*it->second, "idle");
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void UdpProxy::do_receive_locked() {
    socket_.async_receive_from(
        boost::asio::buffer(buffer_),
        sender_,
        [self = shared_from_this(), generation = generation_](auto ec, auto length) {
            self->on_receive(ec, length, generation);
        });
}

void UdpProxy::on_receive(const boost::system::error_code& ec, std::size_t length, uint64_t generation) {
    udp::endpoint client;
    std::string payload;
    {
        std::lock_guard lock(socket_mutex_);
        if (!running_ || generation != generation_) return;
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                std::cerr << "[udp] Receive error on port " << port_ << ": " << ec.message() << "\n";
            }
            do_receive_locked();
            return;
        }
        client = sender_;
        payload.assign(buffer_.data(), length);
        do_receive_locked();
    }

    forward_to_backend(client, payload);
}

void UdpProxy::forward_to_backend(const udp::endpoint& client, const std::string& payload) {
    const auto& metrics = options_.metrics;
    if (metrics) metrics->udp_datagrams.fetch_add(1, std::memory_order_relaxed);

    auto route = routes_.lookup(kUdpRouteKey);
    if (!route) {
        if (metrics) metrics->unrouted_drops.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    std::lock_guard lock(sessions_mutex_);
    SessionPtr session;
    if (auto it = sessions_.find(client); it != sessions_.end()) {
        session = it->second;
    } else {
        if (!accepting_) return;
        if (!backend_) {
            if (metrics) metrics->dial_errors.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        session = create_session_locked(client, *backend_);
        if (!session) return;
    }

    session->touch();
    boost::system::error_code ec;
    session->socket.send_to(boost::asio::buffer(payload), session->backend, 0, ec);
    if (ec) {
        close_session_locked(*session, ec.message());
        sessions_.erase(client);
        return;
    }
    if (metrics) metrics->bytes_upstream.fetch_add(payload.size(), std::memory_order_relaxed);
}

std::optional<UdpProxy::udp::endpoint> UdpProxy::resolve_backend(const std::string& host, uint16_t port) {
    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(host, ec);
    if (!ec) return udp::endpoint(address, port);

    udp::resolver resolver(io_);
    const auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec || results.empty()) {
        std::cerr << "[udp] Cannot resolve backend " << host << ":" << port << ": "
                  << (ec ? ec.message() : "no addresses") << "\n";
        return std::nullopt;
    }
    for (const auto& entry : results) {
        if (entry.endpoint().address().is_v4()) return entry.endpoint();
    }
    return results.begin()->endpoint();
}

UdpProxy::SessionPtr UdpProxy::create_session_locked(const udp::endpoint& client, const udp::endpoint& backend) {
    boost::system::error_code ec;
    auto session = std::make_shared<Session>(io_, next_session_id_++, client, backend);
    session->socket.open(backend.protocol(), ec);
    if (ec) {
        std::cerr << "[udp] Cannot open backend socket for " << endpoint_label(client) << ": " << ec.message() << "\n";
        return nullptr;
    }

    sessions_.emplace(client, session);
    if (options_.metrics) options_.metrics->udp_sessions_active.fetch_add(1, std::memory_order_relaxed);
    std::cout << "[udp] Session #" << session->id << " " << endpoint_label(client) << " -> " << endpoint_label(backend) << "\n";
    do_relay_locked(session);
    return session;
}

void UdpProxy::do_relay_locked(const SessionPtr& session) {
    session->socket.async_receive_from(
        boost::asio::buffer(session->buffer),
        session->reply_from,
        [self = shared_from_this(), session](auto ec, auto length) {
            self->on_relay(session, ec, length);
        });
}

void UdpProxy::on_relay(const SessionPtr& session, const boost::system::error_code& ec, std::size_t length) {
    if (ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        std::lock_guard lock(sessions_mutex_);
        if (session->closed) return;
        close_session_locked(*session, ec.message());
        if (auto it = sessions_.find(session->client); it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
        return;
    }

    session->touch();
    {
        std::lock_guard lock(socket_mutex_);
        if (!running_) return;
        boost::system::error_code send_ec;
        socket_.send_to(boost::asio::buffer(session->buffer.data(), length), session->client, 0, send_ec);
        if (send_ec) {
            std::cerr << "[udp] Reply to " << endpoint_label(session->client) << " failed: " << send_ec.message() << "\n";
        } else if (options_.metrics) {
            options_.metrics->bytes_downstream.fetch_add(length, std::memory_order_relaxed);
        }
    }

    std::lock_guard lock(sessions_mutex_);
    if (!session->closed) {
        do_relay_locked(session);
    }
}

void UdpProxy::close_session_locked(Session& session, std::string_view reason) {
    if (session.closed) return;
    session.closed = true;
    boost::system::error_code ec;
    session.socket.close(ec);
    if (ec) {
        std::cerr << "[udp] Failed to close session #" << session.id << ": " << ec.message() << "\n";
    }
    if (options_.metrics) options_.metrics->udp_sessions_active.fetch_sub(1, std::memory_order_relaxed);
    std::cout << "[udp] Session #" << session.id << " for " << endpoint_label(session.client) << " closed (" << reason
              << ")\n";
}

void UdpProxy::schedule_sweep_locked() {
    sweep_timer_.expires_after(options_.udp_sweep_interval);
    sweep_timer_.async_wait([self = shared_from_this(), generation = generation_](auto ec) {
        if (ec) return;
        {
            std::lock_guard lock(self->socket_mutex_);
            if (!self->running_ || generation != self->generation_) return;
        }
        self->sweep_idle();
        std::lock_guard lock(self->socket_mutex_);
        if (self->running_ && generation == self->generation_) {
            self->schedule_sweep_locked();
        }
    });
}

} // namespace craftgate
