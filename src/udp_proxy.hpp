#pragma once

#include "proxy_options.hpp"
#include "route.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio.hpp>

namespace craftgate {

// UDP forwarder with a single backend. Each client address gets its own backend
// socket so replies can be routed back; sessions idle for longer than the idle
// timeout are swept periodically. The backend address is resolved when the route
// is set, never on the datagram path.
class UdpProxy : public std::enable_shared_from_this<UdpProxy> {
public:
    using udp = boost::asio::ip::udp;

    static std::shared_ptr<UdpProxy> create(boost::asio::io_context& io, uint16_t port, ProxyOptions options);

    UdpProxy(boost::asio::io_context& io, uint16_t port, ProxyOptions options);

    void start();
    void stop();
    bool is_running() const;
    uint16_t port() const;

    void add_route(const std::string& owner_id, std::string_view key, const std::string& backend_host, uint16_t backend_port);
    void remove_route(std::string_view key);
    void update_route(std::string_view key, const std::string& backend_host, uint16_t backend_port);
    void set_route_active(std::string_view key, bool active);
    RouteMap get_routes() const;

    std::size_t session_count() const;
    // Identity of the session currently bound to `client`, if any.
    std::optional<uint64_t> session_id(const udp::endpoint& client) const;
    // Closes sessions idle for longer than the idle timeout; returns how many.
    std::size_t sweep_idle();

private:
    using Clock = std::chrono::steady_clock;

    struct Session {
        Session(boost::asio::io_context& io, uint64_t id, udp::endpoint client, udp::endpoint backend);

        void touch();

        uint64_t id;
        udp::endpoint client;
        udp::endpoint backend;
        udp::endpoint reply_from;
        udp::socket socket;
        std::atomic<Clock::rep> last_active;
        std::array<char, 65536> buffer{};
        bool closed = false;
    };
    using SessionPtr = std::shared_ptr<Session>;

    void do_receive_locked();
    void on_receive(const boost::system::error_code& ec, std::size_t length, uint64_t generation);
    void forward_to_backend(const udp::endpoint& client, const std::string& payload);
    std::optional<udp::endpoint> resolve_backend(const std::string& host, uint16_t port);
    SessionPtr create_session_locked(const udp::endpoint& client, const udp::endpoint& backend);
    void do_relay_locked(const SessionPtr& session);
    void on_relay(const SessionPtr& session, const boost::system::error_code& ec, std::size_t length);
    void close_session_locked(Session& session, std::string_view reason);
    void schedule_sweep_locked();

    boost::asio::io_context& io_;
    uint16_t port_;
    ProxyOptions options_;
    RouteTable routes_;

    // Listening socket, receive buffer and sweep timer.
    mutable std::mutex socket_mutex_;
    udp::socket socket_;
    boost::asio::steady_timer sweep_timer_;
    udp::endpoint sender_;
    std::array<char, 65536> buffer_{};
    bool running_ = false;
    uint64_t generation_ = 0;

    // Session table, resolved backend and every operation on a session socket.
    // accepting_ mirrors running_ so a datagram racing stop() opens no session.
    mutable std::mutex sessions_mutex_;
    std::map<udp::endpoint, SessionPtr> sessions_;
    std::optional<udp::endpoint> backend_;
    bool accepting_ = false;
    uint64_t next_session_id_ = 1;
};

} // namespace craftgate
