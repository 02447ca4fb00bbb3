#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <utility>
#include <boost/asio.hpp>

namespace craftgate {

// One bound TCP acceptor with a running/stopped state machine. Accepted sockets
// are handed to the connection callback; closing the acceptor through stop() is
// told apart from real accept errors, which are logged and retried.
class Server : public std::enable_shared_from_this<Server> {
public:
    using tcp = boost::asio::ip::tcp;
    using ConnectionHandler = std::function<void(tcp::socket)>;

    Server(boost::asio::io_context& io,
           std::string address,
           uint16_t port,
           std::string tag,
           ConnectionHandler on_connection);

    // Binds and starts accepting. Throws LifecycleError when already running and
    // boost::system::system_error when the endpoint cannot be bound.
    void start();
    // Closes the acceptor. Idempotent; in-flight connections are left alone.
    void stop();

    bool is_running() const;
    // Bound port once started (useful when constructed with port 0).
    uint16_t port() const;

private:
    void do_accept_locked();

    boost::asio::io_context& io_;
    std::string address_;
    uint16_t port_;
    std::string tag_;
    ConnectionHandler on_connection_;

    mutable std::mutex mutex_;
    tcp::acceptor acceptor_;
    bool running_ = false;
    uint64_t generation_ = 0;
};

} // namespace craftgate
