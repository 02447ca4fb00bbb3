#pragma once

#include "metrics.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <utility>
#include <boost/asio.hpp>

namespace craftgate {

inline constexpr std::chrono::milliseconds kDefaultDialTimeout{5000};

// "ip:port" of the peer, or "unknown" when the socket is no longer connected.
std::string remote_label(const boost::asio::ip::tcp::socket& socket);

using ConnectHandler = std::function<void(const boost::system::error_code&, boost::asio::ip::tcp::socket)>;

// Resolves host:port and connects to the first reachable endpoint. When nothing
// connects within `timeout` the handler receives boost::asio::error::timed_out.
// The handler is invoked exactly once.
void connect_backend(const boost::asio::any_io_executor& executor,
                     std::string host,
                     uint16_t port,
                     std::chrono::milliseconds timeout,
                     ConnectHandler handler);

// Unbuffered bidirectional relay between an accepted client and its backend.
// Each direction is a read -> write chain; the first error or EOF on either side
// closes both sockets.
class Tunnel : public std::enable_shared_from_this<Tunnel> {
public:
    Tunnel(boost::asio::ip::tcp::socket client_socket,
           boost::asio::ip::tcp::socket backend_socket,
           MetricsPtr metrics,
           std::string label);

    // Sends `initial_upstream` to the backend before relaying.
    void start(std::string initial_upstream = {});

private:
    using tcp = boost::asio::ip::tcp;
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    void do_read_from_client();
    void do_write_to_backend(std::size_t length);
    void do_read_from_backend();
    void do_write_to_client(std::size_t length);
    void close_sockets(const boost::system::error_code& ec);

    std::shared_ptr<Strand> strand_;
    tcp::socket client_socket_;
    tcp::socket backend_socket_;
    MetricsPtr metrics_;
    std::string label_;
    std::string initial_upstream_;

    std::array<char, 16384> client_buffer_{};
    std::array<char, 16384> backend_buffer_{};
    std::atomic<bool> closed_{false};
};

} // namespace craftgate
