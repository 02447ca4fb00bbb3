#include "server.hpp"

#include "errors.hpp"

#include <utility>
#include <boost/asio/ip/address.hpp>

#include <iostream>

namespace craftgate {

Server::Server(boost::asio::io_context& io,
               std::string address,
               uint16_t port,
               std::string tag,
               ConnectionHandler on_connection)
    : io_(io),
      address_(std::move(address)),
      port_(port),
      tag_(std::move(tag)),
      on_connection_(std::move(on_connection)),
      acceptor_(io) {}

void Server::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        throw LifecycleError(tag_ + " proxy already running on port " + std::to_string(port_));
    }

    const tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
    tcp::acceptor acceptor(io_);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen();

    acceptor_ = std::move(acceptor);
    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    ++generation_;
    std::cout << "[" << tag_ << "] Listening on " << address_ << ":" << port_ << "\n";
    do_accept_locked();
}

void Server::stop() {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        std::cerr << "[" << tag_ << "] Failed to close listener on port " << port_ << ": " << ec.message() << "\n";
    }
    std::cout << "[" << tag_ << "] Stopped listening on port " << port_ << "\n";
}

bool Server::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

uint16_t Server::port() const {
    std::lock_guard lock(mutex_);
    return port_;
}

void Server::do_accept_locked() {
    acceptor_.async_accept([self = shared_from_this(), generation = generation_](auto ec, auto socket) {
        std::unique_lock lock(self->mutex_);
        if (!self->running_ || generation != self->generation_) {
            // listener closed intentionally
            boost::system::error_code ignored;
            socket.close(ignored);
            return;
        }
        self->do_accept_locked();
        lock.unlock();

        if (ec) {
            std::cerr << "[" << self->tag_ << "] Accept error: " << ec.message() << "\n";
            return;
        }
        self->on_connection_(std::move(socket));
    });
}

} // namespace craftgate
