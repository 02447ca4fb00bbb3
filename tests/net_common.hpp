#pragma once

#include "test_common.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <utility>
#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>

namespace net_shared {

using boost::asio::ip::tcp;
using boost::asio::ip::udp;
using namespace std::chrono_literals;

inline const auto kLoopback = boost::asio::ip::make_address("127.0.0.1");

inline bool is_permission_error(const boost::system::system_error& ex) {
    return ex.code().value() == EPERM;
}

// Runs a socket test, reporting a skip instead of a failure when the sandbox
// forbids binding sockets.
inline void run_or_skip(const char* name, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const boost::system::system_error& ex) {
        if (is_permission_error(ex)) {
            std::cerr << "[SKIP] " << name << ": " << ex.code().message() << "\n";
            return;
        }
        throw;
    }
}

// A free loopback TCP port at the time of the call.
inline uint16_t free_tcp_port() {
    boost::asio::io_context io;
    tcp::acceptor scratch(io, tcp::endpoint(kLoopback, 0));
    return scratch.local_endpoint().port();
}

// io_context driven by a single background thread for the lifetime of the object.
struct IoThread {
    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard{io.get_executor()};
    std::thread thread;

    IoThread() : thread([this]() { io.run(); }) {}

    ~IoThread() {
        guard.reset();
        io.stop();
        if (thread.joinable()) thread.join();
    }
};

template <class Predicate>
bool wait_until(Predicate pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

struct ReadResult {
    std::string data;
    boost::system::error_code ec;

    bool closed() const {
        return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset;
    }
    bool timed_out() const {
        return ec == boost::asio::error::timed_out;
    }
};

// Reads from a connected socket until `complete` accepts the data, the peer
// closed or the timeout passed. The socket's io_context must run on one thread.
class TimedReader : public std::enable_shared_from_this<TimedReader> {
public:
    using Predicate = std::function<bool(const std::string&)>;

    TimedReader(tcp::socket& socket, Predicate complete)
        : socket_(socket), timer_(socket.get_executor()), complete_(std::move(complete)) {}

    std::future<ReadResult> start(std::chrono::milliseconds timeout) {
        auto future = promise_.get_future();
        boost::asio::post(socket_.get_executor(), [self = shared_from_this(), timeout]() {
            self->timer_.expires_after(timeout);
            self->timer_.async_wait([self](const boost::system::error_code& ec) {
                if (ec) return;
                self->timed_out_ = true;
                boost::system::error_code ignored;
                self->socket_.cancel(ignored);
            });
            self->do_read();
        });
        return future;
    }

private:
    void do_read() {
        socket_.async_read_some(boost::asio::buffer(buffer_), [self = shared_from_this()](auto ec, auto n) {
            self->result_.data.append(self->buffer_.data(), n);
            if (!ec && !self->complete_(self->result_.data)) {
                self->do_read();
                return;
            }
            self->timer_.cancel();
            self->result_.ec = self->timed_out_ ? boost::system::error_code(boost::asio::error::timed_out) : ec;
            self->promise_.set_value(std::move(self->result_));
        });
    }

    tcp::socket& socket_;
    boost::asio::steady_timer timer_;
    Predicate complete_;
    std::array<char, 4096> buffer_{};
    ReadResult result_;
    bool timed_out_ = false;
    std::promise<ReadResult> promise_;
};

inline ReadResult read_with(tcp::socket& socket, TimedReader::Predicate complete, std::chrono::milliseconds timeout) {
    auto reader = std::make_shared<TimedReader>(socket, std::move(complete));
    auto future = reader->start(timeout);
    if (future.wait_for(timeout + 2s) != std::future_status::ready) {
        throw TestFailure("reader never completed");
    }
    return future.get();
}

inline ReadResult read_for(tcp::socket& socket, std::size_t expected, std::chrono::milliseconds timeout = 2000ms) {
    return read_with(socket, [expected](const std::string& data) { return data.size() >= expected; }, timeout);
}

inline ReadResult read_until_contains(tcp::socket& socket, std::string needle, std::chrono::milliseconds timeout = 2000ms) {
    return read_with(
        socket, [needle = std::move(needle)](const std::string& data) { return data.find(needle) != std::string::npos; },
        timeout);
}

// Reads until the peer closes the connection.
inline ReadResult read_until_closed(tcp::socket& socket, std::chrono::milliseconds timeout = 2000ms) {
    return read_with(socket, [](const std::string&) { return false; }, timeout);
}

inline tcp::socket connect_to(boost::asio::io_context& io, uint16_t port) {
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(kLoopback, port));
    return socket;
}

// Loopback TCP backend that accepts any number of connections and records the
// bytes each one sends.
class TestBackend : public std::enable_shared_from_this<TestBackend> {
public:
    enum class Mode {
        Record, // keep the connection open, send nothing
        Echo,   // write every chunk back
        Http    // answer the first request head with `http_reply`, then close
    };

    TestBackend(boost::asio::io_context& io, Mode mode, std::string http_reply = {})
        : acceptor_(io, tcp::endpoint(kLoopback, 0)),
          mode_(mode),
          http_reply_(std::move(http_reply)) {}

    static std::shared_ptr<TestBackend> start(boost::asio::io_context& io, Mode mode, std::string http_reply = {}) {
        auto backend = std::make_shared<TestBackend>(io, mode, std::move(http_reply));
        boost::asio::post(backend->acceptor_.get_executor(), [backend]() { backend->do_accept(); });
        return backend;
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    void stop() {
        boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            boost::system::error_code ignored;
            self->acceptor_.close(ignored);
            for (auto& socket : self->sockets_) socket->close(ignored);
        });
    }

    std::size_t connections() const { return accepted_.load(); }

    // Bytes received on connection `index`, once at least `n` of them arrived.
    std::string wait_for(std::size_t index, std::size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [&]() { return index < received_.size() && received_[index].size() >= n; });
        return index < received_.size() ? received_[index] : std::string{};
    }

    std::string wait_for_text(std::size_t index, const std::string& needle, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [&]() {
            return index < received_.size() && received_[index].find(needle) != std::string::npos;
        });
        return index < received_.size() ? received_[index] : std::string{};
    }

    std::string received(std::size_t index) const {
        std::lock_guard lock(mutex_);
        return index < received_.size() ? received_[index] : std::string{};
    }

private:
    struct Connection {
        std::shared_ptr<tcp::socket> socket;
        std::size_t index;
        std::array<char, 4096> buffer{};
        std::string reply;
    };

    void do_accept() {
        auto socket = std::make_shared<tcp::socket>(acceptor_.get_executor());
        acceptor_.async_accept(*socket, [self = shared_from_this(), socket](const boost::system::error_code& ec) {
            if (ec) return;
            auto conn = std::make_shared<Connection>();
            conn->socket = socket;
            {
                std::lock_guard lock(self->mutex_);
                conn->index = self->received_.size();
                self->received_.emplace_back();
            }
            self->sockets_.push_back(socket);
            self->accepted_.fetch_add(1);
            self->do_read(conn);
            self->do_accept();
        });
    }

    void do_read(const std::shared_ptr<Connection>& conn) {
        conn->socket->async_read_some(boost::asio::buffer(conn->buffer), [self = shared_from_this(), conn](auto ec, auto n) {
            if (ec) return;
            bool answer = false;
            {
                std::lock_guard lock(self->mutex_);
                auto& data = self->received_[conn->index];
                const bool had_head = data.find("\r\n\r\n") != std::string::npos;
                data.append(conn->buffer.data(), n);
                answer = self->mode_ == Mode::Http && !had_head && data.find("\r\n\r\n") != std::string::npos;
            }
            self->cv_.notify_all();

            if (self->mode_ == Mode::Echo) {
                conn->reply.assign(conn->buffer.data(), n);
                boost::asio::async_write(*conn->socket, boost::asio::buffer(conn->reply), [self, conn](auto write_ec, auto) {
                    if (!write_ec) self->do_read(conn);
                });
                return;
            }
            if (answer) {
                conn->reply = self->http_reply_;
                boost::asio::async_write(*conn->socket, boost::asio::buffer(conn->reply), [conn](auto, auto) {
                    boost::system::error_code ignored;
                    conn->socket->shutdown(tcp::socket::shutdown_both, ignored);
                    conn->socket->close(ignored);
                });
                return;
            }
            self->do_read(conn);
        });
    }

    tcp::acceptor acceptor_;
    Mode mode_;
    std::string http_reply_;
    std::vector<std::shared_ptr<tcp::socket>> sockets_;
    std::atomic<std::size_t> accepted_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> received_;
};

} // namespace net_shared
