#include "container_resolver.hpp"

#include "errors.hpp"

#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace craftgate {

namespace beast = boost::beast;
namespace http = beast::http;
namespace pt = boost::property_tree;

StaticResolver::StaticResolver(std::map<std::string, std::string> addresses)
    : addresses_(std::move(addresses)) {}

void StaticResolver::set(const std::string& container_id, const std::string& address) {
    std::lock_guard lock(mutex_);
    addresses_[container_id] = address;
}

void StaticResolver::erase(const std::string& container_id) {
    std::lock_guard lock(mutex_);
    addresses_.erase(container_id);
}

std::string StaticResolver::resolve(const std::string& container_id, const std::string&) {
    std::lock_guard lock(mutex_);
    auto it = addresses_.find(container_id);
    if (it == addresses_.end() || it->second.empty()) {
        throw ResolveError("no address configured for container " + container_id);
    }
    return it->second;
}

DockerResolver::DockerResolver(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

std::string DockerResolver::resolve(const std::string& container_id, const std::string& network) {
    if (container_id.empty() || container_id.find_first_of("/?#") != std::string::npos) {
        throw ResolveError("invalid container id '" + container_id + "'");
    }

    using stream_protocol = boost::asio::local::stream_protocol;
    boost::asio::io_context io;
    stream_protocol::socket socket(io);
    boost::system::error_code ec;
    socket.connect(stream_protocol::endpoint(socket_path_), ec);
    if (ec) {
        throw ResolveError("cannot reach docker at " + socket_path_ + ": " + ec.message());
    }

    http::request<http::empty_body> request{http::verb::get, "/containers/" + container_id + "/json", 11};
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, "craftgate");
    http::write(socket, request, ec);
    if (ec) {
        throw ResolveError("docker request failed: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response, ec);
    boost::system::error_code ignored;
    socket.close(ignored);
    if (ec) {
        throw ResolveError("docker response unreadable: " + ec.message());
    }
    if (response.result() == http::status::not_found) {
        throw ResolveError("container " + container_id + " not found");
    }
    if (response.result() != http::status::ok) {
        throw ResolveError("failed to inspect container " + container_id + ": HTTP " +
                           std::to_string(response.result_int()));
    }

    pt::ptree inspect;
    try {
        std::istringstream body(response.body());
        pt::read_json(body, inspect);
    } catch (const pt::json_parser_error& ex) {
        throw ResolveError("failed to parse inspect result for " + container_id + ": " + ex.what());
    }
    return pick_container_ip(inspect, network);
}

std::string pick_container_ip(const pt::ptree& inspect, const std::string& network) {
    std::string fallback;
    if (auto networks = inspect.get_child_optional("NetworkSettings.Networks")) {
        for (const auto& [name, settings] : *networks) {
            const auto address = settings.get<std::string>("IPAddress", "");
            if (address.empty()) continue;
            if (!network.empty() && name == network) return address;
            if (fallback.empty()) fallback = address;
        }
    }
    if (fallback.empty()) {
        throw ResolveError("no IP address found for container");
    }
    return fallback;
}

} // namespace craftgate
