#pragma once

#include <map>
#include <mutex>
#include <string>

#include <boost/property_tree/ptree.hpp>

namespace craftgate {

// Maps a container id to the IP address the proxy should dial.
class ContainerResolver {
public:
    virtual ~ContainerResolver() = default;
    // Throws ResolveError when the container has no usable address.
    virtual std::string resolve(const std::string& container_id, const std::string& network) = 0;
};

// Fixed table, typically from the "containers" config block.
class StaticResolver : public ContainerResolver {
public:
    StaticResolver() = default;
    explicit StaticResolver(std::map<std::string, std::string> addresses);

    void set(const std::string& container_id, const std::string& address);
    void erase(const std::string& container_id);
    std::string resolve(const std::string& container_id, const std::string& network) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string> addresses_;
};

// Asks the Docker Engine API (GET /containers/{id}/json) over its unix socket.
class DockerResolver : public ContainerResolver {
public:
    explicit DockerResolver(std::string socket_path);

    std::string resolve(const std::string& container_id, const std::string& network) override;

private:
    std::string socket_path_;
};

// Address on `network` from a container inspect document, else the first
// network that has one.
std::string pick_container_ip(const boost::property_tree::ptree& inspect, const std::string& network);

} // namespace craftgate
