#include "config.hpp"
#include "container_resolver.hpp"
#include "manager.hpp"
#include "metrics.hpp"
#include "store.hpp"

#include <utility>
#include <boost/asio.hpp>

#include <algorithm>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace craftgate;

namespace {

std::shared_ptr<ContainerResolver> make_resolver(const AppConfig& config) {
    if (!config.containers.empty()) {
        std::cout << "[resolver] Using " << config.containers.size() << " static container address(es)\n";
        return std::make_shared<StaticResolver>(config.containers);
    }
    if (config.docker.enable) {
        std::cout << "[resolver] Resolving containers through " << config.docker.socket << "\n";
        return std::make_shared<DockerResolver>(config.docker.socket);
    }
    std::cout << "[resolver] No container source configured, routes will not resolve\n";
    return std::make_shared<StaticResolver>();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        std::string state_path;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
            } else if ((arg == "-s" || arg == "--state") && i + 1 < argc) {
                state_path = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [-c|--config path] [-s|--state path]\n";
                return 0;
            }
        }

        const auto config = load_config(config_path, std::cerr);
        if (state_path.empty()) state_path = config.state_file;

        auto store = std::make_shared<MemoryStore>();
        load_state(state_path, *store, std::cerr);

        boost::asio::io_context io;
        auto metrics = make_metrics();
        ProxyManager manager(io, store, make_resolver(config), config.proxy, make_proxy_options(config, metrics));
        manager.start();

        std::unique_ptr<MetricsServer> metrics_server;
        if (config.metrics.enable && config.metrics.port != 0) {
            metrics_server = std::make_unique<MetricsServer>(io, metrics, config.proxy.listen_address, config.metrics.port);
            metrics_server->start();
        }

        // refresh timer and signal handling share one strand
        auto control = boost::asio::make_strand(io);
        boost::asio::steady_timer refresh_timer(control);
        const auto refresh_interval = std::chrono::seconds(config.proxy.refresh_interval_s);
        std::function<void()> schedule_refresh = [&]() {
            refresh_timer.expires_after(refresh_interval);
            refresh_timer.async_wait([&](const boost::system::error_code& ec) {
                if (ec) return;
                try {
                    manager.refresh_routes();
                } catch (const std::exception& ex) {
                    std::cerr << "[manager] Route refresh failed: " << ex.what() << "\n";
                }
                schedule_refresh();
            });
        };
        if (config.proxy.enabled && config.proxy.refresh_interval_s > 0) {
            schedule_refresh();
        }

        boost::asio::signal_set signals(control, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            std::cout << "[main] Caught signal " << signal_number << ", shutting down\n";
            refresh_timer.cancel();
            if (metrics_server) metrics_server->stop();
            manager.stop();
            io.stop();
        });

        const auto workers = config.threads != 0 ? config.threads : std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (unsigned int i = 0; i < workers; ++i) {
            threads.emplace_back([&io]() { io.run(); });
        }

        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
