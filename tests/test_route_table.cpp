#include "route.hpp"
#include "test_common.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace craftgate;

int main() {
    auto test_normalize_hostname = [] {
        EXPECT_EQ(normalize_hostname("Play.Example.COM"), "play.example.com");
        EXPECT_EQ(normalize_hostname("play.example.com:25565"), "play.example.com");
        EXPECT_EQ(normalize_hostname("[::1]:8080"), "[::1]");
        EXPECT_EQ(normalize_hostname("[FE80::1]"), "[fe80::1]");
        EXPECT_EQ(normalize_hostname(""), "");
    };

    auto test_add_overwrites = [] {
        RouteTable table;
        const auto first = table.add("s1", "Survival.Example.com", "10.0.0.2", 25565);
        EXPECT_EQ(first.routing_key, "survival.example.com");
        EXPECT_TRUE(first.active);

        table.add("s2", "survival.example.com", "10.0.0.3", 25566);
        EXPECT_EQ(table.size(), 1u);
        const auto route = table.lookup("SURVIVAL.example.com:25565");
        EXPECT_TRUE(route.has_value());
        EXPECT_EQ(route->owner_id, "s2");
        EXPECT_EQ(route->backend_host, "10.0.0.3");
        EXPECT_EQ(route->backend_port, 25566);
    };

    auto test_inactive_not_routed = [] {
        RouteTable table;
        table.add("s1", "a.example.com", "10.0.0.2", 25565);
        EXPECT_TRUE(table.set_active("a.example.com", false));
        EXPECT_FALSE(table.lookup("a.example.com").has_value());
        EXPECT_EQ(table.size(), 1u);
        EXPECT_FALSE(table.snapshot().at("a.example.com").active);

        EXPECT_TRUE(table.set_active("a.example.com", true));
        EXPECT_TRUE(table.lookup("a.example.com").has_value());
        EXPECT_FALSE(table.set_active("missing.example.com", true));
    };

    auto test_update_and_remove = [] {
        RouteTable table;
        EXPECT_FALSE(table.update("ghost.example.com", "10.0.0.9", 1));
        EXPECT_EQ(table.size(), 0u);

        table.add("s1", "b.example.com", "10.0.0.2", 25565);
        table.set_active("b.example.com", false);
        EXPECT_TRUE(table.update("B.example.com", "10.0.0.4", 25570));
        const auto snap = table.snapshot();
        EXPECT_EQ(snap.at("b.example.com").backend_host, "10.0.0.4");
        EXPECT_EQ(snap.at("b.example.com").backend_port, 25570);
        // update keeps the active flag and owner
        EXPECT_FALSE(snap.at("b.example.com").active);
        EXPECT_EQ(snap.at("b.example.com").owner_id, "s1");

        EXPECT_TRUE(table.remove("b.example.com"));
        EXPECT_FALSE(table.remove("b.example.com"));
        EXPECT_EQ(table.size(), 0u);
    };

    auto test_snapshot_is_a_copy = [] {
        RouteTable table;
        table.add("s1", "c.example.com", "10.0.0.2", 25565);
        auto snap = table.snapshot();
        snap["c.example.com"].backend_host = "mutated";
        snap.erase("c.example.com");
        EXPECT_EQ(table.lookup("c.example.com")->backend_host, "10.0.0.2");

        table.clear();
        EXPECT_EQ(table.size(), 0u);
    };

    auto test_concurrent_readers_and_writers = [] {
        RouteTable table;
        table.add("stable", "stable.example.com", "10.0.0.1", 25565);

        std::atomic<bool> done{false};
        std::atomic<int> misses{0};
        std::vector<std::thread> readers;
        for (int r = 0; r < 4; ++r) {
            readers.emplace_back([&]() {
                while (!done.load()) {
                    auto route = table.lookup("stable.example.com");
                    if (!route || route->backend_host != "10.0.0.1") misses.fetch_add(1);
                    table.lookup("churn-3.example.com");
                }
            });
        }

        std::vector<std::thread> writers;
        for (int w = 0; w < 2; ++w) {
            writers.emplace_back([&, w]() {
                for (int i = 0; i < 2000; ++i) {
                    const auto key = "churn-" + std::to_string((i + w) % 8) + ".example.com";
                    table.add("w" + std::to_string(w), key, "10.1.0." + std::to_string(w), 25565);
                    table.update(key, "10.2.0." + std::to_string(w), 25566);
                    table.remove(key);
                }
            });
        }
        for (auto& t : writers) t.join();
        done = true;
        for (auto& t : readers) t.join();

        EXPECT_EQ(misses.load(), 0);
        EXPECT_EQ(table.size(), 1u);
    };

    return run_tests({
        {"normalize_hostname", test_normalize_hostname},
        {"add_overwrites", test_add_overwrites},
        {"inactive_not_routed", test_inactive_not_routed},
        {"update_and_remove", test_update_and_remove},
        {"snapshot_is_a_copy", test_snapshot_is_a_copy},
        {"concurrent_readers_and_writers", test_concurrent_readers_and_writers},
    });
}
