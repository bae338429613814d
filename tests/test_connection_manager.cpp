#include "connection_manager.hpp"
#include "loopback_server.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tollgate;
using tollgate::test_support::LoopbackServer;
using tollgate::test_support::ReceivedRequest;

TEST(ConnectionManagerTest, BuildsOneClientLazily) {
    ConnectionManager manager{ClientLimits()};
    EXPECT_FALSE(manager.has_client());
    EXPECT_EQ(manager.clients_created(), 0u);

    auto first = manager.get_client();
    auto second = manager.get_client();
    EXPECT_EQ(first.get(), second.get());
    EXPECT_TRUE(manager.has_client());
    EXPECT_EQ(manager.clients_created(), 1u);
}

TEST(ConnectionManagerTest, ConcurrentCallersShareTheClient) {
    std::atomic<int> built{0};
    ConnectionManager manager(ClientLimits(), [&](const ClientLimits& limits) {
        ++built;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::make_shared<HttpClient>(limits);
    });

    std::vector<std::shared_ptr<HttpClient>> clients(8);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] { clients[i] = manager.get_client(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(built.load(), 1);
    for (const auto& c : clients) {
        EXPECT_EQ(c.get(), clients[0].get());
    }
}

TEST(ConnectionManagerTest, ClosedClientIsRebuilt) {
    ConnectionManager manager{ClientLimits()};
    auto first = manager.get_client();
    first->close();

    EXPECT_FALSE(manager.has_client());
    auto second = manager.get_client();
    EXPECT_NE(first.get(), second.get());
    EXPECT_FALSE(second->is_closed());
    EXPECT_EQ(manager.clients_created(), 2u);
}

TEST(ConnectionManagerTest, CloseIsIdempotentAndAllowsReuse) {
    ConnectionManager manager{ClientLimits()};
    auto client = manager.get_client();

    manager.close();
    manager.close();
    EXPECT_TRUE(client->is_closed());
    EXPECT_FALSE(manager.has_client());

    auto fresh = manager.get_client();
    EXPECT_FALSE(fresh->is_closed());
}

TEST(ConnectionManagerTest, ReportsPoolStatsOfTheClient) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "{}");
    });
    ConnectionManager manager{ClientLimits()};
    EXPECT_EQ(manager.pool_stats().created, 0u);

    Request req;
    req.url = server.url("/");
    manager.get_client()->request(req);
    manager.get_client()->request(req);

    PoolStats stats = manager.pool_stats();
    EXPECT_EQ(stats.created, 1u);
    EXPECT_EQ(stats.reused, 1u);
}
