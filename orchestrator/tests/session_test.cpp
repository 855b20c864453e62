#include "session.hpp"
#include "errors.hpp"
#include "test_fakes.hpp"
#include <future>
#include <thread>
#include <gtest/gtest.h>

TEST(SessionLeaseTest, OpensOnFirstUseAndClosesOnDestruction) {
    FakeConnectorFactory factory;
    SessionRegistry registry;
    auto device = factory.connector_for("r1");
    device->set_value("/system/hostname", "r1");

    {
        SessionLease lease(registry, factory, make_device("r1"));
        EXPECT_FALSE(lease.is_open());
        EXPECT_EQ(factory.created.load(), 0);

        auto result = lease.fetch(Selector{"/system/hostname", ""});
        EXPECT_TRUE(result.found);
        lease.fetch(Selector{"/system/hostname", ""});

        EXPECT_TRUE(lease.is_open());
        EXPECT_EQ(lease.protocol(), "fake");
        EXPECT_EQ(registry.open_count(), 1u);
    }

    EXPECT_EQ(device->opens, 1);
    EXPECT_EQ(device->closes, 1);
    EXPECT_EQ(factory.created.load(), 1);
    EXPECT_EQ(registry.open_count(), 0u);
}

TEST(SessionLeaseTest, UnusedLeaseNeverTouchesDevice) {
    FakeConnectorFactory factory;
    SessionRegistry registry;
    {
        SessionLease lease(registry, factory, make_device("r1"));
    }
    EXPECT_EQ(factory.created.load(), 0);
    EXPECT_EQ(registry.peak_count(), 0u);
}

TEST(SessionLeaseTest, DeadlineIsForwardedToConnector) {
    FakeConnectorFactory factory;
    SessionRegistry registry;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    SessionLease lease(registry, factory, make_device("r1"));
    lease.set_deadline(deadline);
    lease.open_session();

    auto device = factory.connector_for("r1");
    ASSERT_TRUE(device->last_deadline.has_value());
    EXPECT_EQ(*device->last_deadline, deadline);
}

TEST(SessionLeaseTest, ConcurrentCallsKeepTheirOwnDeadlines) {
    FakeConnectorFactory factory;
    SessionRegistry registry;
    auto device = factory.connector_for("r1");
    device->fetch_delay = std::chrono::milliseconds(20);
    auto now = std::chrono::steady_clock::now();
    auto near = now + std::chrono::seconds(1);
    auto far = now + std::chrono::seconds(60);

    SessionLease lease(registry, factory, make_device("r1"));
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&, i] {
            lease.fetch_within(Selector{"/near/" + std::to_string(i), ""}, near);
        });
        workers.emplace_back([&, i] {
            lease.fetch_within(Selector{"/far/" + std::to_string(i), ""}, far);
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(device->fetches, 8);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(device->fetch_deadlines.at("/near/" + std::to_string(i)), Deadline(near));
        EXPECT_EQ(device->fetch_deadlines.at("/far/" + std::to_string(i)), Deadline(far));
    }
}

TEST(SessionLeaseTest, OpenFailureReleasesSlot) {
    FakeConnectorFactory factory;
    SessionRegistry registry;
    factory.connector_for("r1")->open_error = true;

    SessionLease lease(registry, factory, make_device("r1"));
    EXPECT_THROW(lease.fetch(Selector{"/a", ""}), PermanentConnectorError);
    EXPECT_FALSE(lease.is_open());
    EXPECT_EQ(registry.open_count(), 0u);

    SessionLease other(registry, factory, make_device("r1"));
    factory.connector_for("r1")->open_error = false;
    EXPECT_NO_THROW(other.open_session());
    EXPECT_EQ(registry.open_count(), 1u);
}

TEST(SessionRegistryTest, OneSessionPerDevice) {
    SessionRegistry registry;
    ASSERT_TRUE(registry.acquire("r1", std::nullopt));
    EXPECT_TRUE(registry.acquire("r2", std::nullopt));

    auto soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
    EXPECT_FALSE(registry.acquire("r1", soon));
    EXPECT_EQ(registry.open_count(), 2u);

    auto waiter = std::async(std::launch::async, [&] {
        return registry.acquire("r1", std::chrono::steady_clock::now() + std::chrono::seconds(5));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    registry.release("r1");
    EXPECT_TRUE(waiter.get());
    EXPECT_EQ(registry.peak_count(), 2u);
}

TEST(SessionRegistryTest, SecondLeaseWaitsForFirst) {
    FakeConnectorFactory factory;
    SessionRegistry registry;

    auto first = std::make_unique<SessionLease>(registry, factory, make_device("r1"));
    first->open_session();

    SessionLease second(registry, factory, make_device("r1"));
    second.set_deadline(std::chrono::steady_clock::now() + std::chrono::milliseconds(50));
    EXPECT_THROW(second.open_session(), TransientConnectorError);

    first.reset();
    second.set_deadline(std::chrono::steady_clock::now() + std::chrono::seconds(1));
    EXPECT_NO_THROW(second.open_session());
    EXPECT_EQ(registry.peak_count(), 1u);
}
