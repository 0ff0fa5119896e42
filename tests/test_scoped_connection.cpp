#include <gtest/gtest.h>
#include <memory>
#include <utility>

#include "relay/signal.hpp"
#include "test_support.hpp"

using namespace relay;

// --- Test Suite ---
class ScopedConnectionTest : public ::testing::Test {
protected:
    relay::signal<int> tick_;
    int                count_ = 0;
};

// 1. Going out of scope disconnects
TEST_F(ScopedConnectionTest, DisconnectsOnDestruction) {
    {
        auto guard = tick_.connect_scoped([this](int) { ++count_; });
        EXPECT_TRUE(guard.is_active());
        tick_.emit(1);
        EXPECT_EQ(count_, 1);
    }
    tick_.emit(1);
    EXPECT_EQ(count_, 1);
    EXPECT_EQ(tick_.connection_count(), 0u);
}

// 2. dispose disconnects exactly once
TEST_F(ScopedConnectionTest, DisposeTwice) {
    auto guard = tick_.connect_scoped([this](int) { ++count_; });
    const auto id = guard.id();

    EXPECT_TRUE(guard.dispose());
    EXPECT_FALSE(guard.dispose());
    EXPECT_FALSE(guard.is_active());
    EXPECT_FALSE(tick_.disconnect(id));

    tick_.emit(1);
    EXPECT_EQ(count_, 0);
}

// 3. Manual disconnect first leaves nothing for the guard to do
TEST_F(ScopedConnectionTest, DisposeAfterManualDisconnect) {
    auto guard = tick_.connect_scoped([this](int) { ++count_; });
    EXPECT_TRUE(tick_.disconnect(guard.id()));
    EXPECT_FALSE(guard.dispose());
}

// 4. Outliving the signal is safe
TEST_F(ScopedConnectionTest, SignalDestroyedFirst) {
    scoped_connection guard;
    {
        relay::signal<int> local;
        guard = local.connect_scoped([this](int) { ++count_; });
        EXPECT_TRUE(guard.is_active());
    }
    EXPECT_FALSE(guard.is_active());
    EXPECT_FALSE(guard.dispose());
}

// 5. Moving transfers ownership of the disconnect
TEST_F(ScopedConnectionTest, MoveTransfersOwnership) {
    auto first = tick_.connect_scoped([this](int) { ++count_; });
    scoped_connection second(std::move(first));

    EXPECT_FALSE(first.is_active());
    EXPECT_FALSE(first.dispose());
    EXPECT_TRUE(second.is_active());

    tick_.emit(1);
    EXPECT_EQ(count_, 1);

    EXPECT_TRUE(second.dispose());
    tick_.emit(1);
    EXPECT_EQ(count_, 1);
}

// 6. Move assignment disposes the previous connection
TEST_F(ScopedConnectionTest, MoveAssignDisposesPrevious) {
    int other = 0;
    auto guard = tick_.connect_scoped([this](int) { ++count_; });
    guard = tick_.connect_scoped([&](int) { ++other; });

    tick_.emit(1);
    EXPECT_EQ(count_, 0);
    EXPECT_EQ(other, 1);
    EXPECT_EQ(tick_.connection_count(), 1u);
}

// 7. release keeps the connection alive
TEST_F(ScopedConnectionTest, ReleaseKeepsConnection) {
    connection_id id;
    {
        auto guard = tick_.connect_scoped([this](int) { ++count_; });
        id = guard.release();
        EXPECT_FALSE(guard.is_active());
    }
    tick_.emit(1);
    EXPECT_EQ(count_, 1);
    EXPECT_TRUE(tick_.disconnect(id));
}

// 8. Guards with an explicit connection type and affinity
TEST_F(ScopedConnectionTest, ScopedQueuedConnection) {
    auto guard = tick_.connect_scoped([this](int) { ++count_; }, connection_type::queued, std::nullopt);
    tick_.emit(1);
    EXPECT_EQ(count_, 0);

    // Without affinity queued deliveries go to the owner thread, which is this one.
    EXPECT_EQ(process_deferred(), 1u);
    EXPECT_EQ(count_, 1);

    tick_.emit(1);
    guard.dispose();
    process_deferred();
    EXPECT_EQ(count_, 1);
}
