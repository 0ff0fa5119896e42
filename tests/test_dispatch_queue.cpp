#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "relay/dispatch_queue.hpp"
#include "relay/signal.hpp"
#include "relay/thread_role.hpp"
#include "test_support.hpp"

using namespace relay;
using namespace relay_test;

// --- Dispatch Queue ---
class DispatchQueueTest : public ::testing::Test {
protected:
    dispatch_queue queue_;
    std::vector<int> order_;
};

// 1. FIFO drain
TEST_F(DispatchQueueTest, DrainRunsInPostOrder) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(queue_.post(make_invocation([this, i] { order_.push_back(i); })));
    }
    EXPECT_EQ(queue_.pending(), 5u);

    EXPECT_EQ(queue_.drain(), 5u);
    EXPECT_EQ(order_, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(queue_.pending(), 0u);
}

// 2. Items posted while draining wait for the next drain
TEST_F(DispatchQueueTest, ReentrantPostWaitsForNextDrain) {
    queue_.post(make_invocation([this] {
        order_.push_back(1);
        queue_.post(make_invocation([this] { order_.push_back(2); }));
    }));

    EXPECT_EQ(queue_.drain(), 1u);
    EXPECT_EQ(order_, (std::vector<int>{1}));
    EXPECT_EQ(queue_.drain(), 1u);
    EXPECT_EQ(order_, (std::vector<int>{1, 2}));
}

// 3. close rejects new items but keeps queued ones
TEST_F(DispatchQueueTest, CloseRejectsNewItems) {
    queue_.post(make_invocation([this] { order_.push_back(1); }));
    queue_.close();

    EXPECT_TRUE(queue_.is_closed());
    EXPECT_FALSE(queue_.post(make_invocation([this] { order_.push_back(2); })));
    EXPECT_EQ(queue_.drain(), 1u);
    EXPECT_EQ(order_, (std::vector<int>{1}));
}

// 4. shutdown discards and releases blocked waiters
TEST_F(DispatchQueueTest, ShutdownAbandonsCompletions) {
    auto completion = std::make_shared<detail::completion_state>();
    auto item = make_invocation([this] { order_.push_back(1); });
    item->completion_ = completion;
    queue_.post(std::move(item));

    EXPECT_EQ(queue_.shutdown(), 1u);
    EXPECT_EQ(completion->Wait(), detail::completion_state::status::abandoned);
    EXPECT_TRUE(order_.empty());
}

// 5. Executed items complete their cell, even when they throw
TEST_F(DispatchQueueTest, ThrowingItemStillCompletes) {
    scoped_capture capture;
    auto completion = std::make_shared<detail::completion_state>();
    auto item = make_invocation([] { throw std::runtime_error("item failed"); });
    item->completion_ = completion;
    queue_.post(std::move(item));

    EXPECT_EQ(queue_.drain(), 1u);
    EXPECT_EQ(completion->Wait(), detail::completion_state::status::done);
    EXPECT_TRUE(capture.sink->contains("item failed"));
}

// 6. wait_and_drain times out on an empty queue
TEST_F(DispatchQueueTest, WaitAndDrainTimesOut) {
    EXPECT_EQ(queue_.wait_and_drain(20ms), 0u);
}

TEST_F(DispatchQueueTest, WaitAndDrainWakesOnPost) {
    std::thread producer([this] {
        std::this_thread::sleep_for(10ms);
        queue_.post(make_invocation([this] { order_.push_back(7); }));
    });
    std::size_t ran = 0;
    for (int i = 0; i < 100 && ran == 0; ++i) {
        ran = queue_.wait_and_drain(50ms);
    }
    producer.join();

    EXPECT_EQ(ran, 1u);
    EXPECT_EQ(order_, (std::vector<int>{7}));
}

// 7. run returns once closed and empty
TEST_F(DispatchQueueTest, RunDrainsUntilClosed) {
    std::atomic<int> count{0};
    std::thread runner([this] { queue_.run(); });
    for (int i = 0; i < 10; ++i) {
        queue_.post(make_invocation([&] { ++count; }));
    }
    queue_.close();
    runner.join();

    EXPECT_EQ(count.load(), 10);
}

// --- Thread Roles ---
class ThreadRoleTest : public ::testing::Test {};

// 8. The test main thread is the owner thread
TEST_F(ThreadRoleTest, MainThreadIsOwner) {
    ASSERT_TRUE(owner_thread_id().has_value());
    EXPECT_EQ(*owner_thread_id(), std::this_thread::get_id());
    EXPECT_TRUE(is_owner_thread());
    EXPECT_TRUE(is_main_thread());
    EXPECT_NO_THROW(check_owner_thread("test"));
    EXPECT_EQ(main_thread_id(), owner_thread_id());
    EXPECT_NE(dispatch_queue::current(), nullptr);

    // Designating again from the owner is a no-op.
    EXPECT_NO_THROW(set_owner_thread());
}

// 9. Other threads are rejected
TEST_F(ThreadRoleTest, OtherThreadIsNotOwner) {
    bool owner = true;
    bool check_threw = false;
    bool designate_threw = false;

    std::thread other([&] {
        owner = is_owner_thread();
        try {
            check_owner_thread("a widget update");
        }
        catch (const thread_role_error&) {
            check_threw = true;
        }
        try {
            set_owner_thread();
        }
        catch (const thread_role_error&) {
            designate_threw = true;
        }
    });
    other.join();

    EXPECT_FALSE(owner);
    EXPECT_TRUE(check_threw);
    EXPECT_TRUE(designate_threw);
    EXPECT_EQ(*owner_thread_id(), std::this_thread::get_id());
}

// 10. Affinity records and checks a thread
TEST_F(ThreadRoleTest, ThreadAffinityChecks) {
    auto here = thread_affinity::current();
    EXPECT_TRUE(here.is_same_thread());
    EXPECT_TRUE(here.is_owner_thread_affinity());
    EXPECT_EQ(here, thread_affinity::owner());
    EXPECT_NO_THROW(here.check_same_thread("object"));

    bool same = true;
    bool threw = false;
    thread_affinity there;
    std::thread other([&] {
        there = thread_affinity::current();
        same  = here.is_same_thread();
        try {
            here.check_same_thread("object");
        }
        catch (const thread_role_error&) {
            threw = true;
        }
    });
    other.join();

    EXPECT_FALSE(same);
    EXPECT_TRUE(threw);
    EXPECT_FALSE(there == here);
    EXPECT_FALSE(there.is_owner_thread_affinity());
}

// 11. process_deferred / wait_deferred drain the owner queue
TEST_F(ThreadRoleTest, DeferredDeliveryToOwner) {
    std::atomic<int> count{0};
    std::thread other([&] {
        detail::deliver(detail::destination::bind(std::nullopt), make_invocation([&] { ++count; }));
    });
    other.join();

    EXPECT_EQ(count.load(), 0);
    EXPECT_EQ(process_deferred(), 1u);
    EXPECT_EQ(count.load(), 1);
    EXPECT_EQ(wait_deferred(10ms), 0u);
}

// 12. Deliveries to a retired thread are rejected
TEST_F(ThreadRoleTest, RetiredQueueRejects) {
    queue_thread target;
    const auto bound = detail::destination::bind(target.id());
    target.stop();

    int count = 0;
    EXPECT_EQ(detail::deliver(bound, make_invocation([&] { ++count; })), detail::delivery::rejected);
    EXPECT_EQ(count, 0);
    EXPECT_EQ(dispatch_queue::find(target.id()), nullptr);
}

// 13. A thread that detached its queue leaves nothing behind for the next
// thread with the same id
TEST_F(ThreadRoleTest, RetiredIdBehavesLikeFreshThread) {
    std::thread::id retired;
    std::thread first([&] {
        retired = std::this_thread::get_id();
        dispatch_queue::attach_current();
        dispatch_queue::detach_current();
    });
    first.join();
    EXPECT_EQ(dispatch_queue::find(retired), nullptr);

    scoped_capture capture;
    relay::signal<int> tick;
    int delivered = 0;
    std::thread second([&] {
        tick.connect_with_type([&](int) { ++delivered; }, connection_type::queued, std::this_thread::get_id());
    });
    second.join();

    tick.emit(1);
    EXPECT_EQ(delivered, 1);
    EXPECT_FALSE(capture.sink->contains("is closed"));
    EXPECT_FALSE(capture.sink->contains("is gone"));
}

// 14. Exiting a thread unregisters its queue without detach_current
TEST_F(ThreadRoleTest, ThreadExitUnregistersQueue) {
    std::thread::id exited;
    std::shared_ptr<dispatch_queue> queue;
    std::thread worker([&] {
        exited = std::this_thread::get_id();
        queue  = dispatch_queue::attach_current();
    });
    worker.join();

    EXPECT_EQ(dispatch_queue::find(exited), nullptr);
    ASSERT_NE(queue, nullptr);
    EXPECT_TRUE(queue->is_closed());
}

// 15. A live queue thread runs what is delivered to it
TEST_F(ThreadRoleTest, DeliverToQueueThread) {
    queue_thread target;
    std::atomic<bool> ran{false};
    std::thread::id seen;
    auto completion = std::make_shared<detail::completion_state>();
    auto item = make_invocation([&] {
        seen = std::this_thread::get_id();
        ran  = true;
    });
    item->completion_ = completion;

    EXPECT_EQ(detail::deliver(detail::destination::bind(target.id()), std::move(item)), detail::delivery::queued);
    EXPECT_EQ(completion->Wait(), detail::completion_state::status::done);
    EXPECT_TRUE(ran.load());
    EXPECT_EQ(seen, target.id());
}
