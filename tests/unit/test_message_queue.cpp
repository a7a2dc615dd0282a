#include <acpbridge/errors.hpp>
#include <acpbridge/message_queue.hpp>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using acpbridge::MessageQueue;

TEST(MessageQueueTest, ProcessesInArrivalOrder)
{
    std::mutex mutex;
    std::vector<long> order;

    {
        MessageQueue<std::string> queue(
            [&](std::string& item, long request_id)
            {
                // The second item takes longest; it must still finish second
                if (item == "slow")
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(request_id);
            });

        auto first = queue.enqueue("fast");
        auto second = queue.enqueue("slow");
        auto third = queue.enqueue("fast");
        first.get();
        second.get();
        third.get();
    }

    EXPECT_EQ(order, (std::vector<long>{1, 2, 3}));
}

TEST(MessageQueueTest, OneItemAtATime)
{
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};

    MessageQueue<int> queue(
        [&](int&, long)
        {
            int now = ++running;
            int seen = max_running.load();
            while (now > seen && !max_running.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
        });

    std::vector<std::future<void>> done;
    for (int i = 0; i < 5; ++i)
        done.push_back(queue.enqueue(i));
    for (auto& f : done)
        f.get();

    EXPECT_EQ(max_running.load(), 1);
}

TEST(MessageQueueTest, FailureRejectsOnlyThatItem)
{
    std::vector<int> processed;

    MessageQueue<int> queue(
        [&](int& value, long)
        {
            if (value == 2)
                throw std::runtime_error("item two failed");
            processed.push_back(value);
        });

    auto one = queue.enqueue(1);
    auto two = queue.enqueue(2);
    auto three = queue.enqueue(3);

    EXPECT_NO_THROW(one.get());
    EXPECT_THROW(two.get(), std::runtime_error);
    EXPECT_NO_THROW(three.get());
    EXPECT_EQ(processed, (std::vector<int>{1, 3}));
}

TEST(MessageQueueTest, NonStandardExceptionBecomesItemProcessingError)
{
    MessageQueue<int> queue([](int&, long) { throw 42; });

    auto done = queue.enqueue(1);
    try
    {
        done.get();
        FAIL() << "expected ItemProcessingError";
    }
    catch (const acpbridge::ItemProcessingError& e)
    {
        EXPECT_EQ(e.request_id(), 1);
    }
}

TEST(MessageQueueTest, ReportsBacklog)
{
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> started{false};

    MessageQueue<int> queue(
        [&](int&, long)
        {
            started = true;
            gate.wait();
        });

    auto first = queue.enqueue(1);
    while (!started)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    auto second = queue.enqueue(2);
    auto third = queue.enqueue(3);

    EXPECT_TRUE(queue.is_processing());
    EXPECT_EQ(queue.size(), 2u);

    release.set_value();
    first.get();
    second.get();
    third.get();
    EXPECT_EQ(queue.size(), 0u);
}

TEST(MessageQueueTest, DestructorDrainsRemainingItems)
{
    std::atomic<int> processed{0};
    {
        MessageQueue<int> queue(
            [&](int&, long)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                ++processed;
            });
        for (int i = 0; i < 4; ++i)
            queue.enqueue(i);
    }
    EXPECT_EQ(processed.load(), 4);
}
