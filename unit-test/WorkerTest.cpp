#include <atomic>
#include <future>
#include <stdexcept>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "worker.hpp"

using namespace std;
using namespace grader;

TEST(WorkerTest, RunsSubmittedTasks) {
    atomic<int> counter{0};
    {
        worker_pool pool(3);
        EXPECT_EQ(pool.size(), 3u);
        for (int i = 0; i < 100; ++i)
            pool.submit([&] { ++counter; });
    }
    EXPECT_EQ(counter, 100);
}

TEST(WorkerTest, StartsAtLeastOneWorker) {
    worker_pool pool(0);
    EXPECT_EQ(pool.size(), 1u);

    promise<void> done;
    pool.submit([&] { done.set_value(); });
    EXPECT_EQ(done.get_future().wait_for(chrono::seconds(5)), future_status::ready);
}

TEST(WorkerTest, RejectsEmptyTask) {
    worker_pool pool(1);
    EXPECT_THROW(pool.submit(worker_pool::task()), invalid_argument_error);
}

TEST(WorkerTest, FailingTaskDoesNotStopWorker) {
    worker_pool pool(1);
    pool.submit([] { throw runtime_error("boom"); });
    pool.submit([] { throw analyzer_failure("boom"); });

    promise<void> done;
    pool.submit([&] { done.set_value(); });
    EXPECT_EQ(done.get_future().wait_for(chrono::seconds(5)), future_status::ready);
}

TEST(WorkerTest, StopFinishesQueuedTasks) {
    atomic<int> counter{0};
    worker_pool pool(2);
    for (int i = 0; i < 10; ++i)
        pool.submit([&] {
            this_thread::sleep_for(chrono::milliseconds(5));
            ++counter;
        });
    pool.stop();
    EXPECT_EQ(counter, 10);
    EXPECT_EQ(pool.size(), 0u);
    pool.stop();
}
