#include <gtest/gtest.h>
#include <kgrag/orchestrator/worker_pool.h>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>

using namespace kgrag::orchestrator;
using namespace std::chrono_literals;

TEST(WorkerPoolTest, RunsPostedHandlersOnPoolThreads) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.threads(), 3u);

    std::atomic<int> done{0};
    std::mutex mutex;
    std::set<std::thread::id> seen;
    std::promise<void> allDone;
    for (int i = 0; i < 30; ++i) {
        boost::asio::post(pool.executor(), [&] {
            {
                std::lock_guard lock(mutex);
                seen.insert(std::this_thread::get_id());
            }
            if (++done == 30)
                allDone.set_value();
        });
    }
    ASSERT_EQ(allDone.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_EQ(seen.count(std::this_thread::get_id()), 0u);
    EXPECT_LE(seen.size(), 3u);
}

TEST(WorkerPoolTest, TimersFireWhileWorkersAreBusy) {
    WorkerPool pool(1);
    std::promise<void> release;
    auto released = release.get_future().share();
    boost::asio::post(pool.executor(), [released] { released.wait(); });

    std::promise<void> fired;
    boost::asio::steady_timer timer(pool.timerExecutor(), 20ms);
    timer.async_wait([&](const boost::system::error_code& ec) {
        if (!ec)
            fired.set_value();
    });
    EXPECT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);
    release.set_value();
}

TEST(WorkerPoolTest, StopIsIdempotent) {
    WorkerPool pool(2);
    EXPECT_FALSE(pool.stopped());
    pool.stop();
    EXPECT_TRUE(pool.stopped());
    pool.stop();
    EXPECT_TRUE(pool.stopped());
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.threads(), 1u);
}
