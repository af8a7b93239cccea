#pragma once

#include <atomic>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace kgrag::orchestrator {

// Long-lived IO-based worker pool. Task handlers run on executor(); deadline and backoff
// timers run on a separate single-threaded context so they fire even when every worker
// is busy.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() const { return io_.get_executor(); }
    boost::asio::any_io_executor timerExecutor() const { return timerIo_.get_executor(); }

    // Idempotent. Refuses new work: queued handlers still run and must check stopped().
    // Returns once running handlers and pending timers have completed.
    void stop();

    std::size_t threads() const noexcept { return size_; }
    bool stopped() const noexcept { return stopped_.load(std::memory_order_acquire); }

private:
    void run_thread(std::stop_token st, boost::asio::io_context& io);
    void joinThread(std::size_t i);

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    mutable boost::asio::io_context io_;
    mutable boost::asio::io_context timerIo_;
    std::unique_ptr<WorkGuard> guard_;
    std::unique_ptr<WorkGuard> timerGuard_;
    std::vector<std::jthread> threads_;
    std::size_t size_ = 0;
    std::atomic<bool> stopped_{false};
};

} // namespace kgrag::orchestrator
