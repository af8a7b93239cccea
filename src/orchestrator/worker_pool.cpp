#include <kgrag/orchestrator/worker_pool.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace kgrag::orchestrator {

WorkerPool::WorkerPool(std::size_t threads) : io_(static_cast<int>(threads == 0 ? 1 : threads)) {
    if (threads == 0)
        threads = 1;
    size_ = threads;
    guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
    timerGuard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(timerIo_));
    threads_.reserve(threads + 1);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this](std::stop_token st) { run_thread(st, io_); });
    }
    threads_.emplace_back([this](std::stop_token st) { run_thread(st, timerIo_); });
    spdlog::info("[WorkerPool] started with {} threads", threads);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel))
        return;
    spdlog::debug("[WorkerPool] stopping");

    // Workers drain what is queued (handlers see stopped() and settle without running their
    // task), then the timer context drains the cancellations and backoffs they leave behind.
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    for (std::size_t i = 0; i + 1 < threads_.size(); ++i)
        joinThread(i);
    io_.restart();
    io_.poll();

    if (timerGuard_) {
        timerGuard_->reset();
        timerGuard_.reset();
    }
    if (!threads_.empty())
        joinThread(threads_.size() - 1);
    timerIo_.restart();
    timerIo_.poll();

    threads_.clear();
    spdlog::info("[WorkerPool] stopped");
}

void WorkerPool::joinThread(std::size_t i) {
    auto& t = threads_[i];
    if (!t.joinable())
        return;
    try {
        t.join();
    } catch (const std::system_error& e) {
        spdlog::warn("[WorkerPool] thread {} join failed: {}", i, e.what());
    }
}

void WorkerPool::run_thread(std::stop_token st, boost::asio::io_context& io) {
    using namespace std::chrono_literals;
    while (!st.stop_requested() && !io.stopped()) {
        try {
            io.run_for(50ms);
        } catch (const std::exception& e) {
            spdlog::warn("[WorkerPool] handler threw: {}", e.what());
        }
    }
}

} // namespace kgrag::orchestrator
