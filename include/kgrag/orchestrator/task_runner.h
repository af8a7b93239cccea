#pragma once

#include <kgrag/core/types.h>
#include <kgrag/orchestrator/worker_pool.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

namespace kgrag::orchestrator {

struct TaskRunnerConfig {
    std::size_t maxInFlight = 0; // 0 = one task per pool thread
    std::chrono::milliseconds taskTimeout{120000};
    std::size_t retryCount = 3;
    std::chrono::milliseconds retryBackoff{200}; // multiplied by the attempt number

    bool isValid() const { return taskTimeout.count() > 0 && retryBackoff.count() >= 0; }
};

/// NetworkError, DatabaseError, Timeout and ResourceExhausted are retried
bool isTransient(ErrorCode code) noexcept;

template <typename T> using Task = std::function<Result<T>()>;

template <typename T> struct TaskOutcome {
    std::size_t index = 0; // position in the submitted task list
    Result<T> result;
    std::size_t attempts = 0; // 0 for tasks cancelled before submission
};

template <typename T> struct BatchReport {
    std::vector<TaskOutcome<T>> outcomes; // completion order
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::size_t retries = 0;
    std::size_t timeouts = 0;
};

namespace detail {

template <typename T> Result<T> invokeTask(const Task<T>& task, std::size_t index) {
    try {
        return task();
    } catch (const std::exception& e) {
        spdlog::error("[TaskRunner] task {} threw: {}", index, e.what());
        return Error{ErrorCode::InternalError, std::string("Task threw: ") + e.what()};
    } catch (...) {
        spdlog::error("[TaskRunner] task {} threw a non-standard exception", index);
        return Error{ErrorCode::InternalError, "Task threw a non-standard exception"};
    }
}

inline Error poolStopped() {
    return Error{ErrorCode::SystemShutdown, "Worker pool stopped"};
}

// One batch in flight. Kept alive by the handlers it posts; completion is reported once
// through the callback, after every task has an outcome. Once the pool stops, attempts that
// have not started and tasks not yet launched fail with SystemShutdown.
template <typename T> class Batch : public std::enable_shared_from_this<Batch<T>> {
public:
    using Completion = std::function<void(BatchReport<T>)>;

    Batch(std::shared_ptr<WorkerPool> pool, TaskRunnerConfig cfg, std::size_t maxInFlight,
          std::vector<Task<T>> tasks, Completion onComplete)
        : pool_(std::move(pool)), cfg_(cfg), maxInFlight_(maxInFlight == 0 ? 1 : maxInFlight),
          tasks_(std::move(tasks)), onComplete_(std::move(onComplete)) {}

    void start(std::stop_token st) {
        if (!livePool()) {
            {
                std::lock_guard lock(mutex_);
                shutdownPendingLocked();
                completed_ = true;
            }
            finish();
            return;
        }

        if (st.stop_possible()) {
            std::weak_ptr<Batch> weak = this->weak_from_this();
            stopCallback_ = std::make_unique<std::stop_callback<std::function<void()>>>(
                st, std::function<void()>([weak] {
                    if (auto self = weak.lock())
                        self->cancel();
                }));
        }

        std::vector<std::size_t> toLaunch;
        bool complete = false;
        {
            std::lock_guard lock(mutex_);
            fillLocked(toLaunch);
            complete = checkCompleteLocked();
        }
        for (auto index : toLaunch)
            launchAttempt(index, 1);
        if (complete)
            finish();
    }

private:
    // Null once the pool is stopped or gone
    std::shared_ptr<WorkerPool> livePool() const {
        auto pool = pool_.lock();
        if (!pool || pool->stopped())
            return nullptr;
        return pool;
    }

    void shutdownPendingLocked() {
        if (next_ < tasks_.size()) {
            spdlog::info("[TaskRunner] pool stopped: {} tasks not submitted",
                         tasks_.size() - next_);
        }
        for (std::size_t i = next_; i < tasks_.size(); ++i) {
            report_.outcomes.push_back(TaskOutcome<T>{i, Result<T>(poolStopped()), 0});
            ++report_.failed;
            ++done_;
        }
        next_ = tasks_.size();
    }

    void fillLocked(std::vector<std::size_t>& toLaunch) {
        if (!cancelled_ && next_ < tasks_.size() && !livePool()) {
            shutdownPendingLocked();
            return;
        }
        while (!cancelled_ && inFlight_ < maxInFlight_ && next_ < tasks_.size()) {
            toLaunch.push_back(next_++);
            ++inFlight_;
        }
    }

    bool checkCompleteLocked() {
        if (!completed_ && done_ == tasks_.size()) {
            completed_ = true;
            return true;
        }
        return false;
    }

    void launchAttempt(std::size_t index, std::size_t attempt) {
        auto pool = livePool();
        if (!pool) {
            finalize(index, attempt - 1, Result<T>(poolStopped()));
            return;
        }
        auto self = this->shared_from_this();
        auto settled = std::make_shared<std::atomic<bool>>(false);
        auto timer = std::make_shared<boost::asio::steady_timer>(pool->timerExecutor(),
                                                                 cfg_.taskTimeout);

        timer->async_wait([self, settled, index, attempt](const boost::system::error_code& ec) {
            if (ec)
                return;
            if (settled->exchange(true))
                return;
            spdlog::warn("[TaskRunner] task {} attempt {} timed out after {} ms", index, attempt,
                         self->cfg_.taskTimeout.count());
            self->onAttemptDone(index, attempt,
                                Result<T>(Error{ErrorCode::Timeout, "Task attempt timed out"}),
                                true);
        });

        boost::asio::post(pool->executor(), [self, settled, timer, index, attempt] {
            if (settled->load())
                return;
            if (!self->livePool()) {
                if (settled->exchange(true))
                    return;
                boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
                self->finalize(index, attempt - 1, Result<T>(poolStopped()));
                return;
            }
            auto result = invokeTask<T>(self->tasks_[index], index);
            if (settled->exchange(true)) {
                spdlog::debug("[TaskRunner] discarding late result of task {} attempt {}", index,
                              attempt);
                return;
            }
            boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
            self->onAttemptDone(index, attempt, std::move(result), false);
        });
    }

    void scheduleRetry(std::size_t index, std::size_t nextAttempt) {
        auto pool = livePool();
        if (!pool) {
            finalize(index, nextAttempt - 1, Result<T>(poolStopped()));
            return;
        }
        auto self = this->shared_from_this();
        const auto delay = cfg_.retryBackoff * static_cast<long>(nextAttempt - 1);
        auto timer = std::make_shared<boost::asio::steady_timer>(pool->timerExecutor(), delay);
        timer->async_wait(
            [self, timer, index, nextAttempt](const boost::system::error_code& ec) {
                if (ec) {
                    self->finalize(index, nextAttempt - 1,
                                   Result<T>(Error{ErrorCode::SystemShutdown,
                                                   "Retry aborted: " + ec.message()}));
                    return;
                }
                self->launchAttempt(index, nextAttempt);
            });
    }

    void onAttemptDone(std::size_t index, std::size_t attempt, Result<T> result, bool timedOut) {
        bool retry = false;
        {
            std::lock_guard lock(mutex_);
            if (timedOut)
                ++report_.timeouts;
            if (!result && isTransient(result.error().code) && attempt <= cfg_.retryCount &&
                !cancelled_) {
                ++report_.retries;
                retry = true;
            }
        }
        if (retry) {
            spdlog::info("[TaskRunner] retrying task {} (attempt {} failed: {})", index, attempt,
                         result.error().message);
            scheduleRetry(index, attempt + 1);
            return;
        }
        finalize(index, attempt, std::move(result));
    }

    void finalize(std::size_t index, std::size_t attempts, Result<T> result) {
        std::vector<std::size_t> toLaunch;
        bool complete = false;
        {
            std::lock_guard lock(mutex_);
            if (result)
                ++report_.succeeded;
            else
                ++report_.failed;
            report_.outcomes.push_back(TaskOutcome<T>{index, std::move(result), attempts});
            --inFlight_;
            ++done_;
            fillLocked(toLaunch);
            complete = checkCompleteLocked();
        }
        for (auto i : toLaunch)
            launchAttempt(i, 1);
        if (complete)
            finish();
    }

    void cancel() {
        bool complete = false;
        {
            std::lock_guard lock(mutex_);
            if (cancelled_)
                return;
            cancelled_ = true;
            for (std::size_t i = next_; i < tasks_.size(); ++i) {
                report_.outcomes.push_back(TaskOutcome<T>{
                    i, Result<T>(Error{ErrorCode::OperationCancelled, "Batch cancelled"}), 0});
                ++report_.cancelled;
                ++done_;
            }
            spdlog::info("[TaskRunner] batch cancelled: {} tasks not submitted",
                         tasks_.size() - next_);
            next_ = tasks_.size();
            complete = checkCompleteLocked();
        }
        if (complete)
            finish();
    }

    void finish() {
        BatchReport<T> report;
        {
            std::lock_guard lock(mutex_);
            report = std::move(report_);
        }
        spdlog::debug("[TaskRunner] batch done: {} ok, {} failed, {} cancelled, {} retries, {} "
                      "timeouts",
                      report.succeeded, report.failed, report.cancelled, report.retries,
                      report.timeouts);
        if (onComplete_)
            onComplete_(std::move(report));
    }

    std::weak_ptr<WorkerPool> pool_; // the owner stops the pool, which drains this batch
    TaskRunnerConfig cfg_;
    std::size_t maxInFlight_;
    std::vector<Task<T>> tasks_;
    Completion onComplete_;
    std::unique_ptr<std::stop_callback<std::function<void()>>> stopCallback_;

    std::mutex mutex_;
    BatchReport<T> report_;
    std::size_t next_ = 0;
    std::size_t inFlight_ = 0;
    std::size_t done_ = 0;
    bool cancelled_ = false;
    bool completed_ = false;
};

} // namespace detail

/**
 * @brief Runs units of work on a WorkerPool with bounded concurrency, per-attempt timeouts
 * and retry of transient failures
 *
 * A failing task never aborts its batch. The blocking calls (runBatch, runOne) must not be
 * made from a pool thread.
 */
class TaskRunner {
public:
    explicit TaskRunner(std::shared_ptr<WorkerPool> pool, TaskRunnerConfig config = {});

    template <typename T>
    std::future<BatchReport<T>> runBatchAsync(std::vector<Task<T>> tasks,
                                              std::stop_token st = {}) {
        auto promise = std::make_shared<std::promise<BatchReport<T>>>();
        auto future = promise->get_future();
        auto batch = std::make_shared<detail::Batch<T>>(
            pool_, config_, maxInFlight(), std::move(tasks),
            [promise](BatchReport<T> report) { promise->set_value(std::move(report)); });
        batch->start(std::move(st));
        return future;
    }

    template <typename T>
    BatchReport<T> runBatch(std::vector<Task<T>> tasks, std::stop_token st = {}) {
        return runBatchAsync<T>(std::move(tasks), std::move(st)).get();
    }

    /// Single task under the same retry and timeout policy
    template <typename T> std::future<Result<T>> submit(Task<T> task) {
        auto promise = std::make_shared<std::promise<Result<T>>>();
        auto future = promise->get_future();
        std::vector<Task<T>> tasks;
        tasks.push_back(std::move(task));
        auto batch = std::make_shared<detail::Batch<T>>(
            pool_, config_, 1, std::move(tasks), [promise](BatchReport<T> report) {
                promise->set_value(std::move(report.outcomes.front().result));
            });
        batch->start(std::stop_token{});
        return future;
    }

    template <typename T> Result<T> runOne(Task<T> task) {
        return submit<T>(std::move(task)).get();
    }

    const TaskRunnerConfig& config() const { return config_; }

private:
    std::size_t maxInFlight() const;

    std::shared_ptr<WorkerPool> pool_;
    TaskRunnerConfig config_;
};

} // namespace kgrag::orchestrator
