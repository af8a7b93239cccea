#include <kgrag/orchestrator/task_runner.h>

namespace kgrag::orchestrator {

bool isTransient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::DatabaseError:
        case ErrorCode::Timeout:
        case ErrorCode::ResourceExhausted:
            return true;
        default:
            return false;
    }
}

TaskRunner::TaskRunner(std::shared_ptr<WorkerPool> pool, TaskRunnerConfig config)
    : pool_(std::move(pool)), config_(config) {
    if (!config_.isValid()) {
        spdlog::warn("[TaskRunner] invalid configuration, using defaults");
        config_ = TaskRunnerConfig{};
    }
}

std::size_t TaskRunner::maxInFlight() const {
    if (config_.maxInFlight > 0)
        return config_.maxInFlight;
    return pool_ ? pool_->threads() : 1;
}

} // namespace kgrag::orchestrator
