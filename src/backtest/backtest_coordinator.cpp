// src/backtest/backtest_coordinator.cpp

#include "tcrimer/backtest/backtest_coordinator.hpp"
#include "tcrimer/core/logger.hpp"
#include "tcrimer/core/run_id_generator.hpp"

namespace tcrimer {

namespace {

bool is_finished(RunState state) {
    return state == RunState::COMPLETED || state == RunState::FAILED;
}

}  // namespace

BacktestCoordinator::BacktestCoordinator(std::shared_ptr<BacktestEngine> engine, size_t workers,
                                         size_t max_retained_runs)
    : engine_(std::move(engine)),
      workers_(std::make_unique<WorkerPool>(workers > 0 ? workers : 1, "backtest")),
      max_retained_runs_(max_retained_runs > 0 ? max_retained_runs : 1) {}

BacktestCoordinator::~BacktestCoordinator() {
    shutdown();
}

Result<std::string> BacktestCoordinator::submit(const BacktestRequest& request) {
    return enqueue(request, false);
}

Result<std::string> BacktestCoordinator::enqueue(const BacktestRequest& request,
                                                 bool reserve_waiter) {
    const auto now = std::chrono::system_clock::now();
    const std::string run_id =
        RunIdGenerator::generate_backtest_run_id(request.strategy_id, request.symbol, now);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return make_error<std::string>(ErrorCode::NOT_INITIALIZED,
                                           "Backtest coordinator is shut down",
                                           "BacktestCoordinator");
        }
        RunRecord record;
        record.status.run_id = run_id;
        record.status.request = request;
        record.status.submitted_at = now;
        record.cancel = std::make_shared<CancellationToken>();
        record.waiters = reserve_waiter ? 1 : 0;
        runs_.emplace(run_id, std::move(record));
    }

    try {
        workers_->submit([this, run_id]() { execute(run_id); });
    } catch (const std::runtime_error& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_.erase(run_id);
        return make_error<std::string>(ErrorCode::NOT_INITIALIZED, e.what(),
                                       "BacktestCoordinator");
    }
    DEBUG("Submitted backtest " << run_id << " PENDING");
    return run_id;
}

void BacktestCoordinator::execute(const std::string& run_id) {
    Logger::register_component("BacktestWorker");

    BacktestRequest request;
    std::shared_ptr<CancellationToken> cancel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(run_id);
        if (it == runs_.end()) {
            return;
        }
        auto& record = it->second;
        if (record.cancel->is_cancelled()) {
            record.status.state = RunState::FAILED;
            record.status.reason = FailureReason::CANCELLED;
            record.status.message = "Cancelled before start";
            record.status.finished_at = std::chrono::system_clock::now();
            record.error = std::make_unique<TcrimerError>(ErrorCode::BACKTEST_CANCELLED,
                                                          record.status.message,
                                                          "BacktestCoordinator");
            INFO("Backtest " << run_id << " FAILED (CANCELLED) before start");
            finish_locked(run_id);
            return;
        }
        record.status.state = RunState::RUNNING;
        record.status.started_at = std::chrono::system_clock::now();
        request = record.status.request;
        cancel = record.cancel;
    }

    Result<BacktestResult> outcome = make_error<BacktestResult>(
        ErrorCode::UNKNOWN_ERROR, "Backtest did not produce an outcome", "BacktestCoordinator");
    try {
        outcome = engine_->run(request, cancel.get());
    } catch (const std::exception& e) {
        outcome = make_error<BacktestResult>(ErrorCode::BACKTEST_DATA_FAULT,
                                             std::string("Backtest raised: ") + e.what(),
                                             "BacktestCoordinator");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = runs_.at(run_id);
    record.status.finished_at = std::chrono::system_clock::now();
    if (outcome.is_ok()) {
        record.status.state = RunState::COMPLETED;
        record.result = std::move(outcome.value());
    } else {
        const TcrimerError* error = outcome.error();
        record.status.state = RunState::FAILED;
        record.status.reason = failure_reason_from_error(error->code());
        record.status.message = error->what();
        record.error = std::make_unique<TcrimerError>(error->code(), error->what(),
                                                      error->component());
    }
    finish_locked(run_id);
}

void BacktestCoordinator::finish_locked(const std::string& run_id) {
    finished_order_.push_back(run_id);
    prune_finished_locked();
    finished_cv_.notify_all();
}

void BacktestCoordinator::prune_finished_locked() {
    size_t excess =
        finished_order_.size() > max_retained_runs_ ? finished_order_.size() - max_retained_runs_
                                                    : 0;
    for (auto it = finished_order_.begin(); excess > 0 && it != finished_order_.end();) {
        auto record = runs_.find(*it);
        if (record != runs_.end() && record->second.waiters > 0) {
            ++it;
            continue;
        }
        if (record != runs_.end()) {
            runs_.erase(record);
        }
        it = finished_order_.erase(it);
        --excess;
    }
}

Result<BacktestResult> BacktestCoordinator::wait(const std::string& run_id) {
    return await(run_id, false);
}

Result<BacktestResult> BacktestCoordinator::await(const std::string& run_id, bool reserved) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return make_error<BacktestResult>(ErrorCode::INVALID_ARGUMENT,
                                          "Unknown backtest run " + run_id,
                                          "BacktestCoordinator");
    }
    RunRecord& record = it->second;
    if (!reserved) {
        ++record.waiters;
    }
    finished_cv_.wait(lock, [&record] { return is_finished(record.status.state); });
    --record.waiters;

    if (record.status.state == RunState::COMPLETED) {
        BacktestResult result = *record.result;
        prune_finished_locked();
        return result;
    }
    auto failed = make_error<BacktestResult>(record.error->code(), record.error->what(),
                                             record.error->component());
    prune_finished_locked();
    return failed;
}

Result<BacktestResult> BacktestCoordinator::run(const BacktestRequest& request) {
    auto run_id = enqueue(request, true);
    if (run_id.is_error()) {
        return forward_error<BacktestResult>(run_id.error());
    }
    return await(run_id.value(), true);
}

bool BacktestCoordinator::cancel(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end() || is_finished(it->second.status.state)) {
        return false;
    }
    it->second.cancel->cancel();
    INFO("Cancellation requested for backtest " << run_id);
    return true;
}

Result<RunStatus> BacktestCoordinator::status(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return make_error<RunStatus>(ErrorCode::INVALID_ARGUMENT, "Unknown backtest run " + run_id,
                                     "BacktestCoordinator");
    }
    return it->second.status;
}

std::vector<RunStatus> BacktestCoordinator::list_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RunStatus> statuses;
    statuses.reserve(runs_.size());
    for (const auto& [id, record] : runs_) {
        statuses.push_back(record.status);
    }
    return statuses;
}

void BacktestCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (auto& [id, record] : runs_) {
            if (!is_finished(record.status.state)) {
                record.cancel->cancel();
            }
        }
    }
    workers_->shutdown();
}

}  // namespace tcrimer
