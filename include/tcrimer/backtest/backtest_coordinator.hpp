// include/tcrimer/backtest/backtest_coordinator.hpp
#pragma once

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "tcrimer/backtest/backtest_engine.hpp"
#include "tcrimer/core/worker_pool.hpp"

namespace tcrimer {

/**
 * @brief Externally visible state of one submitted run
 */
struct RunStatus {
    std::string run_id;
    BacktestRequest request;
    RunState state{RunState::PENDING};
    FailureReason reason{FailureReason::NONE};
    std::string message;
    Timestamp submitted_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
};

/**
 * @brief Schedules backtest runs on a worker pool
 *
 * Each run moves Pending -> Running -> Completed or Failed exactly once.
 * Runs are independent and execute concurrently up to the worker count; a
 * single run stays on one worker from start to finish.
 *
 * Only the most recent max_retained_runs finished runs stay queryable. Older
 * ones are forgotten once nobody is waiting on them; their results remain in
 * the results store.
 */
class BacktestCoordinator {
public:
    BacktestCoordinator(std::shared_ptr<BacktestEngine> engine, size_t workers,
                        size_t max_retained_runs = 256);
    ~BacktestCoordinator();

    BacktestCoordinator(const BacktestCoordinator&) = delete;
    BacktestCoordinator& operator=(const BacktestCoordinator&) = delete;

    /**
     * @return The run id, or NOT_INITIALIZED after shutdown
     */
    Result<std::string> submit(const BacktestRequest& request);

    /**
     * @brief Block until the run finishes
     * @return The result, or the run's BACKTEST_* error; INVALID_ARGUMENT
     *         for an unknown or forgotten id
     */
    Result<BacktestResult> wait(const std::string& run_id);

    Result<BacktestResult> run(const BacktestRequest& request);

    /**
     * @brief Request cancellation
     *
     * A pending run fails as CANCELLED when a worker picks it up; a running
     * one stops at its next bar.
     * @return false if the run is unknown or already finished
     */
    bool cancel(const std::string& run_id);

    Result<RunStatus> status(const std::string& run_id) const;

    std::vector<RunStatus> list_runs() const;

    /**
     * @brief Cancel outstanding runs and join the workers
     */
    void shutdown();

private:
    struct RunRecord {
        RunStatus status;
        std::optional<BacktestResult> result;
        std::unique_ptr<TcrimerError> error;
        std::shared_ptr<CancellationToken> cancel;
        size_t waiters{0};
    };

    // reserve_waiter keeps the run from being forgotten before await() claims it
    Result<std::string> enqueue(const BacktestRequest& request, bool reserve_waiter);
    Result<BacktestResult> await(const std::string& run_id, bool reserved);
    void execute(const std::string& run_id);
    // Requires mutex_
    void finish_locked(const std::string& run_id);
    void prune_finished_locked();

    std::shared_ptr<BacktestEngine> engine_;
    std::unique_ptr<WorkerPool> workers_;

    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
    std::map<std::string, RunRecord> runs_;
    std::deque<std::string> finished_order_;  // oldest first
    size_t max_retained_runs_;
    bool shut_down_{false};
};

}  // namespace tcrimer
