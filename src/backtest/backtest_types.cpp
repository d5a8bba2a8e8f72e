// src/backtest/backtest_types.cpp

#include "tcrimer/backtest/backtest_types.hpp"

namespace tcrimer {

std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::PENDING:
            return "PENDING";
        case RunState::RUNNING:
            return "RUNNING";
        case RunState::COMPLETED:
            return "COMPLETED";
        case RunState::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

std::string failure_reason_to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE:
            return "NONE";
        case FailureReason::DATA_FAULT:
            return "DATA_FAULT";
        case FailureReason::CANCELLED:
            return "CANCELLED";
        case FailureReason::INVALID_PARAMS:
            return "INVALID_PARAMS";
        case FailureReason::TIMEOUT:
            return "TIMEOUT";
    }
    return "UNKNOWN";
}

FailureReason failure_reason_from_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::BACKTEST_CANCELLED:
            return FailureReason::CANCELLED;
        case ErrorCode::BACKTEST_INVALID_PARAMS:
            return FailureReason::INVALID_PARAMS;
        case ErrorCode::BACKTEST_TIMEOUT:
            return FailureReason::TIMEOUT;
        default:
            return FailureReason::DATA_FAULT;
    }
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["run_timeout_ms"] = run_timeout.count();
    j["workers"] = workers;
    j["reuse_stored_results"] = reuse_stored_results;
    j["persist_results"] = persist_results;
    j["close_at_end"] = close_at_end;
    j["max_retained_runs"] = max_retained_runs;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("run_timeout_ms"))
        run_timeout = std::chrono::milliseconds(j.at("run_timeout_ms").get<int64_t>());
    if (j.contains("workers"))
        workers = j.at("workers").get<size_t>();
    if (j.contains("reuse_stored_results"))
        reuse_stored_results = j.at("reuse_stored_results").get<bool>();
    if (j.contains("persist_results"))
        persist_results = j.at("persist_results").get<bool>();
    if (j.contains("close_at_end"))
        close_at_end = j.at("close_at_end").get<bool>();
    if (j.contains("max_retained_runs"))
        max_retained_runs = j.at("max_retained_runs").get<size_t>();
}

}  // namespace tcrimer
