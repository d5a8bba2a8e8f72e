// src/data/backend_selector.cpp

#include "tcrimer/data/backend_selector.hpp"
#include <mutex>
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

BackendSelector::BackendSelector(FailoverPolicy policy, BackendKind initial)
    : policy_(policy), authoritative_(initial) {}

BackendKind BackendSelector::authoritative() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return authoritative_;
}

bool BackendSelector::record_primary_failure(const std::string& reason) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ++consecutive_failures_;
    WARN("Primary backend failure " << consecutive_failures_ << "/"
                                    << policy_.primary_failure_threshold << ": " << reason);

    if (authoritative_ == BackendKind::PRIMARY &&
        consecutive_failures_ >= policy_.primary_failure_threshold) {
        // Start the reconciliation backoff from the moment of failover
        last_reconciliation_attempt_ = Clock::now();
        transition_locked(BackendKind::FALLBACK,
                          std::to_string(consecutive_failures_) +
                              " consecutive primary failures: " + reason);
        return true;
    }
    return false;
}

void BackendSelector::record_primary_success() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    consecutive_failures_ = 0;
    last_primary_success_ = Clock::now();
}

void BackendSelector::force_fallback(const std::string& reason) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (authoritative_ == BackendKind::FALLBACK) {
        return;
    }
    last_reconciliation_attempt_ = Clock::now();
    transition_locked(BackendKind::FALLBACK, reason);
}

bool BackendSelector::try_begin_reconciliation() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (authoritative_ != BackendKind::FALLBACK || reconciliation_in_flight_) {
        return false;
    }
    auto now = Clock::now();
    if (last_reconciliation_attempt_ &&
        now - *last_reconciliation_attempt_ < policy_.reconciliation_backoff) {
        return false;
    }
    last_reconciliation_attempt_ = now;
    reconciliation_in_flight_ = true;
    return true;
}

void BackendSelector::complete_reconciliation(bool primary_healthy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!reconciliation_in_flight_) {
        return;
    }
    reconciliation_in_flight_ = false;

    if (primary_healthy) {
        consecutive_failures_ = 0;
        last_primary_success_ = Clock::now();
        transition_locked(BackendKind::PRIMARY, "reconciliation probe succeeded");
    } else {
        INFO("Primary still unavailable, next reconciliation in "
             << policy_.reconciliation_backoff.count() << "s");
    }
}

int BackendSelector::consecutive_primary_failures() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return consecutive_failures_;
}

std::optional<BackendSelector::Clock::time_point> BackendSelector::last_primary_success() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_primary_success_;
}

size_t BackendSelector::failover_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return failover_count_;
}

void BackendSelector::set_transition_listener(TransitionListener listener) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void BackendSelector::transition_locked(BackendKind to, const std::string& reason) {
    BackendKind from = authoritative_;
    if (from == to) {
        return;
    }
    authoritative_ = to;
    if (to == BackendKind::FALLBACK) {
        ++failover_count_;
    }
    WARN("Authoritative backend " << backend_kind_to_string(from) << " -> "
                                  << backend_kind_to_string(to) << " (" << reason << ")");

    if (listener_) {
        try {
            listener_(from, to, reason);
        } catch (const std::exception& e) {
            ERROR("Backend transition listener failed: " << e.what());
        }
    }
}

}  // namespace tcrimer
