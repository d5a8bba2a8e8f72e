// include/tcrimer/data/backend_selector.hpp
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include "tcrimer/data/database_interface.hpp"

namespace tcrimer {

struct FailoverPolicy {
    int primary_failure_threshold{3};
    std::chrono::seconds reconciliation_backoff{60};
};

/**
 * @brief Tracks which backend is authoritative
 *
 * Exactly one backend is authoritative at any instant. All state changes go
 * through a single writer lock, so at most one failover or reconciliation
 * transition is in flight at a time. The pool owns an instance through a
 * shared pointer; there is no global.
 */
class BackendSelector {
public:
    using Clock = std::chrono::steady_clock;
    using TransitionListener =
        std::function<void(BackendKind from, BackendKind to, const std::string& reason)>;

    explicit BackendSelector(FailoverPolicy policy = {},
                             BackendKind initial = BackendKind::PRIMARY);

    BackendKind authoritative() const;

    /**
     * @brief Record a failed acquire or probe against the primary
     * @return true if this failure switched the authoritative backend to fallback
     */
    bool record_primary_failure(const std::string& reason);

    /**
     * @brief Record a successful primary round trip; resets the failure streak
     */
    void record_primary_success();

    /**
     * @brief Switch to fallback without counting failures (no primary configured)
     */
    void force_fallback(const std::string& reason);

    /**
     * @brief Claim the right to probe the primary for reconciliation
     *
     * Succeeds only when fallback is authoritative, no other reconciliation is
     * in flight, and the backoff since the previous attempt has elapsed.
     */
    bool try_begin_reconciliation();

    /**
     * @brief Finish a claimed reconciliation; success reverts to primary
     */
    void complete_reconciliation(bool primary_healthy);

    int consecutive_primary_failures() const;
    std::optional<Clock::time_point> last_primary_success() const;
    size_t failover_count() const;

    /**
     * @brief Called under the writer lock on every transition; must not call
     * back into the selector
     */
    void set_transition_listener(TransitionListener listener);

private:
    void transition_locked(BackendKind to, const std::string& reason);

    const FailoverPolicy policy_;
    mutable std::shared_mutex mutex_;
    BackendKind authoritative_;
    int consecutive_failures_{0};
    std::optional<Clock::time_point> last_primary_success_;
    std::optional<Clock::time_point> last_reconciliation_attempt_;
    bool reconciliation_in_flight_{false};
    size_t failover_count_{0};
    TransitionListener listener_;
};

}  // namespace tcrimer
