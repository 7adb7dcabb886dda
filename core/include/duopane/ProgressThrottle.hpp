// Rate-limit bookkeeping for progress notifications. Pure logic: callers pass
// the current time so the policy can be exercised without sleeping.
#pragma once
#include "JobModel.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace duopane {

class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressThrottle(std::chrono::milliseconds interval)
        : interval_(interval) {}

    std::chrono::milliseconds interval() const { return interval_; }
    // Applies to the next offer; already delivered snapshots keep their time.
    void setInterval(std::chrono::milliseconds interval) { interval_ = interval; }

    // Offers a snapshot. Returns it when it may be delivered now; otherwise it
    // is kept as the job's pending snapshot (latest wins) and nullopt is
    // returned.
    std::optional<ProgressSnapshot> offer(std::uint64_t jobId,
                                          const ProgressSnapshot &s,
                                          Clock::time_point now);

    // Returns the pending snapshot if the window has elapsed (trailing flush).
    std::optional<ProgressSnapshot> flushDue(std::uint64_t jobId,
                                             Clock::time_point now);

    // Time left until a pending snapshot may be flushed; nullopt if none.
    std::optional<std::chrono::milliseconds>
    pendingDelay(std::uint64_t jobId, Clock::time_point now) const;

    // Final delivery: returns whatever is pending regardless of the window
    // and drops the job's state.
    std::optional<ProgressSnapshot> finish(std::uint64_t jobId);

private:
    struct State {
        std::optional<Clock::time_point> lastDelivered;
        std::optional<ProgressSnapshot> pending;
    };

    std::chrono::milliseconds interval_;
    std::unordered_map<std::uint64_t, State> states_;
};

} // namespace duopane
