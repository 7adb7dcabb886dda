// Parks one job's worker until the user decides what to do with an existing
// destination. Only the requesting worker waits; every other job and the
// interactive thread keep running.
#pragma once
#include "JobModel.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace duopane {

class CollisionResolver {
public:
    // Invoked on the worker thread right before it parks / after it wakes.
    using PauseHook = std::function<void(const CollisionRequest &)>;
    using ResumeHook =
        std::function<void(std::uint64_t jobId, const CollisionDecision &)>;

    void setPauseHook(PauseHook h) { onPause_ = std::move(h); }
    void setResumeHook(ResumeHook h) { onResume_ = std::move(h); }

    // Worker side. Returns a sticky decision immediately when one exists,
    // otherwise blocks until resolve() or abandon() is called for the job.
    CollisionDecision awaitDecision(const CollisionRequest &request);

    // Interactive side. Returns false when the job has nothing pending.
    bool resolve(std::uint64_t jobId, const CollisionDecision &decision);
    // Wakes a parked worker with CancelAll and makes later requests of the
    // job return CancelAll without parking.
    void abandon(std::uint64_t jobId);

    bool hasPending(std::uint64_t jobId) const;
    std::optional<CollisionRequest> pending(std::uint64_t jobId) const;
    std::optional<CollisionDecision> stickyDecision(std::uint64_t jobId) const;
    // Drops all state for a finalized job.
    void forget(std::uint64_t jobId);

private:
    struct Slot {
        std::optional<CollisionRequest> request;
        std::optional<CollisionDecision> answer;
        std::optional<CollisionDecision> sticky;
        bool abandoned = false;
    };

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::unordered_map<std::uint64_t, Slot> slots_;
    PauseHook onPause_;
    ResumeHook onResume_;
};

} // namespace duopane
