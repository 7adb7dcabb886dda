#include "duopane/CollisionResolver.hpp"

namespace duopane {

CollisionDecision
CollisionResolver::awaitDecision(const CollisionRequest &request) {
    const std::uint64_t id = request.jobId;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Slot &s = slots_[id];
        if (s.abandoned)
            return CollisionDecision::cancelAll();
        if (s.sticky)
            return *s.sticky;
        s.request = request;
        s.answer.reset();
    }
    // Hooks run unlocked: they touch the registry and emit notifications.
    if (onPause_)
        onPause_(request);

    CollisionDecision decision;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this, id] {
            const Slot &s = slots_[id];
            return s.answer.has_value() || s.abandoned;
        });
        Slot &s = slots_[id];
        decision = s.abandoned ? CollisionDecision::cancelAll() : *s.answer;
        s.request.reset();
        s.answer.reset();
        if (decision.applyToAll &&
            (decision.action == CollisionDecision::Action::Skip ||
             decision.action == CollisionDecision::Action::Overwrite)) {
            s.sticky = decision;
        }
    }
    if (onResume_)
        onResume_(id, decision);
    return decision;
}

bool CollisionResolver::resolve(std::uint64_t jobId,
                                const CollisionDecision &decision) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = slots_.find(jobId);
        if (it == slots_.end() || !it->second.request || it->second.answer)
            return false;
        it->second.answer = decision;
    }
    cv_.notify_all();
    return true;
}

void CollisionResolver::abandon(std::uint64_t jobId) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        slots_[jobId].abandoned = true;
    }
    cv_.notify_all();
}

bool CollisionResolver::hasPending(std::uint64_t jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = slots_.find(jobId);
    return it != slots_.end() && it->second.request.has_value() &&
           !it->second.answer.has_value();
}

std::optional<CollisionRequest>
CollisionResolver::pending(std::uint64_t jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = slots_.find(jobId);
    if (it == slots_.end() || it->second.answer)
        return std::nullopt;
    return it->second.request;
}

std::optional<CollisionDecision>
CollisionResolver::stickyDecision(std::uint64_t jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = slots_.find(jobId);
    if (it == slots_.end())
        return std::nullopt;
    return it->second.sticky;
}

void CollisionResolver::forget(std::uint64_t jobId) {
    std::lock_guard<std::mutex> lk(mtx_);
    slots_.erase(jobId);
}

} // namespace duopane
