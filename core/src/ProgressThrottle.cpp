#include "duopane/ProgressThrottle.hpp"

namespace duopane {

std::optional<ProgressSnapshot>
ProgressThrottle::offer(std::uint64_t jobId, const ProgressSnapshot &s,
                        Clock::time_point now) {
    State &st = states_[jobId];
    if (!st.lastDelivered || now - *st.lastDelivered >= interval_) {
        st.lastDelivered = now;
        st.pending.reset();
        return s;
    }
    st.pending = s;
    return std::nullopt;
}

std::optional<ProgressSnapshot>
ProgressThrottle::flushDue(std::uint64_t jobId, Clock::time_point now) {
    auto it = states_.find(jobId);
    if (it == states_.end() || !it->second.pending)
        return std::nullopt;
    State &st = it->second;
    if (st.lastDelivered && now - *st.lastDelivered < interval_)
        return std::nullopt;
    st.lastDelivered = now;
    std::optional<ProgressSnapshot> out = std::move(st.pending);
    st.pending.reset();
    return out;
}

std::optional<std::chrono::milliseconds>
ProgressThrottle::pendingDelay(std::uint64_t jobId, Clock::time_point now) const {
    auto it = states_.find(jobId);
    if (it == states_.end() || !it->second.pending)
        return std::nullopt;
    if (!it->second.lastDelivered)
        return std::chrono::milliseconds(0);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - *it->second.lastDelivered);
    if (elapsed >= interval_)
        return std::chrono::milliseconds(0);
    return interval_ - elapsed;
}

std::optional<ProgressSnapshot> ProgressThrottle::finish(std::uint64_t jobId) {
    auto it = states_.find(jobId);
    if (it == states_.end())
        return std::nullopt;
    std::optional<ProgressSnapshot> out = std::move(it->second.pending);
    states_.erase(it);
    return out;
}

} // namespace duopane
