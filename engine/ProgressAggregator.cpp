#include "ProgressAggregator.hpp"
#include "EngineLogging.hpp"

#include <QMetaObject>
#include <QTimer>

namespace duopane {

ProgressAggregator::ProgressAggregator(std::chrono::milliseconds interval,
                                       QObject *parent)
    : QObject(parent), throttle_(interval) {}

quint64 ProgressAggregator::subscribe(quint64 jobId, ProgressFn onProgress,
                                      CompletionFn onCompletion) {
    std::lock_guard<std::mutex> lk(mtx_);
    Subscription s;
    s.id = nextSubId_++;
    s.jobId = jobId;
    s.onProgress = std::move(onProgress);
    s.onCompletion = std::move(onCompletion);
    subs_.push_back(std::move(s));
    return subs_.back().id;
}

void ProgressAggregator::unsubscribe(quint64 subscriptionId) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (int i = 0; i < subs_.size(); ++i) {
        if (subs_[i].id == subscriptionId) {
            subs_.removeAt(i);
            return;
        }
    }
}

std::chrono::milliseconds ProgressAggregator::interval() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return throttle_.interval();
}

bool ProgressAggregator::completionPending(quint64 jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return finished_.count(jobId) != 0;
}

void ProgressAggregator::setInterval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lk(mtx_);
    throttle_.setInterval(interval);
}

void ProgressAggregator::report(quint64 jobId, const ProgressSnapshot &s) {
    std::optional<ProgressSnapshot> now;
    std::optional<std::chrono::milliseconds> delay;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (finished_.count(jobId))
            return;
        const auto t = ProgressThrottle::Clock::now();
        now = throttle_.offer(jobId, s, t);
        if (!now && !flushArmed_.count(jobId)) {
            delay = throttle_.pendingDelay(jobId, t);
            if (delay)
                flushArmed_.insert(jobId);
        }
    }
    if (now) {
        const ProgressSnapshot snap = *now;
        QMetaObject::invokeMethod(
            this, [this, jobId, snap] { deliverProgress(jobId, snap); },
            Qt::QueuedConnection);
    }
    if (delay)
        armFlush(jobId, *delay);
}

void ProgressAggregator::armFlush(quint64 jobId, std::chrono::milliseconds delay) {
    // The timer must be started on the aggregator's own thread.
    const int ms = static_cast<int>(delay.count());
    QMetaObject::invokeMethod(
        this,
        [this, jobId, ms] {
            QTimer::singleShot(ms, this, [this, jobId] { flush(jobId); });
        },
        Qt::QueuedConnection);
}

void ProgressAggregator::flush(quint64 jobId) {
    std::optional<ProgressSnapshot> due;
    std::optional<std::chrono::milliseconds> again;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (finished_.count(jobId)) {
            flushArmed_.erase(jobId);
            return;
        }
        const auto t = ProgressThrottle::Clock::now();
        due = throttle_.flushDue(jobId, t);
        if (!due)
            again = throttle_.pendingDelay(jobId, t);
        if (!again)
            flushArmed_.erase(jobId);
    }
    if (due)
        deliverProgress(jobId, *due);
    else if (again)
        QTimer::singleShot(static_cast<int>(again->count()), this,
                           [this, jobId] { flush(jobId); });
}

void ProgressAggregator::finish(quint64 jobId, JobState state,
                                const OperationResult &r) {
    std::optional<ProgressSnapshot> last;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        finished_.insert(jobId);
        flushArmed_.erase(jobId);
        last = throttle_.finish(jobId);
    }
    qCDebug(dpProgress) << "finish" << "job=" << jobId
                        << "state=" << jobStateName(state)
                        << "pendingSnapshot=" << last.has_value();
    QMetaObject::invokeMethod(
        this,
        [this, jobId, state, r, last] {
            if (last)
                deliverProgress(jobId, *last);
            deliverCompletion(jobId, state, r);
        },
        Qt::QueuedConnection);
}

void ProgressAggregator::deliverProgress(quint64 jobId, const ProgressSnapshot &s) {
    QVector<ProgressFn> targets;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &sub : subs_)
            if ((sub.jobId == 0 || sub.jobId == jobId) && sub.onProgress)
                targets.push_back(sub.onProgress);
    }
    qCInfo(dpProgress) << "progress" << "job=" << jobId
                       << "file=" << s.fileIndex << "/" << s.fileTotal
                       << "bytes=" << s.bytesDone << "/" << s.bytesTotal
                       << "indeterminate=" << s.indeterminate;
    for (const auto &fn : targets)
        fn(jobId, s);
}

void ProgressAggregator::deliverCompletion(quint64 jobId, JobState state,
                                           const OperationResult &r) {
    QVector<CompletionFn> targets;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (int i = 0; i < subs_.size();) {
            const Subscription &sub = subs_[i];
            if (sub.jobId == 0 || sub.jobId == jobId) {
                if (sub.onCompletion)
                    targets.push_back(sub.onCompletion);
                if (sub.jobId == jobId) {
                    subs_.removeAt(i);
                    continue;
                }
            }
            ++i;
        }
        finished_.erase(jobId);
    }
    for (const auto &fn : targets)
        fn(jobId, state, r);
}

} // namespace duopane
