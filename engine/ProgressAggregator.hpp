// Coalesces worker progress into rate-limited notifications delivered on the
// aggregator's thread (the interactive event loop).
#pragma once
#include "duopane/JobModel.hpp"
#include "duopane/ProgressThrottle.hpp"

#include <QObject>
#include <QVector>
#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_set>

namespace duopane {

class ProgressAggregator : public QObject {
    Q_OBJECT
public:
    using ProgressFn = std::function<void(quint64 jobId, const ProgressSnapshot &)>;
    using CompletionFn =
        std::function<void(quint64 jobId, JobState state, const OperationResult &)>;

    explicit ProgressAggregator(std::chrono::milliseconds interval,
                                QObject *parent = nullptr);

    // jobId 0 subscribes to every job. Job-specific subscriptions are dropped
    // after that job's completion has been delivered. Returns a subscription
    // id for unsubscribe().
    quint64 subscribe(quint64 jobId, ProgressFn onProgress,
                      CompletionFn onCompletion = {});
    void unsubscribe(quint64 subscriptionId);

    // Callable from any thread.
    void report(quint64 jobId, const ProgressSnapshot &s);
    // Delivers the last pending snapshot, then the completion event.
    void finish(quint64 jobId, JobState state, const OperationResult &r);

    std::chrono::milliseconds interval() const;
    // Live update of the delivery interval.
    void setInterval(std::chrono::milliseconds interval);

    // True between finish() and delivery of the job's completion.
    bool completionPending(quint64 jobId) const;

private:
    struct Subscription {
        quint64 id = 0;
        quint64 jobId = 0;
        ProgressFn onProgress;
        CompletionFn onCompletion;
    };

    void deliverProgress(quint64 jobId, const ProgressSnapshot &s);
    void deliverCompletion(quint64 jobId, JobState state, const OperationResult &r);
    void armFlush(quint64 jobId, std::chrono::milliseconds delay);
    void flush(quint64 jobId);

    mutable std::mutex mtx_; // protects throttle_, flushArmed_, finished_, subs_
    ProgressThrottle throttle_;
    std::unordered_set<quint64> flushArmed_;
    // Jobs between finish() and delivery of their completion.
    std::unordered_set<quint64> finished_;
    QVector<Subscription> subs_;
    quint64 nextSubId_ = 1;
};

} // namespace duopane
