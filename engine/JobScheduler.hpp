// Admission control and worker lifecycle for background jobs.
#pragma once
#include "EngineSettings.hpp"
#include "JobRecord.hpp"
#include "JobRegistry.hpp"
#include "ProgressAggregator.hpp"
#include "duopane/ArchiveProvider.hpp"
#include "duopane/CancellationFlag.hpp"
#include "duopane/CollisionResolver.hpp"
#include "duopane/FileOperationExecutor.hpp"

#include <QObject>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace duopane {

// Runs at most maxSimultaneousJobs() jobs at once, one worker thread each.
// Further jobs wait Queued in submission order. A Paused job keeps its slot.
// Public methods are meant for the thread that owns the scheduler; they only
// touch the registry, the queue and per-job flags.
class JobScheduler : public QObject {
    Q_OBJECT
public:
    // `archives` may be null (ArchiveOp jobs then fail).
    JobScheduler(JobRegistry &registry, ProgressAggregator &progress,
                 const ArchiveRegistry *archives, EngineSettings settings,
                 QObject *parent = nullptr);
    ~JobScheduler() override;

    // Registers the job and returns immediately. Invalid specs are finalized
    // Failed without taking a slot.
    JobHandle submit(const JobSpec &spec);

    // Queued jobs become Cancelled at once; running or paused jobs stop at
    // their next checkpoint. Terminal jobs are left alone.
    void cancel(quint64 id);
    void cancelAll();

    // Answers a pending collision. False when the job is not waiting.
    bool resolveCollision(quint64 id, const CollisionDecision &decision);

    // A job that already finished gets its completion queued from the
    // registry and no subscription is kept (returns 0, as for unknown ids).
    quint64 subscribe(quint64 jobId, ProgressAggregator::ProgressFn onProgress,
                      ProgressAggregator::CompletionFn onCompletion = {});
    void unsubscribe(quint64 subscriptionId);

    QVector<JobRecord> listJobs(const JobFilter &filter = {}) const;
    std::optional<JobRecord> job(quint64 id) const;

    int maxSimultaneousJobs() const { return maxSimultaneous_.load(); }
    void setMaxSimultaneousJobs(int n);
    int activeCount() const { return running_.load(); }
    int queuedCount() const;

    // Non-terminal jobs tagged with `origin` (see JobSpec::origin).
    int activeCountForOrigin(const QString &origin) const;
    QStringList busyPaths() const;

    // Applies a new progress interval to running and future jobs.
    void setProgressInterval(int ms);

    const EngineSettings &settings() const { return settings_; }

signals:
    void jobsChanged();
    void jobStateChanged(quint64 id, duopane::JobState state);
    void collisionRequested(quint64 id);

public slots:
    // Admits queued jobs while slots are free.
    void schedule();

private:
    static QString validate(const JobSpec &spec);
    void launch(quint64 id, const JobSpec &spec,
                std::shared_ptr<CancellationFlag> flag);
    OperationResult runJob(const JobSpec &spec, const ExecutionHooks &hooks) const;
    OperationResult runArchive(const JobSpec &spec, const ExecutionHooks &hooks) const;
    void finishJob(quint64 id, JobKind kind, const OperationResult &r);
    void finalizeWithoutRunning(quint64 id, JobKind kind, JobState state,
                                const OperationResult &r);
    // Worker side: hands a state change to the owning thread.
    void notifyState(quint64 id, JobState state);
    void decrementRunningCounter();
    void joinFinishedWorkers();

    JobRegistry &registry_;
    ProgressAggregator &progress_;
    const ArchiveRegistry *archives_ = nullptr;
    EngineSettings settings_;
    FileOperationExecutor executor_;
    CollisionResolver resolver_;

    std::atomic<int> running_{0}; // Running + Paused
    std::atomic<int> maxSimultaneous_{4};
    std::atomic<bool> shuttingDown_{false};

    mutable std::mutex mtx_; // protects queue_ and flags_
    std::deque<quint64> queue_;
    std::unordered_map<quint64, std::shared_ptr<CancellationFlag>> flags_;

    std::mutex workersMutex_; // protects workers_ and finishedWorkers_
    std::unordered_map<quint64, std::thread> workers_;
    std::unordered_set<quint64> finishedWorkers_;
};

} // namespace duopane
