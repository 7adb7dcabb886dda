// Job registry: every job behind one mutex, shared by the interactive thread
// and the workers. Owned by the caller and injected where needed.
#pragma once
#include "JobRecord.hpp"

#include <QDateTime>
#include <QStringList>
#include <mutex>

namespace duopane {

class JobRegistry {
public:
    // Registers a new Queued job and returns its id (monotonic, never 0).
    quint64 add(const JobSpec &spec);

    // Applies a state change if the state machine allows it; illegal changes
    // are rejected and logged.
    bool transition(quint64 id, JobState to);

    // Counters never go backwards; totals and current file follow the
    // snapshot.
    void updateProgress(quint64 id, const ProgressSnapshot &s);

    void setPendingCollision(quint64 id, std::optional<CollisionRequest> req);
    void addError(quint64 id, const OperationError &e);

    // Moves the job to a terminal state and stores its result.
    bool finalize(quint64 id, JobState terminal, const OperationResult &r);

    std::optional<JobRecord> find(quint64 id) const;
    QVector<JobRecord> list(const JobFilter &filter = {}) const;
    int countInState(JobState state) const;
    int size() const;

    // Non-terminal jobs issued by `origin`.
    int activeCountForOrigin(const QString &origin) const;
    bool isOriginBusy(const QString &origin) const {
        return activeCountForOrigin(origin) > 0;
    }

    // Paths non-terminal jobs are using: the current item, sources, compare
    // set and destination. Deduplicated, in job order.
    QStringList busyPaths() const;

    // One-line summary (see duopane::summaryLine); empty for unknown ids.
    QString summaryLine(quint64 id) const;

    // Housekeeping: drop terminal jobs (all / finished before now - minutes).
    int clearFinished();
    int clearFinishedOlderThan(int minutes,
                               qint64 nowMs = QDateTime::currentMSecsSinceEpoch());

private:
    int indexForId(quint64 id) const;

    mutable std::mutex mtx_;
    QVector<JobRecord> jobs_;
    quint64 nextId_ = 1;
};

} // namespace duopane
