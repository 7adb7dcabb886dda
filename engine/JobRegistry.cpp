#include "JobRegistry.hpp"
#include "EngineLogging.hpp"

#include <algorithm>

namespace duopane {

quint64 JobRegistry::add(const JobSpec &spec) {
    JobRecord r;
    r.spec = spec;
    r.state = JobState::Queued;
    r.createdAtMs = QDateTime::currentMSecsSinceEpoch();
    std::lock_guard<std::mutex> lk(mtx_);
    r.id = nextId_++;
    jobs_.push_back(r);
    return r.id;
}

int JobRegistry::indexForId(quint64 id) const {
    for (int i = 0; i < jobs_.size(); ++i)
        if (jobs_[i].id == id)
            return i;
    return -1;
}

bool JobRegistry::transition(quint64 id, JobState to) {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0)
        return false;
    JobRecord &r = jobs_[i];
    if (!canTransition(r.state, to)) {
        qCWarning(dpJobs) << "illegal transition rejected"
                          << "job=" << id << "from=" << jobStateName(r.state)
                          << "to=" << jobStateName(to);
        return false;
    }
    qCDebug(dpJobs) << "transition" << "job=" << id
                    << "from=" << jobStateName(r.state)
                    << "to=" << jobStateName(to);
    r.state = to;
    if (to == JobState::Running && r.startedAtMs == 0)
        r.startedAtMs = QDateTime::currentMSecsSinceEpoch();
    if (isTerminal(to))
        r.finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    return true;
}

void JobRegistry::updateProgress(quint64 id, const ProgressSnapshot &s) {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0 || isTerminal(jobs_[i].state))
        return;
    ProgressSnapshot &p = jobs_[i].progress;
    p.currentFile = s.currentFile;
    p.currentPath = s.currentPath;
    p.fileIndex = std::max(p.fileIndex, s.fileIndex);
    p.bytesDone = std::max(p.bytesDone, s.bytesDone);
    p.fileTotal = s.fileTotal;
    p.bytesTotal = s.bytesTotal;
    p.indeterminate = s.indeterminate;
    p.timestampMs = std::max(p.timestampMs, s.timestampMs);
}

void JobRegistry::setPendingCollision(quint64 id,
                                      std::optional<CollisionRequest> req) {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i >= 0)
        jobs_[i].pendingCollision = std::move(req);
}

void JobRegistry::addError(quint64 id, const OperationError &e) {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i >= 0)
        jobs_[i].errors.push_back(e);
}

bool JobRegistry::finalize(quint64 id, JobState terminal,
                           const OperationResult &r) {
    if (!isTerminal(terminal))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0)
        return false;
    JobRecord &rec = jobs_[i];
    if (!canTransition(rec.state, terminal)) {
        qCWarning(dpJobs) << "illegal finalize rejected"
                          << "job=" << id << "from=" << jobStateName(rec.state)
                          << "to=" << jobStateName(terminal);
        return false;
    }
    rec.state = terminal;
    rec.finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    rec.pendingCollision.reset();
    for (const auto &e : r.errors)
        rec.errors.push_back(e);
    rec.result = r;
    rec.message = QString::fromStdString(completionMessage(r));
    return true;
}

std::optional<JobRecord> JobRegistry::find(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0)
        return std::nullopt;
    return jobs_[i];
}

QVector<JobRecord> JobRegistry::list(const JobFilter &filter) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!filter)
        return jobs_;
    QVector<JobRecord> out;
    for (const auto &r : jobs_)
        if (filter(r))
            out.push_back(r);
    return out;
}

int JobRegistry::countInState(JobState state) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(std::count_if(
        jobs_.begin(), jobs_.end(),
        [state](const JobRecord &r) { return r.state == state; }));
}

int JobRegistry::activeCountForOrigin(const QString &origin) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(std::count_if(
        jobs_.begin(), jobs_.end(), [&origin](const JobRecord &r) {
            return !isTerminal(r.state) && r.spec.origin == origin;
        }));
}

QStringList JobRegistry::busyPaths() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QStringList out;
    auto add = [&out](const QString &p) {
        if (!p.isEmpty() && !out.contains(p))
            out << p;
    };
    for (const auto &r : jobs_) {
        if (isTerminal(r.state))
            continue;
        add(QString::fromStdString(r.progress.currentPath));
        for (const auto &s : r.spec.sources)
            add(s);
        for (const auto &s : r.spec.compareWith)
            add(s);
        add(r.spec.destination);
    }
    return out;
}

int JobRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return jobs_.size();
}

QString JobRegistry::summaryLine(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0)
        return {};
    const JobRecord &r = jobs_[i];
    OperationResult partial;
    if (r.result) {
        partial = *r.result;
    } else {
        partial.filesProcessed = r.progress.fileIndex;
        partial.bytesProcessed = r.progress.bytesDone;
        partial.errors.assign(r.errors.begin(), r.errors.end());
    }
    return QString::fromStdString(
        duopane::summaryLine(r.id, r.spec.kind, r.state, partial));
}

int JobRegistry::clearFinished() {
    std::lock_guard<std::mutex> lk(mtx_);
    const int before = jobs_.size();
    jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(),
                               [](const JobRecord &r) { return isTerminal(r.state); }),
                jobs_.end());
    return before - jobs_.size();
}

int JobRegistry::clearFinishedOlderThan(int minutes, qint64 nowMs) {
    if (minutes <= 0)
        return 0;
    const qint64 cutoff = nowMs - qint64(minutes) * 60 * 1000;
    std::lock_guard<std::mutex> lk(mtx_);
    const int before = jobs_.size();
    jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(),
                               [cutoff](const JobRecord &r) {
                                   return isTerminal(r.state) &&
                                          r.finishedAtMs > 0 &&
                                          r.finishedAtMs <= cutoff;
                               }),
                jobs_.end());
    return before - jobs_.size();
}

} // namespace duopane
