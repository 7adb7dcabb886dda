// Scheduler implementation: FIFO admission with a concurrency cap, one
// worker thread per admitted job, collision pauses through the resolver.
#include "JobScheduler.hpp"
#include "EngineLogging.hpp"
#include "duopane/SplitNaming.hpp"

#include <QMetaObject>
#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

namespace duopane {

namespace {

std::vector<std::string> toStdList(const QStringList &l) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(l.size()));
    for (const auto &s : l)
        out.push_back(s.toStdString());
    return out;
}

} // namespace

JobScheduler::JobScheduler(JobRegistry &registry, ProgressAggregator &progress,
                           const ArchiveRegistry *archives,
                           EngineSettings settings, QObject *parent)
    : QObject(parent), registry_(registry), progress_(progress),
      archives_(archives), settings_(std::move(settings)),
      executor_(settings_.executorOptions()) {
    maxSimultaneous_ = clampMaxSimultaneousJobs(settings_.maxSimultaneousJobs);

    resolver_.setPauseHook([this](const CollisionRequest &req) {
        const quint64 id = req.jobId;
        registry_.setPendingCollision(id, req);
        registry_.transition(id, JobState::Paused);
        qCInfo(dpCollision) << "job paused on collision"
                            << "job=" << id
                            << "source=" << QString::fromStdString(req.source.path)
                            << "destination="
                            << QString::fromStdString(req.destination.path);
        QMetaObject::invokeMethod(
            this,
            [this, id] {
                emit jobStateChanged(id, JobState::Paused);
                emit jobsChanged();
                emit collisionRequested(id);
            },
            Qt::QueuedConnection);
    });
    resolver_.setResumeHook([this](std::uint64_t id, const CollisionDecision &d) {
        registry_.setPendingCollision(id, std::nullopt);
        qCInfo(dpCollision) << "collision resolved"
                            << "job=" << id
                            << "action=" << collisionActionName(d.action)
                            << "applyToAll=" << d.applyToAll;
        // CancelAll: the job finalizes straight from Paused.
        if (d.action == CollisionDecision::Action::CancelAll)
            return;
        if (registry_.transition(id, JobState::Running))
            notifyState(id, JobState::Running);
    });
}

JobScheduler::~JobScheduler() {
    shuttingDown_ = true;
    cancelAll();
    std::unordered_map<quint64, std::thread> workersToJoin;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        workersToJoin.swap(workers_);
        finishedWorkers_.clear();
    }
    for (auto &kv : workersToJoin) {
        if (kv.second.joinable())
            kv.second.join();
    }
    running_ = 0;
}

QString JobScheduler::validate(const JobSpec &spec) {
    if (spec.sources.isEmpty())
        return QStringLiteral("No source entries");
    switch (spec.kind) {
    case JobKind::Copy:
    case JobKind::Move:
        if (spec.destination.isEmpty())
            return QStringLiteral("Destination directory required");
        break;
    case JobKind::Split:
        if (spec.sources.size() != 1)
            return QStringLiteral("Split takes exactly one file");
        if (spec.partSize == 0)
            return QStringLiteral("Part size must be greater than zero");
        break;
    case JobKind::ArchiveOp:
        if (spec.archiveAction == ArchiveAction::Extract) {
            if (spec.sources.size() != 1)
                return QStringLiteral("Extract takes exactly one archive");
            if (spec.destination.isEmpty())
                return QStringLiteral("Extraction directory required");
        } else if (spec.destination.isEmpty()) {
            return QStringLiteral("Archive path required");
        }
        break;
    case JobKind::Delete:
    case JobKind::Join:
    case JobKind::Compare:
    case JobKind::ScanSize:
        break;
    }
    return {};
}

JobHandle JobScheduler::submit(const JobSpec &spec) {
    const QString problem = validate(spec);
    const quint64 id = registry_.add(spec);
    if (!problem.isEmpty()) {
        qCWarning(dpJobs) << "job rejected"
                          << "job=" << id
                          << "kind=" << jobKindName(spec.kind)
                          << "reason=" << problem;
        OperationResult r;
        r.addError(spec.sources.isEmpty() ? std::string()
                                          : spec.sources.front().toStdString(),
                   problem.toStdString(), true);
        finalizeWithoutRunning(id, spec.kind, JobState::Failed, r);
        return {id};
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.push_back(id);
        flags_[id] = std::make_shared<CancellationFlag>();
    }
    qCInfo(dpJobs) << "job submitted"
                   << "job=" << id
                   << "kind=" << jobKindName(spec.kind)
                   << "sources=" << spec.sources.size();
    emit jobStateChanged(id, JobState::Queued);
    emit jobsChanged();
    if (!shuttingDown_)
        schedule();
    return {id};
}

void JobScheduler::schedule() {
    if (shuttingDown_)
        return;
    joinFinishedWorkers();
    while (running_.load() < maxSimultaneous_.load()) {
        quint64 id = 0;
        std::shared_ptr<CancellationFlag> flag;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (queue_.empty())
                break;
            id = queue_.front();
            queue_.pop_front();
            auto it = flags_.find(id);
            if (it != flags_.end())
                flag = it->second;
        }
        const auto rec = registry_.find(id);
        if (!rec || !flag || rec->state != JobState::Queued)
            continue;
        if (!registry_.transition(id, JobState::Running))
            continue;
        running_.fetch_add(1);
        qCInfo(dpJobs) << "job admitted"
                       << "job=" << id
                       << "kind=" << jobKindName(rec->spec.kind)
                       << "active=" << running_.load()
                       << "max=" << maxSimultaneous_.load();
        emit jobStateChanged(id, JobState::Running);
        emit jobsChanged();
        launch(id, rec->spec, flag);
    }
}

void JobScheduler::launch(quint64 id, const JobSpec &spec,
                          std::shared_ptr<CancellationFlag> flag) {
    std::lock_guard<std::mutex> wl(workersMutex_);
    workers_[id] = std::thread([this, id, spec, flag]() {
        ExecutionHooks hooks;
        hooks.jobId = id;
        hooks.shouldCancel = [flag]() { return flag->isCancelled(); };
        hooks.progress = [this, id](const ProgressSnapshot &s) {
            registry_.updateProgress(id, s);
            progress_.report(id, s);
        };
        hooks.resolveCollision = [this](const CollisionRequest &req) {
            return resolver_.awaitDecision(req);
        };
        OperationResult r;
        try {
            r = runJob(spec, hooks);
        } catch (const std::exception &e) {
            r = OperationResult{};
            r.addError(spec.sources.isEmpty() ? std::string()
                                              : spec.sources.front().toStdString(),
                       std::string("Unexpected failure: ") + e.what(), true);
        }
        finishJob(id, spec.kind, r);
    });
}

OperationResult JobScheduler::runJob(const JobSpec &spec,
                                     const ExecutionHooks &hooks) const {
    const std::string destination = spec.destination.toStdString();
    switch (spec.kind) {
    case JobKind::Copy:
        return executor_.copy(toStdList(spec.sources), destination, hooks);
    case JobKind::Move:
        return executor_.move(toStdList(spec.sources), destination, hooks);
    case JobKind::Delete:
        return executor_.remove(toStdList(spec.sources), hooks);
    case JobKind::Split:
        return executor_.split(spec.sources.front().toStdString(), spec.partSize,
                               destination, hooks);
    case JobKind::Join: {
        std::vector<std::string> parts = toStdList(spec.sources);
        // A single part stands for its whole sibling set.
        if (parts.size() == 1) {
            std::vector<std::string> found;
            std::string err;
            if (!discoverParts(parts.front(), executor_.options().naming, found,
                               err)) {
                OperationResult r;
                r.addError(parts.front(), err, true);
                return r;
            }
            parts.swap(found);
        }
        return executor_.join(parts, destination, hooks);
    }
    case JobKind::Compare:
        return executor_.compare(toStdList(spec.sources),
                                 toStdList(spec.compareWith), spec.criteria,
                                 hooks);
    case JobKind::ScanSize:
        return executor_.scanSize(toStdList(spec.sources), hooks);
    case JobKind::ArchiveOp:
        return runArchive(spec, hooks);
    }
    OperationResult r;
    r.addError({}, "Unknown job kind", true);
    return r;
}

OperationResult JobScheduler::runArchive(const JobSpec &spec,
                                         const ExecutionHooks &hooks) const {
    const bool extract = spec.archiveAction == ArchiveAction::Extract;
    const std::string archivePath = extract ? spec.sources.front().toStdString()
                                            : spec.destination.toStdString();
    const auto provider = archives_ ? archives_->providerFor(archivePath) : nullptr;
    if (!provider) {
        OperationResult r;
        r.addError(archivePath, "No archive provider for this file type", true);
        return r;
    }
    const auto started = std::chrono::steady_clock::now();
    OperationResult r =
        extract ? provider->extract(archivePath, spec.destination.toStdString(),
                                    hooks.progress, hooks.shouldCancel)
                : provider->compress(toStdList(spec.sources), archivePath,
                                     hooks.progress, hooks.shouldCancel);
    r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (!r.fatal && r.fatalError())
        r.fatal = true;
    r.success = !r.cancelled && !r.fatal && r.errors.empty();
    return r;
}

void JobScheduler::finishJob(quint64 id, JobKind kind, const OperationResult &r) {
    const JobState state = r.cancelled ? JobState::Cancelled
                           : r.fatal   ? JobState::Failed
                                       : JobState::Completed;
    registry_.finalize(id, state, r);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        flags_.erase(id);
        resolver_.forget(id);
    }
    const QString line = QString::fromStdString(summaryLine(id, kind, state, r));
    if (state == JobState::Failed)
        qCWarning(dpJobs).noquote() << line;
    else
        qCInfo(dpJobs).noquote() << line;
    progress_.finish(id, state, r);
    notifyState(id, state);
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        finishedWorkers_.insert(id);
    }
    decrementRunningCounter();
    QMetaObject::invokeMethod(this, "schedule", Qt::QueuedConnection);
}

void JobScheduler::finalizeWithoutRunning(quint64 id, JobKind kind,
                                          JobState state,
                                          const OperationResult &r) {
    registry_.finalize(id, state, r);
    qCInfo(dpJobs).noquote()
        << QString::fromStdString(summaryLine(id, kind, state, r));
    progress_.finish(id, state, r);
    emit jobStateChanged(id, state);
    emit jobsChanged();
}

void JobScheduler::notifyState(quint64 id, JobState state) {
    QMetaObject::invokeMethod(
        this,
        [this, id, state] {
            emit jobStateChanged(id, state);
            emit jobsChanged();
        },
        Qt::QueuedConnection);
}

void JobScheduler::cancel(quint64 id) {
    bool wasQueued = false;
    bool active = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto q = std::find(queue_.begin(), queue_.end(), id);
        if (q != queue_.end()) {
            queue_.erase(q);
            wasQueued = true;
        }
        auto f = flags_.find(id);
        if (f != flags_.end()) {
            f->second->requestCancel();
            if (wasQueued) {
                flags_.erase(f);
            } else {
                active = true;
                // Wakes the worker if it is parked on a collision.
                resolver_.abandon(id);
            }
        }
    }
    qCInfo(dpJobs) << "cancel requested"
                   << "job=" << id
                   << "queued=" << wasQueued
                   << "active=" << active;
    if (wasQueued) {
        const auto rec = registry_.find(id);
        OperationResult r;
        r.cancelled = true;
        finalizeWithoutRunning(id, rec ? rec->spec.kind : JobKind::Copy,
                               JobState::Cancelled, r);
    }
}

void JobScheduler::cancelAll() {
    const auto live = registry_.list(
        [](const JobRecord &r) { return !isTerminal(r.state); });
    for (const auto &r : live)
        cancel(r.id);
}

bool JobScheduler::resolveCollision(quint64 id, const CollisionDecision &decision) {
    const bool ok = resolver_.resolve(id, decision);
    if (!ok)
        qCWarning(dpCollision) << "no pending collision"
                               << "job=" << id
                               << "action=" << collisionActionName(decision.action);
    return ok;
}

quint64 JobScheduler::subscribe(quint64 jobId,
                                ProgressAggregator::ProgressFn onProgress,
                                ProgressAggregator::CompletionFn onCompletion) {
    if (jobId != 0) {
        const auto rec = registry_.find(jobId);
        if (!rec) {
            qCWarning(dpJobs) << "subscribe to unknown job" << "job=" << jobId;
            return 0;
        }
        // Completion was delivered before this subscriber existed.
        if (isTerminal(rec->state) && !progress_.completionPending(jobId)) {
            if (onCompletion) {
                const JobState state = rec->state;
                const OperationResult result = rec->result.value_or(OperationResult{});
                QMetaObject::invokeMethod(
                    this,
                    [onCompletion, jobId, state, result] {
                        onCompletion(jobId, state, result);
                    },
                    Qt::QueuedConnection);
            }
            return 0;
        }
    }
    return progress_.subscribe(jobId, std::move(onProgress),
                               std::move(onCompletion));
}

void JobScheduler::unsubscribe(quint64 subscriptionId) {
    progress_.unsubscribe(subscriptionId);
}

QVector<JobRecord> JobScheduler::listJobs(const JobFilter &filter) const {
    return registry_.list(filter);
}

std::optional<JobRecord> JobScheduler::job(quint64 id) const {
    return registry_.find(id);
}

void JobScheduler::setMaxSimultaneousJobs(int n) {
    maxSimultaneous_ = clampMaxSimultaneousJobs(n);
    qCInfo(dpJobs) << "concurrency cap changed" << "max=" << maxSimultaneous_.load();
    schedule();
}

int JobScheduler::activeCountForOrigin(const QString &origin) const {
    return registry_.activeCountForOrigin(origin);
}

QStringList JobScheduler::busyPaths() const {
    return registry_.busyPaths();
}

void JobScheduler::setProgressInterval(int ms) {
    settings_.progressIntervalMs = clampProgressIntervalMs(ms);
    progress_.setInterval(std::chrono::milliseconds(settings_.progressIntervalMs));
    qCInfo(dpJobs) << "progress interval changed"
                   << "ms=" << settings_.progressIntervalMs;
}

int JobScheduler::queuedCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(queue_.size());
}

void JobScheduler::decrementRunningCounter() {
    int current = running_.load();
    while (current > 0 &&
           !running_.compare_exchange_weak(current, current - 1)) {
    }
    if (current <= 0)
        running_.store(0);
}

void JobScheduler::joinFinishedWorkers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        for (const quint64 id : finishedWorkers_) {
            auto it = workers_.find(id);
            if (it != workers_.end()) {
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
        }
        finishedWorkers_.clear();
    }
    for (auto &t : done) {
        if (t.joinable())
            t.join();
    }
}

} // namespace duopane
