// Engine tests: scheduler admission, cancellation, collision pauses, progress
// throttling, registry bookkeeping and settings (run via CTest).
#include "EngineLogging.hpp"
#include "EngineSettings.hpp"
#include "JobRegistry.hpp"
#include "JobScheduler.hpp"
#include "ProgressAggregator.hpp"
#include "duopane/MockArchiveProvider.hpp"

#include <unistd.h>

#include <QCoreApplication>
#include <QSettings>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace duopane;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const QString &haystack, const QString &needle,
                       const std::string &msg) {
        check(haystack.contains(needle), msg);
    }
};

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string &tag) {
        path = fs::temp_directory_path() /
               ("duopane_engine_" + tag + "_" + std::to_string(::getpid()) + "_" +
                std::to_string(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void writeFile(const fs::path &p, const std::string &content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string readFile(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

// Spins the event loop until `pred` holds or the timeout expires.
bool waitUntil(const std::function<bool()> &pred, int timeoutMs = 5000) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        QCoreApplication::processEvents();
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    QCoreApplication::processEvents();
    return pred();
}

void pumpFor(int ms) {
    waitUntil([] { return false; }, ms);
}

// Archive backend whose extract holds its worker until the archive path is
// released or the job is cancelled.
class BlockingArchiveProvider : public ArchiveProvider {
public:
    std::vector<std::string> supportedExtensions() const override {
        return {".block"};
    }

    void release(const std::string &archivePath) {
        std::lock_guard<std::mutex> lk(mtx_);
        released_.insert(archivePath);
    }

    bool list(const std::string &, std::vector<FileEntry> &out,
              std::string &) override {
        out.clear();
        return true;
    }

    OperationResult extract(const std::string &archivePath, const std::string &,
                            ProgressCB progress,
                            std::function<bool()> shouldCancel) override {
        OperationResult r;
        ProgressSnapshot s;
        s.currentFile = archivePath;
        s.currentPath = archivePath;
        s.fileTotal = 1;
        s.bytesTotal = 1;
        if (progress)
            progress(s);
        for (;;) {
            if (shouldCancel && shouldCancel()) {
                r.cancelled = true;
                return r;
            }
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (released_.count(archivePath))
                    break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        s.fileIndex = 1;
        s.bytesDone = 1;
        if (progress)
            progress(s);
        r.filesProcessed = 1;
        r.bytesProcessed = 1;
        r.success = true;
        return r;
    }

    OperationResult compress(const std::vector<std::string> &, const std::string &path,
                             ProgressCB, std::function<bool()>) override {
        OperationResult r;
        r.addError(path, "Compression not supported", true);
        return r;
    }

private:
    std::mutex mtx_;
    std::set<std::string> released_;
};

JobSpec blockingJob(const std::string &name) {
    JobSpec spec;
    spec.kind = JobKind::ArchiveOp;
    spec.archiveAction = ArchiveAction::Extract;
    spec.sources = QStringList{QString::fromStdString("/virtual/" + name + ".block")};
    spec.destination = QStringLiteral("/virtual/out");
    return spec;
}

struct Engine {
    JobRegistry registry;
    ProgressAggregator progress{std::chrono::milliseconds(50)};
    ArchiveRegistry archives;
    std::shared_ptr<BlockingArchiveProvider> blocking =
        std::make_shared<BlockingArchiveProvider>();
    std::shared_ptr<MockArchiveProvider> mock = std::make_shared<MockArchiveProvider>();
    std::unique_ptr<JobScheduler> scheduler;

    explicit Engine(int maxJobs = 4) {
        archives.registerProvider(blocking);
        archives.registerProvider(mock);
        EngineSettings s;
        s.maxSimultaneousJobs = maxJobs;
        scheduler = std::make_unique<JobScheduler>(registry, progress, &archives, s);
    }
    ~Engine() {
        // Workers must stop before the registry and aggregator go away.
        scheduler.reset();
    }

    JobState stateOf(quint64 id) const {
        const auto rec = registry.find(id);
        return rec ? rec->state : JobState::Failed;
    }
};

void test_admission_cap(TestContext &t) {
    Engine e(4);
    std::vector<quint64> ids;
    for (int i = 0; i < 6; ++i)
        ids.push_back(e.scheduler->submit(blockingJob("a" + std::to_string(i))).id);

    t.check(waitUntil([&] { return e.registry.countInState(JobState::Running) == 4; }),
            "four jobs should be running");
    t.check(e.registry.countInState(JobState::Queued) == 2, "two jobs should wait");
    t.check(e.scheduler->queuedCount() == 2, "queue holds the waiting jobs");
    t.check(e.scheduler->activeCount() == 4, "active count follows the cap");
    t.check(e.stateOf(ids[4]) == JobState::Queued && e.stateOf(ids[5]) == JobState::Queued,
            "admission is in submission order");

    e.blocking->release("/virtual/a1.block");
    t.check(waitUntil([&] { return e.stateOf(ids[1]) == JobState::Completed; }),
            "released job completes");
    t.check(waitUntil([&] { return e.stateOf(ids[4]) == JobState::Running; }),
            "the oldest queued job takes the free slot");
    t.check(e.stateOf(ids[5]) == JobState::Queued, "the next job keeps waiting");
    t.check(e.registry.countInState(JobState::Running) == 4, "cap still holds");

    e.scheduler->setMaxSimultaneousJobs(5);
    t.check(waitUntil([&] { return e.stateOf(ids[5]) == JobState::Running; }),
            "raising the cap admits queued jobs");

    e.scheduler->cancelAll();
    t.check(waitUntil([&] {
                return e.registry.countInState(JobState::Cancelled) == 5;
            }),
            "cancelAll stops every live job");
}

void test_queued_cancel_is_immediate(TestContext &t) {
    Engine e(1);
    const quint64 running = e.scheduler->submit(blockingJob("q0")).id;
    const quint64 queued = e.scheduler->submit(blockingJob("q1")).id;
    t.check(waitUntil([&] { return e.stateOf(running) == JobState::Running; }),
            "first job runs");
    std::atomic<int> completions{0};
    JobState delivered = JobState::Queued;
    e.scheduler->subscribe(queued, {}, [&](quint64, JobState s, const OperationResult &) {
        ++completions;
        delivered = s;
    });
    e.scheduler->cancel(queued);
    t.check(e.stateOf(queued) == JobState::Cancelled,
            "a queued job is cancelled without running");
    t.check(e.scheduler->queuedCount() == 0, "cancelled job leaves the queue");
    t.check(waitUntil([&] { return completions.load() == 1; }),
            "completion is delivered for a queued cancel");
    t.check(delivered == JobState::Cancelled, "completion carries Cancelled");
    const auto rec = e.registry.find(queued);
    t.check(rec && rec->startedAtMs == 0, "a queued cancel never started");

    e.scheduler->cancel(queued);
    t.check(e.stateOf(queued) == JobState::Cancelled, "cancel of a terminal job is a no-op");
    e.scheduler->cancel(running);
    t.check(waitUntil([&] { return e.stateOf(running) == JobState::Cancelled; }),
            "running job stops at its next checkpoint");
}

void test_invalid_spec_fails(TestContext &t) {
    Engine e;
    JobSpec spec;
    spec.kind = JobKind::Split;
    spec.sources = QStringList{"/tmp/whatever.bin"};
    spec.partSize = 0;
    std::atomic<int> completions{0};
    const quint64 id = e.scheduler->submit(spec).id;
    t.check(id != 0, "a rejected job still gets an id");
    t.check(e.stateOf(id) == JobState::Failed, "an invalid JobSpec is Failed at once");
    const auto rec = e.registry.find(id);
    t.check(rec && rec->result && rec->result->fatal, "failure is fatal");
    t.checkContains(rec ? rec->message : QString(), "Failed:", "message says Failed");

    JobSpec empty;
    empty.kind = JobKind::Copy;
    const quint64 id2 = e.scheduler->submit(empty).id;
    e.scheduler->subscribe(0, {}, [&](quint64 job, JobState s, const OperationResult &) {
        if (job == id2 && s == JobState::Failed)
            ++completions;
    });
    t.check(waitUntil([&] { return completions.load() == 1; }),
            "completion reaches catch-all subscribers");
    t.check(e.scheduler->activeCount() == 0, "rejected jobs take no slot");
}

void test_collision_pause_and_resolve(TestContext &t) {
    TempDir tmp("collision");
    writeFile(tmp.path / "src" / "a", "new");
    writeFile(tmp.path / "dst" / "a", "old");
    Engine e(4);

    std::atomic<int> requests{0};
    QObject::connect(e.scheduler.get(), &JobScheduler::collisionRequested,
                     [&](quint64) { ++requests; });

    JobSpec copy;
    copy.kind = JobKind::Copy;
    copy.sources = QStringList{QString::fromStdString((tmp.path / "src" / "a").string())};
    copy.destination = QString::fromStdString((tmp.path / "dst").string());
    const quint64 paused = e.scheduler->submit(copy).id;
    const quint64 other = e.scheduler->submit(blockingJob("c1")).id;

    t.check(waitUntil([&] { return e.stateOf(paused) == JobState::Paused; }),
            "the colliding job pauses");
    t.check(waitUntil([&] { return requests.load() == 1; }),
            "collisionRequested is emitted once");
    const auto rec = e.registry.find(paused);
    t.check(rec && rec->pendingCollision &&
                rec->pendingCollision->destination.size == 3,
            "pending collision describes the destination");
    t.check(e.scheduler->activeCount() == 2, "a paused job keeps its slot");

    e.scheduler->cancel(other);
    t.check(waitUntil([&] { return e.stateOf(other) == JobState::Cancelled; }),
            "the other job is cancelled");
    pumpFor(50);
    t.check(e.stateOf(paused) == JobState::Paused,
            "cancelling one job leaves a paused job paused");

    t.check(!e.scheduler->resolveCollision(other, CollisionDecision::skip()),
            "a job without a pending collision cannot be resolved");
    t.check(e.scheduler->resolveCollision(paused, CollisionDecision::overwrite()),
            "the paused job accepts a decision");
    t.check(waitUntil([&] { return e.stateOf(paused) == JobState::Completed; }),
            "the job resumes and completes");
    t.check(readFile(tmp.path / "dst" / "a") == "new", "overwrite was applied");
    const auto done = e.registry.find(paused);
    t.check(done && !done->pendingCollision, "pending collision is cleared");
    t.checkContains(done ? done->message : QString(), "Done: 1 processed, 0 skipped",
                    "completion message counts the file");
}

void test_cancel_while_paused(TestContext &t) {
    TempDir tmp("paused_cancel");
    writeFile(tmp.path / "src" / "a", "new");
    writeFile(tmp.path / "src" / "b", "new");
    writeFile(tmp.path / "dst" / "a", "old");
    Engine e(2);
    JobSpec copy;
    copy.kind = JobKind::Copy;
    copy.sources = QStringList{QString::fromStdString((tmp.path / "src" / "a").string()),
                               QString::fromStdString((tmp.path / "src" / "b").string())};
    copy.destination = QString::fromStdString((tmp.path / "dst").string());
    const quint64 id = e.scheduler->submit(copy).id;
    t.check(waitUntil([&] { return e.stateOf(id) == JobState::Paused; }),
            "job pauses on the collision");
    e.scheduler->cancel(id);
    t.check(waitUntil([&] { return e.stateOf(id) == JobState::Cancelled; }),
            "cancel wakes a paused job");
    t.check(!fs::exists(tmp.path / "dst" / "b"), "no file starts after the cancel");
    t.check(readFile(tmp.path / "dst" / "a") == "old", "destination untouched");
}

void test_destination_vanishing_fails_job(TestContext &t) {
    TempDir tmp("vanish");
    writeFile(tmp.path / "src" / "a", "new");
    writeFile(tmp.path / "src" / "b", "bb");
    writeFile(tmp.path / "src" / "c", "cc");
    writeFile(tmp.path / "dst" / "a", "old");
    Engine e(2);
    JobSpec move;
    move.kind = JobKind::Move;
    for (const char *name : {"a", "b", "c"})
        move.sources << QString::fromStdString((tmp.path / "src" / name).string());
    move.destination = QString::fromStdString((tmp.path / "dst").string());
    const quint64 id = e.scheduler->submit(move).id;
    t.check(waitUntil([&] { return e.stateOf(id) == JobState::Paused; }),
            "job pauses on the first file");

    fs::remove_all(tmp.path / "dst");
    t.check(e.scheduler->resolveCollision(id, CollisionDecision::skip()),
            "skip is accepted");
    t.check(waitUntil([&] { return e.stateOf(id) == JobState::Failed; }),
            "losing the destination fails the job");
    const auto rec = e.registry.find(id);
    t.check(rec && rec->result && rec->result->fatal, "result is marked fatal");
    t.checkContains(rec ? rec->message : QString(), "Destination unreachable",
                    "message names the fatal error");
    t.check(fs::exists(tmp.path / "src" / "b") && fs::exists(tmp.path / "src" / "c"),
            "remaining sources are untouched");
    t.check(e.scheduler->activeCount() == 0, "the slot is released");
}

void test_origin_and_busy_paths(TestContext &t) {
    Engine e(4);
    JobSpec left = blockingJob("left");
    left.origin = QStringLiteral("left");
    left.label = QStringLiteral("Extract left");
    left.description = QStringLiteral("left.block to /virtual/out");
    JobSpec right = blockingJob("right");
    right.origin = QStringLiteral("right");
    right.destination = QStringLiteral("/virtual/other");
    const quint64 l = e.scheduler->submit(left).id;
    const quint64 r = e.scheduler->submit(right).id;

    t.check(waitUntil([&] { return e.registry.countInState(JobState::Running) == 2; }),
            "both jobs run");
    t.check(e.scheduler->activeCountForOrigin("left") == 1,
            "active count is scoped to the origin");
    t.check(e.registry.isOriginBusy("right"), "the right pane is busy");
    t.check(!e.registry.isOriginBusy("bottom"), "an unused origin is idle");
    const auto rec = e.registry.find(l);
    t.check(rec && rec->spec.label == "Extract left" &&
                rec->spec.description == "left.block to /virtual/out",
            "label and description are kept on the record");

    t.check(waitUntil([&] {
                return e.registry.find(l)->progress.currentPath == "/virtual/left.block";
            }),
            "the record follows the current path");
    const QStringList busy = e.scheduler->busyPaths();
    t.check(busy.contains("/virtual/left.block") && busy.contains("/virtual/right.block"),
            "sources are busy");
    t.check(busy.contains("/virtual/out") && busy.contains("/virtual/other"),
            "destinations are busy");
    t.check(busy.count("/virtual/left.block") == 1, "busy paths are deduplicated");

    e.scheduler->cancel(l);
    t.check(waitUntil([&] { return e.stateOf(l) == JobState::Cancelled; }),
            "left job is cancelled");
    t.check(!e.registry.isOriginBusy("left"), "left pane is idle after the cancel");
    t.check(!e.scheduler->busyPaths().contains("/virtual/left.block"),
            "finished jobs release their paths");
    e.blocking->release("/virtual/right.block");
    t.check(waitUntil([&] { return e.stateOf(r) == JobState::Completed; }),
            "right job completes");
    t.check(e.scheduler->busyPaths().isEmpty(), "nothing is busy when idle");
}

void test_subscribe_after_completion(TestContext &t) {
    Engine e(2);
    const quint64 id = e.scheduler->submit(blockingJob("late")).id;
    e.blocking->release("/virtual/late.block");
    t.check(waitUntil([&] { return e.stateOf(id) == JobState::Completed; }),
            "job completes");
    pumpFor(30);

    int completions = 0;
    int progress = 0;
    JobState seen = JobState::Queued;
    std::uint64_t processed = 0;
    const quint64 sub = e.scheduler->subscribe(
        id, [&](quint64, const ProgressSnapshot &) { ++progress; },
        [&](quint64, JobState st, const OperationResult &r) {
            ++completions;
            seen = st;
            processed = r.filesProcessed;
        });
    t.check(sub == 0, "no subscription is kept for a finished job");
    t.check(waitUntil([&] { return completions == 1; }),
            "a late subscriber still gets the completion");
    pumpFor(50);
    t.check(completions == 1 && progress == 0, "the completion is delivered once");
    t.check(seen == JobState::Completed && processed == 1,
            "the completion carries the stored result");
    t.check(e.scheduler->subscribe(9999, {}, {}) == 0, "unknown jobs are rejected");
}

void test_progress_interval_change(TestContext &t) {
    ProgressAggregator agg(std::chrono::milliseconds(5000));
    int got = 0;
    agg.subscribe(3, [&](quint64, const ProgressSnapshot &) { ++got; });
    ProgressSnapshot s;
    s.fileIndex = 1;
    agg.report(3, s);
    s.fileIndex = 2;
    agg.report(3, s);
    pumpFor(30);
    t.check(got == 1, "the long window holds the second report back");

    agg.setInterval(std::chrono::milliseconds(20));
    t.check(agg.interval() == std::chrono::milliseconds(20), "interval is replaced");
    pumpFor(40);
    s.fileIndex = 3;
    agg.report(3, s);
    t.check(waitUntil([&] { return got >= 2; }, 500),
            "reports follow the shorter window");

    Engine e(1);
    e.scheduler->setProgressInterval(1);
    t.check(e.progress.interval() == std::chrono::milliseconds(16),
            "scheduler clamps the interval floor");
    e.scheduler->setProgressInterval(60000);
    t.check(e.progress.interval() == std::chrono::milliseconds(5000),
            "scheduler clamps the interval ceiling");
    t.check(clampProgressIntervalMs(300) == 300, "values in range are kept");
}

void test_end_to_end_jobs(TestContext &t) {
    TempDir tmp("e2e");
    writeFile(tmp.path / "data.bin", std::string(2500, 'x'));
    Engine e(4);

    JobSpec split;
    split.kind = JobKind::Split;
    split.sources = QStringList{QString::fromStdString((tmp.path / "data.bin").string())};
    split.partSize = 1000;
    std::vector<ProgressSnapshot> seen;
    const quint64 s = e.scheduler->submit(split).id;
    e.scheduler->subscribe(s, [&](quint64, const ProgressSnapshot &p) {
        seen.push_back(p);
    });
    t.check(waitUntil([&] { return e.stateOf(s) == JobState::Completed; }),
            "split completes");
    const auto rec = e.registry.find(s);
    t.check(rec && rec->result && rec->result->producedPaths.size() == 3,
            "split produces three parts");

    fs::rename(tmp.path / "data.bin", tmp.path / "original.bin");
    JobSpec join;
    join.kind = JobKind::Join;
    join.sources = QStringList{QString::fromStdString((tmp.path / "data.bin.002").string())};
    const quint64 j = e.scheduler->submit(join).id;
    t.check(waitUntil([&] { return e.stateOf(j) == JobState::Completed; }),
            "join from one part completes");
    t.check(readFile(tmp.path / "data.bin") == readFile(tmp.path / "original.bin"),
            "joined file matches the original");

    e.mock->addArchive((tmp.path / "bundle.mock").string(),
                       {{"one.txt", "1"}, {"dir/two.txt", "22"}});
    JobSpec extract;
    extract.kind = JobKind::ArchiveOp;
    extract.archiveAction = ArchiveAction::Extract;
    extract.sources = QStringList{QString::fromStdString((tmp.path / "bundle.mock").string())};
    extract.destination = QString::fromStdString((tmp.path / "out").string());
    fs::create_directories(tmp.path / "out");
    const quint64 x = e.scheduler->submit(extract).id;
    t.check(waitUntil([&] { return e.stateOf(x) == JobState::Completed; }),
            "extract through the archive registry completes");
    t.check(readFile(tmp.path / "out" / "dir" / "two.txt") == "22",
            "extracted content is written");

    JobSpec unknown = extract;
    unknown.sources = QStringList{QString::fromStdString((tmp.path / "file.rar").string())};
    const quint64 u = e.scheduler->submit(unknown).id;
    t.check(waitUntil([&] { return e.stateOf(u) == JobState::Failed; }),
            "an archive type without provider fails");

    JobSpec scan;
    scan.kind = JobKind::ScanSize;
    scan.sources = QStringList{QString::fromStdString((tmp.path / "out").string())};
    const quint64 sc = e.scheduler->submit(scan).id;
    t.check(waitUntil([&] { return e.stateOf(sc) == JobState::Completed; }),
            "scan completes");
    const auto scanRec = e.registry.find(sc);
    t.check(scanRec && scanRec->result && scanRec->result->scan.files == 2 &&
                scanRec->result->scan.bytes == 3,
            "scan totals are kept on the record");

    const auto finished = e.scheduler->listJobs(
        [](const JobRecord &r) { return r.state == JobState::Completed; });
    t.check(finished.size() == 4, "listJobs filters by state");
    t.checkContains(e.registry.summaryLine(s), "kind=Split", "summary names the kind");
}

void test_aggregator_throttles(TestContext &t) {
    ProgressAggregator agg(std::chrono::milliseconds(200));
    std::vector<ProgressSnapshot> got;
    int completions = 0;
    int others = 0;
    agg.subscribe(7, [&](quint64, const ProgressSnapshot &s) { got.push_back(s); },
                  [&](quint64, JobState, const OperationResult &) { ++completions; });
    agg.subscribe(8, [&](quint64, const ProgressSnapshot &) { ++others; });

    for (int i = 1; i <= 50; ++i) {
        ProgressSnapshot s;
        s.fileIndex = static_cast<std::uint64_t>(i);
        s.bytesDone = static_cast<std::uint64_t>(i) * 100;
        agg.report(7, s);
    }
    pumpFor(30);
    t.check(got.size() == 1, "a burst yields one immediate notification");
    t.check(!got.empty() && got.front().fileIndex == 1, "the first snapshot goes out");

    t.check(waitUntil([&] { return got.size() == 2; }, 1000),
            "the trailing snapshot is flushed after the window");
    t.check(got.size() == 2 && got.back().fileIndex == 50,
            "the flush carries the latest snapshot");

    ProgressSnapshot last;
    last.fileIndex = 51;
    agg.report(7, last);
    OperationResult r;
    r.success = true;
    agg.finish(7, JobState::Completed, r);
    t.check(waitUntil([&] { return completions == 1; }), "completion is delivered");
    t.check(got.back().fileIndex == 51, "the pending snapshot precedes completion");

    const std::size_t before = got.size();
    agg.report(7, last);
    pumpFor(30);
    t.check(got.size() == before, "job subscribers are dropped after completion");
    t.check(others == 0, "subscribers of other jobs are not notified");

    int catchAll = 0;
    agg.subscribe(0, [&](quint64, const ProgressSnapshot &) { ++catchAll; });
    agg.report(7, last);
    t.check(waitUntil([&] { return catchAll >= 1; }, 1000),
            "finished jobs are forgotten once their completion is delivered");
}

void test_registry_bookkeeping(TestContext &t) {
    JobRegistry reg;
    JobSpec spec;
    spec.kind = JobKind::Delete;
    spec.sources = QStringList{"/x"};
    const quint64 a = reg.add(spec);
    const quint64 b = reg.add(spec);
    t.check(a == 1 && b == 2, "ids are monotonic from 1");

    t.check(!reg.transition(a, JobState::Completed), "Queued -> Completed is illegal");
    t.check(!reg.transition(a, JobState::Paused), "Queued -> Paused is illegal");
    t.check(reg.transition(a, JobState::Running), "Queued -> Running is legal");

    ProgressSnapshot s;
    s.fileIndex = 5;
    s.bytesDone = 500;
    reg.updateProgress(a, s);
    s.fileIndex = 3;
    s.bytesDone = 100;
    reg.updateProgress(a, s);
    auto rec = reg.find(a);
    t.check(rec && rec->progress.fileIndex == 5 && rec->progress.bytesDone == 500,
            "progress counters never go backwards");
    t.checkContains(reg.summaryLine(a), "processed=5", "running summary uses progress");

    OperationResult r;
    r.filesProcessed = 5;
    r.addError("/x/y", "Permission denied");
    t.check(reg.finalize(a, JobState::Completed, r), "Running -> Completed finalizes");
    t.check(!reg.transition(a, JobState::Running), "terminal states are final");
    t.check(!reg.finalize(a, JobState::Failed, r), "a job finalizes once");
    rec = reg.find(a);
    t.check(rec && rec->errors.size() == 1, "result errors are kept on the record");
    t.checkContains(rec ? rec->message : QString(), "1 error(s)",
                    "message lists errors");

    s.fileIndex = 99;
    reg.updateProgress(a, s);
    t.check(reg.find(a)->progress.fileIndex == 5, "terminal jobs ignore progress");

    const qint64 finishedAt = reg.find(a)->finishedAtMs;
    t.check(reg.clearFinishedOlderThan(0, finishedAt) == 0, "0 minutes clears nothing");
    t.check(reg.clearFinishedOlderThan(10, finishedAt + 5 * 60 * 1000) == 0,
            "recent jobs are kept");
    t.check(reg.clearFinishedOlderThan(10, finishedAt + 11 * 60 * 1000) == 1,
            "old finished jobs are cleared");
    t.check(reg.size() == 1 && reg.find(b), "live jobs are never cleared");
    t.check(reg.clearFinished() == 0, "nothing else is finished");
}

void test_settings(TestContext &t) {
    TempDir tmp("settings");
    const QString file = QString::fromStdString((tmp.path / "engine.ini").string());
    {
        QSettings s(file, QSettings::IniFormat);
        s.setValue("Jobs/maxSimultaneous", 500);
        s.setValue("Jobs/progressIntervalMs", 1);
        s.setValue("Jobs/bufferKiB", 0);
        s.setValue("Split/digits", 12);
        s.setValue("Split/style", "PART");
        s.setValue("Compare/timestampToleranceSec", -4);
        s.sync();
    }
    QSettings s(file, QSettings::IniFormat);
    const EngineSettings e = loadEngineSettings(s);
    t.check(e.maxSimultaneousJobs == 64, "job cap is clamped to 64");
    t.check(e.progressIntervalMs == 16, "progress interval has a floor");
    t.check(e.bufferKiB == 4, "buffer size has a floor");
    t.check(e.naming.digits == 9, "part digits are clamped");
    t.check(e.naming.style == SplitNaming::Style::PartPrefixed, "style is case-insensitive");
    t.check(e.timestampToleranceSec == 0, "negative tolerance is clamped");
    t.check(e.progressSliceMs == 50, "missing keys keep defaults");
    t.check(e.executorOptions().bufferSize == 4096, "buffer is passed in bytes");
    t.check(clampMaxSimultaneousJobs(0) == 1, "at least one job runs");

    EngineSettings custom;
    custom.maxSimultaneousJobs = 2;
    custom.naming.firstIndex = 0;
    QSettings out(QString::fromStdString((tmp.path / "saved.ini").string()),
                  QSettings::IniFormat);
    saveEngineSettings(out, custom);
    const EngineSettings back = loadEngineSettings(out);
    t.check(back.maxSimultaneousJobs == 2 && back.naming.firstIndex == 0,
            "saved settings load back");
}

void test_logging_rules(TestContext &t) {
    t.checkContains(engineFilterRules(true), "duopane.*.debug=true",
                    "verbose enables debug");
    const QString quiet = engineFilterRules(false);
    t.checkContains(quiet, "duopane.*.debug=false", "default disables debug");
    t.checkContains(quiet, "duopane.progress.info=false",
                    "default mutes per-snapshot progress");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    qRegisterMetaType<duopane::JobState>("duopane::JobState");
    TestContext t;
    test_admission_cap(t);
    test_queued_cancel_is_immediate(t);
    test_invalid_spec_fails(t);
    test_collision_pause_and_resolve(t);
    test_cancel_while_paused(t);
    test_destination_vanishing_fails_job(t);
    test_origin_and_busy_paths(t);
    test_subscribe_after_completion(t);
    test_progress_interval_change(t);
    test_end_to_end_jobs(t);
    test_aggregator_throttles(t);
    test_registry_bookkeeping(t);
    test_settings(t);
    test_logging_rules(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] duopane_engine_tests\n";
    return EXIT_SUCCESS;
}
