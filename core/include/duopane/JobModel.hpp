// Shared job model: kinds, states, progress snapshots, collision requests and
// operation results. Plain value types so the engine and any view can copy
// them across threads.
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace duopane {

enum class JobKind { Copy, Move, Delete, Split, Join, Compare, ArchiveOp, ScanSize };

// Job lifecycle:
//  - Queued: waiting for a concurrency slot
//  - Running: executing on a worker
//  - Paused: parked on a collision decision (keeps its slot)
//  - Completed / Failed / Cancelled: terminal, never change again
enum class JobState { Queued, Running, Paused, Completed, Failed, Cancelled };

enum class CompareCriteria { Size, Timestamp, Name };

enum class ArchiveAction { Extract, Compress };

enum class ErrorSeverity { PerFile, JobFatal };

const char *jobKindName(JobKind kind);
const char *jobStateName(JobState state);

inline bool isTerminal(JobState s) {
    return s == JobState::Completed || s == JobState::Failed ||
           s == JobState::Cancelled;
}

// True when the state machine allows from -> to.
bool canTransition(JobState from, JobState to);

// Maps an errno value to the error taxonomy (disk full, read-only volume and
// device errors abort the job; everything else is skippable).
ErrorSeverity classifyErrno(int code);

struct FileEntry {
    std::string path;    // absolute or caller-relative path
    std::string name;    // base name
    bool is_dir = false;
    std::uint64_t size = 0;
    std::int64_t mtime = 0; // epoch seconds
};

struct ProgressSnapshot {
    std::string currentFile;      // display name
    std::string currentPath;      // full path, empty between items
    std::uint64_t fileIndex = 0;  // 1-based index of the current file
    std::uint64_t fileTotal = 0;  // 0 when indeterminate
    std::uint64_t bytesDone = 0;
    std::uint64_t bytesTotal = 0; // 0 when indeterminate
    bool indeterminate = false;   // absolute counts only (scan)
    std::int64_t timestampMs = 0; // steady clock
};

struct CollisionRequest {
    std::uint64_t jobId = 0;
    FileEntry source;
    FileEntry destination;
};

struct CollisionDecision {
    enum class Action { Skip, Overwrite, Rename, CancelAll } action = Action::Skip;
    std::string newName;     // only for Rename
    bool applyToAll = false; // sticky for the rest of the job

    static CollisionDecision skip(bool all = false) {
        return {Action::Skip, {}, all};
    }
    static CollisionDecision overwrite(bool all = false) {
        return {Action::Overwrite, {}, all};
    }
    static CollisionDecision rename(std::string name) {
        return {Action::Rename, std::move(name), false};
    }
    static CollisionDecision cancelAll() {
        return {Action::CancelAll, {}, false};
    }
};

const char *collisionActionName(CollisionDecision::Action action);

struct OperationError {
    std::string path;
    std::string message;
    bool fatal = false;

    std::string describe() const;
};

struct ScanTotals {
    std::uint64_t files = 0;
    std::uint64_t directories = 0;
    std::uint64_t bytes = 0;
};

struct OperationResult {
    bool success = false;
    bool cancelled = false;
    bool fatal = false;
    std::uint64_t filesProcessed = 0;
    std::uint64_t filesSkipped = 0;
    std::uint64_t bytesProcessed = 0;
    std::vector<OperationError> errors;
    std::chrono::milliseconds duration{0};

    // Kind-specific payload
    std::vector<std::string> producedPaths; // split parts, join output, extracted files
    std::vector<FileEntry> matchesA;        // compare
    std::vector<FileEntry> matchesB;
    ScanTotals scan;

    // Returns the fatal error that stopped the job, if any.
    std::optional<OperationError> fatalError() const;
    void addError(std::string path, std::string message, bool isFatal = false);
};

// End-of-job message: processed/skipped counts plus the first few errors.
std::string completionMessage(const OperationResult &r, std::size_t maxErrors = 3);

// One-line summary for the external log sink.
std::string summaryLine(std::uint64_t jobId, JobKind kind, JobState state,
                        const OperationResult &r);

} // namespace duopane
