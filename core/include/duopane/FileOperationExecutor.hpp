// File operations run by job workers: copy, move, delete, split, join,
// compare and directory-size scan. Every operation streams through one
// fixed-size buffer, reports progress through callbacks and stops at the next
// checkpoint once cancellation is requested.
#pragma once
#include "JobModel.hpp"
#include "SplitNaming.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace duopane {

// Callbacks a worker passes in. All of them are optional.
struct ExecutionHooks {
    std::uint64_t jobId = 0;
    // Checked at every file boundary and every buffer chunk.
    std::function<bool()> shouldCancel;
    // Invoked at file boundaries and, within a file, at most once per
    // ExecutorOptions::progressSlice.
    std::function<void(const ProgressSnapshot &)> progress;
    // Blocks the calling worker until a decision exists. Without a resolver
    // an existing destination is recorded as a per-file error and skipped.
    std::function<CollisionDecision(const CollisionRequest &)> resolveCollision;
};

struct ExecutorOptions {
    std::size_t bufferSize = 1024 * 1024;
    std::chrono::milliseconds progressSlice{50};
    SplitNaming naming;
    std::chrono::seconds timestampTolerance{2};
};

struct CompareMatches {
    std::vector<FileEntry> a; // entries of set A that matched, in A order
    std::vector<FileEntry> b; // entries of set B that matched, in B order
};

// Read-only matching of two entry sets. Directories never match.
CompareMatches compareEntries(const std::vector<FileEntry> &a,
                              const std::vector<FileEntry> &b,
                              CompareCriteria criteria,
                              std::chrono::seconds tolerance);

class FileOperationExecutor {
public:
    explicit FileOperationExecutor(ExecutorOptions opt = {});

    const ExecutorOptions &options() const { return opt_; }

    // Copies sources into the existing directory `destination`, recursively,
    // keeping size, content, modification time and permission bits.
    OperationResult copy(const std::vector<std::string> &sources,
                         const std::string &destination,
                         const ExecutionHooks &hooks) const;

    // Copy + delete with a same-volume rename fast path. A source file is
    // removed only after its destination was written.
    OperationResult move(const std::vector<std::string> &sources,
                         const std::string &destination,
                         const ExecutionHooks &hooks) const;

    // Recursive delete; failures on one entry do not stop the others.
    OperationResult remove(const std::vector<std::string> &entries,
                           const ExecutionHooks &hooks) const;

    // Writes `file` as numbered parts of `partSize` bytes into `outputDir`
    // (the source directory when empty).
    OperationResult split(const std::string &file, std::uint64_t partSize,
                          const std::string &outputDir,
                          const ExecutionHooks &hooks) const;

    // Concatenates parts in numeric order. `output` may be a file path, an
    // existing directory, or empty (next to the first part).
    OperationResult join(const std::vector<std::string> &parts,
                         const std::string &output,
                         const ExecutionHooks &hooks) const;

    // Stats both path sets and returns the matches in result.matchesA/B.
    OperationResult compare(const std::vector<std::string> &setA,
                            const std::vector<std::string> &setB,
                            CompareCriteria criteria,
                            const ExecutionHooks &hooks) const;

    // Recursive size scan with indeterminate progress.
    OperationResult scanSize(const std::vector<std::string> &roots,
                             const ExecutionHooks &hooks) const;

    // lstat-style metadata for one path.
    static bool statEntry(const std::string &path, FileEntry &out,
                          std::string &err);

private:
    ExecutorOptions opt_;
};

} // namespace duopane
