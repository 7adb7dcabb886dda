// Internal helpers shared by the executor translation units.
#pragma once
#include "duopane/FileOperationExecutor.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

namespace duopane {
namespace detail {

namespace fs = std::filesystem;

// Per-call state: counters, the streaming buffer and the stop flag.
class RunContext {
public:
    using Clock = std::chrono::steady_clock;

    RunContext(const ExecutionHooks &hooks, const ExecutorOptions &opt);

    const ExecutionHooks &hooks;
    const ExecutorOptions &opt;
    OperationResult result;
    std::vector<char> buffer;

    std::uint64_t filesTotal = 0;
    std::uint64_t bytesTotal = 0;
    std::uint64_t fileIndex = 0; // files started so far
    std::uint64_t bytesDone = 0;
    bool indeterminate = false;
    // Full path of the item being worked on, reported with each snapshot.
    std::string currentPath;
    // Job destination; when it disappears write errors become fatal.
    fs::path destinationRoot;

    // Checkpoint: true once the job must stop (cancel, CancelAll or fatal).
    bool stopRequested();
    bool stopped() const { return stop_; }
    void markCancelled();
    // Records an error; fatal ones stop the run.
    void fail(const std::string &path, const std::string &message, bool fatal);
    // Write-side errors are classified (disk full, read-only volume and a
    // vanished destination are fatal); read-side errors never are.
    void failErrno(const std::string &path, const std::string &what, int code,
                   bool writeSide);

    // Emits progress when forced or when the slice elapsed.
    void emit(const std::string &currentFile, bool force);

    // Fills duration and success; returns the result.
    OperationResult finish();

private:
    Clock::time_point started_;
    Clock::time_point lastEmit_;
    bool emittedOnce_ = false;
    bool stop_ = false;
};

struct TreeMeasure {
    std::uint64_t files = 0;
    std::uint64_t bytes = 0;
};

// Counts regular files (and symlinks) below `p`, or 1 for a plain file.
TreeMeasure measureTree(const fs::path &p);

// Directory children sorted by name for a stable processing order.
bool listSorted(const fs::path &dir, std::vector<fs::path> &out,
                std::error_code &ec);

// Streams src into dst (created/truncated). Returns 0 or an errno value;
// `interrupted` is set when the run was stopped at a chunk boundary, in which
// case the partial destination is removed. `failedOnWrite` tells which side
// failed.
int streamFile(const fs::path &src, const fs::path &dst, RunContext &ctx,
               const std::string &label, bool &interrupted,
               bool &failedOnWrite);

// Moves up to `limit` bytes from `in` to `out` through ctx.buffer, checking
// for cancellation before every chunk. Returns 0 or an errno value.
int pump(std::FILE *in, std::FILE *out, std::uint64_t limit, RunContext &ctx,
         const std::string &label, bool &interrupted, bool &failedOnWrite,
         std::uint64_t &written);

enum class Outcome { Proceed, Skip, Stop };

// Asks the resolver about an existing destination until it names a free
// target or settles the conflict. `overwrite` is set when the existing entry
// is to be replaced (files) or merged into (directories).
Outcome resolveExisting(const fs::path &src, fs::path &dst, RunContext &ctx,
                        bool &overwrite);

// "dir/" and "dir/." both name "dir".
fs::path normalizedSource(const std::string &s);

// Copies modification time and permission bits.
bool preserveAttributes(const fs::path &src, const fs::path &dst,
                        std::string &err);

} // namespace detail
} // namespace duopane
