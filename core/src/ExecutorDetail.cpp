#include "ExecutorDetail.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

namespace duopane {
namespace detail {

RunContext::RunContext(const ExecutionHooks &h, const ExecutorOptions &o)
    : hooks(h), opt(o), buffer(std::max<std::size_t>(o.bufferSize, 4096)),
      started_(Clock::now()) {}

bool RunContext::stopRequested() {
    if (stop_)
        return true;
    if (hooks.shouldCancel && hooks.shouldCancel())
        markCancelled();
    return stop_;
}

void RunContext::markCancelled() {
    result.cancelled = true;
    stop_ = true;
}

void RunContext::fail(const std::string &path, const std::string &message,
                      bool fatal) {
    result.addError(path, message, fatal);
    if (fatal)
        stop_ = true;
}

void RunContext::failErrno(const std::string &path, const std::string &what,
                           int code, bool writeSide) {
    bool fatal = writeSide && classifyErrno(code) == ErrorSeverity::JobFatal;
    std::string message = what + ": " + std::strerror(code);
    if (writeSide && !destinationRoot.empty()) {
        std::error_code ec;
        if (!fs::is_directory(destinationRoot, ec)) {
            fatal = true;
            message = "Destination unreachable: " + destinationRoot.string();
        }
    }
    fail(path, message, fatal);
}

void RunContext::emit(const std::string &currentFile, bool force) {
    if (!hooks.progress)
        return;
    const auto now = Clock::now();
    if (!force && emittedOnce_ && now - lastEmit_ < opt.progressSlice)
        return;
    lastEmit_ = now;
    emittedOnce_ = true;
    ProgressSnapshot s;
    s.currentFile = currentFile;
    s.currentPath = currentPath;
    s.fileIndex = fileIndex;
    s.fileTotal = indeterminate ? 0 : filesTotal;
    s.bytesDone = bytesDone;
    s.bytesTotal = indeterminate ? 0 : bytesTotal;
    s.indeterminate = indeterminate;
    s.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    hooks.progress(s);
}

OperationResult RunContext::finish() {
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - started_);
    result.success =
        !result.cancelled && !result.fatal && result.errors.empty();
    return std::move(result);
}

TreeMeasure measureTree(const fs::path &p) {
    TreeMeasure m;
    std::error_code ec;
    const auto st = fs::symlink_status(p, ec);
    if (ec || !fs::exists(st))
        return m;
    if (!fs::is_directory(st)) {
        m.files = 1;
        if (fs::is_regular_file(st)) {
            const auto sz = fs::file_size(p, ec);
            if (!ec)
                m.bytes = sz;
        }
        return m;
    }
    fs::recursive_directory_iterator it(
        p, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        const auto s = it->symlink_status(sec);
        if (sec || fs::is_directory(s))
            continue;
        ++m.files;
        if (fs::is_regular_file(s)) {
            const auto sz = it->file_size(sec);
            if (!sec)
                m.bytes += sz;
        }
    }
    return m;
}

bool listSorted(const fs::path &dir, std::vector<fs::path> &out,
                std::error_code &ec) {
    out.clear();
    fs::directory_iterator it(dir, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec))
        out.push_back(it->path());
    if (ec)
        return false;
    std::sort(out.begin(), out.end());
    return true;
}

int pump(std::FILE *in, std::FILE *out, std::uint64_t limit, RunContext &ctx,
         const std::string &label, bool &interrupted, bool &failedOnWrite,
         std::uint64_t &written) {
    written = 0;
    while (written < limit) {
        if (ctx.stopRequested()) {
            interrupted = true;
            return 0;
        }
        const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(
            ctx.buffer.size(), limit - written));
        errno = 0;
        const std::size_t n = std::fread(ctx.buffer.data(), 1, want, in);
        if (n > 0) {
            errno = 0;
            if (std::fwrite(ctx.buffer.data(), 1, n, out) != n) {
                failedOnWrite = true;
                return errno ? errno : EIO;
            }
            written += n;
            ctx.bytesDone += n;
            ctx.emit(label, false);
        }
        if (n < want) {
            if (std::ferror(in)) {
                failedOnWrite = false;
                return errno ? errno : EIO;
            }
            break; // EOF
        }
    }
    return 0;
}

int streamFile(const fs::path &src, const fs::path &dst, RunContext &ctx,
               const std::string &label, bool &interrupted,
               bool &failedOnWrite) {
    interrupted = false;
    failedOnWrite = false;
    errno = 0;
    std::FILE *in = std::fopen(src.c_str(), "rb");
    if (!in)
        return errno ? errno : EIO;
    errno = 0;
    std::FILE *out = std::fopen(dst.c_str(), "wb");
    if (!out) {
        const int e = errno ? errno : EIO;
        std::fclose(in);
        failedOnWrite = true;
        return e;
    }
    std::uint64_t written = 0;
    int rc = pump(in, out, std::numeric_limits<std::uint64_t>::max(), ctx,
                  label, interrupted, failedOnWrite, written);
    std::fclose(in);
    errno = 0;
    // Delayed write errors (ENOSPC on flush) surface here.
    if (std::fclose(out) != 0 && rc == 0 && !interrupted) {
        rc = errno ? errno : EIO;
        failedOnWrite = true;
    }
    if (rc != 0 || interrupted) {
        std::error_code ec;
        fs::remove(dst, ec);
    }
    return rc;
}

bool preserveAttributes(const fs::path &src, const fs::path &dst,
                        std::string &err) {
    std::error_code ec;
    const auto t = fs::last_write_time(src, ec);
    if (!ec)
        fs::last_write_time(dst, t, ec);
    if (ec) {
        err = "Could not preserve timestamp: " + ec.message();
        return false;
    }
    const auto perms = fs::status(src, ec).permissions();
    if (!ec)
        fs::permissions(dst, perms, ec);
    if (ec) {
        err = "Could not preserve permissions: " + ec.message();
        return false;
    }
    return true;
}

namespace {

bool isValidEntryName(const std::string &name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find('/') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

} // namespace

fs::path normalizedSource(const std::string &s) {
    fs::path p = fs::path(s).lexically_normal();
    if (!p.has_filename() && p.has_parent_path())
        p = p.parent_path();
    return p;
}

Outcome resolveExisting(const fs::path &src, fs::path &dst, RunContext &ctx,
                        bool &overwrite) {
    overwrite = false;
    for (;;) {
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(dst, ec)))
            return Outcome::Proceed;
        if (!ctx.hooks.resolveCollision) {
            ctx.fail(dst.string(), "Destination already exists", false);
            return Outcome::Skip;
        }
        CollisionRequest req;
        req.jobId = ctx.hooks.jobId;
        std::string serr;
        if (!FileOperationExecutor::statEntry(src.string(), req.source, serr))
            req.source.path = src.string();
        if (!FileOperationExecutor::statEntry(dst.string(), req.destination, serr))
            req.destination.path = dst.string();

        const CollisionDecision d = ctx.hooks.resolveCollision(req);
        if (d.action == CollisionDecision::Action::CancelAll) {
            ctx.markCancelled();
            return Outcome::Stop;
        }
        // Cancelled while parked on the decision.
        if (ctx.stopRequested())
            return Outcome::Stop;
        switch (d.action) {
        case CollisionDecision::Action::Skip:
            return Outcome::Skip;
        case CollisionDecision::Action::Overwrite:
            overwrite = true;
            return Outcome::Proceed;
        case CollisionDecision::Action::Rename:
            if (!isValidEntryName(d.newName)) {
                ctx.fail(dst.string(), "Invalid name: " + d.newName, false);
                return Outcome::Skip;
            }
            dst = dst.parent_path() / d.newName;
            continue;
        case CollisionDecision::Action::CancelAll:
            break;
        }
        return Outcome::Stop;
    }
}

} // namespace detail
} // namespace duopane
