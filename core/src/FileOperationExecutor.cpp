// Copy, move, delete and scan over the local filesystem.
#include "duopane/FileOperationExecutor.hpp"
#include "ExecutorDetail.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <system_error>

namespace duopane {

using namespace detail;

namespace {

bool isWithin(const fs::path &child, const fs::path &parent) {
    std::error_code ec;
    const fs::path c = fs::weakly_canonical(child, ec);
    if (ec)
        return false;
    const fs::path p = fs::weakly_canonical(parent, ec);
    if (ec)
        return false;
    auto pi = p.begin();
    auto ci = c.begin();
    for (; pi != p.end(); ++pi, ++ci) {
        if (ci == c.end() || *pi != *ci)
            return false;
    }
    return true;
}

bool sameDevice(const fs::path &a, const fs::path &b) {
    struct stat sa {};
    struct stat sb {};
    if (::lstat(a.c_str(), &sa) != 0 || ::stat(b.c_str(), &sb) != 0)
        return false;
    return sa.st_dev == sb.st_dev;
}

// Accounts a subtree that will not be processed.
void skipTree(const TreeMeasure &m, RunContext &ctx, const std::string &label) {
    ctx.fileIndex += m.files;
    ctx.bytesDone += m.bytes;
    ctx.result.filesSkipped += m.files;
    ctx.emit(label, true);
}

void copyFile(const fs::path &src, fs::path dst, RunContext &ctx,
              bool removeSource, bool preResolved) {
    std::error_code ec;
    const std::string label = src.filename().string();
    ctx.currentPath = src.string();
    const auto srcStatus = fs::symlink_status(src, ec);
    if (ec || !fs::exists(srcStatus)) {
        ++ctx.fileIndex;
        ++ctx.result.filesSkipped;
        ctx.fail(src.string(), "Source not found", false);
        ctx.emit(label, true);
        return;
    }
    std::uint64_t size = 0;
    if (fs::is_regular_file(srcStatus)) {
        size = fs::file_size(src, ec);
        if (ec)
            size = 0;
    }
    if (!preResolved) {
        bool overwrite = false;
        switch (resolveExisting(src, dst, ctx, overwrite)) {
        case Outcome::Stop:
            return;
        case Outcome::Skip:
            skipTree(TreeMeasure{1, size}, ctx, label);
            return;
        case Outcome::Proceed:
            break;
        }
    }
    // Opening the target for writing would truncate the source.
    if (fs::equivalent(src, dst, ec)) {
        ctx.fail(src.string(), "Source and destination are the same", false);
        skipTree(TreeMeasure{1, size}, ctx, label);
        return;
    }
    ec.clear();

    const std::uint64_t bytesAtStart = ctx.bytesDone;
    ++ctx.fileIndex;
    ctx.emit(label, true);

    bool ok = false;
    const auto dstStatus = fs::symlink_status(dst, ec);
    if (fs::is_directory(dstStatus)) {
        ctx.fail(dst.string(), "Cannot overwrite a directory with a file", false);
    } else if (fs::is_symlink(srcStatus)) {
        if (fs::exists(dstStatus))
            fs::remove(dst, ec);
        ec.clear();
        fs::copy_symlink(src, dst, ec);
        if (ec)
            ctx.failErrno(dst.string(), "Cannot copy link", ec.value(), true);
        else
            ok = true;
    } else if (!fs::is_regular_file(srcStatus)) {
        ctx.fail(src.string(), "Unsupported file type", false);
    } else {
        bool interrupted = false;
        bool onWrite = false;
        const int rc = streamFile(src, dst, ctx, label, interrupted, onWrite);
        if (interrupted)
            return; // partial output already removed
        if (rc != 0) {
            if (onWrite)
                ctx.failErrno(dst.string(), "Write failed", rc, true);
            else
                ctx.failErrno(src.string(), "Read failed", rc, false);
        } else {
            std::string aerr;
            if (!preserveAttributes(src, dst, aerr))
                ctx.fail(dst.string(), aerr, false);
            ok = true;
        }
    }

    ctx.bytesDone = std::max(ctx.bytesDone, bytesAtStart + size);
    if (ok) {
        ++ctx.result.filesProcessed;
        ctx.result.bytesProcessed += size;
        if (removeSource) {
            fs::remove(src, ec);
            if (ec)
                ctx.failErrno(src.string(), "Copied but source not removed",
                              ec.value(), false);
        }
    } else {
        ++ctx.result.filesSkipped;
    }
    ctx.emit(label, true);
}

void copyTree(const fs::path &src, fs::path dst, RunContext &ctx,
              bool removeSource, bool preResolved) {
    std::error_code ec;
    const auto st = fs::symlink_status(src, ec);
    if (ec || !fs::is_directory(st)) {
        copyFile(src, dst, ctx, removeSource, preResolved);
        return;
    }
    const std::string label = src.filename().string();
    ctx.currentPath = src.string();
    if (!preResolved) {
        bool overwrite = false;
        switch (resolveExisting(src, dst, ctx, overwrite)) {
        case Outcome::Stop:
            return;
        case Outcome::Skip:
            skipTree(measureTree(src), ctx, label);
            return;
        case Outcome::Proceed:
            break;
        }
    }
    if (isWithin(dst, src)) {
        ctx.fail(src.string(), "Cannot copy a directory into itself", false);
        skipTree(measureTree(src), ctx, label);
        return;
    }

    // Overwriting a non-directory with a directory replaces it.
    const auto dstStatus = fs::symlink_status(dst, ec);
    if (fs::exists(dstStatus) && !fs::is_directory(dstStatus)) {
        fs::remove(dst, ec);
        if (ec) {
            ctx.failErrno(dst.string(), "Cannot replace", ec.value(), true);
            skipTree(measureTree(src), ctx, label);
            return;
        }
    }
    ec.clear();
    fs::create_directories(dst, ec);
    if (ec) {
        ctx.failErrno(dst.string(), "Cannot create directory", ec.value(), true);
        skipTree(measureTree(src), ctx, label);
        return;
    }

    std::vector<fs::path> children;
    if (!listSorted(src, children, ec)) {
        ctx.failErrno(src.string(), "Cannot list directory", ec.value(), false);
        return;
    }
    for (const auto &child : children) {
        if (ctx.stopRequested())
            return;
        copyTree(child, dst / child.filename(), ctx, removeSource, false);
        if (ctx.stopped())
            return;
    }

    std::string aerr;
    if (!preserveAttributes(src, dst, aerr))
        ctx.fail(dst.string(), aerr, false);
    if (removeSource) {
        // Still holds whatever was skipped; that is not an error.
        fs::remove(src, ec);
        if (ec && ec != std::errc::directory_not_empty)
            ctx.failErrno(src.string(), "Cannot remove source directory",
                          ec.value(), false);
    }
}

void removeTree(const fs::path &p, RunContext &ctx) {
    std::error_code ec;
    const std::string label = p.filename().string();
    ctx.currentPath = p.string();
    const auto st = fs::symlink_status(p, ec);
    if (ec || !fs::exists(st)) {
        ++ctx.fileIndex;
        ++ctx.result.filesSkipped;
        ctx.fail(p.string(), "Not found", false);
        ctx.emit(label, true);
        return;
    }
    if (fs::is_directory(st)) {
        std::vector<fs::path> children;
        if (!listSorted(p, children, ec)) {
            ctx.failErrno(p.string(), "Cannot list directory", ec.value(), false);
            return;
        }
        for (const auto &child : children) {
            if (ctx.stopRequested())
                return;
            removeTree(child, ctx);
            if (ctx.stopped())
                return;
        }
        fs::remove(p, ec);
        // A child that failed already explains why the directory stays.
        if (ec && ec != std::errc::directory_not_empty)
            ctx.failErrno(p.string(), "Cannot remove directory", ec.value(), true);
        return;
    }

    std::uint64_t size = 0;
    if (fs::is_regular_file(st)) {
        size = fs::file_size(p, ec);
        if (ec)
            size = 0;
    }
    ++ctx.fileIndex;
    fs::remove(p, ec);
    if (ec) {
        ++ctx.result.filesSkipped;
        ctx.failErrno(p.string(), "Cannot delete", ec.value(), true);
    } else {
        ++ctx.result.filesProcessed;
        ctx.result.bytesProcessed += size;
    }
    ctx.bytesDone += size;
    ctx.emit(label, true);
}

} // namespace

FileOperationExecutor::FileOperationExecutor(ExecutorOptions opt)
    : opt_(std::move(opt)) {
    if (opt_.bufferSize == 0)
        opt_.bufferSize = 1024 * 1024;
}

OperationResult FileOperationExecutor::copy(const std::vector<std::string> &sources,
                                            const std::string &destination,
                                            const ExecutionHooks &hooks) const {
    RunContext ctx(hooks, opt_);
    const fs::path destRoot(destination);
    std::error_code ec;
    if (destination.empty() || !fs::is_directory(destRoot, ec)) {
        ctx.fail(destination, "Destination directory does not exist", true);
        return ctx.finish();
    }
    ctx.destinationRoot = destRoot;
    for (const auto &s : sources) {
        const TreeMeasure m = measureTree(normalizedSource(s));
        ctx.filesTotal += m.files;
        ctx.bytesTotal += m.bytes;
    }
    ctx.emit({}, true);

    for (const auto &s : sources) {
        if (ctx.stopRequested())
            break;
        const fs::path src = normalizedSource(s);
        copyTree(src, destRoot / src.filename(), ctx, false, false);
    }
    return ctx.finish();
}

OperationResult FileOperationExecutor::move(const std::vector<std::string> &sources,
                                            const std::string &destination,
                                            const ExecutionHooks &hooks) const {
    RunContext ctx(hooks, opt_);
    const fs::path destRoot(destination);
    std::error_code ec;
    if (destination.empty() || !fs::is_directory(destRoot, ec)) {
        ctx.fail(destination, "Destination directory does not exist", true);
        return ctx.finish();
    }
    ctx.destinationRoot = destRoot;
    std::vector<TreeMeasure> measures;
    measures.reserve(sources.size());
    for (const auto &s : sources) {
        measures.push_back(measureTree(normalizedSource(s)));
        ctx.filesTotal += measures.back().files;
        ctx.bytesTotal += measures.back().bytes;
    }
    ctx.emit({}, true);

    for (std::size_t i = 0; i < sources.size(); ++i) {
        if (ctx.stopRequested())
            break;
        const fs::path src = normalizedSource(sources[i]);
        const TreeMeasure &m = measures[i];
        const std::string label = src.filename().string();
        fs::path dst = destRoot / src.filename();
        ctx.currentPath = src.string();

        const auto srcStatus = fs::symlink_status(src, ec);
        if (ec || !fs::exists(srcStatus)) {
            ++ctx.fileIndex;
            ++ctx.result.filesSkipped;
            ctx.fail(src.string(), "Source not found", false);
            ctx.emit(label, true);
            continue;
        }
        if (fs::equivalent(src, dst, ec)) {
            ctx.fail(src.string(), "Source and destination are the same", false);
            skipTree(m, ctx, label);
            continue;
        }

        bool overwrite = false;
        const Outcome o = resolveExisting(src, dst, ctx, overwrite);
        if (o == Outcome::Stop)
            break;
        if (o == Outcome::Skip) {
            skipTree(m, ctx, label);
            continue;
        }

        const bool srcIsDir = fs::is_directory(srcStatus);
        if (srcIsDir && isWithin(dst, src)) {
            ctx.fail(src.string(), "Cannot move a directory into itself", false);
            skipTree(m, ctx, label);
            continue;
        }
        const auto dstStatus = fs::symlink_status(dst, ec);
        const bool dstExists = fs::exists(dstStatus);
        // rename(2) replaces files but cannot merge directories.
        const bool renameFits =
            !dstExists || (!srcIsDir && !fs::is_directory(dstStatus));
        if (renameFits && sameDevice(src, dst.parent_path())) {
            ec.clear();
            fs::rename(src, dst, ec);
            if (!ec) {
                ctx.fileIndex += m.files;
                ctx.bytesDone += m.bytes;
                ctx.result.filesProcessed += m.files;
                ctx.result.bytesProcessed += m.bytes;
                ctx.emit(label, true);
                continue;
            }
            if (ec != std::errc::cross_device_link) {
                ctx.failErrno(src.string(), "Cannot move", ec.value(), true);
                skipTree(m, ctx, label);
                continue;
            }
        }
        // Cross-volume (or merge): copy, deleting each source once written.
        copyTree(src, dst, ctx, true, true);
    }
    return ctx.finish();
}

OperationResult FileOperationExecutor::remove(const std::vector<std::string> &entries,
                                              const ExecutionHooks &hooks) const {
    RunContext ctx(hooks, opt_);
    for (const auto &e : entries) {
        const TreeMeasure m = measureTree(normalizedSource(e));
        ctx.filesTotal += m.files;
        ctx.bytesTotal += m.bytes;
    }
    ctx.emit({}, true);
    for (const auto &e : entries) {
        if (ctx.stopRequested())
            break;
        removeTree(normalizedSource(e), ctx);
    }
    return ctx.finish();
}

OperationResult FileOperationExecutor::scanSize(const std::vector<std::string> &roots,
                                                const ExecutionHooks &hooks) const {
    RunContext ctx(hooks, opt_);
    ctx.indeterminate = true;
    ScanTotals totals;
    ctx.emit({}, true);

    for (const auto &r : roots) {
        if (ctx.stopRequested())
            break;
        const fs::path root = normalizedSource(r);
        std::error_code ec;
        const auto st = fs::symlink_status(root, ec);
        if (ec || !fs::exists(st)) {
            ctx.fail(root.string(), "Not found", false);
            continue;
        }
        ctx.currentPath = root.string();
        if (!fs::is_directory(st)) {
            ++totals.files;
            if (fs::is_regular_file(st)) {
                const auto sz = fs::file_size(root, ec);
                if (!ec)
                    totals.bytes += sz;
            }
            ctx.fileIndex = totals.files;
            ctx.bytesDone = totals.bytes;
            ctx.emit(root.filename().string(), false);
            continue;
        }

        std::vector<fs::path> stack{root};
        std::vector<fs::path> children;
        while (!stack.empty()) {
            if (ctx.stopRequested())
                break;
            const fs::path dir = stack.back();
            stack.pop_back();
            ctx.currentPath = dir.string();
            if (!listSorted(dir, children, ec)) {
                ctx.failErrno(dir.string(), "Cannot list directory", ec.value(),
                              false);
                continue;
            }
            // Reverse push keeps the walk in name order.
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                std::error_code sec;
                const auto cs = fs::symlink_status(*it, sec);
                if (sec)
                    continue;
                if (fs::is_directory(cs)) {
                    ++totals.directories;
                    stack.push_back(*it);
                    continue;
                }
                ++totals.files;
                if (fs::is_regular_file(cs)) {
                    const auto sz = fs::file_size(*it, sec);
                    if (!sec)
                        totals.bytes += sz;
                }
                ctx.fileIndex = totals.files;
                ctx.bytesDone = totals.bytes;
                ctx.emit(it->filename().string(), false);
            }
        }
    }

    ctx.currentPath.clear();
    ctx.result.scan = totals;
    ctx.result.filesProcessed = totals.files;
    ctx.result.bytesProcessed = totals.bytes;
    ctx.fileIndex = totals.files;
    ctx.bytesDone = totals.bytes;
    ctx.emit({}, true);
    return ctx.finish();
}

bool FileOperationExecutor::statEntry(const std::string &path, FileEntry &out,
                                      std::string &err) {
    struct stat sb {};
    if (::lstat(path.c_str(), &sb) != 0) {
        err = "Cannot stat " + path + ": " + std::generic_category().message(errno);
        return false;
    }
    out.path = path;
    out.name = normalizedSource(path).filename().string();
    out.is_dir = S_ISDIR(sb.st_mode);
    out.size = S_ISREG(sb.st_mode) ? static_cast<std::uint64_t>(sb.st_size) : 0;
    out.mtime = static_cast<std::int64_t>(sb.st_mtime);
    return true;
}

} // namespace duopane
