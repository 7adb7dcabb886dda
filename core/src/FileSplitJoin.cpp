// Split a file into numbered parts and join them back.
#include "duopane/FileOperationExecutor.hpp"
#include "ExecutorDetail.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

namespace duopane {

using namespace detail;

namespace {

std::string errnoText(int code) { return std::strerror(code ? code : EIO); }

} // namespace

OperationResult FileOperationExecutor::split(const std::string &file,
                                             std::uint64_t partSize,
                                             const std::string &outputDir,
                                             const ExecutionHooks &hooks) const {
    RunContext ctx(hooks, opt_);
    const fs::path src(file);
    if (partSize == 0) {
        ctx.fail(file, "Part size must be greater than zero", true);
        return ctx.finish();
    }
    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) {
        ctx.fail(file, "Source file not found", true);
        return ctx.finish();
    }
    const std::uint64_t size = fs::file_size(src, ec);
    if (ec) {
        ctx.fail(file, "Cannot read size: " + ec.message(), true);
        return ctx.finish();
    }
    fs::path outDir = outputDir.empty() ? src.parent_path() : fs::path(outputDir);
    if (outDir.empty())
        outDir = ".";
    if (!fs::is_directory(outDir, ec)) {
        ctx.fail(outDir.string(), "Output directory does not exist", true);
        return ctx.finish();
    }
    ctx.destinationRoot = outDir;

    // An empty source still yields one (empty) part so it can be joined.
    // Rounded up without `size + partSize - 1`, which wraps near UINT64_MAX.
    const std::uint64_t partCount =
        size == 0 ? 1 : size / partSize + (size % partSize != 0 ? 1 : 0);
    ctx.filesTotal = partCount;
    ctx.bytesTotal = size;
    ctx.emit({}, true);

    errno = 0;
    std::FILE *in = std::fopen(src.c_str(), "rb");
    if (!in) {
        ctx.fail(file, "Cannot open source: " + errnoText(errno), true);
        return ctx.finish();
    }
    const std::string base = src.filename().string();
    for (std::uint64_t i = 0; i < partCount; ++i) {
        if (ctx.stopRequested())
            break;
        const fs::path part = outDir / opt_.naming.partName(base, i);
        const std::string label = part.filename().string();
        ctx.currentPath = part.string();
        ++ctx.fileIndex;
        ctx.emit(label, true);

        errno = 0;
        std::FILE *out = std::fopen(part.c_str(), "wb");
        if (!out) {
            ctx.fail(part.string(), "Cannot create part: " + errnoText(errno), true);
            break;
        }
        const std::uint64_t limit = std::min(partSize, size - i * partSize);
        bool interrupted = false;
        bool onWrite = false;
        std::uint64_t written = 0;
        int rc = pump(in, out, limit, ctx, label, interrupted, onWrite, written);
        errno = 0;
        if (std::fclose(out) != 0 && rc == 0 && !interrupted) {
            rc = errno ? errno : EIO;
            onWrite = true;
        }
        if (interrupted || rc != 0 || written != limit) {
            fs::remove(part, ec);
            if (rc != 0)
                ctx.fail(onWrite ? part.string() : file,
                         std::string(onWrite ? "Write failed: " : "Read failed: ") +
                             errnoText(rc),
                         true);
            else if (!interrupted)
                ctx.fail(file, "Source changed while splitting", true);
            break;
        }
        ctx.result.producedPaths.push_back(part.string());
        ++ctx.result.filesProcessed;
        ctx.result.bytesProcessed += written;
        ctx.emit(label, true);
    }
    std::fclose(in);
    return ctx.finish();
}

OperationResult FileOperationExecutor::join(const std::vector<std::string> &parts,
                                            const std::string &output,
                                            const ExecutionHooks &hooks) const {
    RunContext ctx(hooks, opt_);
    std::vector<std::string> ordered;
    std::string baseName;
    std::string err;
    if (!orderParts(parts, opt_.naming, ordered, baseName, err)) {
        ctx.fail(parts.empty() ? output : parts.front(), err, true);
        return ctx.finish();
    }
    std::error_code ec;
    for (const auto &p : ordered) {
        const auto sz = fs::file_size(p, ec);
        if (ec) {
            ctx.fail(p, "Missing part: " + ec.message(), true);
            return ctx.finish();
        }
        ctx.bytesTotal += sz;
    }
    ctx.filesTotal = ordered.size();

    fs::path outPath;
    if (output.empty())
        outPath = fs::path(ordered.front()).parent_path() / baseName;
    else if (fs::is_directory(output, ec))
        outPath = fs::path(output) / baseName;
    else
        outPath = output;
    ctx.destinationRoot = outPath.parent_path().empty() ? fs::path(".")
                                                       : outPath.parent_path();
    ctx.emit({}, true);

    bool overwrite = false;
    switch (resolveExisting(fs::path(ordered.front()), outPath, ctx, overwrite)) {
    case Outcome::Stop:
        return ctx.finish();
    case Outcome::Skip:
        ctx.result.filesSkipped += ordered.size();
        ctx.fileIndex = ordered.size();
        ctx.bytesDone = ctx.bytesTotal;
        ctx.emit(outPath.filename().string(), true);
        return ctx.finish();
    case Outcome::Proceed:
        break;
    }
    for (const auto &p : ordered) {
        if (fs::equivalent(p, outPath, ec)) {
            ctx.fail(outPath.string(), "Output would overwrite one of the parts", true);
            return ctx.finish();
        }
    }

    errno = 0;
    std::FILE *out = std::fopen(outPath.c_str(), "wb");
    if (!out) {
        ctx.fail(outPath.string(), "Cannot create output: " + errnoText(errno), true);
        return ctx.finish();
    }
    bool complete = true;
    for (const auto &p : ordered) {
        if (ctx.stopRequested()) {
            complete = false;
            break;
        }
        const std::string label = fs::path(p).filename().string();
        ctx.currentPath = p;
        ++ctx.fileIndex;
        ctx.emit(label, true);
        errno = 0;
        std::FILE *in = std::fopen(p.c_str(), "rb");
        if (!in) {
            ctx.fail(p, "Cannot open part: " + errnoText(errno), true);
            complete = false;
            break;
        }
        bool interrupted = false;
        bool onWrite = false;
        std::uint64_t written = 0;
        const int rc = pump(in, out, std::numeric_limits<std::uint64_t>::max(), ctx,
                            label, interrupted, onWrite, written);
        std::fclose(in);
        if (interrupted || rc != 0) {
            if (rc != 0)
                ctx.fail(onWrite ? outPath.string() : p,
                         std::string(onWrite ? "Write failed: " : "Read failed: ") +
                             errnoText(rc),
                         true);
            complete = false;
            break;
        }
        ++ctx.result.filesProcessed;
        ctx.result.bytesProcessed += written;
    }
    errno = 0;
    if (std::fclose(out) != 0 && complete) {
        ctx.fail(outPath.string(), "Write failed: " + errnoText(errno), true);
        complete = false;
    }
    if (!complete) {
        fs::remove(outPath, ec);
    } else {
        ctx.result.producedPaths.push_back(outPath.string());
        ctx.emit(outPath.filename().string(), true);
    }
    return ctx.finish();
}

} // namespace duopane
