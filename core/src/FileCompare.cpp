// Matching two entry sets by size, timestamp or name.
#include "duopane/FileOperationExecutor.hpp"
#include "ExecutorDetail.hpp"

#include <cctype>
#include <cstdlib>

namespace duopane {

using namespace detail;

namespace {

bool equalsIgnoreCase(const std::string &a, const std::string &b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool entriesMatch(const FileEntry &a, const FileEntry &b, CompareCriteria c,
                  std::chrono::seconds tolerance) {
    switch (c) {
    case CompareCriteria::Size:
        return a.size == b.size;
    case CompareCriteria::Timestamp:
        return std::llabs(static_cast<long long>(a.mtime - b.mtime)) <=
               static_cast<long long>(tolerance.count());
    case CompareCriteria::Name:
        return equalsIgnoreCase(a.name, b.name);
    }
    return false;
}

} // namespace

CompareMatches compareEntries(const std::vector<FileEntry> &a,
                              const std::vector<FileEntry> &b,
                              CompareCriteria criteria,
                              std::chrono::seconds tolerance) {
    std::vector<bool> markedA(a.size(), false);
    std::vector<bool> markedB(b.size(), false);
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].is_dir)
            continue;
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (b[j].is_dir || !entriesMatch(a[i], b[j], criteria, tolerance))
                continue;
            markedA[i] = true;
            markedB[j] = true;
            // A timestamp match pairs with the first candidate only.
            if (criteria == CompareCriteria::Timestamp)
                break;
        }
    }
    CompareMatches m;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (markedA[i])
            m.a.push_back(a[i]);
    for (std::size_t j = 0; j < b.size(); ++j)
        if (markedB[j])
            m.b.push_back(b[j]);
    return m;
}

OperationResult FileOperationExecutor::compare(const std::vector<std::string> &setA,
                                               const std::vector<std::string> &setB,
                                               CompareCriteria criteria,
                                               const ExecutionHooks &hooks) const {
    RunContext ctx(hooks, opt_);
    ctx.filesTotal = setA.size() + setB.size();
    ctx.emit({}, true);

    auto load = [&](const std::vector<std::string> &paths,
                    std::vector<FileEntry> &out) {
        for (const auto &p : paths) {
            if (ctx.stopRequested())
                return;
            ++ctx.fileIndex;
            ctx.currentPath = p;
            FileEntry e;
            std::string err;
            if (!statEntry(p, e, err)) {
                ++ctx.result.filesSkipped;
                ctx.fail(p, err, false);
                continue;
            }
            out.push_back(std::move(e));
            ctx.emit(out.back().name, false);
        }
    };
    std::vector<FileEntry> a;
    std::vector<FileEntry> b;
    load(setA, a);
    load(setB, b);
    if (ctx.stopped())
        return ctx.finish();

    CompareMatches m = compareEntries(a, b, criteria, opt_.timestampTolerance);
    ctx.result.filesProcessed = a.size() + b.size();
    ctx.result.matchesA = std::move(m.a);
    ctx.result.matchesB = std::move(m.b);
    ctx.emit({}, true);
    return ctx.finish();
}

} // namespace duopane
