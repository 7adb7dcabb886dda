#include "duopane/JobModel.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <sstream>

namespace duopane {

const char *jobKindName(JobKind kind) {
    switch (kind) {
    case JobKind::Copy:
        return "Copy";
    case JobKind::Move:
        return "Move";
    case JobKind::Delete:
        return "Delete";
    case JobKind::Split:
        return "Split";
    case JobKind::Join:
        return "Join";
    case JobKind::Compare:
        return "Compare";
    case JobKind::ArchiveOp:
        return "ArchiveOp";
    case JobKind::ScanSize:
        return "ScanSize";
    }
    return "Unknown";
}

const char *jobStateName(JobState state) {
    switch (state) {
    case JobState::Queued:
        return "Queued";
    case JobState::Running:
        return "Running";
    case JobState::Paused:
        return "Paused";
    case JobState::Completed:
        return "Completed";
    case JobState::Failed:
        return "Failed";
    case JobState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char *collisionActionName(CollisionDecision::Action action) {
    switch (action) {
    case CollisionDecision::Action::Skip:
        return "Skip";
    case CollisionDecision::Action::Overwrite:
        return "Overwrite";
    case CollisionDecision::Action::Rename:
        return "Rename";
    case CollisionDecision::Action::CancelAll:
        return "CancelAll";
    }
    return "Unknown";
}

bool canTransition(JobState from, JobState to) {
    if (isTerminal(from))
        return false;
    switch (from) {
    case JobState::Queued:
        // Failed covers specs rejected before admission.
        return to == JobState::Running || to == JobState::Cancelled ||
               to == JobState::Failed;
    case JobState::Running:
        return to == JobState::Paused || isTerminal(to);
    case JobState::Paused:
        return to == JobState::Running || to == JobState::Cancelled ||
               to == JobState::Failed;
    default:
        return false;
    }
}

ErrorSeverity classifyErrno(int code) {
    switch (code) {
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
    case EROFS:
    case EIO:
    case ENODEV:
    case ENXIO:
        return ErrorSeverity::JobFatal;
    default:
        return ErrorSeverity::PerFile;
    }
}

std::string OperationError::describe() const {
    if (path.empty())
        return message;
    return path + ": " + message;
}

std::optional<OperationError> OperationResult::fatalError() const {
    for (const auto &e : errors) {
        if (e.fatal)
            return e;
    }
    return std::nullopt;
}

void OperationResult::addError(std::string path, std::string message,
                               bool isFatal) {
    errors.push_back({std::move(path), std::move(message), isFatal});
    if (isFatal)
        fatal = true;
}

std::string completionMessage(const OperationResult &r, std::size_t maxErrors) {
    std::ostringstream out;
    if (r.cancelled)
        out << "Cancelled: ";
    else if (r.fatal)
        out << "Failed: ";
    else
        out << "Done: ";
    out << r.filesProcessed << " processed, " << r.filesSkipped << " skipped";
    if (!r.errors.empty()) {
        out << ", " << r.errors.size() << " error(s)";
        const std::size_t shown = std::min(maxErrors, r.errors.size());
        for (std::size_t i = 0; i < shown; ++i)
            out << (i == 0 ? ": " : "; ") << r.errors[i].describe();
        if (r.errors.size() > shown)
            out << "; ...";
    }
    return out.str();
}

std::string summaryLine(std::uint64_t jobId, JobKind kind, JobState state,
                        const OperationResult &r) {
    char duration[32];
    std::snprintf(duration, sizeof(duration), "%.2fs",
                  static_cast<double>(r.duration.count()) / 1000.0);
    std::ostringstream out;
    out << "job=" << jobId << " kind=" << jobKindName(kind)
        << " state=" << jobStateName(state)
        << " processed=" << r.filesProcessed
        << " skipped=" << r.filesSkipped << " bytes=" << r.bytesProcessed
        << " errors=" << r.errors.size() << " duration=" << duration;
    if (auto f = r.fatalError())
        out << " fatal=\"" << f->describe() << "\"";
    return out.str();
}

} // namespace duopane
