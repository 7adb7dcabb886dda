// Job description submitted by commands and the record kept per job.
#pragma once
#include "duopane/JobModel.hpp"

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>
#include <functional>
#include <optional>

namespace duopane {

// What to run. Field use by kind:
//  - Copy/Move: sources -> destination directory
//  - Delete: sources
//  - Split: sources[0], partSize, destination = output dir (optional)
//  - Join: sources = parts, destination = output file or dir (optional)
//  - Compare: sources = set A, compareWith = set B, criteria
//  - ArchiveOp/Extract: sources[0] = archive, destination = target dir
//  - ArchiveOp/Compress: sources -> destination = archive path
//  - ScanSize: sources = roots
// `origin` tags the pane or tab that issued the job; `label` and
// `description` are shown by job monitors.
struct JobSpec {
    JobKind kind = JobKind::Copy;
    QString origin;
    QString label;
    QString description;
    QStringList sources;
    QString destination;
    QStringList compareWith;
    CompareCriteria criteria = CompareCriteria::Size;
    quint64 partSize = 0;
    ArchiveAction archiveAction = ArchiveAction::Extract;
};

struct JobHandle {
    quint64 id = 0;
    bool isValid() const { return id != 0; }
};

struct JobRecord {
    quint64 id = 0;
    JobSpec spec;
    JobState state = JobState::Queued;
    ProgressSnapshot progress;
    QVector<OperationError> errors;
    std::optional<CollisionRequest> pendingCollision;
    std::optional<OperationResult> result;
    QString message; // completion message once terminal
    qint64 createdAtMs = 0;
    qint64 startedAtMs = 0;
    qint64 finishedAtMs = 0;
};

using JobFilter = std::function<bool(const JobRecord &)>;

} // namespace duopane

Q_DECLARE_METATYPE(duopane::JobState)
