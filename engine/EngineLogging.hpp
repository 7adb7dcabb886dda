// Logging categories of the job engine.
#pragma once
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(dpJobs)
Q_DECLARE_LOGGING_CATEGORY(dpProgress)
Q_DECLARE_LOGGING_CATEGORY(dpCollision)

namespace duopane {

// Filter rules for the duopane.* categories. Verbose enables debug output;
// otherwise debug is off and per-snapshot progress lines are muted.
QString engineFilterRules(bool verbose);

// Applies the rules chosen from DUOPANE_ENV / DUOPANE_LOG_VERBOSE.
void installEngineLogging();

} // namespace duopane
