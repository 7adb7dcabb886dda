#include "EngineLogging.hpp"
#include "duopane/RuntimeLogging.hpp"

Q_LOGGING_CATEGORY(dpJobs, "duopane.jobs", QtInfoMsg)
Q_LOGGING_CATEGORY(dpProgress, "duopane.progress", QtInfoMsg)
Q_LOGGING_CATEGORY(dpCollision, "duopane.collision", QtInfoMsg)

namespace duopane {

QString engineFilterRules(bool verbose) {
    if (verbose)
        return QStringLiteral("duopane.*.debug=true");
    return QStringLiteral("duopane.*.debug=false\n"
                          "duopane.progress.info=false");
}

void installEngineLogging() {
    const bool verbose = verboseLoggingEnabled();
    QLoggingCategory::setFilterRules(engineFilterRules(verbose));
    qCInfo(dpJobs) << "logging installed"
                   << "verbose=" << verbose
                   << "dev=" << isDevEnvironment();
}

} // namespace duopane
