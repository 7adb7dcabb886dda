#include "EngineSettings.hpp"

#include <QSettings>
#include <QString>
#include <QtGlobal>

namespace duopane {

int clampMaxSimultaneousJobs(int n) { return qBound(1, n, 64); }

int clampProgressIntervalMs(int ms) { return qBound(16, ms, 5000); }

ExecutorOptions EngineSettings::executorOptions() const {
    ExecutorOptions o;
    o.bufferSize = static_cast<std::size_t>(bufferKiB) * 1024;
    o.progressSlice = std::chrono::milliseconds(progressSliceMs);
    o.naming = naming;
    o.timestampTolerance = std::chrono::seconds(timestampToleranceSec);
    return o;
}

EngineSettings loadEngineSettings(QSettings &s) {
    EngineSettings e;
    e.maxSimultaneousJobs =
        clampMaxSimultaneousJobs(s.value("Jobs/maxSimultaneous", 4).toInt());
    e.progressIntervalMs =
        clampProgressIntervalMs(s.value("Jobs/progressIntervalMs", 300).toInt());
    e.bufferKiB = qBound(4, s.value("Jobs/bufferKiB", 1024).toInt(), 64 * 1024);
    e.progressSliceMs =
        qBound(10, s.value("Jobs/progressSliceMs", 50).toInt(), 1000);

    e.naming.digits = qBound(1, s.value("Split/digits", 3).toInt(), 9);
    e.naming.firstIndex = qBound(0, s.value("Split/firstIndex", 1).toInt(), 1);
    const QString style =
        s.value("Split/style", "numeric").toString().trimmed().toLower();
    e.naming.style = (style == QLatin1String("part"))
                         ? SplitNaming::Style::PartPrefixed
                         : SplitNaming::Style::Numeric;

    e.timestampToleranceSec =
        qBound(0, s.value("Compare/timestampToleranceSec", 2).toInt(), 3600);
    return e;
}

void saveEngineSettings(QSettings &s, const EngineSettings &e) {
    s.setValue("Jobs/maxSimultaneous", e.maxSimultaneousJobs);
    s.setValue("Jobs/progressIntervalMs", e.progressIntervalMs);
    s.setValue("Jobs/bufferKiB", e.bufferKiB);
    s.setValue("Jobs/progressSliceMs", e.progressSliceMs);
    s.setValue("Split/digits", e.naming.digits);
    s.setValue("Split/firstIndex", e.naming.firstIndex);
    s.setValue("Split/style", e.naming.style == SplitNaming::Style::PartPrefixed
                                  ? QStringLiteral("part")
                                  : QStringLiteral("numeric"));
    s.setValue("Compare/timestampToleranceSec", e.timestampToleranceSec);
}

} // namespace duopane
