// Engine configuration read once from QSettings.
#pragma once
#include "duopane/FileOperationExecutor.hpp"
#include "duopane/SplitNaming.hpp"

class QSettings;

namespace duopane {

struct EngineSettings {
    int maxSimultaneousJobs = 4;   // Jobs/maxSimultaneous, 1..64
    int progressIntervalMs = 300;  // Jobs/progressIntervalMs
    int bufferKiB = 1024;          // Jobs/bufferKiB
    int progressSliceMs = 50;      // Jobs/progressSliceMs
    SplitNaming naming;            // Split/digits, Split/firstIndex, Split/style
    int timestampToleranceSec = 2; // Compare/timestampToleranceSec

    ExecutorOptions executorOptions() const;
};

int clampMaxSimultaneousJobs(int n);
int clampProgressIntervalMs(int ms);

// Missing keys keep their defaults; out-of-range values are clamped.
EngineSettings loadEngineSettings(QSettings &s);
void saveEngineSettings(QSettings &s, const EngineSettings &e);

} // namespace duopane
