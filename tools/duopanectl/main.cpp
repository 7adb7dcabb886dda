// Command-line front-end: runs one job through the engine on a
// QCoreApplication loop and prints progress and the completion message.
#include "EngineLogging.hpp"
#include "EngineSettings.hpp"
#include "JobRegistry.hpp"
#include "JobScheduler.hpp"
#include "ProgressAggregator.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QTextStream>
#include <cstdio>
#include <iostream>
#include <string>

using namespace duopane;

namespace {

enum ExitCode { ExitOk = 0, ExitFailed = 1, ExitCancelled = 2, ExitUsage = 64 };

// "10M", "512K", "1G" or plain bytes. 0 on error.
quint64 parseSize(const QString &text) {
    QString t = text.trimmed().toUpper();
    quint64 mult = 1;
    if (t.endsWith('K')) {
        mult = 1024ULL;
        t.chop(1);
    } else if (t.endsWith('M')) {
        mult = 1024ULL * 1024;
        t.chop(1);
    } else if (t.endsWith('G')) {
        mult = 1024ULL * 1024 * 1024;
        t.chop(1);
    }
    bool ok = false;
    const quint64 v = t.toULongLong(&ok);
    return ok ? v * mult : 0;
}

QStringList filesIn(const QString &dir) {
    QStringList out;
    const QFileInfoList entries =
        QDir(dir).entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    for (const auto &fi : entries)
        out << fi.absoluteFilePath();
    return out;
}

bool parseCriteria(const QString &s, CompareCriteria &out) {
    const QString v = s.trimmed().toLower();
    if (v == QLatin1String("size"))
        out = CompareCriteria::Size;
    else if (v == QLatin1String("time") || v == QLatin1String("timestamp"))
        out = CompareCriteria::Timestamp;
    else if (v == QLatin1String("name"))
        out = CompareCriteria::Name;
    else
        return false;
    return true;
}

// Interactive prompt on stdin; the worker stays parked meanwhile.
CollisionDecision askUser(const CollisionRequest &req) {
    std::fprintf(stderr,
                 "\"%s\" already exists (%llu bytes, source %llu bytes).\n"
                 "[s]kip [o]verwrite [r]ename [S]kip all [O]verwrite all "
                 "[c]ancel: ",
                 req.destination.path.c_str(),
                 static_cast<unsigned long long>(req.destination.size),
                 static_cast<unsigned long long>(req.source.size));
    std::string line;
    if (!std::getline(std::cin, line))
        return CollisionDecision::cancelAll();
    if (line == "o")
        return CollisionDecision::overwrite();
    if (line == "O")
        return CollisionDecision::overwrite(true);
    if (line == "S")
        return CollisionDecision::skip(true);
    if (line == "c")
        return CollisionDecision::cancelAll();
    if (line == "r") {
        std::fprintf(stderr, "New name: ");
        std::string name;
        if (!std::getline(std::cin, name))
            return CollisionDecision::cancelAll();
        return CollisionDecision::rename(name);
    }
    return CollisionDecision::skip();
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("duopanectl");
    QCoreApplication::setOrganizationName("DuoPane");
    installEngineLogging();

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Runs a background file job: copy, move, delete, split, join, "
        "compare or scan.");
    parser.addHelpOption();
    QCommandLineOption jobsOpt("jobs", "Maximum simultaneous jobs.", "n");
    QCommandLineOption collisionOpt("on-collision",
                                    "skip, overwrite or ask (default ask).",
                                    "mode", "ask");
    QCommandLineOption outputOpt(QStringList{"o", "output"},
                                 "Output directory or file (split, join).",
                                 "path");
    QCommandLineOption quietOpt(QStringList{"q", "quiet"}, "No progress output.");
    parser.addOption(jobsOpt);
    parser.addOption(collisionOpt);
    parser.addOption(outputOpt);
    parser.addOption(quietOpt);
    parser.addPositionalArgument("command",
                                 "copy|move|delete|split|join|compare|scan");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    QStringList args = parser.positionalArguments();
    QTextStream err(stderr);
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }
    const QString command = args.takeFirst().toLower();

    QSettings settingsStore("DuoPane", "DuoPane");
    EngineSettings settings = loadEngineSettings(settingsStore);
    if (parser.isSet(jobsOpt))
        settings.maxSimultaneousJobs =
            clampMaxSimultaneousJobs(parser.value(jobsOpt).toInt());

    JobSpec spec;
    const QString output = parser.value(outputOpt);
    if (command == QLatin1String("copy") || command == QLatin1String("move")) {
        if (args.size() < 2) {
            err << "usage: duopanectl " << command << " <source>... <dest-dir>\n";
            return ExitUsage;
        }
        spec.kind = command == QLatin1String("copy") ? JobKind::Copy : JobKind::Move;
        spec.destination = args.takeLast();
        spec.sources = args;
    } else if (command == QLatin1String("delete")) {
        spec.kind = JobKind::Delete;
        spec.sources = args;
    } else if (command == QLatin1String("split")) {
        if (args.size() != 2) {
            err << "usage: duopanectl split <file> <part-size> [-o dir]\n";
            return ExitUsage;
        }
        spec.kind = JobKind::Split;
        spec.sources = QStringList{args.at(0)};
        spec.partSize = parseSize(args.at(1));
        spec.destination = output;
    } else if (command == QLatin1String("join")) {
        spec.kind = JobKind::Join;
        spec.sources = args;
        spec.destination = output;
    } else if (command == QLatin1String("compare")) {
        if (args.size() != 3 || !parseCriteria(args.at(0), spec.criteria)) {
            err << "usage: duopanectl compare size|time|name <dir-a> <dir-b>\n";
            return ExitUsage;
        }
        spec.kind = JobKind::Compare;
        spec.sources = filesIn(args.at(1));
        spec.compareWith = filesIn(args.at(2));
    } else if (command == QLatin1String("scan")) {
        spec.kind = JobKind::ScanSize;
        spec.sources = args;
    } else {
        err << "unknown command: " << command << "\n";
        return ExitUsage;
    }
    spec.origin = QStringLiteral("duopanectl");
    spec.label = command;
    spec.description = spec.sources.join(QLatin1Char(' '));

    JobRegistry registry;
    ProgressAggregator progress(std::chrono::milliseconds(settings.progressIntervalMs));
    JobScheduler scheduler(registry, progress, nullptr, settings);

    const QString collisionMode = parser.value(collisionOpt).toLower();
    QObject::connect(&scheduler, &JobScheduler::collisionRequested, &app,
                     [&](quint64 id) {
                         const auto rec = scheduler.job(id);
                         if (!rec || !rec->pendingCollision)
                             return;
                         CollisionDecision d;
                         if (collisionMode == QLatin1String("skip"))
                             d = CollisionDecision::skip(true);
                         else if (collisionMode == QLatin1String("overwrite"))
                             d = CollisionDecision::overwrite(true);
                         else
                             d = askUser(*rec->pendingCollision);
                         scheduler.resolveCollision(id, d);
                     });

    const bool quiet = parser.isSet(quietOpt);
    int exitCode = ExitOk;
    const JobHandle handle = scheduler.submit(spec);
    scheduler.subscribe(
        handle.id,
        [quiet](quint64, const ProgressSnapshot &s) {
            if (quiet)
                return;
            if (s.indeterminate)
                std::fprintf(stderr, "\r%llu files, %llu bytes",
                             static_cast<unsigned long long>(s.fileIndex),
                             static_cast<unsigned long long>(s.bytesDone));
            else
                std::fprintf(stderr, "\r[%llu/%llu] %llu/%llu bytes  %s",
                             static_cast<unsigned long long>(s.fileIndex),
                             static_cast<unsigned long long>(s.fileTotal),
                             static_cast<unsigned long long>(s.bytesDone),
                             static_cast<unsigned long long>(s.bytesTotal),
                             s.currentFile.c_str());
        },
        [&](quint64, JobState state, const OperationResult &r) {
            if (!quiet)
                std::fprintf(stderr, "\n");
            QTextStream out(stdout);
            out << QString::fromStdString(completionMessage(r)) << "\n";
            for (const auto &m : r.matchesA)
                out << "A " << QString::fromStdString(m.path) << "\n";
            for (const auto &m : r.matchesB)
                out << "B " << QString::fromStdString(m.path) << "\n";
            if (spec.kind == JobKind::ScanSize)
                out << r.scan.files << " files, " << r.scan.directories
                    << " directories, " << r.scan.bytes << " bytes\n";
            for (const auto &p : r.producedPaths)
                out << QString::fromStdString(p) << "\n";
            exitCode = state == JobState::Completed ? ExitOk
                       : state == JobState::Cancelled ? ExitCancelled
                                                      : ExitFailed;
            QCoreApplication::exit(exitCode);
        });

    // A rejected JobSpec is already terminal; its completion is queued.
    return app.exec();
}
