#include <QCoreApplication>
#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <QElapsedTimer>
#include <QTextStream>
#include <QDebug>
#include <QDir>
#include <QScopedPointer>
#include <utility>

#include "log_manager.h"
#include "console_prompt.h"
#include "run_config.h"
#include "errors.h"
#include "error_log.h"
#include "work_list.h"
#include "s3_source_store.h"
#include "drive_auth.h"
#include "drive_store.h"
#include "transcode_monitor.h"
#include "transfer_pipeline.h"
#include "duplicate_scanner.h"
#include "duplicate_resolver.h"

namespace {

QTextStream& out()
{
    static QTextStream ts(stdout);
    return ts;
}

// Shared by every prompt; a second stream would miss input the first buffered.
QTextStream& in()
{
    static QTextStream ts(stdin);
    return ts;
}

QString formatSeconds(double seconds)
{
    const int total = int(seconds + 0.5);
    return QString("%1:%2:%3")
        .arg(total / 3600, 2, 10, QChar('0'))
        .arg((total / 60) % 60, 2, 10, QChar('0'))
        .arg(total % 60, 2, 10, QChar('0'));
}

// Rewrites one console line in place.
void printStatusLine(const QString& text)
{
    out() << '\r' << text.leftJustified(100) << Qt::flush;
}

ConsolePrompt& prompt()
{
    static ConsolePrompt p(in(), out());
    return p;
}

// Leaves store null when the destination is disabled, or when its credentials
// are unusable and the run tolerates that. Fails only for a required destination.
bool setUpDrive(const RunConfig& config, QScopedPointer<DriveAuth>& auth,
                QScopedPointer<DriveDestinationStore>& store, OpError* err)
{
    if (!config.driveEnabled) {
        qInfo() << "[Main] Destination disabled by configuration";
        return true;
    }
    auth.reset(new DriveAuth(config.driveCredentialsPath, config.driveTokensPath, config.networkTimeoutMs));
    OpError authErr;
    if (!auth->load(&authErr)) {
        auth.reset();
        if (config.requireDestination) {
            if (err) *err = authErr;
            return false;
        }
        qWarning().noquote() << "[Main] Drive unavailable, continuing without upload:" << authErr.toString();
        return true;
    }
    // "root" is the Drive alias for the top of My Drive.
    const QString root = config.driveRootFolderId.isEmpty() ? QStringLiteral("root") : config.driveRootFolderId;
    store.reset(new DriveDestinationStore(*auth, root, config.networkTimeoutMs));
    return true;
}

int runTransfer(const RunConfig& config)
{
    qInfo().noquote() << QString("[Main] Running as instance %1 of %2").arg(config.shard.index).arg(config.shard.count);

    ErrorLog errorLog(QDir(config.workDir).filePath(config.errorLogPath));
    if (!errorLog.ensureInitialized())
        qWarning() << "[Main] Could not initialize error log" << errorLog.path();

    QScopedPointer<DriveAuth> auth;
    QScopedPointer<DriveDestinationStore> drive;
    OpError err;
    if (!setUpDrive(config, auth, drive, &err)) {
        qCritical().noquote() << "[Main]" << err.toString();
        return 1;
    }

    QStringList all;
    if (!WorkList::readFile(config.workListPath, &all, &err)) {
        qCritical().noquote() << "[Main]" << err.toString();
        return 1;
    }
    QStringList mine;
    if (!WorkList::partition(all, config.shard.index, config.shard.count, &mine, &err)) {
        qCritical().noquote() << "[Main]" << err.toString();
        return 1;
    }
    qInfo().noquote() << QString("[Main] Found %1 items, this instance will process %2").arg(all.size()).arg(mine.size());

    S3SourceStore source = S3SourceStore::fromConfig(config);
    TranscodeMonitor monitor;
    monitor.setFfmpegPath(config.ffmpegPath);

    TransferPipeline pipeline(config, source, drive.data(), monitor, errorLog);

    QObject::connect(&pipeline, &TransferPipeline::itemStarted,
                     [](int index, int total, const QString& key) {
        out() << QString("\n[%1/%2] %3\n").arg(index + 1).arg(total).arg(key) << Qt::flush;
    });
    QObject::connect(&pipeline, &TransferPipeline::fetchProgress,
                     [](const QString&, qint64 received, qint64 total) {
        if (total > 0)
            printStatusLine(QString("Downloading... %1% (%2 / %3 MB)")
                                .arg(100.0 * received / total, 0, 'f', 1)
                                .arg(received / 1048576.0, 0, 'f', 1)
                                .arg(total / 1048576.0, 0, 'f', 1));
        else
            printStatusLine(QString("Downloading... %1 MB").arg(received / 1048576.0, 0, 'f', 1));
    });
    QObject::connect(&monitor, &TranscodeMonitor::progress, [](const TranscodeProgress& p) {
        QString line = QString("Converting... %1% | %2 / %3")
                           .arg(p.percentComplete, 0, 'f', 1)
                           .arg(formatSeconds(p.elapsedSeconds), formatSeconds(p.durationSeconds));
        if (p.fps > 0) line += QString(" | %1 fps").arg(p.fps, 0, 'f', 1);
        if (p.speedMultiplier > 0) line += QString(" | %1x").arg(p.speedMultiplier, 0, 'f', 2);
        if (p.durationSeconds > 0) line += " | ETA " + formatSeconds(p.etaSeconds);
        printStatusLine(line);
    });
    QObject::connect(&pipeline, &TransferPipeline::itemFinished, [](const ItemOutcome& o) {
        out() << '\n' << Qt::flush;
        if (o.item.status == ItemStatus::Failed)
            qWarning().noquote() << "[Main] Failed:" << o.item.sourceKey << "-" << o.error.toString();
    });

    QElapsedTimer timer;
    timer.start();
    const RunSummary s = pipeline.run(mine);

    out() << QString("\nSummary for instance %1: %2 items, %3 done, %4 skipped, %5 failed, %6 publish warnings (%7)\n")
                 .arg(config.shard.index)
                 .arg(s.total)
                 .arg(s.done)
                 .arg(s.skipped)
                 .arg(s.failed)
                 .arg(s.publishWarnings)
                 .arg(formatSeconds(timer.elapsed() / 1000.0))
          << Qt::flush;
    if (errorLog.appendedCount() > 0)
        out() << QString("%1 entries written to %2\n").arg(errorLog.appendedCount()).arg(errorLog.path()) << Qt::flush;
    LogManager::instance().flush();
    return 0;
}

int runDedupe(const RunConfig& config, const QCommandLineParser& parser)
{
    QScopedPointer<DriveAuth> auth;
    QScopedPointer<DriveDestinationStore> drive;
    OpError err;
    RunConfig strict = config;
    strict.driveEnabled = true;
    strict.requireDestination = true;
    if (!setUpDrive(strict, auth, drive, &err)) {
        qCritical().noquote() << "[Main]" << err.toString();
        return 1;
    }
    DuplicateScanner scanner(*drive);
    const DuplicateScanResult scan = scanner.scan(drive->rootFolderId());
    out() << QString("Scanned %1 folders, %2 files\n").arg(scan.foldersVisited).arg(scan.files.size());
    if (!scan.complete)
        out() << "Warning: some folders could not be listed; results are partial\n";

    const bool assumeYes = parser.isSet("yes");
    DuplicateResolver resolver(*drive, DuplicateResolver::optionsFrom(config),
                               [assumeYes](const QString& summary) {
        out() << summary << '\n';
        if (assumeYes) return true;
        return prompt().askYesNo("Are you sure you want to proceed?");
    });
    QObject::connect(&resolver, &DuplicateResolver::batchStarted, [](int index, int count, int size) {
        out() << QString("Processing batch %1/%2 (%3 items)\n").arg(index + 1).arg(count).arg(size) << Qt::flush;
    });

    QVector<DuplicateGroup> groups = scan.groups;
    if (parser.isSet("refresh")) {
        int dropped = 0;
        groups = resolver.refresh(groups, &dropped);
        out() << QString("Refresh dropped %1 stale records\n").arg(dropped);
    }
    if (groups.isEmpty()) {
        out() << "No duplicates found.\n" << Qt::flush;
        return 0;
    }

    for (const DuplicateGroup& g : std::as_const(groups)) {
        out() << QString("\"%1\" (%2 copies)\n").arg(g.name).arg(g.records.size());
        for (const RemoteFileRecord& r : g.records)
            out() << QString("  - %1 (parent %2)\n").arg(r.id, r.parentId);
    }

    ResolveStrategy strategy = ResolveStrategy::ListOnly;
    if (parser.isSet("strategy")) {
        if (!parseResolveStrategy(parser.value("strategy"), &strategy)) {
            qCritical().noquote() << "[Main] unknown strategy" << parser.value("strategy");
            return 1;
        }
    } else if (!prompt().askStrategy(&strategy)) {
        qCritical() << "[Main] invalid choice";
        return 1;
    }

    ResolveOutcome outcome;
    if (!resolver.resolve(groups, strategy, &outcome, &err)) {
        qCritical().noquote() << "[Main]" << err.toString();
        return 1;
    }
    out() << QString("%1 groups, %2 records, %3 redundant\n")
                 .arg(outcome.report.groups)
                 .arg(outcome.report.totalRecords)
                 .arg(outcome.report.redundantRecords);
    if (outcome.declined) {
        out() << "Operation cancelled.\n" << Qt::flush;
        return 0;
    }
    if (outcome.result.total() > 0) {
        out() << QString("Success: %1, not found: %2, permission denied: %3, other errors: %4\n")
                     .arg(outcome.result.success)
                     .arg(outcome.result.notFound)
                     .arg(outcome.result.permissionDenied)
                     .arg(outcome.result.otherErrors);
    }
    out() << Qt::flush;
    return 0;
}

int runAuthCode(const RunConfig& config, const QString& code)
{
    DriveAuth auth(config.driveCredentialsPath, config.driveTokensPath, config.networkTimeoutMs);
    OpError err;
    if (!auth.loadCredentials(&err) || !auth.exchangeCode(code, &err)) {
        qCritical().noquote() << "[Main]" << err.toString();
        return 1;
    }
    out() << "OAuth tokens saved to " << config.driveTokensPath << '\n' << Qt::flush;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("mediarelay");
    QCoreApplication::setApplicationVersion("1.0.0");
    qRegisterMetaType<TranscodeProgress>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Transcode source bucket videos and publish them to Google Drive.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"config", "INI configuration file.", "file"},
        {"instance", "0-based index of this instance.", "n"},
        {"instances", "Total number of instances.", "m"},
        {"encoder", "software or hardware.", "encoder"},
        {"work-list", "Comma-separated list of source keys.", "file"},
        {"dedupe", "Scan the destination for duplicate names instead of transferring."},
        {"strategy", "delete, trash, rename, list or newest.", "strategy"},
        {"yes", "Do not ask for confirmation."},
        {"refresh", "Re-check duplicates against the destination before resolving."},
        {"auth-code", "Exchange a consent-screen authorization code for tokens and exit.", "code"},
    });
    parser.addPositionalArgument("instance", "Instance index (same as --instance).", "[instance]");
    parser.addPositionalArgument("instances", "Instance count (same as --instances).", "[instances]");
    parser.process(app);

    ConfigLoader::Overrides overrides;
    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 0) overrides.insert("run/instance", positional.at(0));
    if (positional.size() > 1) overrides.insert("run/instances", positional.at(1));
    if (parser.isSet("instance")) overrides.insert("run/instance", parser.value("instance"));
    if (parser.isSet("instances")) overrides.insert("run/instances", parser.value("instances"));
    if (parser.isSet("encoder")) overrides.insert("transcode/encoder", parser.value("encoder"));
    if (parser.isSet("work-list")) overrides.insert("run/work_list", parser.value("work-list"));
    if (parser.isSet("dedupe")) overrides.insert("dedupe/enabled", "true");

    RunConfig config;
    OpError err;
    if (!ConfigLoader::load(parser.value("config"), QProcessEnvironment::systemEnvironment(), overrides, &config, &err)) {
        qCritical().noquote() << "[Main]" << err.toString();
        return 1;
    }

    LogManager::Level level = LogManager::Level::Info;
    if (LogManager::parseLevel(config.logLevel, &level))
        LogManager::instance().setMinimumLevel(level);
    if (!config.appLogPath.isEmpty() && !LogManager::instance().openFile(QDir(config.workDir).filePath(config.appLogPath)))
        qWarning() << "[Main] Logging to stderr only";
    qInstallMessageHandler(customMessageHandler);

    if (parser.isSet("auth-code"))
        return runAuthCode(config, parser.value("auth-code"));
    if (config.duplicateScanEnabled)
        return runDedupe(config, parser);
    return runTransfer(config);
}
