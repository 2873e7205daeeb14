#include "transcode_monitor.h"

#include <QEventLoop>
#include <QFileInfo>
#include <QDir>
#include <QDebug>

namespace {
constexpr int kDiagnosticTailLines = 8;
}

TranscodeMonitor::TranscodeMonitor(QObject* parent) : QObject(parent) {}

QString TranscodeMonitor::encoderName(EncoderChoice choice)
{
    return choice == EncoderChoice::Hardware ? QStringLiteral("h264_nvenc") : QStringLiteral("libx264");
}

QStringList TranscodeMonitor::buildArguments(const TranscodeRequest& req)
{
    // Paths starting with '-' would be read as options.
    auto safePath = [](const QString& p) -> QString {
        if (!QFileInfo(p).isAbsolute() && p.startsWith('-')) return QStringLiteral("./") + p;
        return p;
    };

    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-y";
    if (req.encoder == EncoderChoice::Hardware) args << "-hwaccel" << "cuda";
    if (!req.inputCodec.isEmpty()) args << "-c:v" << req.inputCodec;
    args << "-i" << safePath(req.inputPath);
    args << "-c:v" << encoderName(req.encoder);
    args << "-progress" << "pipe:1"; // key=value progress on stdout
    args << safePath(req.outputPath);
    return args;
}

bool TranscodeMonitor::transcode(const TranscodeRequest& req, TranscodeResult* result, OpError* err)
{
    if (result) *result = TranscodeResult();
    if (m_ffmpegPath.isEmpty())
        return setError(err, ErrorKind::Transcode, "FFmpeg path not set");
    if (!QFileInfo::exists(req.inputPath))
        return setError(err, ErrorKind::Transcode, QString("Source not found: %1").arg(req.inputPath));
    QDir().mkpath(QFileInfo(req.outputPath).absolutePath());

    const QStringList args = buildArguments(req);
    QElapsedTimer timer;
    timer.start();

    QStringList diagTail;
    TranscodeProgressTracker tracker(
        [&timer]() { return timer.elapsed(); },
        [this](const TranscodeProgress& p) { emit progress(p); },
        m_progressIntervalMs);

    QProcess proc;
    QEventLoop loop;
    bool done = false;

    connect(&proc, &QProcess::readyReadStandardOutput, this, [&]() {
        tracker.onProgress(proc.readAllStandardOutput());
    });
    auto consumeDiagnostics = [&](const QByteArray& data) {
        tracker.onDiagnostic(data);
        for (const QByteArray& raw : QByteArray(data).replace('\r', '\n').split('\n')) {
            const QString line = QString::fromUtf8(raw).trimmed();
            if (line.isEmpty()) continue;
            emit diagnosticLine(line);
            diagTail << line;
            if (diagTail.size() > kDiagnosticTailLines) diagTail.removeFirst();
        }
    };
    connect(&proc, &QProcess::readyReadStandardError, this, [&]() {
        consumeDiagnostics(proc.readAllStandardError());
    });
    connect(&proc, &QProcess::finished, &loop, [&]() {
        done = true;
        loop.quit();
    });

    proc.setProgram(m_ffmpegPath);
    proc.setArguments(args);
    qInfo().noquote() << "[Transcode]" << QFileInfo(m_ffmpegPath).fileName() << args.join(' ');
    emit started(m_ffmpegPath, args);
    proc.start();

    if (!proc.waitForStarted(-1)) {
        const QString reason = proc.errorString();
        qWarning() << "[Transcode] Failed to start" << m_ffmpegPath << reason;
        return setError(err, ErrorKind::Transcode, QString("failed to start %1: %2").arg(m_ffmpegPath, reason), -1);
    }
    if (!done && proc.state() != QProcess::NotRunning) loop.exec();
    if (!done) proc.waitForFinished(-1);

    // Drain anything still buffered after exit.
    tracker.onProgress(proc.readAllStandardOutput());
    consumeDiagnostics(proc.readAllStandardError());
    tracker.flush();

    const TranscodeProgress last = tracker.parser().snapshot();
    if (result) {
        result->elapsedMs = timer.elapsed();
        result->lastProgress = last;
        result->exitCode = proc.exitStatus() == QProcess::NormalExit ? proc.exitCode() : -1;
    }

    if (proc.exitStatus() != QProcess::NormalExit) {
        qWarning() << "[Transcode] Process crashed:" << req.inputPath;
        return setError(err, ErrorKind::Transcode,
                        QString("encoder crashed: %1").arg(diagTail.join(" | ")), -1);
    }
    if (proc.exitCode() != 0) {
        qWarning() << "[Transcode] Exit code" << proc.exitCode() << "for" << req.inputPath;
        return setError(err, ErrorKind::Transcode,
                        QString("encoder exited with code %1: %2").arg(proc.exitCode()).arg(diagTail.join(" | ")),
                        proc.exitCode());
    }

    qInfo().noquote() << QString("[Transcode] Completed %1 in %2 s")
                             .arg(QFileInfo(req.outputPath).fileName())
                             .arg(timer.elapsed() / 1000.0, 0, 'f', 1);
    return true;
}
