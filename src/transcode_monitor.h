#pragma once

#include <QObject>
#include <QProcess>
#include <QStringList>
#include <QElapsedTimer>

#include "errors.h"
#include "run_config.h"
#include "transcode_progress.h"

struct TranscodeRequest {
    QString inputPath;
    QString outputPath;
    EncoderChoice encoder = EncoderChoice::Software;
    QString inputCodec;       // decoder hint placed before -i; empty = autodetect
};

struct TranscodeResult {
    int exitCode = -1;
    qint64 elapsedMs = 0;
    TranscodeProgress lastProgress;
};

// Seam between the pipeline and the external encoder.
class Transcoder {
public:
    virtual ~Transcoder() = default;
    // Blocks until the encoder exits. Success only on exit code 0; otherwise
    // *err is ErrorKind::Transcode carrying the exit code or spawn failure.
    virtual bool transcode(const TranscodeRequest& req, TranscodeResult* result, OpError* err) = 0;
};

// Runs ffmpeg as a child process, consuming its diagnostic (stderr) and
// machine progress (stdout) streams while waiting for it to exit.
class TranscodeMonitor : public QObject, public Transcoder {
    Q_OBJECT
public:
    explicit TranscodeMonitor(QObject* parent = nullptr);

    void setFfmpegPath(const QString& path) { m_ffmpegPath = path; }
    QString ffmpegPath() const { return m_ffmpegPath; }
    void setProgressIntervalMs(qint64 ms) { m_progressIntervalMs = ms; }

    bool transcode(const TranscodeRequest& req, TranscodeResult* result, OpError* err) override;

    static QString encoderName(EncoderChoice choice);
    static QStringList buildArguments(const TranscodeRequest& req);

signals:
    void started(const QString& program, const QStringList& args);
    void progress(const TranscodeProgress& p);
    void diagnosticLine(const QString& line);

private:
    QString m_ffmpegPath = "ffmpeg";
    qint64 m_progressIntervalMs = 1000;
};

Q_DECLARE_METATYPE(TranscodeProgress)
