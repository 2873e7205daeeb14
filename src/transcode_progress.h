#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <functional>

struct TranscodeProgress {
    double percentComplete = 0.0;      // clamped to [0, 100]
    double elapsedSeconds = 0.0;       // output time written so far
    double durationSeconds = 0.0;      // 0 when not yet known
    qint64 frameCount = 0;
    double fps = 0.0;
    double speedMultiplier = 0.0;      // 0 when unknown
    double etaSeconds = 0.0;
};

// Parser for the two text streams ffmpeg produces.
//
// Diagnostic stream (stderr), human-readable, lines end in '\n' or '\r':
//   "  Duration: 00:01:02.50, start: ..."         total duration, first one wins
//   "    Stream #0:0: Video: hevc ..., 29.97 fps"  frame rate
//   "frame=  42 fps= 30 q=28.0 ... speed=1.5x"    processing fps and speed
// Progress stream (stdout, -progress pipe:1), key=value per line:
//   out_time_us=<us> | out_time_ms=<us> | out_time=HH:MM:SS.ffffff
//   frame=<n> | progress=continue|end
// Lines that match nothing are ignored.
class TranscodeProgressParser {
public:
    // Feed raw chunks; partial trailing lines are kept until completed.
    // Return true when any field changed.
    bool feedDiagnostic(const QByteArray& chunk);
    bool feedProgress(const QByteArray& chunk);

    bool parseDiagnosticLine(const QString& line);
    bool parseProgressLine(const QString& line);

    TranscodeProgress snapshot() const;

    bool hasDuration() const { return m_duration > 0.0; }
    bool progressEnded() const { return m_ended; }

    // "HH:MM:SS(.fraction)" -> seconds; -1 when malformed.
    static double parseClock(const QString& text);
    // Remaining output time, scaled by speed when speed > 0.
    static double estimateRemaining(double duration, double elapsed, double speed);

private:
    static QStringList takeLines(QByteArray& buffer, const QByteArray& chunk);

    QByteArray m_diagBuffer;
    QByteArray m_progressBuffer;
    double m_duration = 0.0;
    double m_elapsed = 0.0;
    qint64 m_frames = 0;
    double m_fps = 0.0;
    double m_speed = 0.0;
    bool m_ended = false;
};

// Time-based gate: at most one pass per interval regardless of call rate.
class ProgressThrottle {
public:
    explicit ProgressThrottle(qint64 intervalMs = 1000) : m_intervalMs(intervalMs) {}

    bool shouldEmit(qint64 nowMs);
    void reset() { m_lastMs = -1; }

private:
    qint64 m_intervalMs;
    qint64 m_lastMs = -1;
};

// Parser + throttle + sink. The clock returns milliseconds on any monotonic base.
class TranscodeProgressTracker {
public:
    using Clock = std::function<qint64()>;
    using Sink = std::function<void(const TranscodeProgress&)>;

    TranscodeProgressTracker(Clock clock, Sink sink, qint64 intervalMs = 1000);

    void onDiagnostic(const QByteArray& chunk);
    void onProgress(const QByteArray& chunk);
    // Delivers a change the throttle held back; call once the stream ends.
    void flush();

    const TranscodeProgressParser& parser() const { return m_parser; }
    int emittedCount() const { return m_emitted; }

private:
    void maybeEmit(bool changed);

    TranscodeProgressParser m_parser;
    ProgressThrottle m_throttle;
    Clock m_clock;
    Sink m_sink;
    int m_emitted = 0;
    bool m_pending = false;
};
