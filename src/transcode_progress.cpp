#include "transcode_progress.h"

#include <QRegularExpression>
#include <QStringList>
#include <algorithm>

namespace {

const QRegularExpression& durationPattern()
{
    static const QRegularExpression rx(R"(Duration:\s*(\d+:\d{2}:\d{2}(?:\.\d+)?))");
    return rx;
}

const QRegularExpression& statsFpsPattern()
{
    static const QRegularExpression rx(R"(fps=\s*(\d+(?:\.\d+)?))");
    return rx;
}

const QRegularExpression& streamFpsPattern()
{
    static const QRegularExpression rx(R"((\d+(?:\.\d+)?) fps\b)");
    return rx;
}

const QRegularExpression& speedPattern()
{
    static const QRegularExpression rx(R"(speed=\s*(\d+(?:\.\d+)?)x)");
    return rx;
}

} // namespace

QStringList TranscodeProgressParser::takeLines(QByteArray& buffer, const QByteArray& chunk)
{
    buffer.append(chunk);
    QStringList lines;
    int start = 0;
    for (int i = 0; i < buffer.size(); ++i) {
        const char c = buffer.at(i);
        if (c == '\n' || c == '\r') {
            if (i > start) lines << QString::fromUtf8(buffer.mid(start, i - start));
            start = i + 1;
        }
    }
    buffer.remove(0, start);
    return lines;
}

bool TranscodeProgressParser::feedDiagnostic(const QByteArray& chunk)
{
    bool changed = false;
    for (const QString& line : takeLines(m_diagBuffer, chunk))
        changed = parseDiagnosticLine(line) || changed;
    return changed;
}

bool TranscodeProgressParser::feedProgress(const QByteArray& chunk)
{
    bool changed = false;
    for (const QString& line : takeLines(m_progressBuffer, chunk))
        changed = parseProgressLine(line) || changed;
    return changed;
}

bool TranscodeProgressParser::parseDiagnosticLine(const QString& line)
{
    bool changed = false;

    if (m_duration <= 0.0) {
        const QRegularExpressionMatch m = durationPattern().match(line);
        if (m.hasMatch()) {
            const double d = parseClock(m.captured(1));
            if (d > 0.0) { m_duration = d; changed = true; }
        }
    }

    QRegularExpressionMatch fm = statsFpsPattern().match(line);
    if (!fm.hasMatch()) fm = streamFpsPattern().match(line);
    if (fm.hasMatch()) {
        m_fps = fm.captured(1).toDouble();
        changed = true;
    }

    const QRegularExpressionMatch sm = speedPattern().match(line);
    if (sm.hasMatch()) {
        m_speed = sm.captured(1).toDouble();
        changed = true;
    }
    return changed;
}

bool TranscodeProgressParser::parseProgressLine(const QString& line)
{
    const int eq = line.indexOf('=');
    if (eq <= 0) return false;
    const QString key = line.left(eq).trimmed();
    const QString value = line.mid(eq + 1).trimmed();

    bool ok = false;
    if (key == "out_time_us" || key == "out_time_ms") {
        // ffmpeg reports microseconds under both names.
        const qint64 us = value.toLongLong(&ok);
        if (!ok || us < 0) return false;
        m_elapsed = double(us) / 1e6;
        return true;
    }
    if (key == "out_time") {
        const double s = parseClock(value);
        if (s < 0.0) return false;
        m_elapsed = s;
        return true;
    }
    if (key == "frame") {
        const qint64 f = value.toLongLong(&ok);
        if (!ok) return false;
        m_frames = f;
        return true;
    }
    if (key == "progress") {
        if (value == "end") { m_ended = true; return true; }
        return false;
    }
    return false;
}

double TranscodeProgressParser::parseClock(const QString& text)
{
    const QStringList parts = text.trimmed().split(':');
    if (parts.size() != 3) return -1.0;
    bool ok1 = false, ok2 = false, ok3 = false;
    const double h = parts[0].toDouble(&ok1);
    const double m = parts[1].toDouble(&ok2);
    const double s = parts[2].toDouble(&ok3);
    if (!ok1 || !ok2 || !ok3 || h < 0 || m < 0 || s < 0) return -1.0;
    return h * 3600.0 + m * 60.0 + s;
}

double TranscodeProgressParser::estimateRemaining(double duration, double elapsed, double speed)
{
    const double remaining = std::max(0.0, duration - elapsed);
    return speed > 0.0 ? remaining / speed : remaining;
}

TranscodeProgress TranscodeProgressParser::snapshot() const
{
    TranscodeProgress p;
    p.elapsedSeconds = m_elapsed;
    p.durationSeconds = m_duration;
    p.frameCount = m_frames;
    p.fps = m_fps;
    p.speedMultiplier = m_speed;
    if (m_duration > 0.0) {
        p.percentComplete = std::clamp(m_elapsed / m_duration * 100.0, 0.0, 100.0);
        p.etaSeconds = estimateRemaining(m_duration, m_elapsed, m_speed);
    }
    if (m_ended) p.percentComplete = 100.0;
    return p;
}

bool ProgressThrottle::shouldEmit(qint64 nowMs)
{
    if (m_lastMs >= 0 && nowMs - m_lastMs < m_intervalMs) return false;
    m_lastMs = nowMs;
    return true;
}

TranscodeProgressTracker::TranscodeProgressTracker(Clock clock, Sink sink, qint64 intervalMs)
    : m_throttle(intervalMs), m_clock(std::move(clock)), m_sink(std::move(sink))
{
}

void TranscodeProgressTracker::onDiagnostic(const QByteArray& chunk)
{
    maybeEmit(m_parser.feedDiagnostic(chunk));
}

void TranscodeProgressTracker::onProgress(const QByteArray& chunk)
{
    maybeEmit(m_parser.feedProgress(chunk));
}

void TranscodeProgressTracker::maybeEmit(bool changed)
{
    if (!changed || !m_sink) return;
    if (!m_throttle.shouldEmit(m_clock())) {
        m_pending = true;
        return;
    }
    m_pending = false;
    ++m_emitted;
    m_sink(m_parser.snapshot());
}

void TranscodeProgressTracker::flush()
{
    if (!m_pending || !m_sink) return;
    m_pending = false;
    ++m_emitted;
    m_sink(m_parser.snapshot());
}
