#include "log_manager.h"
#include <QMutexLocker>
#include <QFileInfo>
#include <QDir>
#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
}

LogManager::~LogManager() {
    flush();
}

bool LogManager::openFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) m_file.close();

    const QString dir = QFileInfo(path).absolutePath();
    QDir().mkpath(dir);
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "[LogManager] cannot open %s: %s\n",
                path.toLocal8Bit().constData(), m_file.errorString().toLocal8Bit().constData());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    m_unflushed = 0;
    return true;
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker locker(&m_mutex);
    m_minLevel = level;
}

LogManager::Level LogManager::minimumLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_minLevel;
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, Level level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        if (level < m_minLevel) return;

        const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, levelName(level), message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        fprintf(stderr, "%s\n", logEntry.toLocal8Bit().constData());
        fflush(stderr);

        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            ++m_unflushed;
            // Warnings and errors must survive a crash right after them.
            if (level >= Level::Warn || m_unflushed >= FLUSH_EVERY_LINES) {
                m_ts.flush();
                m_unflushed = 0;
            }
        }
    } // unlock before emitting

    emit logAdded(logEntry);
}

void LogManager::flush() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_unflushed = 0;
    }
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

bool LogManager::parseLevel(const QString& text, Level* out) {
    const QString upper = text.trimmed().toUpper();
    if (upper == "DEBUG") { *out = Level::Debug; return true; }
    if (upper == "INFO") { *out = Level::Info; return true; }
    if (upper == "WARN" || upper == "WARNING") { *out = Level::Warn; return true; }
    if (upper == "ERROR") { *out = Level::Error; return true; }
    if (upper == "FATAL") { *out = Level::Fatal; return true; }
    return false;
}

QString LogManager::levelName(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "INFO";
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    LogManager::Level level = LogManager::Level::Info;
    switch (type) {
        case QtDebugMsg:
            level = LogManager::Level::Debug;
            break;
        case QtInfoMsg:
            level = LogManager::Level::Info;
            break;
        case QtWarningMsg:
            level = LogManager::Level::Warn;
            break;
        case QtCriticalMsg:
            level = LogManager::Level::Error;
            break;
        case QtFatalMsg:
            level = LogManager::Level::Fatal;
            break;
    }

    // Called from pool threads during batch mutations as well; addLog locks.
    LogManager::instance().addLog(msg, level);

    if (type == QtFatalMsg) {
        LogManager::instance().flush();
        abort();
    }
}
