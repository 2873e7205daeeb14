#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>

class LogManager : public QObject {
    Q_OBJECT

public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Fatal = 4 };

    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    // Opens (appending) the persistent application log. Safe to call again with
    // another path; the previous file is flushed and closed.
    bool openFile(const QString& path);
    void setMinimumLevel(Level level);
    Level minimumLevel() const;

    QStringList logs() const;

    void addLog(const QString& message, Level level = Level::Info);
    void flush();
    void clear();

    static bool parseLevel(const QString& text, Level* out);
    static QString levelName(Level level);

signals:
    void logAdded(const QString& line);

private:
    explicit LogManager(QObject* parent = nullptr);
    Q_DISABLE_COPY(LogManager)

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    Level m_minLevel = Level::Info;
    int m_unflushed = 0;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_EVERY_LINES = 20;
};

// Routes qDebug/qInfo/qWarning/qCritical through LogManager.
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
