#include "error_log.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QDateTime>
#include <QMutexLocker>
#include <QDebug>

ErrorLog::ErrorLog(const QString& path) : m_path(path) {}

QString ErrorLog::headerLine()
{
    return QString("Transfer Error Log - Created at %1")
        .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
}

bool ErrorLog::ensureInitialized()
{
    QMutexLocker lk(&m_mutex);
    return ensureInitializedLocked();
}

bool ErrorLog::ensureInitializedLocked()
{
    if (QFileInfo::exists(m_path)) return true;

    QDir().mkpath(QFileInfo(m_path).absolutePath());
    QFile f(m_path);
    // NewOnly: a concurrent shard may have created it since the exists() check.
    if (!f.open(QIODevice::WriteOnly | QIODevice::NewOnly | QIODevice::Text)) {
        if (QFileInfo::exists(m_path)) return true;
        qWarning() << "[ErrorLog] Failed to create error log file" << m_path << f.errorString();
        return false;
    }
    f.write(headerLine().toUtf8());
    f.write("\n");
    qInfo() << "[ErrorLog] Created error log file:" << m_path;
    return true;
}

bool ErrorLog::append(const QString& sourceKey, const QString& message)
{
    QMutexLocker lk(&m_mutex);
    if (!ensureInitializedLocked()) return false;

    QFile f(m_path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "[ErrorLog] Failed to write to error log:" << f.errorString();
        return false;
    }
    QString line = sourceKey;
    if (!message.isEmpty()) line += ": " + QString(message).replace('\n', ' ');
    f.write(line.toUtf8());
    f.write("\n");
    ++m_appended;
    qWarning().noquote() << "[ErrorLog] Added to error log:" << sourceKey;
    return true;
}
