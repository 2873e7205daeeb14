#pragma once
#include <QString>
#include <QMutex>

// Append-only ledger of items that did not complete, one line per failure,
// suitable as the work list of a follow-up run.
class ErrorLog {
public:
    explicit ErrorLog(const QString& path);

    // Creates the file with a timestamped header if it does not exist.
    bool ensureInitialized();

    // Appends "key: message" (or the bare key when message is empty). The file
    // is re-created with its header first if it disappeared mid-run.
    bool append(const QString& sourceKey, const QString& message = QString());

    QString path() const { return m_path; }
    int appendedCount() const { return m_appended; }

    static QString headerLine();

private:
    bool ensureInitializedLocked();

    QString m_path;
    QMutex m_mutex;
    int m_appended = 0;
};
