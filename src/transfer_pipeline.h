#pragma once

#include <QObject>
#include <QHash>
#include <QStringList>

#include "errors.h"
#include "run_config.h"
#include "work_item.h"

class SourceStore;
class DestinationStore;
class Transcoder;
class ErrorLog;

struct ItemOutcome {
    WorkItem item;
    bool freshlyFetched = false;
    bool transcoded = false;
    bool publishAttempted = false;
    bool published = false;
    bool publishFailed = false;   // transcode succeeded but an upload failed
    OpError error;                // set when item.status == Failed
};

struct RunSummary {
    int total = 0;
    int done = 0;
    int skipped = 0;
    int failed = 0;
    int publishWarnings = 0;
};

// Drives one WorkItem at a time through
//   CheckingDestination -> Fetching -> Transcoding -> Publishing -> CleaningUp
// ending in Done, SkippedExisting or Failed. Resumability comes from the
// existence checks against the durable stores; nothing is persisted here.
// Per-item errors never leave processItem().
class TransferPipeline : public QObject {
    Q_OBJECT
public:
    // destination may be null when the run tolerates a missing destination.
    TransferPipeline(const RunConfig& config,
                     SourceStore& source,
                     DestinationStore* destination,
                     Transcoder& transcoder,
                     ErrorLog& errorLog,
                     QObject* parent = nullptr);

    RunSummary run(const QStringList& sourceKeys);
    ItemOutcome processItem(const QString& sourceKey);

    // Local copies always live under workDir; empty for keys that escape it.
    QString localInputPath(const WorkItem& item) const;
    QString localOutputPath(const WorkItem& item) const;

signals:
    void itemStarted(int index, int total, const QString& sourceKey);
    void statusChanged(const QString& sourceKey, ItemStatus status);
    void fetchProgress(const QString& sourceKey, qint64 received, qint64 total);
    void itemFinished(const ItemOutcome& outcome);

private:
    void transition(WorkItem& item, ItemStatus status);
    bool claimDestinationName(const WorkItem& item, OpError* err);

    bool existsInDestination(const WorkItem& item);
    bool fetch(ItemOutcome& out);
    bool transcode(ItemOutcome& out);
    void publish(ItemOutcome& out);
    void cleanup(ItemOutcome& out);
    void removeLocal(const QString& path);

    void fail(ItemOutcome& out, const OpError& error);
    QString categoryFolderId(const QString& category, bool create);

    const RunConfig& m_config;
    SourceStore& m_source;
    DestinationStore* m_destination;
    Transcoder& m_transcoder;
    ErrorLog& m_errorLog;

    QHash<QString, QString> m_folderIds;     // category -> folder id
    QHash<QString, QString> m_claimedNames;  // category/destinationName -> source key
};
