#pragma once

#include <QHash>
#include <QVector>
#include <QStringList>

#include "destination_store.h"

// Every record sharing one name; records[0] is the first one seen and is
// never a mutation target. Always holds at least two records.
struct DuplicateGroup {
    QString name;
    QVector<RemoteFileRecord> records;
};

struct DuplicateScanResult {
    QVector<RemoteFileRecord> files;   // every non-folder entry, first-seen order
    QVector<DuplicateGroup> groups;    // in the order each name reached two records
    int foldersVisited = 0;
    bool complete = true;              // false when any subtree listing failed

    bool hasDuplicates() const { return !groups.isEmpty(); }
    int redundantCount() const;        // records beyond the first of each group
    const DuplicateGroup* group(const QString& name) const;
};

// Recursive, paginated enumeration of the destination hierarchy.
class DuplicateScanner {
public:
    explicit DuplicateScanner(DestinationStore& store);

    DuplicateScanResult scan(const QString& rootFolderId);

    // Builds name -> records from an ordered file list.
    static QVector<DuplicateGroup> groupByName(const QVector<RemoteFileRecord>& files);

private:
    void scanFolder(const QString& folderId, DuplicateScanResult& result, QStringList& path);

    DestinationStore& m_store;
};
