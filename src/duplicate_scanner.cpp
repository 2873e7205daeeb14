#include "duplicate_scanner.h"

#include <QDebug>
#include <QSet>
#include <utility>

int DuplicateScanResult::redundantCount() const
{
    int n = 0;
    for (const DuplicateGroup& g : groups) n += g.records.size() - 1;
    return n;
}

const DuplicateGroup* DuplicateScanResult::group(const QString& name) const
{
    for (const DuplicateGroup& g : groups) {
        if (g.name == name) return &g;
    }
    return nullptr;
}

DuplicateScanner::DuplicateScanner(DestinationStore& store) : m_store(store) {}

DuplicateScanResult DuplicateScanner::scan(const QString& rootFolderId)
{
    DuplicateScanResult result;
    QStringList path;
    qInfo() << "[Scanner] Scanning folder tree from" << rootFolderId;
    scanFolder(rootFolderId, result, path);

    // Listings may repeat an entry across page boundaries; keep the first.
    QSet<QString> ids;
    QVector<RemoteFileRecord> unique;
    unique.reserve(result.files.size());
    for (const RemoteFileRecord& f : std::as_const(result.files)) {
        if (ids.contains(f.id)) continue;
        ids.insert(f.id);
        unique << f;
    }
    result.files = unique;
    result.groups = groupByName(result.files);

    qInfo().noquote() << QString("[Scanner] %1 files in %2 folders, %3 duplicate names, %4 redundant copies%5")
                             .arg(result.files.size())
                             .arg(result.foldersVisited)
                             .arg(result.groups.size())
                             .arg(result.redundantCount())
                             .arg(result.complete ? QString() : QStringLiteral(" (partial scan)"));
    return result;
}

void DuplicateScanner::scanFolder(const QString& folderId, DuplicateScanResult& result, QStringList& path)
{
    ++result.foldersVisited;
    QVector<RemoteFileRecord> subfolders;
    QString token;
    int pages = 0;

    do {
        ListPage page;
        OpError err;
        if (!m_store.listChildren(folderId, ListQuery(), token, &page, &err)) {
            // Keep what this subtree produced so far; the caller sees complete == false.
            qWarning().noquote() << "[Scanner] Listing failed in" << (path.isEmpty() ? folderId : path.join('/'))
                                 << "after" << pages << "pages:" << err.toString();
            result.complete = false;
            break;
        }
        ++pages;
        for (const RemoteFileRecord& r : page.records) {
            if (r.isFolder) subfolders << r;
            else result.files << r;
        }
        token = page.nextPageToken;
    } while (!token.isEmpty());

    qDebug().noquote() << "[Scanner] Listed" << (path.isEmpty() ? QStringLiteral("/") : path.join('/'))
                       << "-" << pages << "pages," << subfolders.size() << "subfolders";

    for (const RemoteFileRecord& sub : subfolders) {
        path << sub.name;
        scanFolder(sub.id, result, path);
        path.removeLast();
    }
}

QVector<DuplicateGroup> DuplicateScanner::groupByName(const QVector<RemoteFileRecord>& files)
{
    QHash<QString, QVector<RemoteFileRecord>> byName;
    QStringList order;   // names in the order they first reached two records

    for (const RemoteFileRecord& f : files) {
        QVector<RemoteFileRecord>& list = byName[f.name];
        list << f;
        if (list.size() == 2) order << f.name;
    }

    QVector<DuplicateGroup> groups;
    groups.reserve(order.size());
    for (const QString& name : order) groups.push_back({name, byName.value(name)});
    return groups;
}
