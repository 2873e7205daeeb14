#include "destination_store.h"

#include <QDebug>

namespace DestinationOps {

bool findFirst(DestinationStore& store, const QString& parentId, const ListQuery& query,
               RemoteFileRecord* match, bool* found, OpError* err)
{
    *found = false;
    QString token;
    do {
        ListPage page;
        if (!store.listChildren(parentId, query, token, &page, err)) return false;
        if (!page.records.isEmpty()) {
            if (match) *match = page.records.first();
            *found = true;
            return true;
        }
        // A short or empty page does not mean the listing is exhausted.
        token = page.nextPageToken;
    } while (!token.isEmpty());
    return true;
}

bool findFolder(DestinationStore& store, const QString& parentId, const QString& name,
                QString* id, OpError* err)
{
    ListQuery q;
    q.name = name;
    q.foldersOnly = true;
    RemoteFileRecord match;
    bool found = false;
    id->clear();
    if (!findFirst(store, parentId, q, &match, &found, err)) return false;
    if (found) *id = match.id;
    return true;
}

bool findOrCreateFolder(DestinationStore& store, const QString& parentId, const QString& name,
                        QString* id, OpError* err)
{
    if (!findFolder(store, parentId, name, id, err)) return false;
    if (!id->isEmpty()) {
        qDebug() << "[Drive] Found existing folder:" << name;
        return true;
    }
    if (!store.createFolder(parentId, name, id, err)) return false;
    qInfo() << "[Drive] Created new folder:" << name;
    return true;
}

bool fileExists(DestinationStore& store, const QString& parentId, const QString& name,
                bool* exists, OpError* err)
{
    ListQuery q;
    q.name = name;
    q.filesOnly = true;
    return findFirst(store, parentId, q, nullptr, exists, err);
}

} // namespace DestinationOps
