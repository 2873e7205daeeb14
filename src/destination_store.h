#pragma once
#include <QString>
#include <QVector>

#include "errors.h"

class QIODevice;

// One entry of the destination hierarchy. `id` is stable; `name` is not a key.
struct RemoteFileRecord {
    QString id;
    QString name;
    QString parentId;
    QString mimeType;
    bool isFolder = false;
};

struct ListQuery {
    QString name;              // exact name match when non-empty
    bool foldersOnly = false;
    bool filesOnly = false;
};

struct ListPage {
    QVector<RemoteFileRecord> records;
    QString nextPageToken;     // empty when exhausted
};

struct UploadResult {
    QString id;
    QString viewLink;
};

struct RemoteMetadata {
    QString name;
    QString mimeType;
    bool trashed = false;
};

// Either field may be set; unset fields are left untouched remotely.
struct MetadataPatch {
    bool setTrashed = false;
    bool trashed = false;
    QString newName;
};

// Hierarchical store receiving the transcoded artifacts (Google Drive in production).
class DestinationStore {
public:
    virtual ~DestinationStore() = default;

    virtual QString rootFolderId() const = 0;

    virtual bool listChildren(const QString& parentId, const ListQuery& query, const QString& pageToken,
                              ListPage* out, OpError* err) = 0;
    virtual bool createFolder(const QString& parentId, const QString& name, QString* id, OpError* err) = 0;
    virtual bool uploadFile(const QString& parentId, const QString& name, const QString& mimeHint,
                            QIODevice* body, UploadResult* out, OpError* err) = 0;
    // timeoutMs <= 0 uses the store default; expiry is ErrorKind::Timeout.
    virtual bool getMetadata(const QString& id, RemoteMetadata* out, OpError* err, int timeoutMs = 0) = 0;
    virtual bool updateMetadata(const QString& id, const MetadataPatch& patch, OpError* err) = 0;
    virtual bool deleteFile(const QString& id, OpError* err) = 0;
};

namespace DestinationOps {

// Follows page tokens until a record matches or the listing runs out.
// *match (optional) receives the first hit.
bool findFirst(DestinationStore& store, const QString& parentId, const ListQuery& query,
               RemoteFileRecord* match, bool* found, OpError* err);

// Looks up a folder by name under parentId without creating it. *id is empty
// when absent.
bool findFolder(DestinationStore& store, const QString& parentId, const QString& name,
                QString* id, OpError* err);

// List-by-name-and-parent first; creates only when nothing matched.
bool findOrCreateFolder(DestinationStore& store, const QString& parentId, const QString& name,
                        QString* id, OpError* err);

// Folders carrying the same name do not count.
bool fileExists(DestinationStore& store, const QString& parentId, const QString& name,
                bool* exists, OpError* err);

} // namespace DestinationOps
