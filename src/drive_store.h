#pragma once
#include <QByteArray>
#include <QString>

#include "destination_store.h"
#include "http_client.h"

class DriveAuth;

namespace DriveQuery {

extern const char* const kFolderMimeType;

// Quotes a literal for the Drive search language ('...' with \ and ' escaped).
QString escape(const QString& literal);

// Always restricted to direct, untrashed children of parentId.
QString build(const QString& parentId, const ListQuery& query);

// Parses a files.list response body.
bool parseFileList(const QByteArray& json, ListPage* out, OpError* err);

} // namespace DriveQuery

// Google Drive v3 over REST. Every call passes supportsAllDrives so shared
// drives behave like My Drive.
class DriveDestinationStore : public DestinationStore {
public:
    DriveDestinationStore(DriveAuth& auth, const QString& rootFolderId, int timeoutMs = 60000);

    QString rootFolderId() const override { return m_rootFolderId; }

    bool listChildren(const QString& parentId, const ListQuery& query, const QString& pageToken,
                      ListPage* out, OpError* err) override;
    bool createFolder(const QString& parentId, const QString& name, QString* id, OpError* err) override;
    bool uploadFile(const QString& parentId, const QString& name, const QString& mimeHint,
                    QIODevice* body, UploadResult* out, OpError* err) override;
    bool getMetadata(const QString& id, RemoteMetadata* out, OpError* err, int timeoutMs = 0) override;
    bool updateMetadata(const QString& id, const MetadataPatch& patch, OpError* err) override;
    bool deleteFile(const QString& id, OpError* err) override;

private:
    // Adds the bearer token; a 401 forces one token refresh and a retry.
    bool call(HttpRequest req, HttpResponse* resp, const QString& context, OpError* err);
    QUrl filesUrl(const QString& suffix, const QList<QPair<QString, QString>>& params) const;

    DriveAuth& m_auth;
    QString m_rootFolderId;
    int m_timeoutMs;
};
