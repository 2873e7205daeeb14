#include "drive_store.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QIODevice>
#include <QStringList>
#include <QDebug>

#include "drive_auth.h"

namespace {

const char* const kApiBase = "https://www.googleapis.com/drive/v3/files";
const char* const kUploadBase = "https://www.googleapis.com/upload/drive/v3/files";

QJsonObject parseObject(const QByteArray& body)
{
    return QJsonDocument::fromJson(body).object();
}

} // namespace

namespace DriveQuery {

const char* const kFolderMimeType = "application/vnd.google-apps.folder";

QString escape(const QString& literal)
{
    QString out = literal;
    out.replace('\\', "\\\\");
    out.replace('\'', "\\'");
    return '\'' + out + '\'';
}

QString build(const QString& parentId, const ListQuery& query)
{
    QStringList terms;
    terms << QString("%1 in parents").arg(escape(parentId));
    terms << "trashed=false";
    if (!query.name.isEmpty()) terms << QString("name=%1").arg(escape(query.name));
    if (query.foldersOnly) terms << QString("mimeType='%1'").arg(kFolderMimeType);
    else if (query.filesOnly) terms << QString("mimeType!='%1'").arg(kFolderMimeType);
    return terms.join(" and ");
}

bool parseFileList(const QByteArray& json, ListPage* out, OpError* err)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (!doc.isObject())
        return setError(err, ErrorKind::TransientIO, QString("files.list: %1").arg(parseError.errorString()));

    const QJsonObject root = doc.object();
    out->records.clear();
    out->nextPageToken = root.value("nextPageToken").toString();
    const QJsonArray files = root.value("files").toArray();
    out->records.reserve(files.size());
    for (const QJsonValue& v : files) {
        const QJsonObject f = v.toObject();
        RemoteFileRecord r;
        r.id = f.value("id").toString();
        r.name = f.value("name").toString();
        r.mimeType = f.value("mimeType").toString();
        const QJsonArray parents = f.value("parents").toArray();
        if (!parents.isEmpty()) r.parentId = parents.first().toString();
        r.isFolder = r.mimeType == QLatin1String(kFolderMimeType);
        out->records.append(r);
    }
    return true;
}

} // namespace DriveQuery

DriveDestinationStore::DriveDestinationStore(DriveAuth& auth, const QString& rootFolderId, int timeoutMs)
    : m_auth(auth), m_rootFolderId(rootFolderId), m_timeoutMs(timeoutMs)
{
}

QUrl DriveDestinationStore::filesUrl(const QString& suffix, const QList<QPair<QString, QString>>& params) const
{
    QUrl url(QString(kApiBase) + suffix);
    QList<QPair<QString, QString>> all = params;
    all.append({"supportsAllDrives", "true"});
    url.setQuery(QString::fromLatin1(Http::formEncode(all)));
    return url;
}

bool DriveDestinationStore::call(HttpRequest req, HttpResponse* resp, const QString& context, OpError* err)
{
    for (int attempt = 0; attempt < 2; ++attempt) {
        QString token;
        if (!m_auth.accessToken(&token, err, attempt > 0)) return false;

        HttpRequest signedReq = req;
        signedReq.headers.append({"Authorization", "Bearer " + token.toLatin1()});
        if (signedReq.bodyDevice && attempt > 0 && !signedReq.bodyDevice->seek(0))
            return setError(err, ErrorKind::TransientIO, QString("%1: cannot rewind upload body").arg(context));

        Http::send(signedReq, resp);
        if (resp->ok()) return true;
        if (resp->status != 401) break;
        qWarning() << "[Drive] 401 from" << context << "- refreshing token";
    }
    if (err) *err = Http::toError(*resp, context);
    return false;
}

bool DriveDestinationStore::listChildren(const QString& parentId, const ListQuery& query, const QString& pageToken,
                                         ListPage* out, OpError* err)
{
    QList<QPair<QString, QString>> params = {
        {"q", DriveQuery::build(parentId, query)},
        {"fields", "nextPageToken,files(id,name,mimeType,parents)"},
        {"pageSize", "1000"},
        {"includeItemsFromAllDrives", "true"},
    };
    if (!pageToken.isEmpty()) params.append({"pageToken", pageToken});

    HttpRequest req;
    req.url = filesUrl(QString(), params);
    req.timeoutMs = m_timeoutMs;
    HttpResponse resp;
    if (!call(req, &resp, QString("files.list in %1").arg(parentId), err)) return false;
    return DriveQuery::parseFileList(resp.body, out, err);
}

bool DriveDestinationStore::createFolder(const QString& parentId, const QString& name, QString* id, OpError* err)
{
    QJsonObject meta;
    meta.insert("name", name);
    meta.insert("mimeType", DriveQuery::kFolderMimeType);
    meta.insert("parents", QJsonArray{parentId});

    HttpRequest req;
    req.method = "POST";
    req.url = filesUrl(QString(), {{"fields", "id"}});
    req.headers.append({"Content-Type", "application/json; charset=UTF-8"});
    req.body = QJsonDocument(meta).toJson(QJsonDocument::Compact);
    req.timeoutMs = m_timeoutMs;
    HttpResponse resp;
    if (!call(req, &resp, QString("create folder %1").arg(name), err)) return false;
    *id = parseObject(resp.body).value("id").toString();
    if (id->isEmpty()) return setError(err, ErrorKind::TransientIO, "create folder: response carried no id");
    return true;
}

bool DriveDestinationStore::uploadFile(const QString& parentId, const QString& name, const QString& mimeHint,
                                       QIODevice* body, UploadResult* out, OpError* err)
{
    const QString context = QString("upload %1").arg(name);
    QJsonObject meta;
    meta.insert("name", name);
    meta.insert("parents", QJsonArray{parentId});

    // Resumable upload: the session request returns the URL the bytes go to.
    QUrl sessionUrl(kUploadBase);
    sessionUrl.setQuery(QString::fromLatin1(Http::formEncode(
        {{"uploadType", "resumable"}, {"supportsAllDrives", "true"}, {"fields", "id,webViewLink"}})));
    HttpRequest session;
    session.method = "POST";
    session.url = sessionUrl;
    session.headers.append({"Content-Type", "application/json; charset=UTF-8"});
    session.headers.append({"X-Upload-Content-Type", mimeHint.toLatin1()});
    session.headers.append({"X-Upload-Content-Length", QByteArray::number(body->size())});
    session.body = QJsonDocument(meta).toJson(QJsonDocument::Compact);
    session.timeoutMs = m_timeoutMs;
    HttpResponse sessionResp;
    if (!call(session, &sessionResp, context, err)) return false;

    const QByteArray location = sessionResp.headers.value("location");
    if (location.isEmpty())
        return setError(err, ErrorKind::TransientIO, QString("%1: no upload session location").arg(context));

    HttpRequest put;
    put.method = "PUT";
    put.url = QUrl::fromEncoded(location);
    put.headers.append({"Content-Type", mimeHint.toLatin1()});
    put.bodyDevice = body;
    put.timeoutMs = m_timeoutMs;
    HttpResponse putResp;
    if (!call(put, &putResp, context, err)) return false;

    const QJsonObject file = parseObject(putResp.body);
    out->id = file.value("id").toString();
    out->viewLink = file.value("webViewLink").toString();
    qInfo().noquote() << "[Drive] Uploaded" << name << "id:" << out->id;
    return true;
}

bool DriveDestinationStore::getMetadata(const QString& id, RemoteMetadata* out, OpError* err, int timeoutMs)
{
    HttpRequest req;
    req.url = filesUrl('/' + QString::fromLatin1(QUrl::toPercentEncoding(id)), {{"fields", "name,mimeType,trashed"}});
    req.timeoutMs = timeoutMs > 0 ? timeoutMs : m_timeoutMs;
    HttpResponse resp;
    if (!call(req, &resp, QString("files.get %1").arg(id), err)) return false;
    const QJsonObject f = parseObject(resp.body);
    out->name = f.value("name").toString();
    out->mimeType = f.value("mimeType").toString();
    out->trashed = f.value("trashed").toBool();
    return true;
}

bool DriveDestinationStore::updateMetadata(const QString& id, const MetadataPatch& patch, OpError* err)
{
    QJsonObject body;
    if (patch.setTrashed) body.insert("trashed", patch.trashed);
    if (!patch.newName.isEmpty()) body.insert("name", patch.newName);

    HttpRequest req;
    req.method = "PATCH";
    req.url = filesUrl('/' + QString::fromLatin1(QUrl::toPercentEncoding(id)), {{"fields", "id"}});
    req.headers.append({"Content-Type", "application/json; charset=UTF-8"});
    req.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    req.timeoutMs = m_timeoutMs;
    HttpResponse resp;
    return call(req, &resp, QString("files.update %1").arg(id), err);
}

bool DriveDestinationStore::deleteFile(const QString& id, OpError* err)
{
    HttpRequest req;
    req.method = "DELETE";
    req.url = filesUrl('/' + QString::fromLatin1(QUrl::toPercentEncoding(id)), {});
    req.timeoutMs = m_timeoutMs;
    HttpResponse resp;
    return call(req, &resp, QString("files.delete %1").arg(id), err);
}
