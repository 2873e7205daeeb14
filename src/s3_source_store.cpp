#include "s3_source_store.h"

#include <QFile>
#include <QFileInfo>
#include <QDebug>

#include "run_config.h"

S3SourceStore::S3SourceStore(const QString& bucket, const QString& region, const AwsCredentials& credentials,
                             const QString& endpoint, int timeoutMs)
    : m_bucket(bucket),
      m_region(region),
      m_endpoint(endpoint),
      m_timeoutMs(timeoutMs),
      m_signer(credentials, region, "s3")
{
}

S3SourceStore S3SourceStore::fromConfig(const RunConfig& config)
{
    AwsCredentials creds;
    creds.accessKeyId = config.awsAccessKeyId;
    creds.secretAccessKey = config.awsSecretAccessKey;
    creds.sessionToken = config.awsSessionToken;
    return S3SourceStore(config.bucket, config.region, creds, config.s3Endpoint, config.networkTimeoutMs);
}

QUrl S3SourceStore::objectUrl(const QString& key) const
{
    QString base;
    QString path;
    if (!m_endpoint.isEmpty()) {
        base = m_endpoint;
        path = '/' + m_bucket + '/' + key;
    } else if (m_bucket.contains('.')) {
        base = QString("https://s3.%1.amazonaws.com").arg(m_region);
        path = '/' + m_bucket + '/' + key;
    } else {
        base = QString("https://%1.s3.%2.amazonaws.com").arg(m_bucket, m_region);
        path = '/' + key;
    }
    QUrl url(base);
    // Already in SigV4 canonical form, so the wire path matches what was signed.
    url.setPath(QString::fromLatin1(AwsSigV4Signer::uriEncode(path, false)), QUrl::TolerantMode);
    return url;
}

HttpRequest S3SourceStore::signedRequest(const QByteArray& method, const QString& key, const QByteArray& payloadHash,
                                         const HeaderList& extra) const
{
    HttpRequest req;
    req.method = method;
    req.url = objectUrl(key);
    req.timeoutMs = m_timeoutMs;
    const HeaderList signedHeaders =
        m_signer.sign(method, req.url, extra, payloadHash, QDateTime::currentDateTimeUtc());
    for (const auto& h : signedHeaders) {
        if (h.first == "host") continue;   // QNetworkAccessManager writes Host itself
        req.headers.append(h);
    }
    return req;
}

bool S3SourceStore::headExists(const QString& key, bool* exists, OpError* err)
{
    *exists = false;
    HttpRequest req = signedRequest("HEAD", key, AwsSigV4Signer::kEmptyPayloadHash);
    HttpResponse resp;
    Http::send(req, &resp);
    if (resp.ok()) { *exists = true; return true; }
    if (resp.status == 404) return true;
    if (err) *err = Http::toError(resp, QString("HEAD s3://%1/%2").arg(m_bucket, key));
    return false;
}

bool S3SourceStore::fetchTo(const QString& key, QIODevice* sink, const ProgressFn& onProgress, OpError* err)
{
    HttpRequest req = signedRequest("GET", key, AwsSigV4Signer::kEmptyPayloadHash);
    req.sink = sink;
    req.onDownloadProgress = onProgress;
    HttpResponse resp;
    Http::send(req, &resp);
    if (resp.ok() && resp.networkError.isEmpty()) return true;
    OpError e = Http::toError(resp, QString("GET s3://%1/%2").arg(m_bucket, key));
    if (resp.ok()) {
        // 200 followed by a broken transfer
        setError(&e, ErrorKind::TransientIO, QString("GET s3://%1/%2: %3").arg(m_bucket, key, resp.networkError));
    }
    qWarning().noquote() << "[S3] Download error:" << e.toString();
    if (err) *err = e;
    return false;
}

bool S3SourceStore::putObject(const QString& key, const QString& localPath, const QString& mimeType, OpError* err)
{
    QFile body(localPath);
    if (!body.open(QIODevice::ReadOnly))
        return setError(err, ErrorKind::TransientIO, QString("cannot read %1: %2").arg(localPath, body.errorString()));

    HeaderList extra;
    extra.append({"content-type", mimeType.toLatin1()});
    extra.append({"content-length", QByteArray::number(body.size())});
    HttpRequest req = signedRequest("PUT", key, AwsSigV4Signer::kUnsignedPayload, extra);
    req.bodyDevice = &body;
    HttpResponse resp;
    Http::send(req, &resp);
    if (resp.ok()) return true;
    if (err) *err = Http::toError(resp, QString("PUT s3://%1/%2").arg(m_bucket, key));
    return false;
}
