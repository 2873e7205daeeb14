#pragma once
#include <QString>
#include <QUrl>

#include "aws_sigv4.h"
#include "source_store.h"

struct RunConfig;

// S3 REST (HEAD/GET/PUT object) signed with SigV4.
class S3SourceStore : public SourceStore {
public:
    S3SourceStore(const QString& bucket, const QString& region, const AwsCredentials& credentials,
                  const QString& endpoint = QString(), int timeoutMs = 60000);

    static S3SourceStore fromConfig(const RunConfig& config);

    bool headExists(const QString& key, bool* exists, OpError* err) override;
    bool fetchTo(const QString& key, QIODevice* sink, const ProgressFn& onProgress, OpError* err) override;
    bool putObject(const QString& key, const QString& localPath, const QString& mimeType, OpError* err) override;

    // Virtual-hosted style unless the bucket name contains dots (TLS wildcard
    // certificates do not cover them) or an explicit endpoint is configured.
    QUrl objectUrl(const QString& key) const;

private:
    HttpRequest signedRequest(const QByteArray& method, const QString& key, const QByteArray& payloadHash,
                              const HeaderList& extra = HeaderList()) const;

    QString m_bucket;
    QString m_region;
    QString m_endpoint;
    int m_timeoutMs;
    AwsSigV4Signer m_signer;
};
