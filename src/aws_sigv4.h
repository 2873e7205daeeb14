#pragma once
#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QUrl>

#include "http_client.h"

struct AwsCredentials {
    QString accessKeyId;
    QString secretAccessKey;
    QString sessionToken;   // optional
};

// AWS Signature Version 4, header-based.
class AwsSigV4Signer {
public:
    static const QByteArray kEmptyPayloadHash;
    static const QByteArray kUnsignedPayload;

    AwsSigV4Signer(const AwsCredentials& credentials, const QString& region, const QString& service = "s3");

    // Returns headers plus host, x-amz-date, x-amz-content-sha256,
    // x-amz-security-token (when set) and Authorization.
    HeaderList sign(const QByteArray& method, const QUrl& url, const HeaderList& headers,
                    const QByteArray& payloadHash, const QDateTime& nowUtc) const;

    static QByteArray canonicalRequest(const QByteArray& method, const QUrl& url, const HeaderList& headers,
                                       const QByteArray& payloadHash, QByteArray* signedHeaders);
    QByteArray stringToSign(const QByteArray& canonicalRequest, const QDateTime& nowUtc) const;
    QByteArray signature(const QByteArray& stringToSign, const QDateTime& nowUtc) const;

    // RFC 3986 unreserved characters pass through; everything else is %XX.
    static QByteArray uriEncode(const QString& text, bool encodeSlash);
    static QByteArray amzDate(const QDateTime& nowUtc);

private:
    QByteArray scope(const QDateTime& nowUtc) const;

    AwsCredentials m_credentials;
    QString m_region;
    QString m_service;
};
