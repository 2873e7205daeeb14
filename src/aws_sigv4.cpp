#include "aws_sigv4.h"

#include <QCryptographicHash>
#include <QMessageAuthenticationCode>
#include <QUrlQuery>
#include <QMap>
#include <algorithm>

const QByteArray AwsSigV4Signer::kEmptyPayloadHash =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const QByteArray AwsSigV4Signer::kUnsignedPayload = "UNSIGNED-PAYLOAD";

namespace {

QByteArray hmac(const QByteArray& key, const QByteArray& data)
{
    return QMessageAuthenticationCode::hash(data, key, QCryptographicHash::Sha256);
}

QByteArray sha256Hex(const QByteArray& data)
{
    return QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex();
}

} // namespace

AwsSigV4Signer::AwsSigV4Signer(const AwsCredentials& credentials, const QString& region, const QString& service)
    : m_credentials(credentials), m_region(region), m_service(service)
{
}

QByteArray AwsSigV4Signer::uriEncode(const QString& text, bool encodeSlash)
{
    static const char hex[] = "0123456789ABCDEF";
    const QByteArray utf8 = text.toUtf8();
    QByteArray out;
    out.reserve(utf8.size() * 3);
    for (const char ch : utf8) {
        const unsigned char c = static_cast<unsigned char>(ch);
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                                || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encodeSlash)) {
            out.append(char(c));
        } else {
            out.append('%');
            out.append(hex[c >> 4]);
            out.append(hex[c & 0x0F]);
        }
    }
    return out;
}

QByteArray AwsSigV4Signer::amzDate(const QDateTime& nowUtc)
{
    return nowUtc.toUTC().toString("yyyyMMdd'T'HHmmss'Z'").toLatin1();
}

QByteArray AwsSigV4Signer::scope(const QDateTime& nowUtc) const
{
    return nowUtc.toUTC().toString("yyyyMMdd").toLatin1() + '/' + m_region.toLatin1() + '/'
           + m_service.toLatin1() + "/aws4_request";
}

QByteArray AwsSigV4Signer::canonicalRequest(const QByteArray& method, const QUrl& url, const HeaderList& headers,
                                            const QByteArray& payloadHash, QByteArray* signedHeaders)
{
    QByteArray path = uriEncode(url.path(QUrl::FullyDecoded), false);
    if (path.isEmpty()) path = "/";

    QList<QPair<QByteArray, QByteArray>> query;
    for (const auto& item : QUrlQuery(url).queryItems(QUrl::FullyDecoded))
        query.append({uriEncode(item.first, true), uriEncode(item.second, true)});
    std::sort(query.begin(), query.end());
    QByteArray canonicalQuery;
    for (const auto& q : query) {
        if (!canonicalQuery.isEmpty()) canonicalQuery += '&';
        canonicalQuery += q.first + '=' + q.second;
    }

    // Sorted, lower-cased, whitespace-collapsed; repeated names are comma-joined.
    QMap<QByteArray, QByteArray> canon;
    for (const auto& h : headers) {
        const QByteArray name = h.first.trimmed().toLower();
        const QByteArray value = h.second.simplified();
        if (canon.contains(name)) canon[name] += ',' + value;
        else canon.insert(name, value);
    }

    QByteArray canonicalHeaders;
    QByteArray names;
    for (auto it = canon.constBegin(); it != canon.constEnd(); ++it) {
        canonicalHeaders += it.key() + ':' + it.value() + '\n';
        if (!names.isEmpty()) names += ';';
        names += it.key();
    }
    if (signedHeaders) *signedHeaders = names;

    return method + '\n' + path + '\n' + canonicalQuery + '\n' + canonicalHeaders + '\n' + names + '\n' + payloadHash;
}

QByteArray AwsSigV4Signer::stringToSign(const QByteArray& canonicalRequest, const QDateTime& nowUtc) const
{
    return "AWS4-HMAC-SHA256\n" + amzDate(nowUtc) + '\n' + scope(nowUtc) + '\n' + sha256Hex(canonicalRequest);
}

QByteArray AwsSigV4Signer::signature(const QByteArray& stringToSign, const QDateTime& nowUtc) const
{
    const QByteArray kDate = hmac("AWS4" + m_credentials.secretAccessKey.toUtf8(),
                                  nowUtc.toUTC().toString("yyyyMMdd").toLatin1());
    const QByteArray kRegion = hmac(kDate, m_region.toLatin1());
    const QByteArray kService = hmac(kRegion, m_service.toLatin1());
    const QByteArray kSigning = hmac(kService, "aws4_request");
    return hmac(kSigning, stringToSign).toHex();
}

HeaderList AwsSigV4Signer::sign(const QByteArray& method, const QUrl& url, const HeaderList& headers,
                                const QByteArray& payloadHash, const QDateTime& nowUtc) const
{
    HeaderList all = headers;
    QByteArray host = url.host().toLatin1();
    if (url.port() != -1) host += ':' + QByteArray::number(url.port());
    all.append({"host", host});
    all.append({"x-amz-content-sha256", payloadHash});
    all.append({"x-amz-date", amzDate(nowUtc)});
    if (!m_credentials.sessionToken.isEmpty())
        all.append({"x-amz-security-token", m_credentials.sessionToken.toUtf8()});

    QByteArray signedHeaders;
    const QByteArray creq = canonicalRequest(method, url, all, payloadHash, &signedHeaders);
    const QByteArray sig = signature(stringToSign(creq, nowUtc), nowUtc);

    all.append({"Authorization",
                "AWS4-HMAC-SHA256 Credential=" + m_credentials.accessKeyId.toLatin1() + '/' + scope(nowUtc)
                    + ", SignedHeaders=" + signedHeaders + ", Signature=" + sig});
    return all;
}
