#include "drive_auth.h"

#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>
#include <QUrlQuery>
#include <QDebug>

#include "http_client.h"

const char* const DriveAuth::kScope = "https://www.googleapis.com/auth/drive";
const char* const DriveAuth::kTokenEndpoint = "https://oauth2.googleapis.com/token";
const char* const DriveAuth::kAuthEndpoint = "https://accounts.google.com/o/oauth2/v2/auth";

DriveAuth::DriveAuth(const QString& credentialsPath, const QString& tokensPath, int timeoutMs)
    : m_credentialsPath(credentialsPath), m_tokensPath(tokensPath), m_timeoutMs(timeoutMs)
{
}

bool DriveAuth::parseCredentials(const QByteArray& json, OAuthClient* out, OpError* err)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (!doc.isObject())
        return setError(err, ErrorKind::AuthSetup, QString("credentials: %1").arg(parseError.errorString()));

    // Console downloads nest the client under "installed" or "web".
    const QJsonObject root = doc.object();
    const QJsonObject c = root.contains("web") ? root.value("web").toObject() : root.value("installed").toObject();
    out->clientId = c.value("client_id").toString();
    out->clientSecret = c.value("client_secret").toString();
    const QJsonArray redirects = c.value("redirect_uris").toArray();
    out->redirectUri = redirects.isEmpty() ? QString() : redirects.first().toString();
    if (out->clientId.isEmpty() || out->clientSecret.isEmpty())
        return setError(err, ErrorKind::AuthSetup, "credentials: client_id or client_secret missing");
    return true;
}

QJsonObject DriveAuth::mergeTokens(const QJsonObject& stored, const QJsonObject& response, qint64 nowMs)
{
    QJsonObject merged = stored;
    for (auto it = response.constBegin(); it != response.constEnd(); ++it) {
        if (it.key() == "expires_in") continue;
        merged.insert(it.key(), it.value());
    }
    if (response.contains("expires_in"))
        merged.insert("expiry_date", double(nowMs + qint64(response.value("expires_in").toDouble()) * 1000));
    return merged;
}

QUrl DriveAuth::consentUrl() const
{
    QUrl url(kAuthEndpoint);
    QUrlQuery q;
    q.addQueryItem("client_id", m_client.clientId);
    q.addQueryItem("redirect_uri", m_client.redirectUri);
    q.addQueryItem("response_type", "code");
    q.addQueryItem("scope", kScope);
    q.addQueryItem("access_type", "offline");
    q.addQueryItem("prompt", "consent");
    url.setQuery(q);
    return url;
}

bool DriveAuth::loadCredentials(OpError* err)
{
    QFile creds(m_credentialsPath);
    if (!creds.open(QIODevice::ReadOnly))
        return setError(err, ErrorKind::AuthSetup,
                        QString("cannot read %1: %2").arg(m_credentialsPath, creds.errorString()));
    return parseCredentials(creds.readAll(), &m_client, err);
}

bool DriveAuth::load(OpError* err)
{
    if (!loadCredentials(err)) return false;

    QFile tokens(m_tokensPath);
    if (!tokens.open(QIODevice::ReadOnly)) {
        return setError(err, ErrorKind::AuthSetup,
                        QString("no stored tokens in %1; authorize at %2 and rerun with --auth-code")
                            .arg(m_tokensPath, consentUrl().toString(QUrl::FullyEncoded)));
    }
    const QJsonDocument doc = QJsonDocument::fromJson(tokens.readAll());
    if (!doc.isObject())
        return setError(err, ErrorKind::AuthSetup, QString("%1 is not a JSON object").arg(m_tokensPath));

    QMutexLocker locker(&m_mutex);
    m_tokens = doc.object();
    qInfo() << "[Drive] Found stored OAuth tokens";
    return true;
}

bool DriveAuth::needsRefresh(qint64 nowMs) const
{
    if (m_tokens.value("access_token").toString().isEmpty()) return true;
    const qint64 expiry = qint64(m_tokens.value("expiry_date").toDouble());
    return expiry > 0 && expiry - 60000 <= nowMs;
}

bool DriveAuth::accessToken(QString* token, OpError* err, bool forceRefresh)
{
    QMutexLocker locker(&m_mutex);
    if (forceRefresh || needsRefresh(QDateTime::currentMSecsSinceEpoch())) {
        const QString refresh = m_tokens.value("refresh_token").toString();
        if (refresh.isEmpty())
            return setError(err, ErrorKind::AuthSetup, "access token expired and no refresh_token is stored");
        qInfo() << "[Drive] Refreshing access token";
        if (!requestTokens({{"grant_type", "refresh_token"},
                            {"client_id", m_client.clientId},
                            {"client_secret", m_client.clientSecret},
                            {"refresh_token", refresh}},
                           err))
            return false;
    }
    *token = m_tokens.value("access_token").toString();
    return true;
}

bool DriveAuth::exchangeCode(const QString& code, OpError* err)
{
    QMutexLocker locker(&m_mutex);
    return requestTokens({{"grant_type", "authorization_code"},
                          {"code", code},
                          {"client_id", m_client.clientId},
                          {"client_secret", m_client.clientSecret},
                          {"redirect_uri", m_client.redirectUri}},
                         err);
}

bool DriveAuth::requestTokens(const QList<QPair<QString, QString>>& form, OpError* err)
{
    HttpRequest req;
    req.method = "POST";
    req.url = QUrl(kTokenEndpoint);
    req.headers.append({"Content-Type", "application/x-www-form-urlencoded"});
    req.body = Http::formEncode(form);
    req.timeoutMs = m_timeoutMs;

    HttpResponse resp;
    if (!Http::send(req, &resp) || !resp.ok()) {
        OpError e = Http::toError(resp, "token endpoint");
        // A rejected grant cannot be retried into success.
        if (resp.status == 400 || resp.status == 401) e.kind = ErrorKind::AuthSetup;
        qWarning().noquote() << "[Drive] Token request failed:" << e.toString();
        if (err) *err = e;
        return false;
    }
    const QJsonDocument doc = QJsonDocument::fromJson(resp.body);
    if (!doc.isObject() || doc.object().value("access_token").toString().isEmpty())
        return setError(err, ErrorKind::AuthSetup, "token endpoint returned no access_token");

    m_tokens = mergeTokens(m_tokens, doc.object(), QDateTime::currentMSecsSinceEpoch());
    return saveTokens(err);
}

bool DriveAuth::saveTokens(OpError* err)
{
    QSaveFile file(m_tokensPath);
    if (!file.open(QIODevice::WriteOnly))
        return setError(err, ErrorKind::AuthSetup, QString("cannot write %1: %2").arg(m_tokensPath, file.errorString()));
    file.write(QJsonDocument(m_tokens).toJson(QJsonDocument::Indented));
    if (!file.commit())
        return setError(err, ErrorKind::AuthSetup, QString("cannot write %1: %2").arg(m_tokensPath, file.errorString()));
    qInfo() << "[Drive] OAuth tokens saved to" << m_tokensPath;
    return true;
}
