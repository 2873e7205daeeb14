#pragma once
#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QMutex>
#include <QUrl>

#include "errors.h"

struct OAuthClient {
    QString clientId;
    QString clientSecret;
    QString redirectUri;
};

// OAuth2 installed-app credentials for Drive. Tokens are read from and saved
// back to a JSON file next to the credentials.
class DriveAuth {
public:
    static const char* const kScope;
    static const char* const kTokenEndpoint;
    static const char* const kAuthEndpoint;

    DriveAuth(const QString& credentialsPath, const QString& tokensPath, int timeoutMs = 60000);

    // Missing or unreadable files are ErrorKind::AuthSetup; when only the
    // tokens are missing the message carries the consent URL.
    bool load(OpError* err);
    // Client credentials only; enough for consentUrl() and exchangeCode().
    bool loadCredentials(OpError* err);

    // Refreshes when the token is absent, expiring within a minute, or
    // forceRefresh is set. Thread-safe.
    bool accessToken(QString* token, OpError* err, bool forceRefresh = false);

    // Trades a consent-screen authorization code for tokens and saves them.
    bool exchangeCode(const QString& code, OpError* err);

    QUrl consentUrl() const;
    const OAuthClient& client() const { return m_client; }

    static bool parseCredentials(const QByteArray& json, OAuthClient* out, OpError* err);

    // Overlays a token endpoint response on the stored tokens; expires_in is
    // converted to an absolute expiry_date in milliseconds.
    static QJsonObject mergeTokens(const QJsonObject& stored, const QJsonObject& response, qint64 nowMs);

private:
    bool requestTokens(const QList<QPair<QString, QString>>& form, OpError* err);
    bool saveTokens(OpError* err);
    bool needsRefresh(qint64 nowMs) const;

    QString m_credentialsPath;
    QString m_tokensPath;
    int m_timeoutMs;
    OAuthClient m_client;
    QJsonObject m_tokens;
    QMutex m_mutex;
};
