#pragma once
#include <QByteArray>
#include <QHash>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>
#include <functional>

#include "errors.h"

class QIODevice;

using HeaderList = QList<QPair<QByteArray, QByteArray>>;

struct HttpRequest {
    QByteArray method = "GET";
    QUrl url;
    HeaderList headers;
    QByteArray body;              // used when bodyDevice is null
    QIODevice* bodyDevice = nullptr;
    QIODevice* sink = nullptr;    // 2xx response bodies stream here instead of into HttpResponse::body
    int timeoutMs = 60000;        // transfer inactivity timeout
    std::function<void(qint64, qint64)> onDownloadProgress;
};

struct HttpResponse {
    int status = 0;               // 0 when no HTTP response arrived
    QByteArray body;
    QHash<QByteArray, QByteArray> headers;   // lower-case names
    bool timedOut = false;
    QString networkError;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking request on a private QNetworkAccessManager and QEventLoop, so it is
// usable from any thread. Returns false only when no HTTP response arrived.
namespace Http {

bool send(const HttpRequest& req, HttpResponse* out);

// Turns a failed exchange into an OpError (timeout, status class, or transport).
OpError toError(const HttpResponse& resp, const QString& context);

QByteArray formEncode(const QList<QPair<QString, QString>>& fields);

} // namespace Http
