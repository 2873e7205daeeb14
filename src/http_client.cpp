#include "http_client.h"

#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QIODevice>
#include <QDebug>

namespace Http {

bool send(const HttpRequest& req, HttpResponse* out)
{
    *out = HttpResponse();

    QNetworkAccessManager nam;
    QNetworkRequest request(req.url);
    for (const auto& h : req.headers) request.setRawHeader(h.first, h.second);
    request.setTransferTimeout(req.timeoutMs);

    QNetworkReply* reply = req.bodyDevice
        ? nam.sendCustomRequest(request, req.method, req.bodyDevice)
        : nam.sendCustomRequest(request, req.method, req.body);

    auto statusOf = [reply]() {
        return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    };

    QEventLoop loop;
    bool sinkFailed = false;
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&]() {
        const int status = statusOf();
        const QByteArray chunk = reply->readAll();
        if (req.sink && status >= 200 && status < 300) {
            if (req.sink->write(chunk) != chunk.size() && !sinkFailed) {
                sinkFailed = true;
                qWarning() << "[Http] Write to sink failed:" << req.sink->errorString();
                reply->abort();
            }
        } else {
            out->body += chunk;
        }
    });
    if (req.onDownloadProgress) {
        QObject::connect(reply, &QNetworkReply::downloadProgress, &loop,
                         [&req](qint64 received, qint64 total) { req.onDownloadProgress(received, total); });
    }
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) loop.exec();

    out->status = statusOf();
    const QByteArray rest = reply->readAll();
    if (req.sink && out->ok() && !sinkFailed) req.sink->write(rest);
    else out->body += rest;

    for (const auto& pair : reply->rawHeaderPairs()) out->headers.insert(pair.first.toLower(), pair.second);

    const QNetworkReply::NetworkError e = reply->error();
    // Transfer timeouts surface as a cancelled operation.
    out->timedOut = e == QNetworkReply::OperationCanceledError || e == QNetworkReply::TimeoutError;
    if (sinkFailed) {
        out->timedOut = false;
        out->networkError = QStringLiteral("local write failed: %1").arg(req.sink->errorString());
        out->status = 0;
    } else if (e != QNetworkReply::NoError) {
        out->networkError = reply->errorString();
    }
    reply->deleteLater();
    return out->status != 0;
}

OpError toError(const HttpResponse& resp, const QString& context)
{
    OpError err;
    if (resp.timedOut) {
        setError(&err, ErrorKind::Timeout, QString("%1: timed out").arg(context));
    } else if (resp.status == 0) {
        setError(&err, ErrorKind::TransientIO, QString("%1: %2").arg(context, resp.networkError));
    } else {
        const QByteArray snippet = resp.body.left(300).simplified();
        setError(&err, errorKindForHttpStatus(resp.status),
                 QString("%1: HTTP %2 %3").arg(context).arg(resp.status).arg(QString::fromUtf8(snippet)));
    }
    return err;
}

QByteArray formEncode(const QList<QPair<QString, QString>>& fields)
{
    QByteArray out;
    for (const auto& f : fields) {
        if (!out.isEmpty()) out += '&';
        out += QUrl::toPercentEncoding(f.first) + '=' + QUrl::toPercentEncoding(f.second);
    }
    return out;
}

} // namespace Http
