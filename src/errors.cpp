#include "errors.h"

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Config: return "config";
        case ErrorKind::TransientIO: return "transient-io";
        case ErrorKind::Transcode: return "transcode";
        case ErrorKind::RemoteNotFound: return "not-found";
        case ErrorKind::RemotePermissionDenied: return "permission-denied";
        case ErrorKind::AuthSetup: return "auth-setup";
        case ErrorKind::WorkListRead: return "work-list-read";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::UnsupportedStrategy: return "unsupported-strategy";
        case ErrorKind::NameCollision: return "name-collision";
    }
    return "unknown";
}

QString OpError::toString() const
{
    if (kind == ErrorKind::Transcode && exitCode != 0)
        return QString("%1 (exit %2): %3").arg(errorKindName(kind)).arg(exitCode).arg(message);
    return QString("%1: %2").arg(errorKindName(kind), message);
}

bool setError(OpError* err, ErrorKind kind, const QString& message, int exitCode)
{
    if (err) {
        err->kind = kind;
        err->message = message;
        err->exitCode = exitCode;
    }
    return false;
}

ErrorKind errorKindForHttpStatus(int status)
{
    if (status == 404) return ErrorKind::RemoteNotFound;
    if (status == 401 || status == 403) return ErrorKind::RemotePermissionDenied;
    return ErrorKind::TransientIO;
}
