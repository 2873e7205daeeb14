#pragma once
#include <QString>

// Failure classes shared by every component. Operations report them through
// an optional OpError* out-parameter next to a bool result.
enum class ErrorKind {
    None,
    Config,
    TransientIO,
    Transcode,
    RemoteNotFound,
    RemotePermissionDenied,
    AuthSetup,
    WorkListRead,
    Timeout,
    UnsupportedStrategy,
    NameCollision
};

struct OpError {
    ErrorKind kind = ErrorKind::None;
    QString message;
    int exitCode = 0; // only meaningful for ErrorKind::Transcode

    bool isError() const { return kind != ErrorKind::None; }
    QString toString() const;
};

QString errorKindName(ErrorKind kind);

// Fills *err when err is non-null; always returns false so callers can write
// `return setError(err, ...);`
bool setError(OpError* err, ErrorKind kind, const QString& message, int exitCode = 0);

// Maps an HTTP status (0 = no response) to the matching error class.
ErrorKind errorKindForHttpStatus(int status);
