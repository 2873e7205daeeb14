#pragma once
#include <QString>
#include <QtGlobal>
#include <functional>

#include "errors.h"

class QIODevice;

// Flat blob store holding the original assets (an S3 bucket in production).
class SourceStore {
public:
    using ProgressFn = std::function<void(qint64 received, qint64 total)>; // total < 0 when unknown

    virtual ~SourceStore() = default;

    // *exists = false for a missing key; only transport failures return false.
    virtual bool headExists(const QString& key, bool* exists, OpError* err) = 0;

    // Streams the object into sink. A missing key is ErrorKind::RemoteNotFound,
    // distinct from ErrorKind::TransientIO.
    virtual bool fetchTo(const QString& key, QIODevice* sink, const ProgressFn& onProgress, OpError* err) = 0;

    // Stores a local file under key.
    virtual bool putObject(const QString& key, const QString& localPath, const QString& mimeType, OpError* err) = 0;
};
