#include "transfer_pipeline.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QMimeDatabase>
#include <QElapsedTimer>
#include <QDebug>

#include "destination_store.h"
#include "error_log.h"
#include "source_store.h"
#include "transcode_monitor.h"
#include "transcode_progress.h"

namespace {
constexpr qint64 kFetchProgressIntervalMs = 500;
const char* const kFallbackMime = "video/mp4";

// Relative path of a key below workDir; empty when the key would resolve
// outside it ("../x", "a/../../x").
QString workRelativePath(const QString& key)
{
    QString rel = QDir::cleanPath(key);
    while (rel.startsWith('/')) rel.remove(0, 1);
    if (rel.isEmpty() || rel == "." || rel == ".." || rel.startsWith("../")) return QString();
    return rel;
}
}

TransferPipeline::TransferPipeline(const RunConfig& config, SourceStore& source, DestinationStore* destination,
                                   Transcoder& transcoder, ErrorLog& errorLog, QObject* parent)
    : QObject(parent),
      m_config(config),
      m_source(source),
      m_destination(destination),
      m_transcoder(transcoder),
      m_errorLog(errorLog)
{
}

QString TransferPipeline::localInputPath(const WorkItem& item) const
{
    const QString rel = workRelativePath(item.sourceKey);
    return rel.isEmpty() ? QString() : QDir(m_config.workDir).filePath(rel);
}

QString TransferPipeline::localOutputPath(const WorkItem& item) const
{
    const QString rel = workRelativePath(item.convertedKey);
    return rel.isEmpty() ? QString() : QDir(m_config.workDir).filePath(rel);
}

RunSummary TransferPipeline::run(const QStringList& sourceKeys)
{
    RunSummary s;
    s.total = sourceKeys.size();
    for (int i = 0; i < sourceKeys.size(); ++i) {
        qInfo().noquote() << QString("[Pipeline] Processing file %1/%2: %3").arg(i + 1).arg(s.total).arg(sourceKeys[i]);
        emit itemStarted(i, s.total, sourceKeys[i]);
        const ItemOutcome out = processItem(sourceKeys[i]);
        switch (out.item.status) {
            case ItemStatus::Done: ++s.done; break;
            case ItemStatus::SkippedExisting: ++s.skipped; break;
            default: ++s.failed; break;
        }
        if (out.publishFailed) ++s.publishWarnings;
    }
    qInfo().noquote() << QString("[Pipeline] Finished: %1 done, %2 skipped, %3 failed, %4 publish warnings")
                             .arg(s.done).arg(s.skipped).arg(s.failed).arg(s.publishWarnings);
    return s;
}

ItemOutcome TransferPipeline::processItem(const QString& sourceKey)
{
    ItemOutcome out;
    out.item = WorkItem::fromSourceKey(sourceKey);
    WorkItem& item = out.item;
    qDebug() << "[Pipeline] Category folder:" << item.categoryKey << "destination:" << item.destinationName;

    if (localInputPath(item).isEmpty() || localOutputPath(item).isEmpty()) {
        OpError err;
        setError(&err, ErrorKind::Config, QString("%1 resolves outside the work directory").arg(sourceKey));
        fail(out, err);
        emit itemFinished(out);
        return out;
    }

    OpError collision;
    if (!claimDestinationName(item, &collision)) {
        fail(out, collision);
        emit itemFinished(out);
        return out;
    }

    transition(item, ItemStatus::CheckingDestination);
    if (existsInDestination(item)) {
        qInfo().noquote() << "[Pipeline] Skip:" << item.destinationName << "already exists in" << item.categoryKey;
        removeLocal(localInputPath(item));
        removeLocal(localOutputPath(item));
        transition(item, ItemStatus::SkippedExisting);
        emit itemFinished(out);
        return out;
    }

    if (!fetch(out)) {
        emit itemFinished(out);
        return out;
    }

    const bool transcoded = transcode(out);
    if (transcoded) publish(out);
    cleanup(out);

    if (transcoded) transition(item, ItemStatus::Done);
    else transition(item, ItemStatus::Failed);
    emit itemFinished(out);
    return out;
}

void TransferPipeline::transition(WorkItem& item, ItemStatus status)
{
    item.status = status;
    item.history.append(status);
    emit statusChanged(item.sourceKey, status);
}

bool TransferPipeline::claimDestinationName(const WorkItem& item, OpError* err)
{
    const QString slot = item.categoryKey + '/' + item.destinationName;
    const auto it = m_claimedNames.constFind(slot);
    if (it != m_claimedNames.constEnd() && it.value() != item.sourceKey) {
        return setError(err, ErrorKind::NameCollision,
                        QString("%1 maps to %2 already claimed by %3").arg(item.sourceKey, slot, it.value()));
    }
    m_claimedNames.insert(slot, item.sourceKey);
    return true;
}

QString TransferPipeline::categoryFolderId(const QString& category, bool create)
{
    const auto it = m_folderIds.constFind(category);
    if (it != m_folderIds.constEnd()) return it.value();

    QString id;
    OpError err;
    const bool ok = create
        ? DestinationOps::findOrCreateFolder(*m_destination, m_destination->rootFolderId(), category, &id, &err)
        : DestinationOps::findFolder(*m_destination, m_destination->rootFolderId(), category, &id, &err);
    if (!ok) {
        qWarning().noquote() << "[Pipeline] Error finding folder" << category << ":" << err.toString();
        return QString();
    }
    if (!id.isEmpty()) m_folderIds.insert(category, id);
    return id;
}

bool TransferPipeline::existsInDestination(const WorkItem& item)
{
    // Lookup failures are treated as "absent": the worst case is redundant work.
    if (m_config.checkSourceForConverted) {
        bool exists = false;
        OpError err;
        if (!m_source.headExists(item.convertedKey, &exists, &err))
            qWarning().noquote() << "[Pipeline] Error checking source bucket for" << item.convertedKey << ":" << err.toString();
        else if (exists)
            return true;
    }

    if (m_destination) {
        const QString folderId = categoryFolderId(item.categoryKey, false);
        if (folderId.isEmpty()) return false;
        bool exists = false;
        OpError err;
        if (!DestinationOps::fileExists(*m_destination, folderId, item.destinationName, &exists, &err)) {
            qWarning().noquote() << "[Pipeline] Error checking if file exists in destination:" << err.toString();
            return false;
        }
        return exists;
    }
    return false;
}

bool TransferPipeline::fetch(ItemOutcome& out)
{
    WorkItem& item = out.item;
    transition(item, ItemStatus::Fetching);

    const QString path = localInputPath(item);
    if (QFileInfo::exists(path)) {
        qInfo().noquote() << "[Pipeline] Using existing local file:" << path;
        out.freshlyFetched = false;
        return true;
    }

    qInfo().noquote() << "[Pipeline] Downloading:" << item.sourceKey;
    QDir().mkpath(QFileInfo(path).absolutePath());

    // Written beside the target and renamed on commit, so an interrupted
    // download never looks like a reusable local copy.
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        OpError err;
        setError(&err, ErrorKind::TransientIO, QString("cannot write %1: %2").arg(path, file.errorString()));
        fail(out, err);
        return false;
    }

    QElapsedTimer clock;
    clock.start();
    ProgressThrottle throttle(kFetchProgressIntervalMs);
    const QString key = item.sourceKey;
    auto onProgress = [&](qint64 received, qint64 total) {
        if (throttle.shouldEmit(clock.elapsed())) emit fetchProgress(key, received, total);
    };

    OpError err;
    if (!m_source.fetchTo(item.sourceKey, &file, onProgress, &err)) {
        file.cancelWriting();
        fail(out, err);
        return false;
    }
    if (!file.commit()) {
        setError(&err, ErrorKind::TransientIO, QString("cannot finalize %1: %2").arg(path, file.errorString()));
        fail(out, err);
        return false;
    }
    emit fetchProgress(key, QFileInfo(path).size(), QFileInfo(path).size());
    qInfo().noquote() << QString("[Pipeline] Download complete: %1 MB")
                             .arg(QFileInfo(path).size() / (1024.0 * 1024.0), 0, 'f', 1);
    out.freshlyFetched = true;
    return true;
}

bool TransferPipeline::transcode(ItemOutcome& out)
{
    WorkItem& item = out.item;
    transition(item, ItemStatus::Transcoding);

    TranscodeRequest req;
    req.inputPath = localInputPath(item);
    req.outputPath = localOutputPath(item);
    req.encoder = m_config.encoder;
    req.inputCodec = m_config.inputCodec;

    TranscodeResult result;
    OpError err;
    if (!m_transcoder.transcode(req, &result, &err)) {
        out.error = err;
        qWarning().noquote() << "[Pipeline] Transcode error:" << err.toString();
        m_errorLog.append(item.sourceKey, err.toString());
        return false;
    }
    out.transcoded = true;
    return true;
}

void TransferPipeline::publish(ItemOutcome& out)
{
    WorkItem& item = out.item;
    const bool toSource = m_config.publishToSourceBucket;
    if (!m_destination && !toSource) {
        qInfo().noquote() << "[Pipeline] No publish target configured; keeping" << localOutputPath(item);
        return;
    }
    transition(item, ItemStatus::Publishing);
    out.publishAttempted = true;

    const QString outputPath = localOutputPath(item);
    QString mime = QMimeDatabase().mimeTypeForFile(outputPath).name();
    if (mime.isEmpty() || mime == "application/octet-stream") mime = kFallbackMime;

    bool allOk = true;
    if (m_destination) {
        QString folderId = categoryFolderId(item.categoryKey, true);
        if (folderId.isEmpty()) {
            qWarning() << "[Pipeline] Could not find or create category folder, uploading to root folder";
            folderId = m_destination->rootFolderId();
        }

        QFile body(outputPath);
        OpError err;
        UploadResult uploaded;
        if (!body.open(QIODevice::ReadOnly)) {
            setError(&err, ErrorKind::TransientIO, QString("cannot read %1: %2").arg(outputPath, body.errorString()));
            allOk = false;
        } else if (!m_destination->uploadFile(folderId, item.destinationName, mime, &body, &uploaded, &err)) {
            allOk = false;
        }
        if (!allOk) {
            qWarning().noquote() << "[Pipeline] Destination upload failed:" << err.toString();
            m_errorLog.append(item.sourceKey, QString("upload failed: %1").arg(err.toString()));
        } else {
            qInfo().noquote() << "[Pipeline] Uploaded to destination:" << uploaded.viewLink;
        }
    }

    if (toSource) {
        OpError err;
        if (!m_source.putObject(item.convertedKey, outputPath, mime, &err)) {
            allOk = false;
            qWarning().noquote() << "[Pipeline] Source bucket upload failed:" << err.toString();
            m_errorLog.append(item.sourceKey, QString("bucket upload failed: %1").arg(err.toString()));
        } else {
            qInfo().noquote() << "[Pipeline] Uploaded" << item.convertedKey << "to source bucket";
        }
    }

    out.published = allOk;
    out.publishFailed = !allOk;
}

void TransferPipeline::cleanup(ItemOutcome& out)
{
    WorkItem& item = out.item;
    transition(item, ItemStatus::CleaningUp);

    // A pre-existing input that failed to transcode stays for inspection.
    if (out.freshlyFetched || out.transcoded)
        removeLocal(localInputPath(item));
    else
        qInfo().noquote() << "[Pipeline] Keeping pre-existing input for inspection:" << localInputPath(item);

    // A failed transcode may leave a partial output; a published one is no longer needed.
    if (!out.transcoded || out.publishAttempted)
        removeLocal(localOutputPath(item));
}

void TransferPipeline::removeLocal(const QString& path)
{
    if (!QFileInfo::exists(path)) return;
    if (QFile::remove(path))
        qInfo().noquote() << "[Pipeline] Deleted local file:" << path;
    else
        qWarning().noquote() << "[Pipeline] Failed to delete local file:" << path;
}

void TransferPipeline::fail(ItemOutcome& out, const OpError& error)
{
    out.error = error;
    qWarning().noquote() << "[Pipeline]" << out.item.sourceKey << "failed:" << error.toString();
    m_errorLog.append(out.item.sourceKey, error.toString());
    transition(out.item, ItemStatus::Failed);
}
