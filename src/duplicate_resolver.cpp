#include "duplicate_resolver.h"

#include <QtConcurrent/QtConcurrent>
#include <QThreadPool>
#include <QThread>
#include <QDebug>

bool parseResolveStrategy(const QString& text, ResolveStrategy* out)
{
    const QString t = text.trimmed().toLower();
    if (t == "delete" || t == "1") { *out = ResolveStrategy::KeepFirstDelete; return true; }
    if (t == "trash" || t == "2") { *out = ResolveStrategy::KeepFirstTrash; return true; }
    if (t == "rename" || t == "3") { *out = ResolveStrategy::RenameWithParentSuffix; return true; }
    if (t == "list" || t == "4") { *out = ResolveStrategy::ListOnly; return true; }
    if (t == "newest" || t == "5") { *out = ResolveStrategy::KeepNewest; return true; }
    return false;
}

QString resolveStrategyName(ResolveStrategy s)
{
    switch (s) {
        case ResolveStrategy::KeepFirstDelete: return "keep first, delete the rest";
        case ResolveStrategy::KeepFirstTrash: return "keep first, trash the rest";
        case ResolveStrategy::RenameWithParentSuffix: return "rename with parent folder suffix";
        case ResolveStrategy::ListOnly: return "list only";
        case ResolveStrategy::KeepNewest: return "keep newest";
    }
    return "unknown";
}

void BatchMutationResult::record(ErrorKind outcome)
{
    switch (outcome) {
        case ErrorKind::None: ++success; break;
        case ErrorKind::RemoteNotFound: ++notFound; break;
        case ErrorKind::RemotePermissionDenied: ++permissionDenied; break;
        default: ++otherErrors; break;
    }
}

BatchMutationResult& BatchMutationResult::operator+=(const BatchMutationResult& o)
{
    success += o.success;
    notFound += o.notFound;
    permissionDenied += o.permissionDenied;
    otherErrors += o.otherErrors;
    return *this;
}

DuplicateResolver::DuplicateResolver(DestinationStore& store, const ResolverOptions& options, Confirmer confirm,
                                     QObject* parent)
    : QObject(parent), m_store(store), m_options(options), m_confirm(std::move(confirm))
{
    if (m_options.batchSize < 1) m_options.batchSize = 1;
}

ResolverOptions DuplicateResolver::optionsFrom(const RunConfig& config)
{
    ResolverOptions o;
    o.batchSize = config.batchSize;
    o.batchDelayMs = config.batchDelayMs;
    o.refreshTimeoutMs = config.refreshTimeoutMs;
    return o;
}

QStringList DuplicateResolver::mutationTargets(const QVector<DuplicateGroup>& groups)
{
    QStringList ids;
    for (const DuplicateGroup& g : groups) {
        for (int i = 1; i < g.records.size(); ++i) ids << g.records[i].id;
    }
    return ids;
}

DuplicateReport DuplicateResolver::report(const QVector<DuplicateGroup>& groups)
{
    DuplicateReport r;
    r.groups = groups.size();
    for (const DuplicateGroup& g : groups) {
        r.totalRecords += g.records.size();
        r.redundantRecords += g.records.size() - 1;
    }
    return r;
}

QString DuplicateResolver::renamedWithParent(const QString& name, const QString& parentName)
{
    const int dot = name.lastIndexOf('.');
    if (dot <= 0) return QString("%1_%2").arg(name, parentName);
    return QString("%1_%2%3").arg(name.left(dot), parentName, name.mid(dot));
}

QVector<DuplicateGroup> DuplicateResolver::refresh(const QVector<DuplicateGroup>& groups, int* droppedRecords)
{
    QStringList ids;
    for (const DuplicateGroup& g : groups) {
        for (const RemoteFileRecord& r : g.records) ids << r.id;
    }

    QThreadPool pool;
    pool.setMaxThreadCount(m_options.batchSize);
    const int timeoutMs = m_options.refreshTimeoutMs;
    DestinationStore& store = m_store;

    const QList<bool> alive = QtConcurrent::blockingMapped<QList<bool>>(&pool, ids, [&store, timeoutMs](const QString& id) {
        RemoteMetadata meta;
        OpError err;
        if (store.getMetadata(id, &meta, &err, timeoutMs)) return !meta.trashed;
        if (err.kind == ErrorKind::RemoteNotFound) return false;
        // Timeouts and transport errors: assume the record still exists.
        qWarning().noquote() << "[Resolver] Could not verify" << id << "-" << err.toString() << "- assuming it exists";
        return true;
    });

    QVector<DuplicateGroup> kept;
    int dropped = 0;
    int k = 0;
    for (const DuplicateGroup& g : groups) {
        DuplicateGroup survivor{g.name, {}};
        for (const RemoteFileRecord& r : g.records) {
            if (alive.at(k++)) survivor.records << r;
            else ++dropped;
        }
        if (survivor.records.size() >= 2) kept << survivor;
    }

    qInfo().noquote() << QString("[Resolver] Refresh: %1 of %2 groups still duplicated, %3 records gone")
                             .arg(kept.size()).arg(groups.size()).arg(dropped);
    if (droppedRecords) *droppedRecords = dropped;
    return kept;
}

bool DuplicateResolver::resolve(const QVector<DuplicateGroup>& groups, ResolveStrategy strategy,
                                ResolveOutcome* out, OpError* err)
{
    ResolveOutcome outcome;
    outcome.report = report(groups);
    qInfo().noquote() << QString("[Resolver] %1 duplicate names, %2 records, %3 redundant; strategy: %4")
                             .arg(outcome.report.groups).arg(outcome.report.totalRecords)
                             .arg(outcome.report.redundantRecords).arg(resolveStrategyName(strategy));

    switch (strategy) {
        case ResolveStrategy::ListOnly:
            break;

        case ResolveStrategy::KeepFirstDelete:
        case ResolveStrategy::KeepFirstTrash: {
            const bool trash = strategy == ResolveStrategy::KeepFirstTrash;
            if (outcome.report.redundantRecords == 0) break;
            const QString summary = QString("%1 %2 files across %3 duplicate names (the first copy of each is kept)")
                                        .arg(trash ? "Move to trash" : "PERMANENTLY delete")
                                        .arg(outcome.report.redundantRecords)
                                        .arg(outcome.report.groups);
            if (!m_confirm || !m_confirm(summary)) {
                qInfo() << "[Resolver] Confirmation refused; nothing was changed";
                outcome.declined = true;
                break;
            }
            outcome.result = removeAll(groups, trash);
            break;
        }

        case ResolveStrategy::RenameWithParentSuffix:
            outcome.result = renameAll(groups);
            break;

        case ResolveStrategy::KeepNewest:
            return setError(err, ErrorKind::UnsupportedStrategy,
                            "keep-newest is not supported: the ordering field and tie-break are undefined");
    }

    if (out) *out = outcome;
    return true;
}

BatchMutationResult DuplicateResolver::removeAll(const QVector<DuplicateGroup>& groups, bool trash)
{
    const QStringList ids = mutationTargets(groups);
    DestinationStore& store = m_store;
    const BatchMutationResult result = applyBatched(ids, [&store, trash](const QString& id) {
        OpError err;
        bool ok = false;
        if (trash) {
            MetadataPatch patch;
            patch.setTrashed = true;
            patch.trashed = true;
            ok = store.updateMetadata(id, patch, &err);
        } else {
            ok = store.deleteFile(id, &err);
        }
        if (ok) return ErrorKind::None;
        qWarning().noquote() << "[Resolver]" << (trash ? "Trash" : "Delete") << "failed for" << id << "-" << err.toString();
        return err.kind == ErrorKind::None ? ErrorKind::TransientIO : err.kind;
    });

    qInfo().noquote() << QString("[Resolver] %1: %2 succeeded, %3 not found, %4 permission denied, %5 other errors")
                             .arg(trash ? "Trash" : "Delete")
                             .arg(result.success).arg(result.notFound)
                             .arg(result.permissionDenied).arg(result.otherErrors);
    return result;
}

BatchMutationResult DuplicateResolver::applyBatched(const QStringList& ids, const Mutation& mutate)
{
    BatchMutationResult total;
    if (ids.isEmpty()) return total;

    const int size = m_options.batchSize;
    const int batchCount = (ids.size() + size - 1) / size;
    QThreadPool pool;
    pool.setMaxThreadCount(size);

    for (int b = 0; b < batchCount; ++b) {
        const QStringList batch = ids.mid(b * size, size);
        emit batchStarted(b, batchCount, batch.size());
        qInfo().noquote() << QString("[Resolver] Batch %1/%2 (%3 items)").arg(b + 1).arg(batchCount).arg(batch.size());

        // Each call returns its own classification; one failure cannot affect its siblings.
        const QList<ErrorKind> outcomes = QtConcurrent::blockingMapped<QList<ErrorKind>>(&pool, batch, mutate);
        for (ErrorKind k : outcomes) total.record(k);

        emit batchFinished(b, batchCount);
        if (b + 1 < batchCount && m_options.batchDelayMs > 0) QThread::msleep(m_options.batchDelayMs);
    }
    return total;
}

bool DuplicateResolver::parentName(const QString& parentId, QString* name, ErrorKind* failure)
{
    const auto it = m_parentNames.constFind(parentId);
    if (it != m_parentNames.constEnd()) { *name = it.value(); return true; }

    RemoteMetadata meta;
    OpError err;
    if (!m_store.getMetadata(parentId, &meta, &err)) {
        qWarning().noquote() << "[Resolver] Cannot read parent folder" << parentId << "-" << err.toString();
        *failure = err.kind == ErrorKind::None ? ErrorKind::TransientIO : err.kind;
        return false;
    }
    m_parentNames.insert(parentId, meta.name);
    *name = meta.name;
    return true;
}

BatchMutationResult DuplicateResolver::renameAll(const QVector<DuplicateGroup>& groups)
{
    BatchMutationResult result;
    for (const DuplicateGroup& g : groups) {
        for (int i = 1; i < g.records.size(); ++i) {
            const RemoteFileRecord& r = g.records[i];
            QString folder;
            ErrorKind failure = ErrorKind::None;
            if (!parentName(r.parentId, &folder, &failure)) {
                result.record(failure);
                continue;
            }
            MetadataPatch patch;
            patch.newName = renamedWithParent(r.name, folder);
            OpError err;
            if (m_store.updateMetadata(r.id, patch, &err)) {
                qInfo().noquote() << "[Resolver] Renamed" << r.name << "->" << patch.newName;
                result.record(ErrorKind::None);
            } else {
                qWarning().noquote() << "[Resolver] Rename failed for" << r.id << "-" << err.toString();
                result.record(err.kind == ErrorKind::None ? ErrorKind::TransientIO : err.kind);
            }
        }
    }
    return result;
}
