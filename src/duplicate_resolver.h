#pragma once

#include <QObject>
#include <QHash>
#include <QStringList>
#include <functional>

#include "duplicate_scanner.h"
#include "errors.h"
#include "run_config.h"

enum class ResolveStrategy {
    KeepFirstDelete,
    KeepFirstTrash,
    RenameWithParentSuffix,
    ListOnly,
    KeepNewest   // recognised but rejected: selection semantics are undefined
};

bool parseResolveStrategy(const QString& text, ResolveStrategy* out);
QString resolveStrategyName(ResolveStrategy s);

// Per-target outcome tally. total() always equals the number of targets submitted.
struct BatchMutationResult {
    int success = 0;
    int notFound = 0;
    int permissionDenied = 0;
    int otherErrors = 0;

    int total() const { return success + notFound + permissionDenied + otherErrors; }
    void record(ErrorKind outcome);
    BatchMutationResult& operator+=(const BatchMutationResult& o);
};

struct DuplicateReport {
    int groups = 0;
    int totalRecords = 0;
    int redundantRecords = 0;
};

struct ResolveOutcome {
    DuplicateReport report;
    BatchMutationResult result;
    bool declined = false;    // confirmation refused; nothing was mutated
};

struct ResolverOptions {
    int batchSize = 10;
    int batchDelayMs = 1000;
    int refreshTimeoutMs = 10000;
};

// Applies a strategy to the scanner's groups. Destructive strategies run only
// after the injected confirmer approves; the first record of every group is
// never targeted.
class DuplicateResolver : public QObject {
    Q_OBJECT
public:
    using Confirmer = std::function<bool(const QString& summary)>;
    using Mutation = std::function<ErrorKind(const QString& id)>;

    DuplicateResolver(DestinationStore& store, const ResolverOptions& options, Confirmer confirm,
                      QObject* parent = nullptr);

    static ResolverOptions optionsFrom(const RunConfig& config);

    // Re-checks every record; drops the ones the store reports gone and the
    // groups that shrink to one. Timeouts and other errors keep the record.
    QVector<DuplicateGroup> refresh(const QVector<DuplicateGroup>& groups, int* droppedRecords = nullptr);

    // Returns false (ErrorKind::UnsupportedStrategy) for KeepNewest.
    bool resolve(const QVector<DuplicateGroup>& groups, ResolveStrategy strategy,
                 ResolveOutcome* out, OpError* err);

    // Every non-first record id across all groups, in group order.
    static QStringList mutationTargets(const QVector<DuplicateGroup>& groups);
    static DuplicateReport report(const QVector<DuplicateGroup>& groups);
    static QString renamedWithParent(const QString& name, const QString& parentName);

    // Fixed-size batches, bounded concurrency inside a batch, a pause between
    // batches. Each id's outcome is classified independently.
    BatchMutationResult applyBatched(const QStringList& ids, const Mutation& mutate);

signals:
    void batchStarted(int batchIndex, int batchCount, int size);
    void batchFinished(int batchIndex, int batchCount);

private:
    BatchMutationResult removeAll(const QVector<DuplicateGroup>& groups, bool trash);
    BatchMutationResult renameAll(const QVector<DuplicateGroup>& groups);
    bool parentName(const QString& parentId, QString* name, ErrorKind* failure);

    DestinationStore& m_store;
    ResolverOptions m_options;
    Confirmer m_confirm;
    QHash<QString, QString> m_parentNames;
};
