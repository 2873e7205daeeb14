#pragma once
#include <QString>
#include <QVector>

enum class ItemStatus {
    Pending,
    CheckingDestination,
    Fetching,
    Transcoding,
    Publishing,
    CleaningUp,
    Done,
    SkippedExisting,
    Failed
};

QString itemStatusName(ItemStatus s);
bool isTerminal(ItemStatus s);

struct WorkItem {
    QString sourceKey;        // key in the source bucket
    QString categoryKey;      // e.g. "camera-12", or "other-videos"
    QString convertedKey;     // flat key of the transcoded artifact
    QString destinationName;  // file name of convertedKey
    ItemStatus status = ItemStatus::Pending;
    QVector<ItemStatus> history{ItemStatus::Pending};

    static WorkItem fromSourceKey(const QString& sourceKey);
};

// Pure key -> name derivations. Identical input always routes identically.
namespace Naming {

extern const char* const kFallbackCategory;
extern const char* const kConvertedSuffix;

QString categoryKey(const QString& sourceKey);
QString convertedKey(const QString& sourceKey);
QString destinationName(const QString& sourceKey);

} // namespace Naming
