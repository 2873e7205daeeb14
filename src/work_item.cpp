#include "work_item.h"

#include <QRegularExpression>

QString itemStatusName(ItemStatus s)
{
    switch (s) {
        case ItemStatus::Pending: return "Pending";
        case ItemStatus::CheckingDestination: return "CheckingDestination";
        case ItemStatus::Fetching: return "Fetching";
        case ItemStatus::Transcoding: return "Transcoding";
        case ItemStatus::Publishing: return "Publishing";
        case ItemStatus::CleaningUp: return "CleaningUp";
        case ItemStatus::Done: return "Done";
        case ItemStatus::SkippedExisting: return "SkippedExisting";
        case ItemStatus::Failed: return "Failed";
    }
    return "Unknown";
}

bool isTerminal(ItemStatus s)
{
    return s == ItemStatus::Done || s == ItemStatus::SkippedExisting || s == ItemStatus::Failed;
}

WorkItem WorkItem::fromSourceKey(const QString& sourceKey)
{
    WorkItem w;
    w.sourceKey = sourceKey;
    w.categoryKey = Naming::categoryKey(sourceKey);
    w.convertedKey = Naming::convertedKey(sourceKey);
    w.destinationName = Naming::destinationName(sourceKey);
    return w;
}

namespace Naming {

const char* const kFallbackCategory = "other-videos";
const char* const kConvertedSuffix = "_converted.mp4";

QString categoryKey(const QString& sourceKey)
{
    static const QRegularExpression rx("camera-(\\d+)");
    const QRegularExpressionMatch m = rx.match(sourceKey);
    if (m.hasMatch()) return QString("camera-%1").arg(m.captured(1));
    return QString::fromLatin1(kFallbackCategory);
}

QString convertedKey(const QString& sourceKey)
{
    // Only strip an extension of the last path segment: "a.b/clip" has none.
    const int dot = sourceKey.lastIndexOf('.');
    const int slash = sourceKey.lastIndexOf('/');
    const QString stem = (dot > slash + 1) ? sourceKey.left(dot) : sourceKey;
    return stem + QString::fromLatin1(kConvertedSuffix);
}

QString destinationName(const QString& sourceKey)
{
    const QString key = convertedKey(sourceKey);
    return key.mid(key.lastIndexOf('/') + 1);
}

} // namespace Naming
