#include "work_list.h"

#include <QFile>

namespace WorkList {

QStringList parse(const QString& text)
{
    QStringList out;
    const QStringList tokens = text.split(',');
    for (const QString& t : tokens) {
        const QString id = t.trimmed();
        if (!id.isEmpty()) out << id;
    }
    return out;
}

bool readFile(const QString& path, QStringList* out, OpError* err)
{
    QFile f(path);
    if (!f.exists())
        return setError(err, ErrorKind::WorkListRead, QString("work list not found: %1").arg(path));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return setError(err, ErrorKind::WorkListRead,
                        QString("cannot read work list %1: %2").arg(path, f.errorString()));
    *out = parse(QString::fromUtf8(f.readAll()));
    return true;
}

bool partition(const QStringList& items, int instanceIndex, int totalInstances,
               QStringList* out, OpError* err)
{
    if (totalInstances < 1)
        return setError(err, ErrorKind::Config,
                        QString("total instances must be >= 1 (got %1)").arg(totalInstances));
    if (instanceIndex < 0 || instanceIndex >= totalInstances)
        return setError(err, ErrorKind::Config,
                        QString("instance index %1 outside [0, %2)").arg(instanceIndex).arg(totalInstances));

    QStringList mine;
    for (int i = instanceIndex; i < items.size(); i += totalInstances)
        mine << items.at(i);
    *out = mine;
    return true;
}

} // namespace WorkList
