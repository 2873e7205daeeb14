#pragma once
#include <QString>
#include <QStringList>

#include "errors.h"

namespace WorkList {

// Splits a comma-separated list, trims every token and drops empty ones.
// Order and duplicates are preserved.
QStringList parse(const QString& text);

// Reads and parses a work list file (UTF-8). Missing or unreadable files are
// ErrorKind::WorkListRead.
bool readFile(const QString& path, QStringList* out, OpError* err);

// Items whose original index i satisfies i % totalInstances == instanceIndex,
// in original order. Invalid parameters are ErrorKind::Config.
bool partition(const QStringList& items, int instanceIndex, int totalInstances,
               QStringList* out, OpError* err);

} // namespace WorkList
