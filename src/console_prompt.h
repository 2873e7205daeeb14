#pragma once
#include <QString>
#include <QTextStream>

#include "duplicate_resolver.h"

// Interactive questions for dedupe mode. Every answer is read from the same
// input stream so piped answers are consumed in order.
class ConsolePrompt {
public:
    ConsolePrompt(QTextStream& in, QTextStream& out) : m_in(in), m_out(out) {}

    // "yes" or "y", case-insensitive; anything else, or end of input, is no.
    bool askYesNo(const QString& question);
    // Menu choice 1-5 or a strategy name; false when unrecognised.
    bool askStrategy(ResolveStrategy* strategy);

private:
    QTextStream& m_in;
    QTextStream& m_out;
};
