#include "console_prompt.h"

bool ConsolePrompt::askYesNo(const QString& question)
{
    m_out << question << " (yes/no): " << Qt::flush;
    const QString answer = m_in.readLine().trimmed().toLower();
    return answer == "yes" || answer == "y";
}

bool ConsolePrompt::askStrategy(ResolveStrategy* strategy)
{
    m_out << "How do you want to handle duplicates?\n"
          << "  1. Keep first, delete others\n"
          << "  2. Keep first, move others to trash\n"
          << "  3. Rename with parent folder suffix\n"
          << "  4. List only\n"
          << "  5. Keep newest (not supported)\n"
          << "Enter choice (1-5): " << Qt::flush;
    return parseResolveStrategy(m_in.readLine().trimmed(), strategy);
}
