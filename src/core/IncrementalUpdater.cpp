#include "todome/core/IncrementalUpdater.hpp"

#include <QtGlobal>

#include "todome/core/Logging.hpp"
#include "todome/syntax/LineClassifier.hpp"

namespace todome {
namespace core {

DocumentState applyEdit(const DocumentState &previous, const LineEdit &edit)
{
    const int lineCount = previous.lines.size();
    const int first = qBound(0, edit.firstLine, lineCount);
    const int removed = qBound(0, edit.removedCount, lineCount - first);
    if (first != edit.firstLine || removed != edit.removedCount) {
        qCWarning(lcTodomeDocument) << "edit" << edit.firstLine << "+" << edit.removedCount << "outside of"
                                    << lineCount << "lines, clamped to" << first << "+" << removed;
    }

    const QStringList insertedText = syntax::splitLines(edit.text);
    QVector<syntax::ClassifiedLine> inserted = syntax::classifyLines(insertedText);

    DocumentState next = previous;
    next.version = previous.version + 1;

    for (int line = first; line < first + removed; ++line) {
        next.index.removeLine(previous.forest.lines().at(line));
    }
    for (const auto &line : inserted) {
        next.index.addLine(line);
    }

    QStringList lines = previous.lines.mid(0, first);
    lines += insertedText;
    lines += previous.lines.mid(first + removed);
    next.lines = std::move(lines);

    const syntax::BlockSplice splice = next.forest.replaceLines(first, removed, std::move(inserted));
    next.resolution.applySplice(next.forest, splice);

    qCDebug(lcTodomeDocument) << "version" << next.version << "rebuilt lines" << splice.firstLine << "to"
                              << splice.newEndLine << "nodes" << splice.firstNode << "to" << splice.newEndNode;
    return next;
}

} // namespace core
} // namespace todome
