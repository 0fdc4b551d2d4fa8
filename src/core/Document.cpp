#include "todome/core/Document.hpp"

#include "todome/syntax/LineClassifier.hpp"
#include "todome/syntax/TreeBuilder.hpp"

namespace todome {
namespace core {

QString DocumentState::text() const
{
    if (lines.isEmpty()) {
        return {};
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

DocumentState parseDocument(const QString &text, int version)
{
    DocumentState state;
    state.version = version;
    state.lines = syntax::splitLines(text);
    state.forest = syntax::buildForest(syntax::classifyLines(state.lines));
    state.resolution = resolve(state.forest);
    state.index = QueryIndex::fromForest(state.forest);
    return state;
}

} // namespace core
} // namespace todome
