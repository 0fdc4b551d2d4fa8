#pragma once

#include <QString>

#include "todome/core/Document.hpp"

namespace todome {
namespace core {

// Replaces removedCount lines starting at firstLine with the lines of text.
// text is split like a document: "a\nb" and "a\nb\n" both insert two lines,
// an empty text inserts none.
struct LineEdit
{
    int firstLine = 0;
    int removedCount = 0;
    QString text;
};

// Produces the state a full parseDocument() of the edited text would give,
// reclassifying only the inserted lines and rebuilding only the top-level
// block around the edit. Out-of-range edits are clamped to the document.
DocumentState applyEdit(const DocumentState &previous, const LineEdit &edit);

} // namespace core
} // namespace todome
