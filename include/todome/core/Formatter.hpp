#pragma once

#include <QString>

#include "todome/syntax/Forest.hpp"
#include "todome/syntax/Notation.hpp"

namespace todome {
namespace core {

enum class FormatMode
{
    // Every written token, grouped priority / due date / category.
    Raw,
    // One written value per field: the last priority and due date, each
    // category once. Inherited values are never added or removed.
    Normalized,
};

QString format(const syntax::Forest &forest, FormatMode mode = FormatMode::Raw);
QString formatText(const QString &text, FormatMode mode = FormatMode::Raw);

QString formatItemLine(const syntax::ItemLine &item, int depth);

} // namespace core
} // namespace todome
