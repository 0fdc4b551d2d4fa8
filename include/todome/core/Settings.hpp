#pragma once

#include "todome/core/Formatter.hpp"

class QSettings;

namespace todome {
namespace core {

struct DiagnosticOptions
{
    int dueSoonDays = 7;
    bool reportDueToday = true;
    bool reportDueSoon = true;
};

struct Settings
{
    DiagnosticOptions diagnostics;
    FormatMode formatMode = FormatMode::Raw;

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace todome
