#include "todome/core/Settings.hpp"

#include <QSettings>
#include <QString>
#include <QtGlobal>

namespace todome {
namespace core {

namespace {
constexpr int MaxDueSoonDays = 365;
}

Settings Settings::load(const QSettings &settings)
{
    Settings loaded;
    const int dueSoon = settings.value(QStringLiteral("diagnostics/dueSoonDays"), loaded.diagnostics.dueSoonDays).toInt();
    loaded.diagnostics.dueSoonDays = qBound(0, dueSoon, MaxDueSoonDays);
    loaded.diagnostics.reportDueToday
        = settings.value(QStringLiteral("diagnostics/reportDueToday"), loaded.diagnostics.reportDueToday).toBool();
    loaded.diagnostics.reportDueSoon
        = settings.value(QStringLiteral("diagnostics/reportDueSoon"), loaded.diagnostics.reportDueSoon).toBool();
    const bool normalize = settings.value(QStringLiteral("format/normalize"), false).toBool();
    loaded.formatMode = normalize ? FormatMode::Normalized : FormatMode::Raw;
    return loaded;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("diagnostics/dueSoonDays"), diagnostics.dueSoonDays);
    settings.setValue(QStringLiteral("diagnostics/reportDueToday"), diagnostics.reportDueToday);
    settings.setValue(QStringLiteral("diagnostics/reportDueSoon"), diagnostics.reportDueSoon);
    settings.setValue(QStringLiteral("format/normalize"), formatMode == FormatMode::Normalized);
}

} // namespace core
} // namespace todome
