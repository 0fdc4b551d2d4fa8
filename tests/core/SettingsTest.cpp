#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "todome/core/Settings.hpp"

using namespace todome::core;

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void roundTripsThroughIniFile();
    void clampsDueSoonWindow();
};

void SettingsTest::defaultsWhenEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("todome.ini")), QSettings::IniFormat);

    const Settings loaded = Settings::load(settings);
    QCOMPARE(loaded.diagnostics.dueSoonDays, 7);
    QVERIFY(loaded.diagnostics.reportDueToday);
    QVERIFY(loaded.diagnostics.reportDueSoon);
    QVERIFY(loaded.formatMode == FormatMode::Raw);
}

void SettingsTest::roundTripsThroughIniFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("todome.ini"));

    Settings written;
    written.diagnostics.dueSoonDays = 14;
    written.diagnostics.reportDueToday = false;
    written.formatMode = FormatMode::Normalized;
    {
        QSettings settings(path, QSettings::IniFormat);
        written.save(settings);
        settings.sync();
        QCOMPARE(settings.status(), QSettings::NoError);
    }

    QSettings settings(path, QSettings::IniFormat);
    const Settings loaded = Settings::load(settings);
    QCOMPARE(loaded.diagnostics.dueSoonDays, 14);
    QVERIFY(!loaded.diagnostics.reportDueToday);
    QVERIFY(loaded.diagnostics.reportDueSoon);
    QVERIFY(loaded.formatMode == FormatMode::Normalized);
}

void SettingsTest::clampsDueSoonWindow()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("todome.ini")), QSettings::IniFormat);

    settings.setValue(QStringLiteral("diagnostics/dueSoonDays"), 5000);
    QCOMPARE(Settings::load(settings).diagnostics.dueSoonDays, 365);
    settings.setValue(QStringLiteral("diagnostics/dueSoonDays"), -3);
    QCOMPARE(Settings::load(settings).diagnostics.dueSoonDays, 0);
}

QTEST_GUILESS_MAIN(SettingsTest)
#include "SettingsTest.moc"
