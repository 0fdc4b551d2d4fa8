#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QFile>
#include <QSaveFile>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <optional>

#include "version.h"

#include "todome/core/Document.hpp"
#include "todome/core/Formatter.hpp"
#include "todome/core/Logging.hpp"
#include "todome/core/OverdueDetector.hpp"
#include "todome/core/Settings.hpp"

using namespace todome;

namespace {
enum ExitCode
{
    ExitOk = 0,
    ExitOverdue = 1,
    ExitFailure = 2,
};

constexpr auto DATE_FORMAT = "yyyy-MM-dd";

std::optional<QString> readInput(const QString &path)
{
    QFile file;
    bool opened = false;
    if (path.isEmpty() || path == QLatin1String("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly | QIODevice::Text);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly | QIODevice::Text);
    }
    if (!opened) {
        return std::nullopt;
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return stream.readAll();
}

bool writeOutput(const QString &path, const QString &text)
{
    if (path.isEmpty() || path == QLatin1String("-")) {
        QTextStream out(stdout);
        out.setCodec("UTF-8");
        out << text;
        out.flush();
        return true;
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return false;
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream << text;
    stream.flush();
    return file.commit();
}

void reportError(const QString &message)
{
    QTextStream err(stderr);
    err << QCoreApplication::applicationName() << ": " << message << '\n';
}

int runFormat(const QString &input, const QString &output, core::FormatMode mode)
{
    const auto text = readInput(input);
    if (!text) {
        reportError(QObject::tr("cannot read %1").arg(input.isEmpty() ? QStringLiteral("stdin") : input));
        return ExitFailure;
    }
    const QString formatted = core::formatText(*text, mode);
    if (!writeOutput(output, formatted)) {
        reportError(QObject::tr("cannot write %1").arg(output));
        return ExitFailure;
    }
    return ExitOk;
}

int runCheck(const QString &input, const QDate &reference, const core::DiagnosticOptions &options)
{
    const auto text = readInput(input);
    if (!text) {
        reportError(QObject::tr("cannot read %1").arg(input.isEmpty() ? QStringLiteral("stdin") : input));
        return ExitFailure;
    }
    const core::DocumentState state = core::parseDocument(*text);
    const auto diagnostics = core::dateDiagnostics(state.forest, state.resolution, reference, options);
    qCDebug(lcTodomeCli) << diagnostics.size() << "diagnostics relative to" << reference;

    const QString name = input.isEmpty() ? QStringLiteral("<stdin>") : input;
    QTextStream out(stdout);
    out.setCodec("UTF-8");
    bool overdueFound = false;
    for (const auto &diagnostic : diagnostics) {
        out << name << ':' << diagnostic.line + 1 << ": " << core::severityName(diagnostic.severity) << ": "
            << diagnostic.message << '\n';
        overdueFound = overdueFound || diagnostic.severity == core::Severity::Error;
    }
    out.flush();
    return overdueFound ? ExitOverdue : ExitOk;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("todome"));
    QCoreApplication::setApplicationName(QStringLiteral("todome"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodomeVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Formats and checks todome task lists."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QObject::tr("format or check"));
    parser.addPositionalArgument(QStringLiteral("file"), QObject::tr("Input file, stdin when omitted."), QStringLiteral("[file]"));

    const QCommandLineOption normalizeOption(QStringLiteral("normalize"),
                                             QObject::tr("Collapse repeated attributes to one value per field."));
    const QCommandLineOption outputOption({ QStringLiteral("o"), QStringLiteral("output") },
                                          QObject::tr("Write the formatted text to <file>."),
                                          QStringLiteral("file"));
    const QCommandLineOption dateOption(QStringLiteral("date"),
                                        QObject::tr("Reference date (yyyy-MM-dd), today when omitted."),
                                        QStringLiteral("date"));
    parser.addOption(normalizeOption);
    parser.addOption(outputOption);
    parser.addOption(dateOption);
    parser.process(app);

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty() || arguments.size() > 2) {
        parser.showHelp(ExitFailure);
    }
    const QString command = arguments.at(0);
    const QString input = arguments.value(1);

    QSettings settings;
    const core::Settings config = core::Settings::load(settings);

    if (command == QLatin1String("format")) {
        const core::FormatMode mode = parser.isSet(normalizeOption) ? core::FormatMode::Normalized : config.formatMode;
        return runFormat(input, parser.value(outputOption), mode);
    }
    if (command == QLatin1String("check")) {
        QDate reference = QDate::currentDate();
        if (parser.isSet(dateOption)) {
            reference = QDate::fromString(parser.value(dateOption), QLatin1String(DATE_FORMAT));
            if (!reference.isValid()) {
                reportError(QObject::tr("invalid date %1").arg(parser.value(dateOption)));
                return ExitFailure;
            }
        }
        return runCheck(input, reference, config.diagnostics);
    }

    reportError(QObject::tr("unknown command %1").arg(command));
    return ExitFailure;
}
