#include "core/record/record_coordinator.h"
#include "core/record/write_context.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/shared/write_error.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <cstdio>

namespace {

// Value of the option, or of the first set environment variable in `envNames`.
QString optionOrEnv(const QCommandLineParser& parser, const QCommandLineOption& option,
                    const QStringList& envNames)
{
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    for (const QString& name : envNames) {
        const QByteArray key = name.toLatin1();
        if (qEnvironmentVariableIsSet(key.constData())) {
            return qEnvironmentVariable(key.constData());
        }
    }
    return QString();
}

void printLine(FILE* stream, const QString& text)
{
    std::fprintf(stream, "%s\n", qUtf8Printable(text));
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("elf-record"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Record a learning as a document, an index row and a history commit."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption typeOption(
        QStringLiteral("type"), QStringLiteral("failure, success, heuristic or experiment."),
        QStringLiteral("type"));
    const QCommandLineOption domainOption(
        QStringLiteral("domain"), QStringLiteral("Domain the learning belongs to."),
        QStringLiteral("domain"));
    const QCommandLineOption titleOption(
        QStringLiteral("title"), QStringLiteral("Title, or the rule of a heuristic."),
        QStringLiteral("title"));
    const QCommandLineOption summaryOption(
        QStringLiteral("summary"), QStringLiteral("Summary, or the explanation of a heuristic."),
        QStringLiteral("summary"));
    const QCommandLineOption tagsOption(
        QStringLiteral("tags"), QStringLiteral("Comma separated tags."), QStringLiteral("tags"));
    const QCommandLineOption severityOption(
        QStringLiteral("severity"), QStringLiteral("Severity 1-5 (non-heuristics, default 3)."),
        QStringLiteral("n"));
    const QCommandLineOption confidenceOption(
        QStringLiteral("confidence"), QStringLiteral("Confidence 0.0-1.0 (heuristics, default 0.7)."),
        QStringLiteral("x"));
    const QCommandLineOption sourceOption(
        QStringLiteral("source"), QStringLiteral("failure, success or observation (heuristics)."),
        QStringLiteral("source"));
    const QCommandLineOption baseDirOption(
        QStringLiteral("base-dir"), QStringLiteral("Base directory (default $ELF_BASE_DIR)."),
        QStringLiteral("dir"));
    parser.addOptions({typeOption, domainOption, titleOption, summaryOption, tagsOption,
                       severityOption, confidenceOption, sourceOption, baseDirOption});
    parser.process(app);

    if (!parser.positionalArguments().isEmpty()) {
        printLine(stderr, QStringLiteral("elf-record: unexpected argument '%1'")
                              .arg(parser.positionalArguments().constFirst()));
        return elf::exit_code::kInputError;
    }

    elf::RecordInput input;
    input.type = optionOrEnv(parser, typeOption, {QStringLiteral("ELF_RECORD_TYPE")});
    if (input.type.isEmpty()) {
        printLine(stderr, QStringLiteral("elf-record: --type is required"));
        printLine(stderr, parser.helpText());
        return elf::exit_code::kInputError;
    }

    const bool heuristic = input.type.trimmed().toLower() == QLatin1String("heuristic");
    const QString envPrefix = heuristic ? QStringLiteral("HEURISTIC_") : QStringLiteral("FAILURE_");
    input.domain = optionOrEnv(parser, domainOption, {envPrefix + QStringLiteral("DOMAIN")});
    input.title = optionOrEnv(parser, titleOption,
                              {heuristic ? QStringLiteral("HEURISTIC_RULE")
                                         : QStringLiteral("FAILURE_TITLE")});
    input.summary = optionOrEnv(parser, summaryOption,
                                {heuristic ? QStringLiteral("HEURISTIC_EXPLANATION")
                                           : QStringLiteral("FAILURE_SUMMARY")});
    const QString tags = optionOrEnv(parser, tagsOption, {envPrefix + QStringLiteral("TAGS")});
    if (!tags.isEmpty()) {
        input.tags = tags.split(QLatin1Char(','), Qt::SkipEmptyParts);
    }
    if (heuristic) {
        input.confidence = optionOrEnv(parser, confidenceOption,
                                       {QStringLiteral("HEURISTIC_CONFIDENCE")});
        input.source = optionOrEnv(parser, sourceOption, {QStringLiteral("HEURISTIC_SOURCE")});
        if (parser.isSet(severityOption)) {
            input.severity = parser.value(severityOption);
        }
    } else {
        input.severity = optionOrEnv(parser, severityOption, {QStringLiteral("FAILURE_SEVERITY")});
        if (parser.isSet(confidenceOption)) {
            input.confidence = parser.value(confidenceOption);
        }
    }

    QString settingsError;
    const auto settings = elf::SettingsManager::load(parser.value(baseDirOption), &settingsError);
    if (!settings.has_value()) {
        printLine(stderr, QStringLiteral("elf-record: %1").arg(settingsError));
        return elf::exit_code::kInputError;
    }

    if (settings->fileLogging) {
        QString logError;
        if (!elf::installFileLogSink(settings->resolvedLogDir(), &logError)) {
            LOG_WARN(elfCore, "File logging disabled: %s", qUtf8Printable(logError));
        }
    }

    elf::WriteError openError;
    auto context = elf::WriteContext::open(*settings, &openError);
    if (!context) {
        printLine(stderr, QStringLiteral("elf-record: %1").arg(openError.toString()));
        elf::removeFileLogSink();
        return elf::exitCodeFor(openError.kind);
    }

    elf::RecordCoordinator coordinator(*context);
    const elf::RecordResult result = coordinator.record(input);

    if (result.ok()) {
        printLine(stdout, QStringLiteral("id=%1").arg(result.id));
        printLine(stdout, QStringLiteral("filepath=%1").arg(result.filepath));
        if (result.status == elf::RecordStatus::SavedNotHistorized) {
            printLine(stderr, QStringLiteral("elf-record: warning: saved but not historized: %1")
                                  .arg(result.error.toString()));
            for (const QString& failure : result.rollbackFailures) {
                printLine(stderr, QStringLiteral("  residual: %1").arg(failure));
            }
        }
    } else {
        printLine(stderr, QStringLiteral("elf-record: %1 (%2)")
                              .arg(result.error.toString(),
                                   elf::recordStatusToString(result.status)));
        printLine(stderr, QStringLiteral("rolled back: %1%2")
                              .arg(result.rolledBack ? QStringLiteral("yes") : QStringLiteral("no"),
                                   result.rollbackComplete ? QString()
                                                           : QStringLiteral(" (incomplete)")));
        for (const QString& failure : result.rollbackFailures) {
            printLine(stderr, QStringLiteral("  residual: %1").arg(failure));
        }
        printLine(stderr, QStringLiteral("safe to retry: %1")
                              .arg(result.safeToRetry ? QStringLiteral("yes") : QStringLiteral("no")));
    }

    elf::removeFileLogSink();
    return result.exitCode();
}
