/**
 * @file main.cpp
 * @brief Baresha command-line entry point
 *
 * Parses options, loads settings, restores checkpoints and runs the batch
 * until every job has reached a final state.
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QTextStream>

#include <cstdio>

#include "baresha/app/AppSettings.h"
#include "baresha/app/BatchRunner.h"
#include "baresha/core/Errors.h"
#include "baresha/engine/FormatSelector.h"
#include "baresha/persistence/PersistenceManager.h"

namespace {

constexpr int EXIT_USAGE = 2;

void printHistory(Baresha::PersistenceManager& persistence, int limit) {
    QTextStream out(stdout);
    const auto records = persistence.loadHistory(limit);
    if (records.empty()) {
        out << "History is empty" << Qt::endl;
        return;
    }

    for (const auto& record : records) {
        out << record.finishedAt.toLocalTime().toString(Qt::ISODate) << "  "
            << Baresha::jobStateToString(record.state).leftJustified(10) << "  "
            << (record.title.isEmpty() ? record.sourceUrl : record.title);
        if (record.bytesTotal) {
            out << "  " << Baresha::formatByteSize(*record.bytesTotal);
        }
        if (record.errorKind) {
            out << "  (" << Baresha::errorCauseToString(record.errorCause) << ": "
                << record.errorMessage << ")";
        }
        out << Qt::endl;
    }
}

void printStatistics(Baresha::PersistenceManager& persistence) {
    const auto stats = persistence.historyStatistics();
    QTextStream(stdout) << "Total: " << stats.total
                        << "  Completed: " << stats.completed
                        << "  Failed: " << stats.failed
                        << "  Cancelled: " << stats.cancelled << Qt::endl;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // Application metadata
    app.setOrganizationName(QStringLiteral("Baresha"));
    app.setOrganizationDomain(QStringLiteral("baresha.org"));
    app.setApplicationName(QStringLiteral("Baresha"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Batch media downloader"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("urls"), QStringLiteral("Media URLs to download."),
                                 QStringLiteral("<url>..."));

    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Download directory."), QStringLiteral("dir"));
    const QCommandLineOption qualityOption(
        {QStringLiteral("q"), QStringLiteral("quality")},
        QStringLiteral("Quality: %1.").arg(Baresha::FormatSelector::qualityPresets().join(QStringLiteral(", "))),
        QStringLiteral("quality"));
    const QCommandLineOption formatOption(
        {QStringLiteral("f"), QStringLiteral("format")},
        QStringLiteral("Format: %1.").arg(Baresha::FormatSelector::formatPresets().join(QStringLiteral(", "))),
        QStringLiteral("format"));
    const QCommandLineOption limitOption(
        {QStringLiteral("l"), QStringLiteral("limit-rate")},
        QStringLiteral("Maximum speed in bytes/s, K/M/G suffixes allowed, 0 = unlimited."),
        QStringLiteral("rate"));
    const QCommandLineOption resolveTimeoutOption(
        QStringLiteral("resolve-timeout"),
        QStringLiteral("Give up resolving a URL after this many milliseconds."), QStringLiteral("ms"));
    const QCommandLineOption databaseOption(
        QStringLiteral("database"), QStringLiteral("Database file."), QStringLiteral("path"));
    const QCommandLineOption historyOption(
        QStringLiteral("history"), QStringLiteral("Show the most recent history (first argument may give N)."));
    const QCommandLineOption clearHistoryOption(
        QStringLiteral("clear-history"), QStringLiteral("Delete all history records."));
    const QCommandLineOption statsOption(
        QStringLiteral("stats"), QStringLiteral("Show history statistics."));
    const QCommandLineOption resumeOption(
        QStringLiteral("resume-interrupted"), QStringLiteral("Restore and resume jobs from an earlier run."));
    const QCommandLineOption saveSettingsOption(
        QStringLiteral("save-settings"), QStringLiteral("Store the given options as defaults."));
    const QCommandLineOption nonInteractiveOption(
        QStringLiteral("no-input"), QStringLiteral("Do not read commands from stdin."));

    parser.addOptions({outputOption, qualityOption, formatOption, limitOption, resolveTimeoutOption,
                       databaseOption, historyOption, clearHistoryOption, statsOption, resumeOption,
                       saveSettingsOption, nonInteractiveOption});
    parser.process(app);

    QStringList urls = parser.positionalArguments();

    // Open persistence; a failure only costs checkpoints and history
    Baresha::PersistenceManager persistence;
    const bool persistent = persistence.initialize(parser.value(databaseOption));
    if (!persistent) {
        qWarning() << "Baresha: Running without persistence";
    }

    const bool historyCommand = parser.isSet(historyOption) || parser.isSet(clearHistoryOption) ||
                                parser.isSet(statsOption);
    if (historyCommand && !persistent) {
        qCritical() << "Baresha: History is unavailable, database could not be opened";
        return EXIT_USAGE;
    }

    // ─── Settings: stored values, then command-line overrides ───
    Baresha::AppSettings settings = persistent ? Baresha::AppSettings::load(persistence)
                                               : Baresha::AppSettings::defaults();

    if (parser.isSet(outputOption)) {
        settings.downloadPath = QDir(parser.value(outputOption)).absolutePath();
    }
    if (parser.isSet(qualityOption)) {
        const auto quality = Baresha::FormatSelector::normalizeQuality(parser.value(qualityOption));
        if (!quality) {
            qWarning() << "Baresha: Unknown quality" << parser.value(qualityOption) << "- using best";
        }
        settings.defaultQuality = quality.value_or(QString::fromLatin1(Baresha::FormatSelector::DEFAULT_QUALITY));
    }
    if (parser.isSet(formatOption)) {
        const auto format = Baresha::FormatSelector::normalizeFormat(parser.value(formatOption));
        if (!format) {
            qCritical() << "Baresha: Unknown format" << parser.value(formatOption);
            return EXIT_USAGE;
        }
        settings.defaultFormat = *format;
    }
    if (parser.isSet(limitOption)) {
        try {
            settings.speedLimit = Baresha::AppSettings::parseRate(parser.value(limitOption));
        } catch (const Baresha::RateLimitConfigError& e) {
            qCritical() << "Baresha:" << e.message();
            return EXIT_USAGE;
        }
    }
    if (parser.isSet(resolveTimeoutOption)) {
        bool ok = false;
        const qint64 ms = parser.value(resolveTimeoutOption).toLongLong(&ok);
        if (!ok || ms <= 0) {
            qCritical() << "Baresha: Invalid resolve timeout" << parser.value(resolveTimeoutOption);
            return EXIT_USAGE;
        }
        settings.resolveTimeout = Baresha::Duration(ms);
    }

    if (parser.isSet(saveSettingsOption)) {
        if (!persistent) {
            qCritical() << "Baresha: Cannot save settings without a database";
            return EXIT_USAGE;
        }
        settings.save(persistence);
    }

    // ─── History commands ───
    if (historyCommand) {
        if (parser.isSet(clearHistoryOption)) {
            persistence.clearHistory();
            persistence.flush();
            QTextStream(stdout) << "History cleared" << Qt::endl;
        }
        if (parser.isSet(historyOption)) {
            int limit = Baresha::Constants::HISTORY_DEFAULT_LIMIT;
            bool ok = false;
            if (!urls.isEmpty()) {
                const int requested = urls.first().toInt(&ok);
                if (ok && requested > 0) {
                    limit = requested;
                    urls.removeFirst();
                }
            }
            printHistory(persistence, limit);
        }
        if (parser.isSet(statsOption)) {
            printStatistics(persistence);
        }
        if (urls.isEmpty() && !parser.isSet(resumeOption)) {
            return 0;
        }
    }

    if (urls.isEmpty() && !parser.isSet(resumeOption)) {
        if (parser.isSet(saveSettingsOption)) {
            return 0;
        }
        parser.showHelp(EXIT_USAGE);
    }

    // ─── Batch ───
    Baresha::BatchRunner runner(settings, persistent ? &persistence : nullptr);

    if (parser.isSet(resumeOption)) {
        runner.restoreCheckpoints(true);
    }

    const int rejected = runner.addUrls(urls);
    if (rejected > 0 && rejected == urls.size() && runner.queue().size() == 0) {
        return EXIT_USAGE;
    }

    int exitCode = 0;
    QObject::connect(&runner, &Baresha::BatchRunner::finished, &app, [&app, &exitCode, rejected](int code) {
        exitCode = (code == 0 && rejected > 0) ? 1 : code;
        app.quit();
    });

    runner.start(!parser.isSet(nonInteractiveOption));
    app.exec();

    qInfo() << "Baresha: Exiting with code" << exitCode;
    return exitCode;
}
