#include "core/decision/cache_context.h"
#include "core/shared/config_manager.h"
#include "core/shared/logging.h"
#include "core/store/cache_store.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <stdexcept>

namespace {

QString formatTimestamp(double epochSeconds)
{
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(epochSeconds * 1000.0))
        .toString(Qt::ISODate);
}

QJsonObject statsToJson(const cr::CacheStats& stats, const cr::ConfidenceDistribution& dist,
                        const cr::DegradationHealth& health)
{
    QJsonObject json;
    json[QStringLiteral("dbPath")] = stats.dbPath;
    json[QStringLiteral("schemaVersion")] = stats.schemaVersion;
    json[QStringLiteral("totalEntries")] = static_cast<double>(stats.totalEntries);
    json[QStringLiteral("totalFeedback")] = static_cast<double>(stats.totalFeedback);
    json[QStringLiteral("dbSizeBytes")] = static_cast<double>(stats.dbSizeBytes);
    json[QStringLiteral("totalConfirmations")] = static_cast<double>(stats.totalConfirmations);
    json[QStringLiteral("totalRejections")] = static_cast<double>(stats.totalRejections);
    json[QStringLiteral("averageConfidence")] = stats.averageConfidence;

    QJsonObject bands;
    bands[QStringLiteral("veryHigh")] = static_cast<double>(dist.veryHigh);
    bands[QStringLiteral("high")] = static_cast<double>(dist.high);
    bands[QStringLiteral("medium")] = static_cast<double>(dist.medium);
    bands[QStringLiteral("low")] = static_cast<double>(dist.low);
    json[QStringLiteral("confidence")] = bands;

    QJsonObject healthJson;
    healthJson[QStringLiteral("enabled")] = health.enabled;
    healthJson[QStringLiteral("errorCount")] = health.errorCount;
    healthJson[QStringLiteral("maxErrorCount")] = health.maxErrorCount;
    healthJson[QStringLiteral("lastError")] = health.lastError;
    json[QStringLiteral("health")] = healthJson;
    return json;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("cmdrecall-maint"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Inspect and maintain the CmdRecall command cache."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("stats | cleanup | recalculate | backup | history <query> | reset"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));

    const QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Configuration file (default: %1).").arg(cr::ConfigManager::configFilePath()),
        QStringLiteral("path"));
    const QCommandLineOption dirOption(
        QStringLiteral("cache-dir"),
        QStringLiteral("Override the cache directory."),
        QStringLiteral("dir"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Backup destination path."),
        QStringLiteral("path"));
    const QCommandLineOption limitOption(
        QStringLiteral("limit"),
        QStringLiteral("Maximum history rows (default 20)."),
        QStringLiteral("n"), QStringLiteral("20"));
    const QCommandLineOption jsonOption(QStringLiteral("json"), QStringLiteral("JSON output."));
    parser.addOptions({configOption, dirOption, outputOption, limitOption, jsonOption});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.first();

    const std::optional<cr::CacheConfig> loaded = parser.isSet(configOption)
        ? cr::ConfigManager::load(parser.value(configOption))
        : cr::ConfigManager::load();
    if (!loaded.has_value()) {
        err << "Configuration could not be loaded; see log for details\n";
        return 2;
    }
    cr::CacheConfig config = *loaded;
    if (parser.isSet(dirOption)) {
        config.cacheDirectory = parser.value(dirOption);
    }

    std::unique_ptr<cr::CacheContext> context;
    try {
        context = std::make_unique<cr::CacheContext>(config);
    } catch (const std::invalid_argument& e) {
        err << e.what() << "\n";
        return 2;
    }

    cr::DegradationController& controller = context->controller();
    if (!context->store()) {
        err << "Cache store unavailable: " << controller.health().lastError << "\n";
        return 1;
    }

    try {
        if (command == QLatin1String("stats")) {
            const cr::CacheStats stats = context->manager().stats();
            const cr::ConfidenceDistribution dist = context->confidence().distribution();
            if (parser.isSet(jsonOption)) {
                out << QJsonDocument(statsToJson(stats, dist, controller.health()))
                           .toJson(QJsonDocument::Indented);
            } else {
                out << "Database:        " << stats.dbPath << "\n"
                    << "Schema version:  " << stats.schemaVersion << "\n"
                    << "Entries:         " << stats.totalEntries << "\n"
                    << "Feedback events: " << stats.totalFeedback << "\n"
                    << "Confirmations:   " << stats.totalConfirmations << "\n"
                    << "Rejections:      " << stats.totalRejections << "\n"
                    << "Avg confidence:  " << QString::number(stats.averageConfidence, 'f', 3) << "\n"
                    << "Size (bytes):    " << stats.dbSizeBytes << "\n"
                    << "Confidence >=0.9: " << dist.veryHigh << ", >=0.8: " << dist.high
                    << ", >=0.5: " << dist.medium << ", lower: " << dist.low << "\n";
            }
        } else if (command == QLatin1String("cleanup")) {
            const int removed = context->manager().cleanup(config.maxCacheAgeDays,
                                                           config.cacheSizeLimit);
            out << "Removed " << removed << " entries\n";
        } else if (command == QLatin1String("recalculate")) {
            const cr::RecalculationResult result = context->confidence().recalculateAll();
            out << "Processed " << result.processed << ", updated " << result.updated
                << ", failed " << result.failed << "\n";
            if (result.failed > 0) {
                return 1;
            }
        } else if (command == QLatin1String("backup")) {
            const QString path = context->store()->backup(parser.value(outputOption));
            out << "Backup written to " << path << "\n";
        } else if (command == QLatin1String("history")) {
            if (positional.size() < 2) {
                err << "history needs a query\n";
                return 2;
            }
            const QString query = positional.mid(1).join(QLatin1Char(' '));
            const QString hash = context->manager().queryHash(query);
            const std::optional<cr::CacheEntry> entry = context->manager().findByHash(hash);
            const auto events = context->manager().feedbackHistory(
                hash, parser.value(limitOption).toInt());

            if (parser.isSet(jsonOption)) {
                QJsonArray array;
                for (const cr::FeedbackEvent& event : events) {
                    QJsonObject row;
                    row[QStringLiteral("command")] = event.command;
                    row[QStringLiteral("action")] = cr::feedbackActionToString(event.action);
                    row[QStringLiteral("timestamp")] = event.timestamp;
                    array.append(row);
                }
                out << QJsonDocument(array).toJson(QJsonDocument::Indented);
            } else {
                out << "Query hash: " << hash << "\n";
                if (entry.has_value()) {
                    out << "Command:    " << entry->command << "\n"
                        << "Confirmed:  " << entry->confirmationCount
                        << ", rejected: " << entry->rejectionCount
                        << ", score: " << QString::number(entry->confidenceScore, 'f', 3) << "\n";
                } else {
                    out << "No cached entry\n";
                }
                for (const cr::FeedbackEvent& event : events) {
                    out << formatTimestamp(event.timestamp) << "  "
                        << cr::feedbackActionToString(event.action) << "  " << event.command << "\n";
                }
            }
        } else if (command == QLatin1String("reset")) {
            context->manager().clear();
            controller.reset();
            out << "Cache cleared\n";
        } else {
            err << "Unknown command: " << command << "\n";
            parser.showHelp(2);
        }
    } catch (const cr::CacheError& e) {
        LOG_ERROR(crCore, "%s failed: %s", qUtf8Printable(command), e.what());
        err << command << " failed: " << e.message() << "\n";
        return 1;
    }

    return 0;
}
