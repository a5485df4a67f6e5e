#include "core/store/store_location.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

#include <vector>

namespace cr {

namespace {

QString expandHome(const QString& path)
{
    if (path == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

} // namespace

QString storeLocationSourceToString(StoreLocation::Source source)
{
    switch (source) {
    case StoreLocation::Source::Configured:   return QStringLiteral("configured");
    case StoreLocation::Source::UserDefault:  return QStringLiteral("user-default");
    case StoreLocation::Source::TempFallback: return QStringLiteral("temp-fallback");
    }
    return QStringLiteral("configured");
}

QString defaultStoreDirectory()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    if (base.isEmpty()) {
        return QDir::homePath() + QStringLiteral("/.cmdrecall");
    }
    return base + QStringLiteral("/cmdrecall");
}

QString tempStoreDirectory()
{
    return QDir::tempPath() + QStringLiteral("/cmdrecall");
}

bool isWritableDirectory(const QString& directory)
{
    if (directory.isEmpty()) {
        return false;
    }

    if (!QDir().mkpath(directory)) {
        LOG_DEBUG(crStore, "Cannot create directory %s", qUtf8Printable(directory));
        return false;
    }

    const QFileInfo info(directory);
    if (!info.isDir() || !info.isWritable()) {
        return false;
    }

    const QString scratchPath = QDir(directory).filePath(
        QStringLiteral(".cmdrecall-writecheck-%1").arg(QCoreApplication::applicationPid()));
    QFile scratch(scratchPath);
    if (!scratch.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_DEBUG(crStore, "Test write failed in %s: %s",
                  qUtf8Printable(directory), qUtf8Printable(scratch.errorString()));
        return false;
    }
    const bool written = scratch.write("ok", 2) == 2;
    scratch.close();
    scratch.remove();
    return written;
}

std::optional<StoreLocation> resolveLocation(const QString& configuredDirectory,
                                             const QString& databaseFile)
{
    struct Candidate {
        QString directory;
        StoreLocation::Source source;
    };

    std::vector<Candidate> candidates;
    if (!configuredDirectory.trimmed().isEmpty()) {
        candidates.push_back({expandHome(configuredDirectory.trimmed()),
                              StoreLocation::Source::Configured});
    }
    candidates.push_back({defaultStoreDirectory(), StoreLocation::Source::UserDefault});
    candidates.push_back({tempStoreDirectory(), StoreLocation::Source::TempFallback});

    for (const Candidate& candidate : candidates) {
        if (!isWritableDirectory(candidate.directory)) {
            LOG_WARN(crStore, "Cache directory not writable (%s): %s",
                     qUtf8Printable(storeLocationSourceToString(candidate.source)),
                     qUtf8Printable(candidate.directory));
            continue;
        }

        StoreLocation location;
        location.directory = QDir(candidate.directory).absolutePath();
        location.dbPath = QDir(location.directory).filePath(databaseFile);
        location.source = candidate.source;
        return location;
    }

    LOG_ERROR(crStore, "No writable cache location; caching unavailable");
    return std::nullopt;
}

} // namespace cr
