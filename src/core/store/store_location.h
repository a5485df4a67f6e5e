#pragma once

#include <QString>
#include <optional>

namespace cr {

struct StoreLocation {
    enum class Source {
        Configured,
        UserDefault,
        TempFallback,
    };

    QString directory;
    QString dbPath;
    Source source = Source::Configured;
};

QString storeLocationSourceToString(StoreLocation::Source source);

// Picks the first writable directory of: configured -> user data
// location -> system temp. nullopt means no cache can be stored.
std::optional<StoreLocation> resolveLocation(const QString& configuredDirectory,
                                             const QString& databaseFile);

QString defaultStoreDirectory();
QString tempStoreDirectory();

// Creates the directory if needed and proves a file can be written in it.
bool isWritableDirectory(const QString& directory);

} // namespace cr
