#pragma once

#include "core/shared/cache_config.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace cr {

// ConfigManager -- JSON save/load for the cache configuration.
//
// The file lives at:
//   <GenericConfigLocation>/cmdrecall/config.json
// Keys absent from the file keep their CacheConfig defaults.
class ConfigManager {
public:
    // Load from the default path. Returns defaults if the file doesn't
    // exist, nullopt if it cannot be parsed or fails validation.
    static std::optional<CacheConfig> load();
    static std::optional<CacheConfig> load(const QString& filePath);

    // Save to disk. Creates the directory if it doesn't exist.
    static bool save(const CacheConfig& config);
    static bool save(const CacheConfig& config, const QString& filePath);

    static QString configFilePath();

    static QJsonObject toJson(const CacheConfig& config);
    // Keys of the wrong type and unknown enum names keep their defaults and
    // are appended to *errors (logged when errors is null). load() rejects
    // the file if any were found.
    static CacheConfig fromJson(const QJsonObject& json, QStringList* errors = nullptr);
};

} // namespace cr
