#include "core/shared/config_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

#include <cmath>
#include <limits>

namespace cr {

namespace {

// Reads typed fields out of one JSON object. Absent keys leave the target
// untouched; present keys of the wrong type are recorded as errors.
class FieldReader {
public:
    FieldReader(const QJsonObject& json, QStringList* errors)
        : m_json(json)
        , m_errors(errors)
    {
    }

    void read(const char* key, bool* out)
    {
        const QJsonValue value = m_json.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        if (!value.isBool()) {
            reject(key, "a boolean");
            return;
        }
        *out = value.toBool();
    }

    void read(const char* key, QString* out)
    {
        const QJsonValue value = m_json.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        if (!value.isString()) {
            reject(key, "a string");
            return;
        }
        *out = value.toString();
    }

    void read(const char* key, double* out)
    {
        const QJsonValue value = m_json.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        if (!value.isDouble()) {
            reject(key, "a number");
            return;
        }
        *out = value.toDouble();
    }

    void read(const char* key, int* out)
    {
        const QJsonValue value = m_json.value(QLatin1String(key));
        if (value.isUndefined()) {
            return;
        }
        const double number = value.toDouble(std::numeric_limits<double>::quiet_NaN());
        if (!value.isDouble() || std::trunc(number) != number
            || number < std::numeric_limits<int>::min()
            || number > std::numeric_limits<int>::max()) {
            reject(key, "an integer");
            return;
        }
        *out = static_cast<int>(number);
    }

    void read(const char* key, DecayCurve* out)
    {
        QString name;
        const auto before = m_errors->size();
        read(key, &name);
        if (m_errors->size() != before || !m_json.contains(QLatin1String(key))) {
            return;
        }
        if (!decayCurveFromString(name, out)) {
            m_errors->append(QStringLiteral("%1 must be one of none, exponential, linear (got '%2')")
                                 .arg(QLatin1String(key), name));
        }
    }

private:
    void reject(const char* key, const char* expected)
    {
        m_errors->append(QStringLiteral("%1 must be %2")
                             .arg(QLatin1String(key), QLatin1String(expected)));
    }

    const QJsonObject& m_json;
    QStringList* m_errors;
};

std::optional<QJsonObject> readObject(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(crCore, "Cannot read config %s: %s", qUtf8Printable(filePath),
                 qUtf8Printable(file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(crCore, "Config %s is not valid JSON: %s", qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        LOG_WARN(crCore, "Config %s must hold a JSON object", qUtf8Printable(filePath));
        return std::nullopt;
    }
    return doc.object();
}

// Written through QSaveFile so a crash never leaves a truncated config.
bool writeObject(const QString& filePath, const QJsonObject& object)
{
    const QString directory = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(directory)) {
        LOG_ERROR(crCore, "Cannot create config directory %s", qUtf8Printable(directory));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(crCore, "Cannot write config %s: %s", qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return false;
    }
    file.write(QJsonDocument(object).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        LOG_ERROR(crCore, "Cannot commit config %s: %s", qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

} // namespace

std::optional<CacheConfig> ConfigManager::load()
{
    return load(configFilePath());
}

std::optional<CacheConfig> ConfigManager::load(const QString& filePath)
{
    if (!QFileInfo::exists(filePath)) {
        LOG_DEBUG(crCore, "No config at %s; using defaults", qUtf8Printable(filePath));
        return CacheConfig{};
    }

    const std::optional<QJsonObject> object = readObject(filePath);
    if (!object.has_value()) {
        return std::nullopt;
    }

    QStringList errors;
    const CacheConfig config = fromJson(*object, &errors);
    errors += config.validate();
    if (!errors.isEmpty()) {
        for (const QString& error : errors) {
            LOG_ERROR(crCore, "Invalid config (%s): %s",
                      qUtf8Printable(filePath), qUtf8Printable(error));
        }
        return std::nullopt;
    }
    return config;
}

bool ConfigManager::save(const CacheConfig& config)
{
    return save(config, configFilePath());
}

bool ConfigManager::save(const CacheConfig& config, const QString& filePath)
{
    return writeObject(filePath, toJson(config));
}

QString ConfigManager::configFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/cmdrecall/config.json");
}

QJsonObject ConfigManager::toJson(const CacheConfig& config)
{
    QJsonObject json;
    json.insert(QStringLiteral("cacheEnabled"), config.cacheEnabled);
    json.insert(QStringLiteral("cacheDirectory"), config.cacheDirectory);
    json.insert(QStringLiteral("databaseFile"), config.databaseFile);
    json.insert(QStringLiteral("storeTimeoutMs"), config.storeTimeoutMs);
    json.insert(QStringLiteral("busyRetryAttempts"), config.busyRetryAttempts);
    json.insert(QStringLiteral("busyRetryBaseMs"), config.busyRetryBaseMs);
    json.insert(QStringLiteral("positiveWeight"), config.positiveWeight);
    json.insert(QStringLiteral("negativeWeight"), config.negativeWeight);
    json.insert(QStringLiteral("confidenceSmoothing"), config.confidenceSmoothing);
    json.insert(QStringLiteral("decayCurve"), decayCurveToString(config.decayCurve));
    json.insert(QStringLiteral("decayHalfLifeDays"), config.decayHalfLifeDays);
    json.insert(QStringLiteral("decayLinearWindowDays"), config.decayLinearWindowDays);
    json.insert(QStringLiteral("decayFloor"), config.decayFloor);
    json.insert(QStringLiteral("confidenceThreshold"), config.confidenceThreshold);
    json.insert(QStringLiteral("autoCopyThreshold"), config.autoCopyThreshold);
    json.insert(QStringLiteral("similarityThreshold"), config.similarityThreshold);
    json.insert(QStringLiteral("jaccardWeight"), config.jaccardWeight);
    json.insert(QStringLiteral("maxCacheAgeDays"), config.maxCacheAgeDays);
    json.insert(QStringLiteral("cacheSizeLimit"), config.cacheSizeLimit);
    json.insert(QStringLiteral("maxErrorCount"), config.maxErrorCount);
    return json;
}

CacheConfig ConfigManager::fromJson(const QJsonObject& json, QStringList* errors)
{
    QStringList localErrors;
    FieldReader reader(json, errors ? errors : &localErrors);
    CacheConfig config;

    reader.read("cacheEnabled", &config.cacheEnabled);
    reader.read("cacheDirectory", &config.cacheDirectory);
    reader.read("databaseFile", &config.databaseFile);
    reader.read("storeTimeoutMs", &config.storeTimeoutMs);
    reader.read("busyRetryAttempts", &config.busyRetryAttempts);
    reader.read("busyRetryBaseMs", &config.busyRetryBaseMs);
    reader.read("positiveWeight", &config.positiveWeight);
    reader.read("negativeWeight", &config.negativeWeight);
    reader.read("confidenceSmoothing", &config.confidenceSmoothing);
    reader.read("decayCurve", &config.decayCurve);
    reader.read("decayHalfLifeDays", &config.decayHalfLifeDays);
    reader.read("decayLinearWindowDays", &config.decayLinearWindowDays);
    reader.read("decayFloor", &config.decayFloor);
    reader.read("confidenceThreshold", &config.confidenceThreshold);
    reader.read("autoCopyThreshold", &config.autoCopyThreshold);
    reader.read("similarityThreshold", &config.similarityThreshold);
    reader.read("jaccardWeight", &config.jaccardWeight);
    reader.read("maxCacheAgeDays", &config.maxCacheAgeDays);
    reader.read("cacheSizeLimit", &config.cacheSizeLimit);
    reader.read("maxErrorCount", &config.maxErrorCount);

    for (const QString& error : localErrors) {
        LOG_WARN(crCore, "Ignoring config value: %s", qUtf8Printable(error));
    }
    return config;
}

} // namespace cr
