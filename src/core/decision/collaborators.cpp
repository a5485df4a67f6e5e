#include "core/decision/collaborators.h"

namespace cr {

QString safetySeverityToString(SafetySeverity severity)
{
    switch (severity) {
    case SafetySeverity::Safe:      return QStringLiteral("safe");
    case SafetySeverity::Warning:   return QStringLiteral("warning");
    case SafetySeverity::Dangerous: return QStringLiteral("dangerous");
    case SafetySeverity::Critical:  return QStringLiteral("critical");
    }
    return QStringLiteral("safe");
}

QString commandSourceToString(CommandSource source)
{
    switch (source) {
    case CommandSource::Translation:                  return QStringLiteral("API");
    case CommandSource::Cache:                        return QStringLiteral("Cache");
    case CommandSource::SimilarCache:                 return QStringLiteral("Similar");
    case CommandSource::CacheAfterTranslationFailure: return QStringLiteral("Cache (API failed)");
    }
    return QStringLiteral("API");
}

} // namespace cr
