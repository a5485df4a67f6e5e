#include "core/shared/cache_error.h"

namespace cr {

QString cacheErrorKindToString(CacheErrorKind kind)
{
    switch (kind) {
    case CacheErrorKind::StoreUnavailable: return QStringLiteral("StoreUnavailable");
    case CacheErrorKind::SchemaError:      return QStringLiteral("SchemaError");
    case CacheErrorKind::CacheUnavailable: return QStringLiteral("CacheUnavailable");
    case CacheErrorKind::CacheDisabled:    return QStringLiteral("CacheDisabled");
    }
    return QStringLiteral("Unknown");
}

CacheError::CacheError(CacheErrorKind kind, const QString& message)
    : std::runtime_error(message.toStdString())
    , m_kind(kind)
    , m_causeKind(kind)
{
}

CacheError::CacheError(CacheErrorKind kind, const QString& context, const CacheError& cause)
    : std::runtime_error(QStringLiteral("%1: %2").arg(context, cause.message()).toStdString())
    , m_kind(kind)
    , m_causeKind(cause.causeKind())
{
}

} // namespace cr
