#pragma once

#include <QString>
#include <stdexcept>

namespace cr {

enum class CacheErrorKind {
    StoreUnavailable,   // I/O, permission, lock timeout or corruption
    SchemaError,        // Unexpected or newer table layout
    CacheUnavailable,   // A Cache Manager operation failed
    CacheDisabled,      // Circuit breaker is open
};

QString cacheErrorKindToString(CacheErrorKind kind);

// The only exception type thrown by the cache layer. The Degradation
// Controller is the single place that catches it.
class CacheError : public std::runtime_error {
public:
    CacheError(CacheErrorKind kind, const QString& message);
    // Wraps a lower-layer error, keeping its kind as the cause.
    CacheError(CacheErrorKind kind, const QString& context, const CacheError& cause);

    CacheErrorKind kind() const { return m_kind; }
    CacheErrorKind causeKind() const { return m_causeKind; }
    QString message() const { return QString::fromUtf8(what()); }

private:
    CacheErrorKind m_kind;
    CacheErrorKind m_causeKind;
};

} // namespace cr
