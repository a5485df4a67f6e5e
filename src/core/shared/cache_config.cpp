#include "core/shared/cache_config.h"

namespace cr {

namespace {

void checkRange(QStringList& errors, const char* name, double value, double lo, double hi)
{
    if (!(value >= lo && value <= hi)) {
        errors.append(QStringLiteral("%1 (%2) must be within [%3, %4]")
                          .arg(QLatin1String(name))
                          .arg(value)
                          .arg(lo)
                          .arg(hi));
    }
}

} // namespace

QString decayCurveToString(DecayCurve curve)
{
    switch (curve) {
    case DecayCurve::None:        return QStringLiteral("none");
    case DecayCurve::Exponential: return QStringLiteral("exponential");
    case DecayCurve::Linear:      return QStringLiteral("linear");
    }
    return QStringLiteral("exponential");
}

bool decayCurveFromString(const QString& str, DecayCurve* out)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("none")) {
        *out = DecayCurve::None;
    } else if (lower == QLatin1String("exponential")) {
        *out = DecayCurve::Exponential;
    } else if (lower == QLatin1String("linear")) {
        *out = DecayCurve::Linear;
    } else {
        return false;
    }
    return true;
}

QStringList CacheConfig::validate() const
{
    QStringList errors;

    checkRange(errors, "confidenceThreshold", confidenceThreshold, 0.0, 1.0);
    checkRange(errors, "autoCopyThreshold", autoCopyThreshold, 0.0, 1.0);
    checkRange(errors, "similarityThreshold", similarityThreshold, 0.0, 1.0);
    checkRange(errors, "jaccardWeight", jaccardWeight, 0.0, 1.0);
    checkRange(errors, "decayFloor", decayFloor, 0.0, 1.0);
    checkRange(errors, "maxCacheAgeDays", maxCacheAgeDays, 1, 365);
    checkRange(errors, "cacheSizeLimit", cacheSizeLimit, 1, 100000);
    checkRange(errors, "storeTimeoutMs", storeTimeoutMs, 1000, 10000);
    checkRange(errors, "busyRetryAttempts", busyRetryAttempts, 1, 10);
    checkRange(errors, "busyRetryBaseMs", busyRetryBaseMs, 1, 1000);
    checkRange(errors, "maxErrorCount", maxErrorCount, 1, 1000);

    if (autoCopyThreshold < confidenceThreshold) {
        errors.append(QStringLiteral("autoCopyThreshold (%1) must not be below confidenceThreshold (%2)")
                          .arg(autoCopyThreshold)
                          .arg(confidenceThreshold));
    }
    if (!(positiveWeight > 0.0)) {
        errors.append(QStringLiteral("positiveWeight must be positive"));
    }
    if (!(negativeWeight > 0.0)) {
        errors.append(QStringLiteral("negativeWeight must be positive"));
    }
    if (!(confidenceSmoothing > 0.0)) {
        errors.append(QStringLiteral("confidenceSmoothing must be positive"));
    }
    if (decayCurve == DecayCurve::Exponential && !(decayHalfLifeDays > 0.0)) {
        errors.append(QStringLiteral("decayHalfLifeDays must be positive"));
    }
    if (decayCurve == DecayCurve::Linear && !(decayLinearWindowDays > 0.0)) {
        errors.append(QStringLiteral("decayLinearWindowDays must be positive"));
    }
    if (databaseFile.trimmed().isEmpty() || databaseFile.contains(QLatin1Char('/'))) {
        errors.append(QStringLiteral("databaseFile must be a plain file name"));
    }

    return errors;
}

} // namespace cr
