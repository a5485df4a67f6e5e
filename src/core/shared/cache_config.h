#pragma once

#include <QString>
#include <QStringList>

namespace cr {

enum class DecayCurve {
    None,
    Exponential,   // 0.5 ^ (days / halfLife), floored
    Linear,        // 1 - days / window, floored
};

QString decayCurveToString(DecayCurve curve);
bool decayCurveFromString(const QString& str, DecayCurve* out);

struct CacheConfig {
    // Storage
    bool cacheEnabled = true;
    QString cacheDirectory;                  // Empty = user data location
    QString databaseFile = QStringLiteral("cache.db");
    int storeTimeoutMs = 5000;               // sqlite busy_timeout, 1000..10000
    int busyRetryAttempts = 5;
    int busyRetryBaseMs = 50;                // 50, 100, 200, 400 ms

    // Confidence
    double positiveWeight = 0.2;
    double negativeWeight = 0.6;
    double confidenceSmoothing = 0.5;        // Prior mass in the score denominator

    // Decay
    DecayCurve decayCurve = DecayCurve::Exponential;
    double decayHalfLifeDays = 30.0;
    double decayLinearWindowDays = 90.0;
    double decayFloor = 0.1;

    // Decision thresholds
    double confidenceThreshold = 0.8;
    double autoCopyThreshold = 0.9;
    double similarityThreshold = 0.7;

    // Similarity blend: jaccardWeight * jaccard + (1 - jaccardWeight) * sequence
    double jaccardWeight = 0.5;

    // Maintenance
    int maxCacheAgeDays = 30;
    int cacheSizeLimit = 1000;

    // Circuit breaker
    int maxErrorCount = 3;

    // Returns one message per violated constraint; empty when valid.
    QStringList validate() const;
    bool isValid() const { return validate().isEmpty(); }
};

} // namespace cr
