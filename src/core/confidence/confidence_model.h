#pragma once

#include "core/shared/cache_config.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <optional>

namespace cr {

class CacheStore;

struct RecalculationResult {
    int processed = 0;
    int updated = 0;
    int failed = 0;
};

// Raw-score bands over all stored entries.
struct ConfidenceDistribution {
    int64_t veryHigh = 0;   // >= 0.9
    int64_t high = 0;       // >= 0.8
    int64_t medium = 0;     // >= 0.5
    int64_t low = 0;
    int64_t totalConfirmations = 0;
    int64_t totalRejections = 0;
};

// ConfidenceModel -- turns confirm/reject counters into a bounded trust score.
//
//   score = clamp((c*wp - r*wn) / (c*wp + r*wn + smoothing), 0, 1)
//
// The stored score is the raw value; time decay is applied only when a
// score is read for a decision (effectiveScore), so reads never write.
class ConfidenceModel {
public:
    // store may be null; store-backed operations then throw StoreUnavailable.
    ConfidenceModel(CacheStore* store, const CacheConfig& config);

    double calculate(int confirmations, int rejections) const;

    // Multiplier in [decayFloor, 1] for the given age; 1.0 at age <= 0.
    double decayFactor(double elapsedDays) const;
    double effectiveScore(const CacheEntry& entry, double now) const;

    // Counter increment, score update and feedback append in one
    // transaction. std::nullopt when no entry has this hash.
    std::optional<CacheEntry> updateFeedback(const QString& queryHash, bool confirmed);
    std::optional<CacheEntry> updateFeedback(const QString& queryHash, bool confirmed, double now);

    // One transaction per entry. Failed entries are logged and counted.
    RecalculationResult recalculateAll();

    QString scoringSignature() const;
    bool isScoringCurrent();

    ConfidenceDistribution distribution();

    const CacheConfig& config() const { return m_config; }

private:
    CacheStore& requireStore() const;

    CacheStore* m_store = nullptr;
    CacheConfig m_config;
};

} // namespace cr
