#include "core/confidence/confidence_model.h"
#include "core/store/cache_store.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace cr {

namespace {

// Bump when the formula itself changes; weights are part of the signature.
constexpr int kScoringAlgorithmVersion = 1;
constexpr const char* kScoringVersionKey = "scoring_version";

constexpr double kScoreEpsilon = 1e-9;

} // namespace

ConfidenceModel::ConfidenceModel(CacheStore* store, const CacheConfig& config)
    : m_store(store)
    , m_config(config)
{
}

CacheStore& ConfidenceModel::requireStore() const
{
    if (!m_store) {
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("confidence model has no store"));
    }
    return *m_store;
}

double ConfidenceModel::calculate(int confirmations, int rejections) const
{
    const double positive = std::max(confirmations, 0) * m_config.positiveWeight;
    const double negative = std::max(rejections, 0) * m_config.negativeWeight;
    const double denominator = positive + negative + m_config.confidenceSmoothing;
    if (denominator <= 0.0) {
        return 0.0;
    }
    return std::clamp((positive - negative) / denominator, 0.0, 1.0);
}

double ConfidenceModel::decayFactor(double elapsedDays) const
{
    const double days = std::max(elapsedDays, 0.0);
    if (days == 0.0) {
        return 1.0;
    }

    double factor = 1.0;
    switch (m_config.decayCurve) {
    case DecayCurve::None:
        return 1.0;
    case DecayCurve::Exponential:
        factor = std::pow(0.5, days / m_config.decayHalfLifeDays);
        break;
    case DecayCurve::Linear:
        factor = 1.0 - days / m_config.decayLinearWindowDays;
        break;
    }
    return std::clamp(factor, m_config.decayFloor, 1.0);
}

double ConfidenceModel::effectiveScore(const CacheEntry& entry, double now) const
{
    const double elapsedDays = (now - entry.lastUsedAt) / kSecondsPerDay;
    return std::clamp(entry.confidenceScore, 0.0, 1.0) * decayFactor(elapsedDays);
}

std::optional<CacheEntry> ConfidenceModel::updateFeedback(const QString& queryHash, bool confirmed)
{
    return updateFeedback(queryHash, confirmed, currentTimestamp());
}

std::optional<CacheEntry> ConfidenceModel::updateFeedback(const QString& queryHash,
                                                          bool confirmed,
                                                          double now)
{
    CacheStore& store = requireStore();

    auto updated = store.withTransaction([&]() -> std::optional<CacheEntry> {
        std::optional<CacheEntry> entry = store.entryByHash(queryHash);
        if (!entry.has_value()) {
            return std::nullopt;
        }

        if (confirmed) {
            ++entry->confirmationCount;
        } else {
            ++entry->rejectionCount;
        }
        entry->confidenceScore = calculate(entry->confirmationCount, entry->rejectionCount);
        entry->lastUsedAt = now;

        store.updateFeedbackCounters(entry->id, entry->confirmationCount,
                                     entry->rejectionCount, entry->confidenceScore, now);

        FeedbackEvent event;
        event.queryHash = queryHash;
        event.command = entry->command;
        event.action = confirmed ? FeedbackAction::Confirm : FeedbackAction::Reject;
        event.timestamp = now;
        store.appendFeedback(event);
        return entry;
    });

    if (updated.has_value()) {
        LOG_DEBUG(crCache, "Feedback %s for %s: c=%d r=%d score=%.3f",
                  confirmed ? "confirm" : "reject", qUtf8Printable(queryHash),
                  updated->confirmationCount, updated->rejectionCount,
                  updated->confidenceScore);
    } else {
        LOG_WARN(crCache, "Feedback for unknown query hash %s ignored",
                 qUtf8Printable(queryHash));
    }
    return updated;
}

RecalculationResult ConfidenceModel::recalculateAll()
{
    CacheStore& store = requireStore();
    RecalculationResult result;

    const std::vector<int64_t> ids = store.allEntryIds();
    for (int64_t id : ids) {
        try {
            const bool changed = store.withTransaction([&]() {
                const std::optional<CacheEntry> entry = store.entryById(id);
                if (!entry.has_value()) {
                    // Removed by another process since the id scan.
                    return false;
                }
                const double score = calculate(entry->confirmationCount, entry->rejectionCount);
                if (std::abs(score - entry->confidenceScore) <= kScoreEpsilon) {
                    return false;
                }
                return store.updateConfidence(id, score);
            });
            ++result.processed;
            if (changed) {
                ++result.updated;
            }
        } catch (const CacheError& e) {
            ++result.failed;
            LOG_WARN(crCache, "Recalculation failed for entry %lld: %s",
                     static_cast<long long>(id), e.what());
        }
    }

    if (result.failed == 0) {
        store.setSetting(QString::fromLatin1(kScoringVersionKey), scoringSignature());
    }

    LOG_INFO(crCache, "Recalculated confidence: processed=%d updated=%d failed=%d",
             result.processed, result.updated, result.failed);
    return result;
}

QString ConfidenceModel::scoringSignature() const
{
    return QStringLiteral("v%1:p=%2:n=%3:s=%4")
        .arg(kScoringAlgorithmVersion)
        .arg(m_config.positiveWeight)
        .arg(m_config.negativeWeight)
        .arg(m_config.confidenceSmoothing);
}

bool ConfidenceModel::isScoringCurrent()
{
    const std::optional<QString> stored =
        requireStore().getSetting(QString::fromLatin1(kScoringVersionKey));
    return stored.has_value() && *stored == scoringSignature();
}

ConfidenceDistribution ConfidenceModel::distribution()
{
    return requireStore().withConnection([](sqlite3* db) {
        const char* sql = R"(
            SELECT
                COALESCE(SUM(CASE WHEN confidence_score >= 0.9 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(CASE WHEN confidence_score >= 0.8 AND confidence_score < 0.9 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(CASE WHEN confidence_score >= 0.5 AND confidence_score < 0.8 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(CASE WHEN confidence_score < 0.5 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(confirmation_count), 0),
                COALESCE(SUM(rejection_count), 0)
            FROM cache_entries
        )";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            throw CacheError(CacheErrorKind::StoreUnavailable,
                             QStringLiteral("distribution: %1")
                                 .arg(QString::fromUtf8(sqlite3_errmsg(db))));
        }

        ConfidenceDistribution dist;
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            dist.veryHigh = sqlite3_column_int64(stmt, 0);
            dist.high = sqlite3_column_int64(stmt, 1);
            dist.medium = sqlite3_column_int64(stmt, 2);
            dist.low = sqlite3_column_int64(stmt, 3);
            dist.totalConfirmations = sqlite3_column_int64(stmt, 4);
            dist.totalRejections = sqlite3_column_int64(stmt, 5);
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW) {
            throw CacheError(CacheErrorKind::StoreUnavailable,
                             QStringLiteral("distribution: %1")
                                 .arg(QString::fromUtf8(sqlite3_errmsg(db))));
        }
        return dist;
    });
}

} // namespace cr
