#pragma once

#include <QString>
#include <cstdint>
#include <optional>

namespace cr {

// One cached translation, keyed by the canonical query hash.
// Timestamps are seconds since the Unix epoch (UTC).
struct CacheEntry {
    int64_t id = 0;
    QString queryText;
    QString queryHash;
    QString command;
    int confirmationCount = 0;
    int rejectionCount = 0;
    double confidenceScore = 0.0;   // Raw score, no time decay applied
    double createdAt = 0.0;
    double lastUsedAt = 0.0;
    QString osType;
    QString shellType;
};

enum class FeedbackAction {
    Confirm,
    Reject,
};

QString feedbackActionToString(FeedbackAction action);
std::optional<FeedbackAction> feedbackActionFromString(const QString& str);

// Append-only audit record. References an entry by hash only.
struct FeedbackEvent {
    int64_t id = 0;
    QString queryHash;
    QString command;
    FeedbackAction action = FeedbackAction::Confirm;
    double timestamp = 0.0;
};

// Seconds since the Unix epoch, millisecond resolution.
double currentTimestamp();

constexpr double kSecondsPerDay = 86400.0;

struct CacheStats {
    QString dbPath;
    int64_t totalEntries = 0;
    int64_t totalFeedback = 0;
    int64_t dbSizeBytes = 0;
    int64_t totalConfirmations = 0;
    int64_t totalRejections = 0;
    double averageConfidence = 0.0;
    int schemaVersion = 0;
};

} // namespace cr
