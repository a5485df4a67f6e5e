#pragma once

#include <QString>

#include <optional>

namespace cr {

// Boundaries to the parts of the tool that live outside the cache core.

class Translator {
public:
    virtual ~Translator() = default;

    // std::nullopt on failure; lastError() then describes it.
    virtual std::optional<QString> translate(const QString& query) = 0;
    virtual QString lastError() const = 0;
};

enum class SafetySeverity {
    Safe,
    Warning,
    Dangerous,
    Critical,
};

QString safetySeverityToString(SafetySeverity severity);

struct SafetyVerdict {
    bool dangerous = false;
    SafetySeverity severity = SafetySeverity::Safe;
};

class SafetyClassifier {
public:
    virtual ~SafetyClassifier() = default;
    virtual SafetyVerdict classify(const QString& command) const = 0;
};

// Where the offered command came from, shown next to it in the prompt.
enum class CommandSource {
    Translation,
    Cache,
    SimilarCache,
    CacheAfterTranslationFailure,
};

QString commandSourceToString(CommandSource source);

enum class PromptResponse {
    Confirmed,
    Rejected,
    TimedOut,
};

class InteractionPrompter {
public:
    virtual ~InteractionPrompter() = default;

    // similarity is 1.0 for exact matches and fresh translations.
    virtual PromptResponse confirm(const QString& command, CommandSource source,
                                   double confidence, double similarity) = 0;
};

} // namespace cr
