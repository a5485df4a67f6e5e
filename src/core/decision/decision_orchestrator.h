#pragma once

#include "core/decision/collaborators.h"
#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace cr {

class CacheContext;

enum class DecisionAction {
    AutoUse,
    Confirm,
    Translate,
};

enum class MatchKind {
    NoMatch,
    ExactMatch,
    SimilarMatch,
};

QString decisionActionToString(DecisionAction action);
QString matchKindToString(MatchKind kind);

struct Decision {
    DecisionAction action = DecisionAction::Translate;
    MatchKind matchKind = MatchKind::NoMatch;
    QString query;
    QString command;
    CommandSource source = CommandSource::Translation;
    QString queryHash;          // Entry that feedback on this decision updates
    double confidence = 0.0;    // Effective (decayed) score of that entry
    double similarity = 0.0;
    SafetyVerdict safety;

    // false only when translation failed and nothing was cached.
    bool ok = true;
    QString error;
};

struct HandledQuery {
    Decision decision;
    std::optional<PromptResponse> response;   // Empty for AutoUse and failures
    bool feedbackRecorded = false;
};

// DecisionOrchestrator -- picks AutoUse, Confirm or Translate for a query
// and routes the user's answer back into the confidence model.
//
//   exact, effective >= autoCopy, safe        -> AutoUse
//   exact, effective >= confidenceThreshold   -> Confirm
//   similar, similarity >= similarityThreshold -> Confirm
//   otherwise                                 -> Translate, then save
//
// Every cache call goes through the context's DegradationController, so a
// broken store degrades to Translate instead of failing.
class DecisionOrchestrator {
public:
    DecisionOrchestrator(CacheContext& context,
                         Translator& translator,
                         const SafetyClassifier& classifier,
                         InteractionPrompter* prompter = nullptr);

    Decision decide(const QString& query);

    // AutoUse records an implicit confirm; Confirm and Translate record the
    // user's answer; TimedOut records nothing. Returns true when feedback
    // was written.
    bool recordOutcome(const Decision& decision, PromptResponse response);

    // decide(), ask the prompter when the action needs an answer, then
    // recordOutcome(). Without a prompter the answer counts as TimedOut.
    HandledQuery handle(const QString& query);

private:
    void translateInto(Decision& decision, const std::optional<CacheEntry>& lowConfidenceExact);

    CacheContext& m_context;
    Translator& m_translator;
    const SafetyClassifier& m_classifier;
    InteractionPrompter* m_prompter = nullptr;
};

} // namespace cr
