#include "core/decision/decision_orchestrator.h"
#include "core/decision/cache_context.h"
#include "core/shared/logging.h"

namespace cr {

QString decisionActionToString(DecisionAction action)
{
    switch (action) {
    case DecisionAction::AutoUse:   return QStringLiteral("auto_use");
    case DecisionAction::Confirm:   return QStringLiteral("confirm");
    case DecisionAction::Translate: return QStringLiteral("translate");
    }
    return QStringLiteral("translate");
}

QString matchKindToString(MatchKind kind)
{
    switch (kind) {
    case MatchKind::NoMatch:      return QStringLiteral("none");
    case MatchKind::ExactMatch:   return QStringLiteral("exact");
    case MatchKind::SimilarMatch: return QStringLiteral("similar");
    }
    return QStringLiteral("none");
}

DecisionOrchestrator::DecisionOrchestrator(CacheContext& context,
                                           Translator& translator,
                                           const SafetyClassifier& classifier,
                                           InteractionPrompter* prompter)
    : m_context(context)
    , m_translator(translator)
    , m_classifier(classifier)
    , m_prompter(prompter)
{
}

Decision DecisionOrchestrator::decide(const QString& query)
{
    const CacheConfig& config = m_context.config();
    DegradationController& controller = m_context.controller();
    CacheManager& manager = m_context.manager();
    ConfidenceModel& confidence = m_context.confidence();
    const double now = currentTimestamp();

    Decision decision;
    decision.query = query;
    decision.queryHash = m_context.matcher().hash(query);

    // ── Exact match ──

    const std::optional<CacheEntry> exact = controller.guard(
        "findExact",
        [&]() { return manager.findByHash(decision.queryHash); },
        []() { return std::optional<CacheEntry>(); });

    if (exact.has_value()) {
        const double effective = confidence.effectiveScore(*exact, now);
        if (effective >= config.confidenceThreshold) {
            decision.matchKind = MatchKind::ExactMatch;
            decision.command = exact->command;
            decision.source = CommandSource::Cache;
            decision.confidence = effective;
            decision.similarity = 1.0;
            decision.safety = m_classifier.classify(exact->command);

            if (effective >= config.autoCopyThreshold && !decision.safety.dangerous) {
                decision.action = DecisionAction::AutoUse;
                controller.guard(
                    "touch",
                    [&]() { manager.touch(exact->queryHash); },
                    []() {});
            } else {
                decision.action = DecisionAction::Confirm;
            }

            LOG_INFO(crDecision, "Exact match for %s: %s (confidence %.3f)",
                     qUtf8Printable(decision.queryHash),
                     qUtf8Printable(decisionActionToString(decision.action)), effective);
            return decision;
        }
        LOG_DEBUG(crDecision, "Exact match for %s below threshold (%.3f < %.3f)",
                  qUtf8Printable(decision.queryHash), effective, config.confidenceThreshold);
    }

    // ── Similar match ──

    const std::optional<SimilarMatch> similar = controller.guard(
        "findSimilar",
        [&]() { return manager.findSimilar(query); },
        []() { return std::optional<SimilarMatch>(); });

    // The low-confidence exact entry itself does not count as "similar".
    if (similar.has_value() && similar->entry.queryHash != decision.queryHash) {
        decision.action = DecisionAction::Confirm;
        decision.matchKind = MatchKind::SimilarMatch;
        decision.command = similar->entry.command;
        decision.source = CommandSource::SimilarCache;
        decision.queryHash = similar->entry.queryHash;
        decision.confidence = confidence.effectiveScore(similar->entry, now);
        decision.similarity = similar->similarity;
        decision.safety = m_classifier.classify(decision.command);

        LOG_INFO(crDecision, "Similar match '%s' (similarity %.3f)",
                 qUtf8Printable(similar->entry.queryText), similar->similarity);
        return decision;
    }

    // ── Translate ──

    translateInto(decision, exact);
    return decision;
}

void DecisionOrchestrator::translateInto(Decision& decision,
                                         const std::optional<CacheEntry>& lowConfidenceExact)
{
    decision.action = DecisionAction::Translate;
    decision.matchKind = MatchKind::NoMatch;
    decision.source = CommandSource::Translation;

    const std::optional<QString> translated = m_translator.translate(decision.query);
    if (!translated.has_value() || translated->trimmed().isEmpty()) {
        const QString error = m_translator.lastError().isEmpty()
            ? QStringLiteral("translation returned no command")
            : m_translator.lastError();

        if (lowConfidenceExact.has_value()) {
            LOG_WARN(crDecision, "Translation failed (%s); offering cached command",
                     qUtf8Printable(error));
            decision.action = DecisionAction::Confirm;
            decision.matchKind = MatchKind::ExactMatch;
            decision.command = lowConfidenceExact->command;
            decision.source = CommandSource::CacheAfterTranslationFailure;
            decision.confidence = m_context.confidence().effectiveScore(*lowConfidenceExact,
                                                                        currentTimestamp());
            decision.similarity = 1.0;
            decision.safety = m_classifier.classify(decision.command);
            return;
        }

        LOG_ERROR(crDecision, "Translation failed: %s", qUtf8Printable(error));
        decision.ok = false;
        decision.error = error;
        return;
    }

    decision.command = translated->trimmed();
    decision.similarity = 1.0;
    decision.safety = m_classifier.classify(decision.command);

    CacheManager& manager = m_context.manager();
    const std::optional<CacheEntry> saved = m_context.controller().guard(
        "save",
        [&]() { return std::optional<CacheEntry>(manager.save(decision.query, decision.command)); },
        []() { return std::optional<CacheEntry>(); });

    if (saved.has_value()) {
        decision.queryHash = saved->queryHash;
        decision.confidence = saved->confidenceScore;
    }
    LOG_INFO(crDecision, "Translated %s (cached: %s)", qUtf8Printable(decision.queryHash),
             saved.has_value() ? "yes" : "no");
}

bool DecisionOrchestrator::recordOutcome(const Decision& decision, PromptResponse response)
{
    if (!decision.ok || decision.command.isEmpty() || decision.queryHash.isEmpty()) {
        return false;
    }

    bool confirmed = true;
    if (decision.action != DecisionAction::AutoUse) {
        switch (response) {
        case PromptResponse::Confirmed:
            confirmed = true;
            break;
        case PromptResponse::Rejected:
            confirmed = false;
            break;
        case PromptResponse::TimedOut:
            LOG_DEBUG(crDecision, "No answer for %s; feedback not recorded",
                      qUtf8Printable(decision.queryHash));
            return false;
        }
    }

    ConfidenceModel& confidence = m_context.confidence();
    const QString hash = decision.queryHash;
    return m_context.controller().guard(
        "updateFeedback",
        [&]() { return confidence.updateFeedback(hash, confirmed).has_value(); },
        []() { return false; });
}

HandledQuery DecisionOrchestrator::handle(const QString& query)
{
    HandledQuery handled;
    handled.decision = decide(query);
    const Decision& decision = handled.decision;

    if (!decision.ok) {
        return handled;
    }

    if (decision.action == DecisionAction::AutoUse) {
        handled.feedbackRecorded = recordOutcome(decision, PromptResponse::Confirmed);
        return handled;
    }

    const PromptResponse response = m_prompter
        ? m_prompter->confirm(decision.command, decision.source, decision.confidence,
                              decision.similarity)
        : PromptResponse::TimedOut;
    handled.response = response;
    handled.feedbackRecorded = recordOutcome(decision, response);
    return handled;
}

} // namespace cr
