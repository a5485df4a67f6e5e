#include "core/decision/pattern_safety_classifier.h"
#include "core/shared/logging.h"

namespace cr {

namespace {

QStringList defaultDangerousPatterns()
{
    return {
        // File system removal
        QStringLiteral(R"(\brm\s+.*-r.*/)"),
        QStringLiteral(R"(\brm\s+.*-f.*/)"),
        QStringLiteral(R"(\brm\s+-[rf]+\s+/)"),
        QStringLiteral(R"(\brm\s+-[rf]+\s+\*)"),
        QStringLiteral(R"(\brmdir\s+.*/)"),

        // Devices and file systems
        QStringLiteral(R"(\bsudo\s+rm\s+.*-[rf])"),
        QStringLiteral(R"(\bdd\s+.*of=/dev/)"),
        QStringLiteral(R"(\bmkfs\.)"),
        QStringLiteral(R"(\bformat\s+[a-z]:)"),
        QStringLiteral(R"(\bdel\s+.*\*)"),

        // Permissions and redirection
        QStringLiteral(R"(\bchmod\s+777)"),
        QStringLiteral(R"(\bchown\s+.*:.*\s+/)"),
        QStringLiteral(R"(>\s*/dev/(sd|hd|nvme|disk))"),
        QStringLiteral(R"(\bmv\s+.*\s+/dev/null)"),

        // Processes and power
        QStringLiteral(R"(\bkill\s+-9\s+1\b)"),
        QStringLiteral(R"(\bkillall\s+)"),
        QStringLiteral(R"(\bshutdown\b)"),
        QStringLiteral(R"(\breboot\b)"),
        QStringLiteral(R"(\bhalt\b)"),

        // Package managers with wildcards
        QStringLiteral(R"(\bapt(-get)?\s+.*remove.*--purge.*\*)"),
        QStringLiteral(R"(\byum\s+.*remove.*\*)"),
        QStringLiteral(R"(\bpip\s+.*uninstall.*-y.*\*)"),
    };
}

QStringList criticalPatterns()
{
    return {
        QStringLiteral(R"(\brm\s+-[rf]+\s+/)"),
        QStringLiteral(R"(\bdd\s+.*of=/dev/)"),
        QStringLiteral(R"(\bformat\s+[a-z]:)"),
        QStringLiteral(R"(\bmkfs\.)"),
        QStringLiteral(R"(\bkill\s+-9\s+1\b)"),
        QStringLiteral(R"(\bshutdown\b)"),
        QStringLiteral(R"(\breboot\b)"),
        QStringLiteral(R"(\bhalt\b)"),
    };
}

QStringList severePatterns()
{
    return {
        QStringLiteral(R"(\brm\s+.*-[rf])"),
        QStringLiteral(R"(\bchmod\s+777)"),
        QStringLiteral(R"(\bkillall\s+)"),
        QStringLiteral(R"(\bsudo\s+rm\s+)"),
    };
}

bool matchesAny(const std::vector<QRegularExpression>& patterns, const QString& text)
{
    for (const QRegularExpression& pattern : patterns) {
        if (pattern.match(text).hasMatch()) {
            return true;
        }
    }
    return false;
}

} // namespace

PatternSafetyClassifier::PatternSafetyClassifier()
    : PatternSafetyClassifier(QStringList{})
{
}

PatternSafetyClassifier::PatternSafetyClassifier(const QStringList& extraPatterns)
{
    compileInto(m_dangerous, defaultDangerousPatterns() + extraPatterns);
    compileInto(m_critical, criticalPatterns());
    compileInto(m_severe, severePatterns());
}

void PatternSafetyClassifier::compileInto(std::vector<QRegularExpression>& out,
                                          const QStringList& patterns)
{
    for (const QString& source : patterns) {
        QRegularExpression pattern(source, QRegularExpression::CaseInsensitiveOption);
        if (!pattern.isValid()) {
            LOG_WARN(crDecision, "Ignoring invalid safety pattern '%s': %s",
                     qUtf8Printable(source), qUtf8Printable(pattern.errorString()));
            continue;
        }
        out.push_back(pattern);
    }
}

SafetyVerdict PatternSafetyClassifier::classify(const QString& command) const
{
    SafetyVerdict verdict;
    const QString trimmed = command.trimmed();
    if (trimmed.isEmpty() || !matchesAny(m_dangerous, trimmed)) {
        return verdict;
    }

    verdict.dangerous = true;
    if (matchesAny(m_critical, trimmed)) {
        verdict.severity = SafetySeverity::Critical;
    } else if (matchesAny(m_severe, trimmed)) {
        verdict.severity = SafetySeverity::Dangerous;
    } else {
        verdict.severity = SafetySeverity::Warning;
    }
    return verdict;
}

} // namespace cr
