#pragma once

#include "core/decision/collaborators.h"

#include <QRegularExpression>
#include <QStringList>

#include <vector>

namespace cr {

// Regex-based SafetyClassifier covering destructive file, device, process
// and package-manager commands. Matching is case-insensitive.
class PatternSafetyClassifier : public SafetyClassifier {
public:
    PatternSafetyClassifier();
    // Extra dangerous patterns; invalid expressions are logged and skipped.
    explicit PatternSafetyClassifier(const QStringList& extraPatterns);

    SafetyVerdict classify(const QString& command) const override;

    int patternCount() const { return static_cast<int>(m_dangerous.size()); }

private:
    static void compileInto(std::vector<QRegularExpression>& out, const QStringList& patterns);

    std::vector<QRegularExpression> m_dangerous;
    std::vector<QRegularExpression> m_critical;
    std::vector<QRegularExpression> m_severe;
};

} // namespace cr
