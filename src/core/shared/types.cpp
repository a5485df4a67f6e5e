#include "core/shared/types.h"

#include <QDateTime>

namespace cr {

QString feedbackActionToString(FeedbackAction action)
{
    switch (action) {
    case FeedbackAction::Confirm: return QStringLiteral("confirm");
    case FeedbackAction::Reject:  return QStringLiteral("reject");
    }
    return QStringLiteral("confirm");
}

std::optional<FeedbackAction> feedbackActionFromString(const QString& str)
{
    if (str == QLatin1String("confirm")) return FeedbackAction::Confirm;
    if (str == QLatin1String("reject"))  return FeedbackAction::Reject;
    return std::nullopt;
}

double currentTimestamp()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

} // namespace cr
