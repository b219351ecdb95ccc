/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionState.h"

namespace Promptline
{

bool SessionState::isReady(int stableMs, const QDateTime &now) const
{
    if (status != SessionStatus::Ready || !readySince.isValid()) {
        return false;
    }
    return readySince.msecsTo(now) >= stableMs;
}

QJsonObject SessionState::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("sessionId")] = sessionId;
    obj[QStringLiteral("status")] = SessionSignalDetector::statusName(status);
    obj[QStringLiteral("phase")] = phaseName(phase);
    obj[QStringLiteral("busy")] = busy();
    obj[QStringLiteral("usageLimitReached")] = usageLimitReached;
    obj[QStringLiteral("awaitingContinue")] = awaitingContinue;
    if (lastUpdate.isValid()) {
        obj[QStringLiteral("lastUpdate")] = lastUpdate.toString(Qt::ISODate);
    }
    return obj;
}

QString SessionState::phaseName(Phase phase)
{
    switch (phase) {
    case Phase::Neutral:
        return QStringLiteral("neutral");
    case Phase::Injecting:
        return QStringLiteral("injecting");
    case Phase::KeywordBlocked:
        return QStringLiteral("keyword-blocked");
    case Phase::AutoContinuing:
        return QStringLiteral("auto-continuing");
    }
    return QStringLiteral("unknown");
}

} // namespace Promptline
