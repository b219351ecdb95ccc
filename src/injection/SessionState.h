/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSTATE_H
#define SESSIONSTATE_H

#include "promptline_export.h"

#include "SessionSignalDetector.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace Promptline
{

/**
 * SessionState is the single record of what we know about one session.
 *
 * Besides the detected status it holds the session's phase: at most one
 * of the injector, the keyword responder or the auto-continue responder
 * owns the session's input at any time.
 */
class PROMPTLINE_EXPORT SessionState
{
public:
    enum class Phase {
        Neutral,        // Nobody is writing to the session
        Injecting,      // An Injector task is typing a queued message
        KeywordBlocked, // A keyword rule is answering the prompt
        AutoContinuing  // The auto-continue responder is answering the prompt
    };

    SessionState() = default;
    explicit SessionState(const QString &id)
        : sessionId(id)
    {
    }

    QString sessionId;

    SessionStatus status = SessionStatus::Ready;
    Phase phase = Phase::Neutral;

    bool usageLimitReached = false;
    bool awaitingContinue = false;

    QDateTime lastUpdate;
    QDateTime readySince;  // Invalid while not ready

    // Trailing output, bounded by outputWindowChars
    QString outputWindow;

    /**
     * True exactly while an injection is in flight
     */
    bool busy() const
    {
        return phase == Phase::Injecting;
    }

    /**
     * Ready and stable for at least @p stableMs
     */
    bool isReady(int stableMs, const QDateTime &now) const;

    /**
     * Summary for status dumps (output window omitted)
     */
    QJsonObject toJson() const;

    static QString phaseName(Phase phase);
};

} // namespace Promptline

#endif // SESSIONSTATE_H
