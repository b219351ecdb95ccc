/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AUTOCONTINUERESPONDER_H
#define AUTOCONTINUERESPONDER_H

#include "promptline_export.h"

#include "InjectionContext.h"

#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QString>

namespace Promptline
{

class KeywordRuleEngine;
struct KeywordRule;

/**
 * Delays used while answering a prompt, in milliseconds
 */
struct PROMPTLINE_EXPORT ResponderTimings {
    int keywordStabilizeMs = 500;
    int keywordSubmitDelayMs = 200;
    int keywordReleaseMs = 2000;

    int continueStabilizeMs = 1000;
    int continueSubmitDelayMs = 200;
    int continueCooldownMs = 5000;
};

/**
 * AutoContinueResponder answers prompts shown in a session's prompt box.
 *
 * Keyword rules are checked first and take precedence: a match blocks the
 * session and types the rule's canned response. Only without a keyword
 * match, and with auto-continue enabled, a continuation prompt is
 * answered with "y". A per-session cooldown keeps a prompt that is still
 * on screen from being answered twice.
 */
class PROMPTLINE_EXPORT AutoContinueResponder : public QObject
{
    Q_OBJECT

public:
    enum class Outcome {
        None,
        KeywordBlocked,
        AutoContinued,
        Busy // Session owned by another writer or cooling down
    };
    Q_ENUM(Outcome)

    AutoContinueResponder(const InjectionContext &context, KeywordRuleEngine *rules, QObject *parent = nullptr);
    ~AutoContinueResponder() override;

    bool isAutoContinueEnabled() const
    {
        return m_autoContinueEnabled;
    }
    void setAutoContinueEnabled(bool enabled);

    void setTimings(const ResponderTimings &timings)
    {
        m_timings = timings;
    }
    const ResponderTimings &timings() const
    {
        return m_timings;
    }

    /**
     * Inspect the prompt area of @p sessionId and react to it
     */
    Outcome handlePromptArea(const QString &sessionId, const QString &promptArea);

    bool isCoolingDown(const QString &sessionId, const QDateTime &now = QDateTime::currentDateTime()) const;

    /**
     * Drop pending responses and release every block
     */
    void cancelAll();

Q_SIGNALS:
    void keywordBlocked(const QString &sessionId, const QString &keyword);
    void keywordBlockReleased(const QString &sessionId);
    void autoContinueSent(const QString &sessionId);
    void responseFailed(const QString &sessionId);

private:
    void startKeywordResponse(const QString &sessionId, const KeywordRule &rule);
    void startAutoContinue(const QString &sessionId);
    void fail(const QString &sessionId, const QString &what);

    InjectionContext m_context;
    KeywordRuleEngine *m_rules = nullptr;
    ResponderTimings m_timings;
    bool m_autoContinueEnabled = false;

    // Bumped by cancelAll(); pending continuations from older generations do nothing
    quint64 m_generation = 0;

    QHash<QString, QDateTime> m_cooldownUntil;
};

} // namespace Promptline

#endif // AUTOCONTINUERESPONDER_H
