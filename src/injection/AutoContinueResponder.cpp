/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AutoContinueResponder.h"

#include "ActionLog.h"
#include "KeywordRuleEngine.h"
#include "SessionChannel.h"
#include "SessionRegistry.h"
#include "SessionSignalDetector.h"

#include <QDebug>
#include <QTimer>

namespace Promptline
{

AutoContinueResponder::AutoContinueResponder(const InjectionContext &context, KeywordRuleEngine *rules, QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_rules(rules)
{
}

AutoContinueResponder::~AutoContinueResponder() = default;

void AutoContinueResponder::setAutoContinueEnabled(bool enabled)
{
    if (m_autoContinueEnabled == enabled) {
        return;
    }
    m_autoContinueEnabled = enabled;
    m_context.log->info(enabled ? QStringLiteral("Auto-continue enabled") : QStringLiteral("Auto-continue disabled"));
}

bool AutoContinueResponder::isCoolingDown(const QString &sessionId, const QDateTime &now) const
{
    const QDateTime until = m_cooldownUntil.value(sessionId);
    return until.isValid() && now < until;
}

AutoContinueResponder::Outcome AutoContinueResponder::handlePromptArea(const QString &sessionId, const QString &promptArea)
{
    if (promptArea.isEmpty()) {
        return Outcome::None;
    }

    const SessionState *state = m_context.sessions->session(sessionId);
    if (!state) {
        return Outcome::None;
    }
    if (state->phase != SessionState::Phase::Neutral || isCoolingDown(sessionId)) {
        return Outcome::Busy;
    }

    // Keyword rules win over auto-continue
    if (m_rules->findMatch(promptArea)) {
        if (!m_context.sessions->tryEnterPhase(sessionId, SessionState::Phase::KeywordBlocked)) {
            return Outcome::Busy;
        }
        const std::optional<KeywordRule> rule = m_rules->matchAndCount(promptArea);
        startKeywordResponse(sessionId, *rule);
        return Outcome::KeywordBlocked;
    }

    if (!m_autoContinueEnabled || !SessionSignalDetector::isContinuationPrompt(promptArea)) {
        return Outcome::None;
    }

    if (!m_context.sessions->tryEnterPhase(sessionId, SessionState::Phase::AutoContinuing)) {
        return Outcome::Busy;
    }
    startAutoContinue(sessionId);
    return Outcome::AutoContinued;
}

void AutoContinueResponder::startKeywordResponse(const QString &sessionId, const KeywordRule &rule)
{
    const quint64 generation = m_generation;
    const QString responseText = rule.escapeOnly() ? QStringLiteral("(Escape only)") : rule.response;

    m_context.log->warning(QStringLiteral("Keyword blocking activated on %1: \"%2\" -> \"%3\"").arg(sessionId, rule.keyword, responseText));
    Q_EMIT keywordBlocked(sessionId, rule.keyword);

    // Let the prompt finish rendering before answering
    QTimer::singleShot(m_timings.keywordStabilizeMs, this, [this, generation, sessionId, rule]() {
        if (generation != m_generation) {
            return;
        }

        const bool written = rule.escapeOnly() ? m_context.channel->sendKey(sessionId, QStringLiteral("Escape"))
                                               : m_context.channel->write(sessionId, rule.response);
        if (!written) {
            fail(sessionId, QStringLiteral("keyword response"));
            return;
        }

        QTimer::singleShot(m_timings.keywordSubmitDelayMs, this, [this, generation, sessionId]() {
            if (generation != m_generation) {
                return;
            }
            if (!m_context.channel->submit(sessionId)) {
                fail(sessionId, QStringLiteral("keyword response"));
                return;
            }

            QTimer::singleShot(m_timings.keywordReleaseMs, this, [this, generation, sessionId]() {
                if (generation != m_generation) {
                    return;
                }
                m_context.sessions->leavePhase(sessionId, SessionState::Phase::KeywordBlocked);
                m_context.log->info(QStringLiteral("Keyword blocking cleared for %1").arg(sessionId));
                Q_EMIT keywordBlockReleased(sessionId);
            });
        });
    });
}

void AutoContinueResponder::startAutoContinue(const QString &sessionId)
{
    const quint64 generation = m_generation;
    m_cooldownUntil.insert(sessionId, QDateTime::currentDateTime().addMSecs(m_timings.continueStabilizeMs + m_timings.continueSubmitDelayMs + m_timings.continueCooldownMs));

    m_context.log->info(QStringLiteral("Auto-continue triggered for %1").arg(sessionId));

    QTimer::singleShot(m_timings.continueStabilizeMs, this, [this, generation, sessionId]() {
        if (generation != m_generation) {
            return;
        }
        if (!m_context.channel->write(sessionId, QStringLiteral("y"))) {
            fail(sessionId, QStringLiteral("auto-continue"));
            return;
        }

        QTimer::singleShot(m_timings.continueSubmitDelayMs, this, [this, generation, sessionId]() {
            if (generation != m_generation) {
                return;
            }
            if (!m_context.channel->submit(sessionId)) {
                fail(sessionId, QStringLiteral("auto-continue"));
                return;
            }

            m_context.sessions->leavePhase(sessionId, SessionState::Phase::AutoContinuing);
            m_context.log->success(QStringLiteral("Auto-continue response sent to %1").arg(sessionId));
            Q_EMIT autoContinueSent(sessionId);
        });
    });
}

void AutoContinueResponder::fail(const QString &sessionId, const QString &what)
{
    qWarning() << "AutoContinueResponder: Write failed for" << sessionId;
    m_context.log->error(QStringLiteral("%1 failed for %2: write to session failed").arg(what, sessionId));

    m_context.sessions->leavePhase(sessionId, SessionState::Phase::KeywordBlocked);
    m_context.sessions->leavePhase(sessionId, SessionState::Phase::AutoContinuing);
    m_cooldownUntil.remove(sessionId);
    Q_EMIT responseFailed(sessionId);
}

void AutoContinueResponder::cancelAll()
{
    ++m_generation;
    m_cooldownUntil.clear();

    const QStringList ids = m_context.sessions->sessionIds();
    for (const QString &id : ids) {
        m_context.sessions->leavePhase(id, SessionState::Phase::KeywordBlocked);
        m_context.sessions->leavePhase(id, SessionState::Phase::AutoContinuing);
    }
}

} // namespace Promptline

#include "moc_AutoContinueResponder.cpp"
