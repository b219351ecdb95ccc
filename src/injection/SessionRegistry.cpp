/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRegistry.h"

#include <QDebug>

namespace Promptline
{

SessionRegistry::SessionRegistry(QObject *parent)
    : QObject(parent)
{
}

SessionRegistry::~SessionRegistry() = default;

SessionState &SessionRegistry::ensureSession(const QString &sessionId)
{
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        it = m_sessions.insert(sessionId, SessionState(sessionId));
        qDebug() << "SessionRegistry: Tracking session" << sessionId;
        Q_EMIT sessionAdded(sessionId);
    }
    return it.value();
}

const SessionState *SessionRegistry::session(const QString &sessionId) const
{
    auto it = m_sessions.constFind(sessionId);
    return it == m_sessions.constEnd() ? nullptr : &it.value();
}

void SessionRegistry::removeSession(const QString &sessionId)
{
    if (m_sessions.remove(sessionId) > 0) {
        qDebug() << "SessionRegistry: Session closed" << sessionId;
        Q_EMIT sessionRemoved(sessionId);
    }
}

QStringList SessionRegistry::sessionIds() const
{
    QStringList ids = m_sessions.keys();
    ids.sort();
    return ids;
}

SignalReport SessionRegistry::appendOutput(const QString &sessionId, const QString &chunk, int maxChars, int detectionChars, const QDateTime &now)
{
    SessionState &state = ensureSession(sessionId);
    state.outputWindow = SessionSignalDetector::appendOutput(state.outputWindow, chunk, maxChars);
    return applyReport(state, now, detectionChars);
}

SignalReport SessionRegistry::replaceOutput(const QString &sessionId, const QString &window, int maxChars, int detectionChars, const QDateTime &now)
{
    SessionState &state = ensureSession(sessionId);
    state.outputWindow = maxChars > 0 ? window.right(maxChars) : window;
    return applyReport(state, now, detectionChars);
}

SignalReport SessionRegistry::applyReport(SessionState &state, const QDateTime &now, int detectionChars)
{
    const SignalReport report = SessionSignalDetector::analyze(state.outputWindow, detectionChars);
    const SessionStatus previous = state.status;

    state.status = report.status;
    state.lastUpdate = now;
    if (report.status == SessionStatus::Ready) {
        if (previous != SessionStatus::Ready || !state.readySince.isValid()) {
            state.readySince = now;
        }
    } else {
        state.readySince = QDateTime();
    }

    if (previous != report.status) {
        Q_EMIT statusChanged(state.sessionId);
    }
    return report;
}

void SessionRegistry::setStatus(const QString &sessionId, SessionStatus status, const QDateTime &now)
{
    SessionState &state = ensureSession(sessionId);
    const SessionStatus previous = state.status;
    state.status = status;
    state.lastUpdate = now;
    if (status != SessionStatus::Ready) {
        state.readySince = QDateTime();
    } else if (previous != SessionStatus::Ready || !state.readySince.isValid()) {
        state.readySince = now;
    }
    if (previous != status) {
        Q_EMIT statusChanged(sessionId);
    }
}

bool SessionRegistry::tryEnterPhase(const QString &sessionId, SessionState::Phase phase)
{
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        qWarning() << "SessionRegistry: Unknown session" << sessionId;
        return false;
    }
    if (phase == SessionState::Phase::Neutral) {
        return false;
    }
    if (it->phase != SessionState::Phase::Neutral) {
        qDebug() << "SessionRegistry: Session" << sessionId << "is" << SessionState::phaseName(it->phase) << "- cannot enter"
                 << SessionState::phaseName(phase);
        return false;
    }

    it->phase = phase;
    Q_EMIT phaseChanged(sessionId);
    return true;
}

void SessionRegistry::leavePhase(const QString &sessionId, SessionState::Phase phase)
{
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end() || it->phase != phase) {
        return;
    }
    it->phase = SessionState::Phase::Neutral;
    Q_EMIT phaseChanged(sessionId);
}

bool SessionRegistry::isBusy(const QString &sessionId) const
{
    const SessionState *state = session(sessionId);
    return state && state->busy();
}

QSet<QString> SessionRegistry::busySessions() const
{
    QSet<QString> busy;
    for (const SessionState &state : m_sessions) {
        if (state.busy()) {
            busy.insert(state.sessionId);
        }
    }
    return busy;
}

bool SessionRegistry::isReadyForInjection(const QString &sessionId, int stableMs, const QDateTime &now) const
{
    const SessionState *state = session(sessionId);
    if (!state) {
        return false;
    }
    return state->phase == SessionState::Phase::Neutral && state->isReady(stableMs, now);
}

void SessionRegistry::markUsageLimitReached(const QString &sessionId)
{
    SessionState &state = ensureSession(sessionId);
    state.usageLimitReached = true;
    state.awaitingContinue = true;
}

QStringList SessionRegistry::sessionsAwaitingContinue() const
{
    QStringList ids;
    for (const SessionState &state : m_sessions) {
        if (state.awaitingContinue) {
            ids.append(state.sessionId);
        }
    }
    ids.sort();
    return ids;
}

void SessionRegistry::clearAwaitingContinue()
{
    for (SessionState &state : m_sessions) {
        state.usageLimitReached = false;
        state.awaitingContinue = false;
    }
}

void SessionRegistry::resetAllPhases()
{
    for (SessionState &state : m_sessions) {
        if (state.phase != SessionState::Phase::Neutral) {
            state.phase = SessionState::Phase::Neutral;
            Q_EMIT phaseChanged(state.sessionId);
        }
    }
}

} // namespace Promptline

#include "moc_SessionRegistry.cpp"
