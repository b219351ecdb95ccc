/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRY_H
#define SESSIONREGISTRY_H

#include "promptline_export.h"

#include "SessionState.h"

#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

namespace Promptline
{

/**
 * SessionRegistry owns the SessionState of every known session.
 *
 * Records are created when a session first reports output and removed
 * when the session closes. Phase changes go through tryEnterPhase() and
 * leavePhase() so that two writers can never own one session.
 */
class PROMPTLINE_EXPORT SessionRegistry : public QObject
{
    Q_OBJECT

public:
    explicit SessionRegistry(QObject *parent = nullptr);
    ~SessionRegistry() override;

    /**
     * Get the record for a session, creating it if needed
     */
    SessionState &ensureSession(const QString &sessionId);

    /**
     * Look up a session, nullptr if unknown
     */
    const SessionState *session(const QString &sessionId) const;

    bool contains(const QString &sessionId) const
    {
        return m_sessions.contains(sessionId);
    }

    void removeSession(const QString &sessionId);

    QStringList sessionIds() const;

    /**
     * Feed a new output chunk and re-run the detectors.
     *
     * @param maxChars Window size kept for the session
     * @param detectionChars Trailing part used for classification
     */
    SignalReport appendOutput(const QString &sessionId,
                              const QString &chunk,
                              int maxChars,
                              int detectionChars,
                              const QDateTime &now = QDateTime::currentDateTime());

    /**
     * Replace the output window (e.g. with a fresh pane capture) and re-run the detectors
     */
    SignalReport replaceOutput(const QString &sessionId,
                               const QString &window,
                               int maxChars,
                               int detectionChars,
                               const QDateTime &now = QDateTime::currentDateTime());

    /**
     * Force a status, bypassing detection (used by external status reports)
     */
    void setStatus(const QString &sessionId, SessionStatus status, const QDateTime &now = QDateTime::currentDateTime());

    /**
     * Move a session from Neutral into @p phase.
     *
     * Fails when the session is unknown or already owned by another phase.
     */
    bool tryEnterPhase(const QString &sessionId, SessionState::Phase phase);

    /**
     * Return a session to Neutral if it is still in @p phase
     */
    void leavePhase(const QString &sessionId, SessionState::Phase phase);

    bool isBusy(const QString &sessionId) const;
    QSet<QString> busySessions() const;

    /**
     * Whether the session may receive a queued message right now
     */
    bool isReadyForInjection(const QString &sessionId, int stableMs, const QDateTime &now = QDateTime::currentDateTime()) const;

    void markUsageLimitReached(const QString &sessionId);
    QStringList sessionsAwaitingContinue() const;

    /**
     * Clear usage-limit and awaiting flags of every session
     */
    void clearAwaitingContinue();

    /**
     * Return every session to Neutral (global cancel)
     */
    void resetAllPhases();

Q_SIGNALS:
    void sessionAdded(const QString &sessionId);
    void sessionRemoved(const QString &sessionId);
    void statusChanged(const QString &sessionId);
    void phaseChanged(const QString &sessionId);

private:
    SignalReport applyReport(SessionState &state, const QDateTime &now, int detectionChars);

    QHash<QString, SessionState> m_sessions;
};

} // namespace Promptline

#endif // SESSIONREGISTRY_H
