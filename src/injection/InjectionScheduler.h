/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INJECTIONSCHEDULER_H
#define INJECTIONSCHEDULER_H

#include "promptline_export.h"

#include "InjectionContext.h"

#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QString>

class QTimer;

namespace Promptline
{

class Injector;

/**
 * Scheduling constants, in milliseconds unless noted
 */
struct PROMPTLINE_EXPORT SchedulerTimings {
    int minWakeMs = 100;
    int rescheduleAfterInjectionMs = 100;
    int safetyCheckIntervalMs = 1000;
    int maxSafetyCheckAttempts = 30; // count, not ms
    int readyStableMs = 1000;
};

/**
 * InjectionScheduler decides which queued message goes to which session.
 *
 * While draining (after timer expiry or a manual drain), each selection
 * pass picks per session the first due message in delivery order and
 * hands it to the Injector if the session is idle and ready. Sessions
 * that are not ready are polled by a safety check with a bounded number
 * of attempts; messages stay queued until their session becomes ready.
 * A session that hit its usage limit only receives its "continue" until
 * the stored reset instant has passed.
 */
class PROMPTLINE_EXPORT InjectionScheduler : public QObject
{
    Q_OBJECT

public:
    InjectionScheduler(const InjectionContext &context, Injector *injector, QObject *parent = nullptr);
    ~InjectionScheduler() override;

    void setTimings(const SchedulerTimings &timings);
    const SchedulerTimings &timings() const
    {
        return m_timings;
    }

    bool isDraining() const
    {
        return m_draining;
    }
    bool isPaused() const
    {
        return m_paused;
    }

    /**
     * Begin draining the queue now
     */
    void startDrain();

    /**
     * Stop draining; in-flight injections are left alone
     */
    void stopDrain();

    /**
     * Timer expiry: queue a "continue" for every session waiting on a
     * usage limit, then start draining
     */
    void onTimerExpired();

    /**
     * Run one selection pass.
     *
     * @return Number of messages handed to the Injector
     */
    int runPass(const QDateTime &now = QDateTime::currentDateTime());

    /**
     * Abort in-flight injections, stop draining and return all sessions to neutral
     */
    void cancel();

    void pause();
    void resume();

    /**
     * When the next pass is scheduled (invalid if none)
     */
    QDateTime nextWakeAt() const
    {
        return m_nextWakeAt;
    }

    int safetyCheckAttempts(const QString &sessionId) const
    {
        return m_safetyChecks.value(sessionId, -1);
    }
    bool hasPendingSafetyChecks() const
    {
        return !m_safetyChecks.isEmpty();
    }

Q_SIGNALS:
    void drainingChanged(bool draining);
    void messageDispatched(const QString &messageId, const QString &sessionId);
    void passFinished(int dispatched);
    void safetyCheckExhausted(const QString &sessionId);

    /**
     * The queue ran empty after at least one injection in this drain
     */
    void drainComplete();

private:
    void scheduleWake(int delayMs);
    void onSafetyTick();
    void onInjectionFinished(const QString &messageId, const QString &sessionId, bool success);
    void checkDrainComplete();

    InjectionContext m_context;
    Injector *m_injector = nullptr;
    SchedulerTimings m_timings;

    QTimer *m_wakeTimer = nullptr;
    QTimer *m_safetyTimer = nullptr;
    QDateTime m_nextWakeAt;

    bool m_passRunning = false;
    bool m_draining = false;
    bool m_paused = false;
    int m_dispatchedThisDrain = 0;

    // Session id -> safety check attempts in the current cycle
    QHash<QString, int> m_safetyChecks;
};

} // namespace Promptline

#endif // INJECTIONSCHEDULER_H
