/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "InjectionScheduler.h"

#include "ActionLog.h"
#include "Injector.h"
#include "MessageQueue.h"
#include "Notifier.h"
#include "Preferences.h"
#include "SessionRegistry.h"

#include <KLocalizedString>

#include <QDebug>
#include <QMap>
#include <QSet>
#include <QTimer>

#include <limits>

namespace Promptline
{

InjectionScheduler::InjectionScheduler(const InjectionContext &context, Injector *injector, QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_injector(injector)
    , m_wakeTimer(new QTimer(this))
    , m_safetyTimer(new QTimer(this))
{
    m_wakeTimer->setSingleShot(true);
    connect(m_wakeTimer, &QTimer::timeout, this, [this]() {
        m_nextWakeAt = QDateTime();
        runPass();
    });

    m_safetyTimer->setInterval(m_timings.safetyCheckIntervalMs);
    connect(m_safetyTimer, &QTimer::timeout, this, &InjectionScheduler::onSafetyTick);

    connect(m_injector, &Injector::injectionFinished, this, &InjectionScheduler::onInjectionFinished);

    connect(m_context.queue, &MessageQueue::messageAdded, this, [this]() {
        if (m_draining) {
            scheduleWake(0);
        }
    });
}

InjectionScheduler::~InjectionScheduler() = default;

void InjectionScheduler::setTimings(const SchedulerTimings &timings)
{
    m_timings = timings;
    m_safetyTimer->setInterval(m_timings.safetyCheckIntervalMs);
}

void InjectionScheduler::startDrain()
{
    if (!m_draining) {
        m_draining = true;
        m_dispatchedThisDrain = 0;
        m_context.log->info(QStringLiteral("Starting injection (%1 queued)").arg(m_context.queue->size()));
        Q_EMIT drainingChanged(true);
    }
    runPass();
}

void InjectionScheduler::stopDrain()
{
    m_wakeTimer->stop();
    m_nextWakeAt = QDateTime();
    m_safetyTimer->stop();
    m_safetyChecks.clear();

    if (m_draining) {
        m_draining = false;
        Q_EMIT drainingChanged(false);
    }
}

void InjectionScheduler::onTimerExpired()
{
    const QStringList awaiting = m_context.sessions->sessionsAwaitingContinue();

    if (!awaiting.isEmpty()) {
        m_context.log->info(QStringLiteral("Injecting continue messages to %1 session(s)").arg(awaiting.size()));
        m_context.sessions->clearAwaitingContinue();

        const QDateTime now = QDateTime::currentDateTime();
        for (const QString &sessionId : awaiting) {
            const QString id = m_context.queue->enqueue(sessionId, QStringLiteral("continue"), now, QStringList(), true);
            if (!id.isEmpty()) {
                m_context.log->success(QStringLiteral("Added continue message for %1").arg(sessionId));
            }
        }
    } else if (m_context.queue->isEmpty()) {
        m_context.log->warning(QStringLiteral("Timer expired but no messages in queue"));
    }

    if (m_context.notifier) {
        m_context.notifier->notify(Notifier::Event::TimerExpired, i18n("Timer expired"), i18n("Starting message injection"));
    }

    startDrain();
}

int InjectionScheduler::runPass(const QDateTime &now)
{
    if (m_passRunning) {
        return 0;
    }
    if (!m_draining || m_paused) {
        return 0;
    }
    m_passRunning = true;

    const QSet<QString> busy = m_context.sessions->busySessions();

    // Best due candidate per session; QMap keeps dispatch order deterministic
    QMap<QString, Message> candidates;
    for (const Message &message : m_context.queue->messages()) {
        if (busy.contains(message.targetSessionId) || !message.isDue(now)) {
            continue;
        }
        auto it = candidates.find(message.targetSessionId);
        if (it == candidates.end()) {
            candidates.insert(message.targetSessionId, message);
        } else if (Message::precedes(message, it.value())) {
            it.value() = message;
        }
    }

    // Sessions left out of the wake computation; something else wakes them
    QSet<QString> waitingSessions;
    QSet<QString> notReady;
    QDateTime limitLiftsAt;
    int dispatched = 0;

    for (auto it = candidates.cbegin(); it != candidates.cend(); ++it) {
        const QString &sessionId = it.key();
        const Message &candidate = it.value();

        const SessionState *state = m_context.sessions->session(sessionId);
        if (state && state->usageLimitReached && !candidate.isAutoContinue) {
            const QDateTime resetAt = m_context.preferences ? m_context.preferences->usageLimitResetInstant() : QDateTime();
            if (resetAt.isValid() && now < resetAt) {
                qDebug() << "InjectionScheduler: Holding back" << sessionId << "until" << resetAt;
                if (!limitLiftsAt.isValid() || resetAt < limitLiftsAt) {
                    limitLiftsAt = resetAt;
                }
                waitingSessions.insert(sessionId);
                continue;
            }
        }

        // A task for an earlier instance of this session is still finishing
        if (m_injector->isInjecting(sessionId)) {
            waitingSessions.insert(sessionId);
            continue;
        }

        if (!m_context.sessions->isReadyForInjection(sessionId, m_timings.readyStableMs, now)) {
            if (!m_safetyChecks.contains(sessionId)) {
                m_safetyChecks.insert(sessionId, 0);
                qDebug() << "InjectionScheduler: Waiting for session" << sessionId << "to become ready";
            }
            notReady.insert(sessionId);
            waitingSessions.insert(sessionId);
            continue;
        }

        const std::optional<Message> message = m_context.queue->take(candidate.id);
        if (!message) {
            continue;
        }
        if (!m_injector->inject(*message)) {
            m_context.log->error(QStringLiteral("Could not start injection of %1 into %2 - message dropped").arg(message->id, sessionId));
            continue;
        }

        ++dispatched;
        ++m_dispatchedThisDrain;
        Q_EMIT messageDispatched(message->id, sessionId);
    }

    // Only sessions still waiting on readiness for a queued message keep a safety check
    for (auto it = m_safetyChecks.begin(); it != m_safetyChecks.end();) {
        if (notReady.contains(it.key())) {
            ++it;
        } else {
            it = m_safetyChecks.erase(it);
        }
    }

    // Wake up for whatever was not selected and has no other trigger
    QDateTime nextWake = limitLiftsAt;
    for (const Message &message : m_context.queue->messages()) {
        if (waitingSessions.contains(message.targetSessionId)) {
            continue;
        }
        if (!nextWake.isValid() || message.executeAt < nextWake) {
            nextWake = message.executeAt;
        }
    }
    if (nextWake.isValid()) {
        scheduleWake(int(qBound<qint64>(m_timings.minWakeMs, now.msecsTo(nextWake), std::numeric_limits<int>::max())));
    }

    if (m_safetyChecks.isEmpty()) {
        m_safetyTimer->stop();
    } else if (!m_safetyTimer->isActive()) {
        m_safetyTimer->start();
    }

    m_passRunning = false;
    Q_EMIT passFinished(dispatched);
    return dispatched;
}

void InjectionScheduler::scheduleWake(int delayMs)
{
    const QDateTime wakeAt = QDateTime::currentDateTime().addMSecs(delayMs);
    if (m_wakeTimer->isActive() && m_nextWakeAt.isValid() && m_nextWakeAt <= wakeAt) {
        return;
    }
    m_nextWakeAt = wakeAt;
    m_wakeTimer->start(delayMs);
}

void InjectionScheduler::onSafetyTick()
{
    if (m_paused || !m_draining) {
        return;
    }

    // Dispatches whatever became ready and drops checks whose message is gone
    runPass();

    const QStringList ids = m_safetyChecks.keys();
    for (const QString &sessionId : ids) {
        const int attempts = ++m_safetyChecks[sessionId];
        if (attempts % 5 == 0) {
            m_context.log->info(QStringLiteral("Safety check: waiting for %1 to be ready (attempt %2/%3)")
                                    .arg(sessionId)
                                    .arg(attempts)
                                    .arg(m_timings.maxSafetyCheckAttempts));
        }
        if (attempts >= m_timings.maxSafetyCheckAttempts) {
            m_context.log->warning(QStringLiteral("Session %1 not ready after %2 checks - message stays queued").arg(sessionId).arg(attempts));
            m_safetyChecks[sessionId] = 0;
            Q_EMIT safetyCheckExhausted(sessionId);
        }
    }
}

void InjectionScheduler::onInjectionFinished(const QString &messageId, const QString &sessionId, bool success)
{
    Q_UNUSED(messageId)
    Q_UNUSED(sessionId)
    Q_UNUSED(success)

    if (!m_draining) {
        return;
    }
    checkDrainComplete();
    scheduleWake(m_timings.rescheduleAfterInjectionMs);
}

void InjectionScheduler::checkDrainComplete()
{
    if (m_dispatchedThisDrain == 0 || !m_context.queue->isEmpty() || m_injector->activeCount() > 0) {
        return;
    }

    m_context.log->success(QStringLiteral("All queued messages injected (%1)").arg(m_dispatchedThisDrain));
    m_dispatchedThisDrain = 0;
    Q_EMIT drainComplete();

    if (m_context.notifier) {
        m_context.notifier->notify(Notifier::Event::DrainComplete, i18n("Queue drained"), i18n("All queued messages were injected"));
    }
}

void InjectionScheduler::cancel()
{
    stopDrain();
    m_injector->cancelAll();
    m_context.sessions->resetAllPhases();
    m_context.log->warning(QStringLiteral("Injection cancelled - all sessions returned to neutral"));
}

void InjectionScheduler::pause()
{
    if (m_paused) {
        return;
    }
    m_paused = true;
    m_injector->pause();
}

void InjectionScheduler::resume()
{
    if (!m_paused) {
        return;
    }
    m_paused = false;
    m_injector->resume();
    runPass();
}

} // namespace Promptline

#include "moc_InjectionScheduler.cpp"
