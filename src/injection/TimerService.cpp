/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TimerService.h"

#include "ActionLog.h"
#include "Preferences.h"

#include <QDebug>
#include <QTimer>

namespace Promptline
{

TimerService::TimerService(Preferences *preferences, ActionLog *log, QObject *parent)
    : QObject(parent)
    , m_preferences(preferences)
    , m_log(log)
    , m_tickTimer(new QTimer(this))
    , m_syncTimer(new QTimer(this))
{
    m_tickTimer->setInterval(1000);
    connect(m_tickTimer, &QTimer::timeout, this, &TimerService::tick);

    m_syncTimer->setInterval(5000);
    connect(m_syncTimer, &QTimer::timeout, this, [this]() {
        syncNow();
    });

    const TimerDuration stored = m_preferences->timerDuration();
    m_hours = qBound(0, stored.hours, 23);
    m_minutes = qBound(0, stored.minutes, 59);
    m_seconds = qBound(0, stored.seconds, 59);
}

TimerService::~TimerService() = default;

QString TimerService::formatted() const
{
    return QStringLiteral("%1:%2:%3")
        .arg(m_hours, 2, 10, QLatin1Char('0'))
        .arg(m_minutes, 2, 10, QLatin1Char('0'))
        .arg(m_seconds, 2, 10, QLatin1Char('0'));
}

void TimerService::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    Q_EMIT stateChanged(state);
}

void TimerService::setValue(int hours, int minutes, int seconds)
{
    m_hours = qBound(0, hours, 23);
    m_minutes = qBound(0, minutes, 59);
    m_seconds = qBound(0, seconds, 59);
    Q_EMIT valueChanged(formatted());
}

void TimerService::setValueFromSeconds(qint64 totalSeconds)
{
    totalSeconds = qMax<qint64>(0, totalSeconds);
    setValue(int(totalSeconds / 3600), int((totalSeconds % 3600) / 60), int(totalSeconds % 60));
}

void TimerService::persistTarget()
{
    TimerDuration duration;
    duration.hours = m_hours;
    duration.minutes = m_minutes;
    duration.seconds = m_seconds;
    m_preferences->setTimerDuration(duration);
    m_preferences->setTimerTarget(QDateTime::currentDateTime().addSecs(remainingSeconds()));
    m_preferences->save();
}

void TimerService::setTimer(int hours, int minutes, int seconds)
{
    m_tickTimer->stop();
    m_syncTimer->stop();
    m_autoSyncEnabled = false;
    m_syncSource = SyncSource::Manual;
    m_manualStart = false;

    setValue(hours, minutes, seconds);
    persistTarget();
    setState(State::Idle);

    m_log->info(QStringLiteral("Timer set to: %1").arg(formatted()));
}

bool TimerService::start()
{
    if (m_state == State::Active) {
        return true;
    }
    if (remainingSeconds() == 0) {
        qWarning() << "TimerService: Refusing to start a zero-length timer";
        m_log->warning(QStringLiteral("Cannot start timer: duration is 00:00:00"));
        return false;
    }

    m_manualStart = (m_syncSource == SyncSource::Manual);
    persistTarget();
    setState(State::Active);
    m_tickTimer->start();

    m_log->info(QStringLiteral("Timer started: %1").arg(formatted()));
    return true;
}

void TimerService::pause()
{
    if (m_state != State::Active) {
        return;
    }
    m_tickTimer->stop();
    setState(State::Paused);
    m_log->info(QStringLiteral("Timer paused at %1").arg(formatted()));
}

void TimerService::resume()
{
    if (m_state != State::Paused) {
        return;
    }
    persistTarget();
    setState(State::Active);
    m_tickTimer->start();
    m_log->info(QStringLiteral("Timer resumed at %1").arg(formatted()));
}

void TimerService::stop()
{
    if (m_state == State::Idle) {
        return;
    }
    m_tickTimer->stop();
    m_manualStart = false;
    m_preferences->setTimerTarget(QDateTime());
    m_preferences->save();
    setState(State::Idle);
    m_log->info(QStringLiteral("Timer stopped at %1").arg(formatted()));
}

void TimerService::reset()
{
    m_tickTimer->stop();
    m_manualStart = false;

    const QDateTime target = m_preferences->timerTarget();
    if (target.isValid() && target <= QDateTime::currentDateTime()) {
        m_log->info(QStringLiteral("Timer target time (%1) has already passed").arg(target.toString(Qt::ISODate)));
        m_preferences->setTimerTarget(QDateTime());
        m_preferences->setTimerDuration(TimerDuration());
        m_preferences->save();
        setValue(0, 0, 0);
        expire();
        return;
    }

    const TimerDuration stored = m_preferences->timerDuration();
    setValue(stored.hours, stored.minutes, stored.seconds);
    setState(State::Idle);
    m_log->info(QStringLiteral("Timer reset to saved value: %1").arg(formatted()));
}

void TimerService::tick()
{
    if (m_state != State::Active) {
        return;
    }

    if (m_seconds > 0) {
        m_seconds--;
    } else if (m_minutes > 0) {
        m_minutes--;
        m_seconds = 59;
    } else if (m_hours > 0) {
        m_hours--;
        m_minutes = 59;
        m_seconds = 59;
    }
    Q_EMIT valueChanged(formatted());

    if (remainingSeconds() == 0) {
        expire();
    }
}

void TimerService::expire()
{
    if (m_state == State::Expired) {
        return;
    }

    m_tickTimer->stop();
    m_syncTimer->stop();
    m_manualStart = false;
    m_preferences->setTimerTarget(QDateTime());
    m_preferences->save();
    setState(State::Expired);

    m_log->success(QStringLiteral("Timer expired - starting injection"));
    Q_EMIT expired();
}

void TimerService::syncToResetInstant(const QDateTime &resetInstant, const QDateTime &now)
{
    m_resetInstant = resetInstant;

    if (!m_autoSyncEnabled) {
        m_log->info(QStringLiteral("Usage limit reset at %1 not applied: timer was set manually").arg(resetInstant.toString(Qt::ISODate)));
        return;
    }
    if (m_manualStart && m_state == State::Active) {
        qDebug() << "TimerService: Manual countdown running, not syncing to" << resetInstant;
        return;
    }

    m_syncSource = SyncSource::UsageLimitSync;
    setValueFromSeconds(now.secsTo(resetInstant));
    m_syncTimer->start();

    if (remainingSeconds() > 0) {
        start();
        m_log->info(QStringLiteral("Timer synced to usage limit reset: %1").arg(formatted()));
    }
}

void TimerService::syncNow(const QDateTime &now)
{
    if (!m_autoSyncEnabled || m_syncSource != SyncSource::UsageLimitSync || m_manualStart) {
        return;
    }
    if (!m_resetInstant.isValid() || m_state == State::Expired) {
        return;
    }

    const qint64 remaining = now.secsTo(m_resetInstant);
    if (remaining <= 0) {
        setValue(0, 0, 0);
        if (m_state == State::Active) {
            expire();
        }
        return;
    }

    if (qAbs(remaining - remainingSeconds()) > 1) {
        setValueFromSeconds(remaining);
        qDebug() << "TimerService: Synced to usage limit reset:" << formatted();
    }
}

void TimerService::armAutoSync()
{
    m_autoSyncEnabled = true;
    m_log->info(QStringLiteral("Timer usage-limit sync re-armed"));
    if (m_resetInstant.isValid() && QDateTime::currentDateTime() < m_resetInstant) {
        syncToResetInstant(m_resetInstant);
    }
}

void TimerService::setTickInterval(int ms)
{
    m_tickTimer->setInterval(qMax(1, ms));
}

void TimerService::setSyncInterval(int ms)
{
    m_syncTimer->setInterval(qMax(1, ms));
}

QJsonObject TimerService::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("hours")] = m_hours;
    obj[QStringLiteral("minutes")] = m_minutes;
    obj[QStringLiteral("seconds")] = m_seconds;
    obj[QStringLiteral("formatted")] = formatted();
    obj[QStringLiteral("state")] = stateName(m_state);
    obj[QStringLiteral("active")] = m_state == State::Active;
    obj[QStringLiteral("expired")] = m_state == State::Expired;
    obj[QStringLiteral("syncSource")] = m_syncSource == SyncSource::Manual ? QStringLiteral("manual") : QStringLiteral("usage-limit-sync");
    return obj;
}

QString TimerService::stateName(State state)
{
    switch (state) {
    case State::Idle:
        return QStringLiteral("idle");
    case State::Active:
        return QStringLiteral("active");
    case State::Paused:
        return QStringLiteral("paused");
    case State::Expired:
        return QStringLiteral("expired");
    }
    return QStringLiteral("unknown");
}

} // namespace Promptline

#include "moc_TimerService.cpp"
