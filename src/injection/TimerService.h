/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TIMERSERVICE_H
#define TIMERSERVICE_H

#include "promptline_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QString>

class QTimer;

namespace Promptline
{

class ActionLog;
class Preferences;

/**
 * TimerService is the countdown that starts a queue drain on expiry.
 *
 * States: Idle -> Active -> Expired, with Paused reachable from Active.
 * The countdown can follow a usage-limit reset instant (UsageLimitSync);
 * a manual setTimer() switches it back to Manual until sync is re-armed.
 */
class PROMPTLINE_EXPORT TimerService : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Active,
        Paused,
        Expired
    };
    Q_ENUM(State)

    enum class SyncSource {
        Manual,
        UsageLimitSync
    };
    Q_ENUM(SyncSource)

    explicit TimerService(Preferences *preferences, ActionLog *log, QObject *parent = nullptr);
    ~TimerService() override;

    State state() const
    {
        return m_state;
    }
    SyncSource syncSource() const
    {
        return m_syncSource;
    }

    int hours() const
    {
        return m_hours;
    }
    int minutes() const
    {
        return m_minutes;
    }
    int seconds() const
    {
        return m_seconds;
    }
    int remainingSeconds() const
    {
        return m_hours * 3600 + m_minutes * 60 + m_seconds;
    }

    bool isActive() const
    {
        return m_state == State::Active;
    }
    bool isExpired() const
    {
        return m_state == State::Expired;
    }

    /**
     * "HH:MM:SS"
     */
    QString formatted() const;

    /**
     * Set the countdown value (clamped to 0..23 / 0..59 / 0..59).
     *
     * This is a manual edit: usage-limit sync stays off until re-armed.
     */
    void setTimer(int hours, int minutes, int seconds);

    /**
     * Start counting down; fails for a zero duration
     */
    bool start();

    void pause();
    void resume();

    /**
     * Stop counting and return to Idle, keeping the current value
     */
    void stop();

    /**
     * Restore the stored duration, or expire if the stored target instant passed
     */
    void reset();

    /**
     * One second elapsed (driven by the internal tick timer)
     */
    void tick();

    /**
     * Follow a usage-limit reset instant, if sync is armed
     */
    void syncToResetInstant(const QDateTime &resetInstant, const QDateTime &now = QDateTime::currentDateTime());

    /**
     * Recompute the remaining time from the tracked reset instant
     */
    void syncNow(const QDateTime &now = QDateTime::currentDateTime());

    bool isAutoSyncEnabled() const
    {
        return m_autoSyncEnabled;
    }

    /**
     * Re-arm usage-limit sync after a manual edit
     */
    void armAutoSync();

    void setTickInterval(int ms);
    void setSyncInterval(int ms);

    QJsonObject toJson() const;

    static QString stateName(State state);

Q_SIGNALS:
    void stateChanged(Promptline::TimerService::State state);
    void valueChanged(const QString &formatted);

    /**
     * Emitted exactly once per expiry
     */
    void expired();

private:
    void setState(State state);
    void setValue(int hours, int minutes, int seconds);
    void setValueFromSeconds(qint64 totalSeconds);
    void persistTarget();
    void expire();

    Preferences *m_preferences = nullptr;
    ActionLog *m_log = nullptr;

    QTimer *m_tickTimer = nullptr;
    QTimer *m_syncTimer = nullptr;

    State m_state = State::Idle;
    SyncSource m_syncSource = SyncSource::Manual;
    bool m_autoSyncEnabled = true;
    bool m_manualStart = false;
    QDateTime m_resetInstant;

    int m_hours = 0;
    int m_minutes = 0;
    int m_seconds = 0;
};

} // namespace Promptline

#endif // TIMERSERVICE_H
