/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PREFERENCES_H
#define PREFERENCES_H

#include "promptline_export.h"

#include "KeywordRuleEngine.h"

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QVector>

#include <KSharedConfig>

namespace Promptline
{

/**
 * A countdown duration as shown in the timer display
 */
struct PROMPTLINE_EXPORT TimerDuration {
    int hours = 0;
    int minutes = 0;
    int seconds = 0;

    int totalSeconds() const
    {
        return hours * 3600 + minutes * 60 + seconds;
    }

    bool isZero() const
    {
        return totalSeconds() == 0;
    }
};

/**
 * Preferences manages the persistent option set of the injector.
 *
 * Options include:
 * - Auto-continue and keyword rules
 * - Usage-limit cooldown and staleness thresholds
 * - Timer duration and persisted target instant
 * - Safety check budget and readiness polling
 *
 * Every setter writes through to the config file; call save() to flush.
 */
class PROMPTLINE_EXPORT Preferences : public QObject
{
    Q_OBJECT

public:
    /**
     * @param configName Config file name, resolved like KSharedConfig::openConfig()
     */
    explicit Preferences(const QString &configName = QStringLiteral("promptlinerc"), QObject *parent = nullptr);
    ~Preferences() override;

    // ========== Auto-continue / keyword rules ==========

    bool autoContinueEnabled() const;
    void setAutoContinueEnabled(bool enabled);

    QVector<KeywordRule> keywordRules() const;
    void setKeywordRules(const QVector<KeywordRule> &rules);

    // ========== Usage limit ==========

    /**
     * Window after a handled detection during which repeats are ignored
     */
    int usageLimitCooldownMinutes() const;
    void setUsageLimitCooldownMinutes(int minutes);

    /**
     * Hours after the first detection when detection switches itself off
     */
    int usageLimitAutoDisableHours() const;
    void setUsageLimitAutoDisableHours(int hours);

    /**
     * Reset instants closer than this are treated as a limit that already lifted
     */
    int usageLimitMinLeadSeconds() const;
    void setUsageLimitMinLeadSeconds(int seconds);

    /**
     * Reset instants further away than this are treated as stale
     */
    int usageLimitMaxLeadHours() const;
    void setUsageLimitMaxLeadHours(int hours);

    QDateTime usageLimitFirstDetected() const;
    void setUsageLimitFirstDetected(const QDateTime &when);

    QDateTime usageLimitResetInstant() const;
    void setUsageLimitResetInstant(const QDateTime &when);

    // ========== Timer ==========

    TimerDuration timerDuration() const;
    void setTimerDuration(const TimerDuration &duration);

    /**
     * Absolute instant the last set timer was due to expire (invalid if none)
     */
    QDateTime timerTarget() const;
    void setTimerTarget(const QDateTime &target);

    // ========== Scheduling ==========

    int maxSafetyCheckAttempts() const;
    void setMaxSafetyCheckAttempts(int attempts);

    int safetyCheckIntervalMs() const;
    void setSafetyCheckIntervalMs(int ms);

    /**
     * How long a session must stay ready before it can receive input
     */
    int readyStableMs() const;
    void setReadyStableMs(int ms);

    int outputWindowChars() const;
    void setOutputWindowChars(int chars);

    int detectionWindowChars() const;
    void setDetectionWindowChars(int chars);

    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    // ========== Notifications ==========

    bool showNotifications() const;
    void setShowNotifications(bool enabled);

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void preferencesChanged();

private:
    KSharedConfig::Ptr m_config;
};

} // namespace Promptline

#endif // PREFERENCES_H
