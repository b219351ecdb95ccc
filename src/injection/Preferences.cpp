/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Preferences.h"

#include <KConfigGroup>
#include <QDebug>

namespace Promptline
{

namespace
{
const QString kInjectionGroup = QStringLiteral("Injection");
const QString kUsageLimitGroup = QStringLiteral("UsageLimit");
const QString kTimerGroup = QStringLiteral("Timer");
const QString kKeywordGroup = QStringLiteral("KeywordRules");
const QString kNotificationGroup = QStringLiteral("Notifications");
}

Preferences::Preferences(const QString &configName, QObject *parent)
    : QObject(parent)
{
    // Load config from ~/.config/<configName>
    m_config = KSharedConfig::openConfig(configName);
}

Preferences::~Preferences()
{
    save();
}

bool Preferences::autoContinueEnabled() const
{
    KConfigGroup group(m_config, kInjectionGroup);
    return group.readEntry("AutoContinue", false);
}

void Preferences::setAutoContinueEnabled(bool enabled)
{
    KConfigGroup group(m_config, kInjectionGroup);
    group.writeEntry("AutoContinue", enabled);
    Q_EMIT preferencesChanged();
}

QVector<KeywordRule> Preferences::keywordRules() const
{
    KConfigGroup group(m_config, kKeywordGroup);
    const int count = group.readEntry("Count", 0);

    QVector<KeywordRule> rules;
    rules.reserve(count);
    for (int i = 0; i < count; ++i) {
        KConfigGroup ruleGroup = group.group(QStringLiteral("Rule-%1").arg(i));
        KeywordRule rule;
        rule.id = ruleGroup.readEntry("Id", QString());
        rule.keyword = ruleGroup.readEntry("Keyword", QString());
        rule.response = ruleGroup.readEntry("Response", QString());
        rule.timesTriggered = ruleGroup.readEntry("TimesTriggered", 0);
        if (rule.keyword.trimmed().isEmpty()) {
            qWarning() << "Preferences: Skipping keyword rule" << i << "with empty keyword";
            continue;
        }
        if (rule.id.isEmpty()) {
            rule.id = KeywordRule::generateId();
        }
        rules.append(rule);
    }
    return rules;
}

void Preferences::setKeywordRules(const QVector<KeywordRule> &rules)
{
    KConfigGroup group(m_config, kKeywordGroup);
    group.deleteGroup();

    KConfigGroup fresh(m_config, kKeywordGroup);
    fresh.writeEntry("Count", rules.size());
    for (int i = 0; i < rules.size(); ++i) {
        KConfigGroup ruleGroup = fresh.group(QStringLiteral("Rule-%1").arg(i));
        ruleGroup.writeEntry("Id", rules[i].id);
        ruleGroup.writeEntry("Keyword", rules[i].keyword);
        ruleGroup.writeEntry("Response", rules[i].response);
        ruleGroup.writeEntry("TimesTriggered", rules[i].timesTriggered);
    }
    Q_EMIT preferencesChanged();
}

int Preferences::usageLimitCooldownMinutes() const
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    return group.readEntry("CooldownMinutes", 30);
}

void Preferences::setUsageLimitCooldownMinutes(int minutes)
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    group.writeEntry("CooldownMinutes", qMax(0, minutes));
    Q_EMIT preferencesChanged();
}

int Preferences::usageLimitAutoDisableHours() const
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    return group.readEntry("AutoDisableHours", 5);
}

void Preferences::setUsageLimitAutoDisableHours(int hours)
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    group.writeEntry("AutoDisableHours", qMax(1, hours));
    Q_EMIT preferencesChanged();
}

int Preferences::usageLimitMinLeadSeconds() const
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    return group.readEntry("MinLeadSeconds", 120);
}

void Preferences::setUsageLimitMinLeadSeconds(int seconds)
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    group.writeEntry("MinLeadSeconds", qMax(0, seconds));
    Q_EMIT preferencesChanged();
}

int Preferences::usageLimitMaxLeadHours() const
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    return group.readEntry("MaxLeadHours", 5);
}

void Preferences::setUsageLimitMaxLeadHours(int hours)
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    group.writeEntry("MaxLeadHours", qMax(1, hours));
    Q_EMIT preferencesChanged();
}

QDateTime Preferences::usageLimitFirstDetected() const
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    return group.readEntry("FirstDetected", QDateTime());
}

void Preferences::setUsageLimitFirstDetected(const QDateTime &when)
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    if (when.isValid()) {
        group.writeEntry("FirstDetected", when);
    } else {
        group.deleteEntry("FirstDetected");
    }
}

QDateTime Preferences::usageLimitResetInstant() const
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    return group.readEntry("ResetInstant", QDateTime());
}

void Preferences::setUsageLimitResetInstant(const QDateTime &when)
{
    KConfigGroup group(m_config, kUsageLimitGroup);
    if (when.isValid()) {
        group.writeEntry("ResetInstant", when);
    } else {
        group.deleteEntry("ResetInstant");
    }
}

TimerDuration Preferences::timerDuration() const
{
    KConfigGroup group(m_config, kTimerGroup);
    TimerDuration d;
    d.hours = group.readEntry("Hours", 0);
    d.minutes = group.readEntry("Minutes", 0);
    d.seconds = group.readEntry("Seconds", 0);
    return d;
}

void Preferences::setTimerDuration(const TimerDuration &duration)
{
    KConfigGroup group(m_config, kTimerGroup);
    group.writeEntry("Hours", duration.hours);
    group.writeEntry("Minutes", duration.minutes);
    group.writeEntry("Seconds", duration.seconds);
    Q_EMIT preferencesChanged();
}

QDateTime Preferences::timerTarget() const
{
    KConfigGroup group(m_config, kTimerGroup);
    return group.readEntry("Target", QDateTime());
}

void Preferences::setTimerTarget(const QDateTime &target)
{
    KConfigGroup group(m_config, kTimerGroup);
    if (target.isValid()) {
        group.writeEntry("Target", target);
    } else {
        group.deleteEntry("Target");
    }
}

int Preferences::maxSafetyCheckAttempts() const
{
    KConfigGroup group(m_config, kInjectionGroup);
    return group.readEntry("MaxSafetyCheckAttempts", 30);
}

void Preferences::setMaxSafetyCheckAttempts(int attempts)
{
    KConfigGroup group(m_config, kInjectionGroup);
    group.writeEntry("MaxSafetyCheckAttempts", qMax(1, attempts));
    Q_EMIT preferencesChanged();
}

int Preferences::safetyCheckIntervalMs() const
{
    KConfigGroup group(m_config, kInjectionGroup);
    return group.readEntry("SafetyCheckIntervalMs", 1000);
}

void Preferences::setSafetyCheckIntervalMs(int ms)
{
    KConfigGroup group(m_config, kInjectionGroup);
    group.writeEntry("SafetyCheckIntervalMs", qMax(1, ms));
    Q_EMIT preferencesChanged();
}

int Preferences::readyStableMs() const
{
    KConfigGroup group(m_config, kInjectionGroup);
    return group.readEntry("ReadyStableMs", 1000);
}

void Preferences::setReadyStableMs(int ms)
{
    KConfigGroup group(m_config, kInjectionGroup);
    group.writeEntry("ReadyStableMs", qMax(0, ms));
    Q_EMIT preferencesChanged();
}

int Preferences::outputWindowChars() const
{
    KConfigGroup group(m_config, kInjectionGroup);
    return group.readEntry("OutputWindowChars", 5000);
}

void Preferences::setOutputWindowChars(int chars)
{
    KConfigGroup group(m_config, kInjectionGroup);
    group.writeEntry("OutputWindowChars", qMax(256, chars));
    Q_EMIT preferencesChanged();
}

int Preferences::detectionWindowChars() const
{
    KConfigGroup group(m_config, kInjectionGroup);
    return group.readEntry("DetectionWindowChars", 2000);
}

void Preferences::setDetectionWindowChars(int chars)
{
    KConfigGroup group(m_config, kInjectionGroup);
    group.writeEntry("DetectionWindowChars", qMax(100, chars));
    Q_EMIT preferencesChanged();
}

int Preferences::pollIntervalMs() const
{
    KConfigGroup group(m_config, kInjectionGroup);
    return group.readEntry("PollIntervalMs", 500);
}

void Preferences::setPollIntervalMs(int ms)
{
    KConfigGroup group(m_config, kInjectionGroup);
    group.writeEntry("PollIntervalMs", qMax(50, ms));
    Q_EMIT preferencesChanged();
}

bool Preferences::showNotifications() const
{
    KConfigGroup group(m_config, kNotificationGroup);
    return group.readEntry("Enabled", true);
}

void Preferences::setShowNotifications(bool enabled)
{
    KConfigGroup group(m_config, kNotificationGroup);
    group.writeEntry("Enabled", enabled);
    Q_EMIT preferencesChanged();
}

void Preferences::save()
{
    if (!m_config->sync()) {
        qWarning() << "Preferences: Failed to write" << m_config->name();
    }
}

} // namespace Promptline

#include "moc_Preferences.cpp"
