/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "UsageLimitTracker.h"

#include "ActionLog.h"
#include "Notifier.h"
#include "Preferences.h"
#include "SessionRegistry.h"

#include <KLocalizedString>

#include <QDebug>
#include <QJsonArray>

namespace Promptline
{

UsageLimitTracker::UsageLimitTracker(const InjectionContext &context, QObject *parent)
    : QObject(parent)
    , m_context(context)
{
}

UsageLimitTracker::~UsageLimitTracker() = default;

QDateTime UsageLimitTracker::nextOccurrence(int hour, bool pm, const QDateTime &now)
{
    int hour24 = hour % 12;
    if (pm) {
        hour24 += 12;
    }

    QDateTime candidate = now;
    candidate.setTime(QTime(hour24, 0, 0));
    if (candidate <= now) {
        candidate = candidate.addDays(1);
    }
    return candidate;
}

std::optional<QDateTime>
UsageLimitTracker::resolveResetInstant(const UsageLimitMatch &match, const QDateTime &now, int minLeadSeconds, int maxLeadHours)
{
    if (match.hour < 1 || match.hour > 12) {
        return std::nullopt;
    }

    const QDateTime candidate = nextOccurrence(match.hour, match.pm, now);
    const qint64 lead = now.secsTo(candidate);

    if (lead < minLeadSeconds) {
        return std::nullopt;
    }
    // Whole hours, so "5h 59m" is still accepted with a 5 hour maximum
    if (lead / 3600 > maxLeadHours) {
        return std::nullopt;
    }
    return candidate;
}

UsageLimitTracker::Outcome UsageLimitTracker::handleDetection(const QString &sessionId, const UsageLimitMatch &match, const QDateTime &now)
{
    Preferences *prefs = m_context.preferences;
    ActionLog *log = m_context.log;

    if (m_autoDisabled) {
        qDebug() << "UsageLimitTracker: Detection disabled for this cycle, ignoring" << match.resetText;
        return Outcome::AutoDisabled;
    }

    const std::optional<QDateTime> reset = resolveResetInstant(match, now, prefs->usageLimitMinLeadSeconds(), prefs->usageLimitMaxLeadHours());
    if (!reset) {
        // Usually the banner of a limit that has already lifted
        const QDateTime candidate = nextOccurrence(match.hour, match.pm, now);
        const qint64 lead = now.secsTo(candidate);
        log->info(QStringLiteral("Usage limit reset at %1 would be %2h %3m away - ignoring as stale")
                      .arg(match.resetText)
                      .arg(lead / 3600)
                      .arg((lead % 3600) / 60));
        return Outcome::Stale;
    }

    QDateTime firstDetected = prefs->usageLimitFirstDetected();
    if (!firstDetected.isValid()) {
        firstDetected = now;
        prefs->setUsageLimitFirstDetected(now);
        prefs->save();
        log->info(QStringLiteral("Usage limit first detected - detection will auto-disable after %1 hours").arg(prefs->usageLimitAutoDisableHours()));
    }

    if (firstDetected.secsTo(now) >= qint64(prefs->usageLimitAutoDisableHours()) * 3600) {
        prefs->setUsageLimitFirstDetected(QDateTime());
        prefs->save();
        m_autoDisabled = true;
        log->info(QStringLiteral("Usage limit detection auto-disabled: %1 hours since first detection").arg(prefs->usageLimitAutoDisableHours()));
        Q_EMIT autoDisabledChanged(true);
        return Outcome::AutoDisabled;
    }

    if (isCooldownActive(now)) {
        const qint64 minutes = (cooldownRemainingSeconds(now) + 59) / 60;
        log->info(QStringLiteral("Usage limit detected but ignored due to cooldown (%1 minutes remaining)").arg(minutes));
        return Outcome::Cooldown;
    }

    m_context.sessions->markUsageLimitReached(sessionId);
    m_cooldownUntil = now.addSecs(qint64(prefs->usageLimitCooldownMinutes()) * 60);
    Q_EMIT usageLimitDetected(sessionId);

    // Another session, or the same banner still on screen, for the reset already waited for
    const QDateTime previousReset = prefs->usageLimitResetInstant();
    if (previousReset.isValid() && *reset == previousReset && now < previousReset) {
        log->info(QStringLiteral("Ignoring duplicate usage limit for %1 - already waiting for this reset time").arg(match.resetText));
        return Outcome::Duplicate;
    }

    if (m_context.notifier) {
        m_context.notifier->notify(Notifier::Event::UsageLimit,
                                   i18n("Usage limit reached"),
                                   i18n("Session %1 hit its usage limit (resets at %2)", sessionId, match.resetText));
    }

    prefs->setUsageLimitResetInstant(*reset);
    prefs->save();

    const qint64 lead = now.secsTo(*reset);
    log->warning(QStringLiteral("Usage limit detected on %1 - resets at %2 (%3h %4m)")
                     .arg(sessionId, match.resetText)
                     .arg(lead / 3600)
                     .arg((lead % 3600) / 60));
    Q_EMIT resetInstantResolved(*reset);
    return Outcome::Accepted;
}

bool UsageLimitTracker::isCooldownActive(const QDateTime &now) const
{
    return m_cooldownUntil.isValid() && now < m_cooldownUntil;
}

qint64 UsageLimitTracker::cooldownRemainingSeconds(const QDateTime &now) const
{
    return isCooldownActive(now) ? now.secsTo(m_cooldownUntil) : 0;
}

QDateTime UsageLimitTracker::firstDetectedAt() const
{
    return m_context.preferences->usageLimitFirstDetected();
}

QDateTime UsageLimitTracker::resetInstant() const
{
    return m_context.preferences->usageLimitResetInstant();
}

void UsageLimitTracker::resetCycle()
{
    Preferences *prefs = m_context.preferences;
    prefs->setUsageLimitFirstDetected(QDateTime());
    prefs->setUsageLimitResetInstant(QDateTime());
    prefs->save();

    m_cooldownUntil = QDateTime();
    const bool wasDisabled = m_autoDisabled;
    m_autoDisabled = false;

    m_context.log->info(QStringLiteral("Usage limit tracking reset - detection re-enabled"));
    if (wasDisabled) {
        Q_EMIT autoDisabledChanged(false);
    }
}

QJsonObject UsageLimitTracker::status(const QDateTime &now) const
{
    const Preferences *prefs = m_context.preferences;

    QJsonObject obj;
    const QDateTime first = prefs->usageLimitFirstDetected();
    obj[QStringLiteral("autoDisabled")] = m_autoDisabled;
    if (first.isValid()) {
        obj[QStringLiteral("firstDetectedAt")] = first.toString(Qt::ISODate);
        const qint64 window = qint64(prefs->usageLimitAutoDisableHours()) * 3600;
        obj[QStringLiteral("autoDisableInSeconds")] = qMax<qint64>(0, window - first.secsTo(now));
    }
    obj[QStringLiteral("cooldownRemainingSeconds")] = cooldownRemainingSeconds(now);

    const QDateTime reset = prefs->usageLimitResetInstant();
    if (reset.isValid()) {
        obj[QStringLiteral("resetInstant")] = reset.toString(Qt::ISODate);
    }
    obj[QStringLiteral("sessionsAwaitingContinue")] = QJsonArray::fromStringList(m_context.sessions->sessionsAwaitingContinue());
    return obj;
}

} // namespace Promptline

#include "moc_UsageLimitTracker.cpp"
