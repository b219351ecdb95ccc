/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef USAGELIMITTRACKER_H
#define USAGELIMITTRACKER_H

#include "promptline_export.h"

#include "InjectionContext.h"
#include "SessionSignalDetector.h"

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include <optional>

namespace Promptline
{

/**
 * UsageLimitTracker reacts to "usage limit reached" banners.
 *
 * It records which sessions need a "continue" once the limit lifts,
 * resolves the printed reset hour into an absolute instant and guards
 * against stale banners with a cooldown and an auto-disable window that
 * starts at the first detection of a cycle.
 */
class PROMPTLINE_EXPORT UsageLimitTracker : public QObject
{
    Q_OBJECT

public:
    enum class Outcome {
        Accepted,    // Session marked and reset instant resolved
        Duplicate,   // Session marked, reset instant already being waited for
        Stale,       // Reset instant too close or too far, nothing changed
        Cooldown,    // Suppressed by the cooldown window
        AutoDisabled // Detection switched off for this cycle
    };
    Q_ENUM(Outcome)

    explicit UsageLimitTracker(const InjectionContext &context, QObject *parent = nullptr);
    ~UsageLimitTracker() override;

    /**
     * Handle a usage-limit match seen in @p sessionId's output
     */
    Outcome handleDetection(const QString &sessionId, const UsageLimitMatch &match, const QDateTime &now = QDateTime::currentDateTime());

    /**
     * Next occurrence of hour:00 (12-hour clock) strictly after @p now
     */
    static QDateTime nextOccurrence(int hour, bool pm, const QDateTime &now);

    /**
     * Resolve a reset instant, rejecting ones that are too close or too far.
     *
     * @param minLeadSeconds Instants closer than this belong to a limit that already lifted
     * @param maxLeadHours Instants further away than this are ignored
     */
    static std::optional<QDateTime>
    resolveResetInstant(const UsageLimitMatch &match, const QDateTime &now, int minLeadSeconds, int maxLeadHours);

    bool isAutoDisabled() const
    {
        return m_autoDisabled;
    }

    bool isCooldownActive(const QDateTime &now = QDateTime::currentDateTime()) const;
    qint64 cooldownRemainingSeconds(const QDateTime &now = QDateTime::currentDateTime()) const;

    QDateTime firstDetectedAt() const;
    QDateTime cooldownUntil() const
    {
        return m_cooldownUntil;
    }
    QDateTime resetInstant() const;

    /**
     * Start a fresh detection cycle (clears first detection, cooldown and auto-disable)
     */
    void resetCycle();

    /**
     * Snapshot for status displays
     */
    QJsonObject status(const QDateTime &now = QDateTime::currentDateTime()) const;

Q_SIGNALS:
    /**
     * A session hit the usage limit (after all suppression checks)
     */
    void usageLimitDetected(const QString &sessionId);

    /**
     * A usable reset instant was resolved; the timer may sync to it
     */
    void resetInstantResolved(const QDateTime &resetInstant);

    void autoDisabledChanged(bool disabled);

private:
    InjectionContext m_context;
    QDateTime m_cooldownUntil;
    bool m_autoDisabled = false;
};

} // namespace Promptline

#endif // USAGELIMITTRACKER_H
