/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NOTIFIER_H
#define NOTIFIER_H

#include "promptline_export.h"

#include <QObject>
#include <QString>

namespace Promptline
{

/**
 * Notifier shows desktop notifications for injector events.
 *
 * Notifications are best effort: a missing notification daemon never
 * affects the caller.
 */
class PROMPTLINE_EXPORT Notifier : public QObject
{
    Q_OBJECT

public:
    enum class Event {
        TimerExpired,
        UsageLimit,
        DrainComplete,
        Error
    };
    Q_ENUM(Event)

    explicit Notifier(QObject *parent = nullptr);
    ~Notifier() override;

    bool isEnabled() const
    {
        return m_enabled;
    }
    void setEnabled(bool enabled)
    {
        m_enabled = enabled;
    }

    void notify(Event event, const QString &title, const QString &body);

Q_SIGNALS:
    /**
     * Emitted for every notification request, shown or not
     */
    void notified(const QString &title, const QString &body);

private:
    static QString eventName(Event event);
    static QString iconName(Event event);

    bool m_enabled = true;
};

} // namespace Promptline

#endif // NOTIFIER_H
