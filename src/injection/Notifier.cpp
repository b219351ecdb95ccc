/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Notifier.h"

#include <KNotification>

#include <QDebug>

namespace Promptline
{

Notifier::Notifier(QObject *parent)
    : QObject(parent)
{
}

Notifier::~Notifier() = default;

void Notifier::notify(Event event, const QString &title, const QString &body)
{
    Q_EMIT notified(title, body);

    if (!m_enabled) {
        return;
    }

    qDebug() << "Notifier:" << title << "-" << body;

    KNotification *notification = new KNotification(eventName(event), KNotification::CloseOnTimeout);
    notification->setTitle(title);
    notification->setText(body);
    notification->setIconName(iconName(event));
    notification->setComponentName(QStringLiteral("promptline"));
    notification->sendEvent();
}

QString Notifier::eventName(Event event)
{
    switch (event) {
    case Event::TimerExpired:
        return QStringLiteral("timerExpired");
    case Event::UsageLimit:
        return QStringLiteral("usageLimit");
    case Event::DrainComplete:
        return QStringLiteral("drainComplete");
    case Event::Error:
        return QStringLiteral("error");
    }
    return QStringLiteral("info");
}

QString Notifier::iconName(Event event)
{
    switch (event) {
    case Event::TimerExpired:
        return QStringLiteral("chronometer");
    case Event::UsageLimit:
        return QStringLiteral("dialog-warning");
    case Event::DrainComplete:
        return QStringLiteral("dialog-ok");
    case Event::Error:
        return QStringLiteral("dialog-error");
    }
    return QStringLiteral("dialog-information");
}

} // namespace Promptline

#include "moc_Notifier.cpp"
