/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionMonitor.h"

#include "TmuxSessionChannel.h"

#include <QDebug>
#include <QPointer>
#include <QTimer>

namespace Promptline
{

SessionMonitor::SessionMonitor(TmuxSessionChannel *channel, QObject *parent)
    : QObject(parent)
    , m_channel(channel)
    , m_pollTimer(new QTimer(this))
{
    m_pollTimer->setInterval(500);
    connect(m_pollTimer, &QTimer::timeout, this, &SessionMonitor::poll);
}

SessionMonitor::~SessionMonitor() = default;

void SessionMonitor::addSession(const QString &sessionId)
{
    if (sessionId.isEmpty() || m_sessions.contains(sessionId)) {
        return;
    }
    m_sessions.insert(sessionId);
    qDebug() << "SessionMonitor: Watching" << sessionId;
}

void SessionMonitor::removeSession(const QString &sessionId)
{
    m_sessions.remove(sessionId);
    m_inFlight.remove(sessionId);
}

QStringList SessionMonitor::sessions() const
{
    QStringList ids = m_sessions.values();
    ids.sort();
    return ids;
}

void SessionMonitor::setPollInterval(int ms)
{
    m_pollTimer->setInterval(qMax(50, ms));
}

int SessionMonitor::pollInterval() const
{
    return m_pollTimer->interval();
}

void SessionMonitor::start()
{
    m_pollTimer->start();
    poll();
}

void SessionMonitor::stop()
{
    m_pollTimer->stop();
}

bool SessionMonitor::isRunning() const
{
    return m_pollTimer->isActive();
}

void SessionMonitor::poll()
{
    QPointer<SessionMonitor> guard(this);

    const QStringList ids = sessions();
    for (const QString &sessionId : ids) {
        if (m_inFlight.contains(sessionId)) {
            continue;
        }
        m_inFlight.insert(sessionId);

        m_channel->capturePaneAsync(sessionId, [this, guard, sessionId](bool ok, const QString &output) {
            if (!guard) {
                return;
            }
            m_inFlight.remove(sessionId);
            if (!m_sessions.contains(sessionId)) {
                return;
            }

            if (ok) {
                Q_EMIT outputCaptured(sessionId, output);
                return;
            }

            m_channel->sessionExistsAsync(sessionId, [this, guard, sessionId](bool exists) {
                if (!guard || exists || !m_sessions.contains(sessionId)) {
                    return;
                }
                qDebug() << "SessionMonitor: Session" << sessionId << "is gone";
                removeSession(sessionId);
                Q_EMIT sessionClosed(sessionId);
            });
        });
    }
}

} // namespace Promptline

#include "moc_SessionMonitor.cpp"
