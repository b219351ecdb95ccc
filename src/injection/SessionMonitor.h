/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMONITOR_H
#define SESSIONMONITOR_H

#include "promptline_export.h"

#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

class QTimer;

namespace Promptline
{

class TmuxSessionChannel;

/**
 * SessionMonitor periodically captures the pane of every managed session.
 *
 * A session whose previous capture has not returned yet is skipped.
 * When a capture fails and the tmux session is gone, sessionClosed()
 * is emitted and the session is dropped from the watch list.
 */
class PROMPTLINE_EXPORT SessionMonitor : public QObject
{
    Q_OBJECT

public:
    explicit SessionMonitor(TmuxSessionChannel *channel, QObject *parent = nullptr);
    ~SessionMonitor() override;

    void addSession(const QString &sessionId);
    void removeSession(const QString &sessionId);
    QStringList sessions() const;

    void setPollInterval(int ms);
    int pollInterval() const;

    void start();
    void stop();
    bool isRunning() const;

    /**
     * Capture every session once
     */
    void poll();

Q_SIGNALS:
    void outputCaptured(const QString &sessionId, const QString &text);
    void sessionClosed(const QString &sessionId);

private:
    TmuxSessionChannel *m_channel = nullptr;
    QTimer *m_pollTimer = nullptr;
    QSet<QString> m_sessions;
    QSet<QString> m_inFlight;
};

} // namespace Promptline

#endif // SESSIONMONITOR_H
