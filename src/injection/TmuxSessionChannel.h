/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXSESSIONCHANNEL_H
#define TMUXSESSIONCHANNEL_H

#include "promptline_export.h"

#include "SessionChannel.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace Promptline
{

/**
 * TmuxSessionChannel talks to sessions running inside tmux.
 *
 * The session id is the tmux target (session name, optionally with
 * ":window.pane"). Text goes through "send-keys -l" so that it is never
 * interpreted as key names; Enter and Escape are sent as key names.
 */
class PROMPTLINE_EXPORT TmuxSessionChannel : public QObject, public SessionChannel
{
    Q_OBJECT

public:
    explicit TmuxSessionChannel(QObject *parent = nullptr);
    ~TmuxSessionChannel() override;

    /**
     * Check if tmux is available on the system
     */
    static bool isAvailable();

    /**
     * Get tmux version string
     */
    static QString version();

    bool write(const QString &sessionId, const QString &text) override;
    bool submit(const QString &sessionId) override;
    bool sendKey(const QString &sessionId, const QString &keyName) override;

    /**
     * Names of all running tmux sessions
     */
    QStringList listSessions() const;

    bool sessionExists(const QString &sessionId) const;
    void sessionExistsAsync(const QString &sessionId, std::function<void(bool)> callback);

    /**
     * Capture the visible pane asynchronously
     */
    void capturePaneAsync(const QString &sessionId, std::function<void(bool, const QString &)> callback);

Q_SIGNALS:
    /**
     * Emitted when a tmux command fails with output on stderr
     */
    void errorOccurred(const QString &message);

private:
    QString executeCommand(const QStringList &args, bool *ok = nullptr) const;
    void executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback);
};

} // namespace Promptline

#endif // TMUXSESSIONCHANNEL_H
