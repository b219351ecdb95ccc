/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxSessionChannel.h"

#include <QDebug>
#include <QProcess>
#include <QStandardPaths>

namespace Promptline
{

TmuxSessionChannel::TmuxSessionChannel(QObject *parent)
    : QObject(parent)
{
}

TmuxSessionChannel::~TmuxSessionChannel() = default;

bool TmuxSessionChannel::isAvailable()
{
    const QString tmuxPath = QStandardPaths::findExecutable(QStringLiteral("tmux"));
    return !tmuxPath.isEmpty();
}

QString TmuxSessionChannel::version()
{
    QProcess process;
    process.start(QStringLiteral("tmux"), {QStringLiteral("-V")});
    if (!process.waitForFinished(5000)) {
        return QString();
    }
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

bool TmuxSessionChannel::write(const QString &sessionId, const QString &text)
{
    if (text.isEmpty()) {
        return true;
    }
    bool ok = false;
    executeCommand({QStringLiteral("send-keys"), QStringLiteral("-t"), sessionId, QStringLiteral("-l"), text}, &ok);
    return ok;
}

bool TmuxSessionChannel::submit(const QString &sessionId)
{
    // A literal \r through -l lands in the input field as a newline;
    // only the Enter key name submits
    return sendKey(sessionId, QStringLiteral("Enter"));
}

bool TmuxSessionChannel::sendKey(const QString &sessionId, const QString &keyName)
{
    bool ok = false;
    executeCommand({QStringLiteral("send-keys"), QStringLiteral("-t"), sessionId, keyName}, &ok);
    return ok;
}

QStringList TmuxSessionChannel::listSessions() const
{
    bool ok = false;
    const QString output = executeCommand({QStringLiteral("list-sessions"), QStringLiteral("-F"), QStringLiteral("#{session_name}")}, &ok);
    if (!ok) {
        return {};
    }
    return output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
}

bool TmuxSessionChannel::sessionExists(const QString &sessionId) const
{
    bool ok = false;
    executeCommand({QStringLiteral("has-session"), QStringLiteral("-t"), sessionId}, &ok);
    return ok;
}

void TmuxSessionChannel::sessionExistsAsync(const QString &sessionId, std::function<void(bool)> callback)
{
    executeCommandAsync({QStringLiteral("has-session"), QStringLiteral("-t"), sessionId}, [callback](bool ok, const QString &) {
        if (callback) {
            callback(ok);
        }
    });
}

void TmuxSessionChannel::capturePaneAsync(const QString &sessionId, std::function<void(bool, const QString &)> callback)
{
    executeCommandAsync({QStringLiteral("capture-pane"), QStringLiteral("-t"), sessionId, QStringLiteral("-p")}, callback);
}

QString TmuxSessionChannel::executeCommand(const QStringList &args, bool *ok) const
{
    QProcess process;
    process.start(QStringLiteral("tmux"), args);

    if (!process.waitForFinished(10000)) {
        qWarning() << "TmuxSessionChannel: tmux" << args.value(0) << "timed out";
        if (ok) {
            *ok = false;
        }
        return QString();
    }

    const bool success = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    if (ok) {
        *ok = success;
    }

    if (!success) {
        const QString errorOutput = QString::fromUtf8(process.readAllStandardError());
        if (!errorOutput.isEmpty()) {
            Q_EMIT const_cast<TmuxSessionChannel *>(this)->errorOccurred(errorOutput);
        }
    }

    return QString::fromUtf8(process.readAllStandardOutput());
}

void TmuxSessionChannel::executeCommandAsync(const QStringList &args, std::function<void(bool, const QString &)> callback)
{
    auto *process = new QProcess(this);
    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [this, process, callback](int exitCode, QProcess::ExitStatus status) {
        const bool ok = (status == QProcess::NormalExit && exitCode == 0);
        const QString output = QString::fromUtf8(process->readAllStandardOutput());
        if (!ok) {
            const QString errorOutput = QString::fromUtf8(process->readAllStandardError());
            if (!errorOutput.isEmpty()) {
                Q_EMIT errorOccurred(errorOutput);
            }
        }
        if (callback) {
            callback(ok, output);
        }
        process->deleteLater();
    });
    connect(process, &QProcess::errorOccurred, this, [this, process, callback](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        Q_EMIT errorOccurred(QStringLiteral("tmux failed to start"));
        if (callback) {
            callback(false, QString());
        }
        process->deleteLater();
    });
    process->start(QStringLiteral("tmux"), args);
}

} // namespace Promptline

#include "moc_TmuxSessionChannel.cpp"
