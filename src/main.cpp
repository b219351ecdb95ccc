/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "injection/ActionLog.h"
#include "injection/AutoInjector.h"
#include "injection/Preferences.h"
#include "injection/QueueStore.h"
#include "injection/SessionMonitor.h"
#include "injection/SessionRegistry.h"
#include "injection/TmuxSessionChannel.h"

#include <KLocalizedString>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>

using namespace Promptline;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("promptlined"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("promptline.org"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("promptline");

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Queue messages for terminal sessions and type them in when the sessions are ready"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption sessionOption(QStringLiteral("session"), i18n("tmux session to manage (repeatable)"), QStringLiteral("name"));
    QCommandLineOption pollOption(QStringLiteral("poll-interval"), i18n("Pane capture interval in milliseconds"), QStringLiteral("ms"));
    QCommandLineOption configOption(QStringLiteral("config"), i18n("Configuration file name"), QStringLiteral("file"), QStringLiteral("promptlinerc"));
    parser.addOption(sessionOption);
    parser.addOption(pollOption);
    parser.addOption(configOption);
    parser.process(app);

    if (!TmuxSessionChannel::isAvailable()) {
        qCritical() << "promptlined: tmux was not found in PATH";
        return 1;
    }
    qDebug() << "promptlined: Using" << TmuxSessionChannel::version();

    Preferences preferences(parser.value(configOption));
    if (parser.isSet(pollOption)) {
        bool ok = false;
        const int interval = parser.value(pollOption).toInt(&ok);
        if (!ok || interval <= 0) {
            qCritical() << "promptlined: Invalid --poll-interval" << parser.value(pollOption);
            return 1;
        }
        preferences.setPollIntervalMs(interval);
    }

    JsonQueueStore store;
    TmuxSessionChannel channel;
    AutoInjector injector(&channel, &preferences, &store);

    SessionMonitor monitor(&channel);
    monitor.setPollInterval(preferences.pollIntervalMs());

    QObject::connect(&monitor, &SessionMonitor::outputCaptured, &injector, [&injector](const QString &sessionId, const QString &text) {
        injector.processOutput(sessionId, text, true);
    });
    QObject::connect(&monitor, &SessionMonitor::sessionClosed, &injector, [&injector](const QString &sessionId) {
        injector.sessions()->removeSession(sessionId);
        injector.actionLog()->warning(QStringLiteral("Session %1 closed").arg(sessionId));
    });

    const QStringList sessions = parser.values(sessionOption);
    if (sessions.isEmpty()) {
        qWarning() << "promptlined: No --session given; nothing will be monitored";
    }
    for (const QString &session : sessions) {
        if (!channel.sessionExists(session)) {
            qWarning() << "promptlined: tmux session" << session << "does not exist yet";
        }
        monitor.addSession(session);
    }

    if (!injector.registerOnSessionBus()) {
        qWarning() << "promptlined: Continuing without D-Bus control surface";
    }

    injector.restoreTimer();
    monitor.start();

    return app.exec();
}
