/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Injector.h"

#include "ActionLog.h"
#include "MessageQueue.h"
#include "Notifier.h"
#include "SessionRegistry.h"

#include <KLocalizedString>

#include <QDebug>

namespace Promptline
{

Injector::Injector(const InjectionContext &context, QObject *parent)
    : QObject(parent)
    , m_context(context)
{
}

Injector::~Injector() = default;

bool Injector::inject(const Message &message)
{
    const QString sessionId = message.targetSessionId;

    if (m_tasks.contains(sessionId) || !m_context.sessions->tryEnterPhase(sessionId, SessionState::Phase::Injecting)) {
        qWarning() << "Injector: Session" << sessionId << "is busy, refusing" << message.id;
        return false;
    }

    auto *task = new InjectionTask(message, m_context.channel, m_timings, this);
    m_tasks.insert(sessionId, task);

    connect(task, &InjectionTask::submitted, this, [this, task]() {
        m_context.queue->recordHistory(task->message());
    });
    connect(task, &InjectionTask::finished, this, [this, task](bool success) {
        onTaskFinished(task, success);
    });

    m_context.log->info(QStringLiteral("Injecting message to %1: \"%2\"").arg(sessionId, message.content.left(60)));
    Q_EMIT injectionStarted(message.id, sessionId);

    if (m_paused) {
        task->pause();
    }
    task->start();
    return true;
}

void Injector::onTaskFinished(InjectionTask *task, bool success)
{
    const Message &message = task->message();
    const QString sessionId = message.targetSessionId;
    const QString messageId = message.id;

    if (success) {
        m_context.log->success(QStringLiteral("Injected message %1 into %2").arg(messageId, sessionId));
    } else if (task->isCancelled()) {
        m_context.log->warning(QStringLiteral("Injection of %1 into %2 cancelled").arg(messageId, sessionId));
    } else {
        m_context.log->error(QStringLiteral("Injection of %1 into %2 failed - message consumed").arg(messageId, sessionId));
        if (m_context.notifier) {
            m_context.notifier->notify(Notifier::Event::Error, i18n("Injection failed"), i18n("Could not write message %1 to session %2", messageId, sessionId));
        }
    }

    if (m_tasks.value(sessionId) == task) {
        m_tasks.remove(sessionId);
    }
    m_context.sessions->leavePhase(sessionId, SessionState::Phase::Injecting);
    task->deleteLater();

    Q_EMIT injectionFinished(messageId, sessionId, success);
}

void Injector::cancelAll()
{
    const QList<QPointer<InjectionTask>> tasks = m_tasks.values();
    for (const QPointer<InjectionTask> &task : tasks) {
        if (task) {
            task->cancel();
        }
    }
    m_tasks.clear();
}

void Injector::pause()
{
    if (m_paused) {
        return;
    }
    m_paused = true;
    for (const QPointer<InjectionTask> &task : std::as_const(m_tasks)) {
        if (task) {
            task->pause();
        }
    }
    m_context.log->info(QStringLiteral("Injection paused"));
}

void Injector::resume()
{
    if (!m_paused) {
        return;
    }
    m_paused = false;
    for (const QPointer<InjectionTask> &task : std::as_const(m_tasks)) {
        if (task) {
            task->resume();
        }
    }
    m_context.log->info(QStringLiteral("Injection resumed"));
}

} // namespace Promptline

#include "moc_Injector.cpp"
