/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INJECTOR_H
#define INJECTOR_H

#include "promptline_export.h"

#include "InjectionContext.h"
#include "InjectionTask.h"

#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>

namespace Promptline
{

/**
 * Injector types messages into sessions.
 *
 * A session is marked Injecting for the whole lifetime of its task and
 * returned to Neutral when the task finishes, fails or is cancelled.
 */
class PROMPTLINE_EXPORT Injector : public QObject
{
    Q_OBJECT

public:
    explicit Injector(const InjectionContext &context, QObject *parent = nullptr);
    ~Injector() override;

    void setTimings(const InjectorTimings &timings)
    {
        m_timings = timings;
    }
    const InjectorTimings &timings() const
    {
        return m_timings;
    }

    /**
     * Start typing @p message into its target session.
     *
     * Fails if another writer already owns the session.
     */
    bool inject(const Message &message);

    bool isInjecting(const QString &sessionId) const
    {
        return m_tasks.contains(sessionId);
    }
    int activeCount() const
    {
        return m_tasks.size();
    }

    bool isPaused() const
    {
        return m_paused;
    }

    /**
     * Abort every running task; bytes already written stay written
     */
    void cancelAll();

    void pause();
    void resume();

Q_SIGNALS:
    void injectionStarted(const QString &messageId, const QString &sessionId);
    void injectionFinished(const QString &messageId, const QString &sessionId, bool success);

private:
    void onTaskFinished(InjectionTask *task, bool success);

    InjectionContext m_context;
    InjectorTimings m_timings;
    QHash<QString, QPointer<InjectionTask>> m_tasks; // by session id
    bool m_paused = false;
};

} // namespace Promptline

#endif // INJECTOR_H
