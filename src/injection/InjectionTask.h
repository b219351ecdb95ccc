/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INJECTIONTASK_H
#define INJECTIONTASK_H

#include "promptline_export.h"

#include "Message.h"

#include <QObject>
#include <QString>

class QTimer;

namespace Promptline
{

class SessionChannel;

/**
 * Pacing of a typing task, in milliseconds (inclusive ranges)
 */
struct PROMPTLINE_EXPORT InjectorTimings {
    int minCharDelayMs = 30;
    int maxCharDelayMs = 80;
    int minSubmitDelayMs = 150;
    int maxSubmitDelayMs = 300;
    int minSettleMs = 500;
    int maxSettleMs = 800;
};

/**
 * InjectionTask types one message into one session.
 *
 * It is a small state machine driven by a single-shot timer:
 * Typing(index) -> Submitting -> Settling -> Done. cancel() is checked
 * before every step, so no byte is written after cancellation.
 */
class PROMPTLINE_EXPORT InjectionTask : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Pending,
        Typing,
        Submitting,
        Settling,
        Done
    };
    Q_ENUM(State)

    InjectionTask(const Message &message, SessionChannel *channel, const InjectorTimings &timings, QObject *parent = nullptr);
    ~InjectionTask() override;

    const Message &message() const
    {
        return m_message;
    }
    State state() const
    {
        return m_state;
    }

    /**
     * Index of the next character to type
     */
    int position() const
    {
        return m_position;
    }

    bool isCancelled() const
    {
        return m_cancelled;
    }
    bool isPaused() const
    {
        return m_paused;
    }

    void start();

    /**
     * Stop before the next step; finished(false) is emitted once
     */
    void cancel();

    void pause();
    void resume();

    static int randomDelay(int minMs, int maxMs);

Q_SIGNALS:
    /**
     * The submit key was sent; the message counts as delivered
     */
    void submitted();

    /**
     * Emitted once when the task reaches Done
     */
    void finished(bool success);

private:
    void step();
    void scheduleStep(int delayMs);
    void finish(bool success);

    Message m_message;
    SessionChannel *m_channel = nullptr;
    InjectorTimings m_timings;
    QTimer *m_stepTimer = nullptr;

    State m_state = State::Pending;
    int m_position = 0;
    bool m_cancelled = false;
    bool m_paused = false;
    bool m_submitted = false;
};

} // namespace Promptline

#endif // INJECTIONTASK_H
