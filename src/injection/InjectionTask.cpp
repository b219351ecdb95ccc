/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "InjectionTask.h"

#include "SessionChannel.h"

#include <QDebug>
#include <QRandomGenerator>
#include <QTimer>

namespace Promptline
{

InjectionTask::InjectionTask(const Message &message, SessionChannel *channel, const InjectorTimings &timings, QObject *parent)
    : QObject(parent)
    , m_message(message)
    , m_channel(channel)
    , m_timings(timings)
    , m_stepTimer(new QTimer(this))
{
    m_stepTimer->setSingleShot(true);
    connect(m_stepTimer, &QTimer::timeout, this, &InjectionTask::step);
}

InjectionTask::~InjectionTask() = default;

int InjectionTask::randomDelay(int minMs, int maxMs)
{
    if (maxMs <= minMs) {
        return qMax(0, minMs);
    }
    return minMs + QRandomGenerator::global()->bounded(maxMs - minMs + 1);
}

void InjectionTask::start()
{
    if (m_state != State::Pending) {
        return;
    }
    m_state = m_message.processedContent.isEmpty() ? State::Submitting : State::Typing;
    scheduleStep(0);
}

void InjectionTask::scheduleStep(int delayMs)
{
    if (m_paused || m_cancelled) {
        return;
    }
    m_stepTimer->start(delayMs);
}

void InjectionTask::step()
{
    if (m_cancelled) {
        finish(false);
        return;
    }

    const QString &text = m_message.processedContent;
    const QString sessionId = m_message.targetSessionId;

    switch (m_state) {
    case State::Pending:
    case State::Done:
        return;

    case State::Typing: {
        // Keep surrogate pairs together
        int length = 1;
        if (text.at(m_position).isHighSurrogate() && m_position + 1 < text.size()) {
            length = 2;
        }
        if (!m_channel->write(sessionId, text.mid(m_position, length))) {
            qWarning() << "InjectionTask: Write failed for" << m_message.id << "at position" << m_position;
            finish(false);
            return;
        }
        m_position += length;

        if (m_position >= text.size()) {
            m_state = State::Submitting;
            scheduleStep(randomDelay(m_timings.minSubmitDelayMs, m_timings.maxSubmitDelayMs));
        } else {
            scheduleStep(randomDelay(m_timings.minCharDelayMs, m_timings.maxCharDelayMs));
        }
        return;
    }

    case State::Submitting:
        if (!m_channel->submit(sessionId)) {
            qWarning() << "InjectionTask: Submit failed for" << m_message.id;
            finish(false);
            return;
        }
        m_submitted = true;
        Q_EMIT submitted();
        m_state = State::Settling;
        scheduleStep(randomDelay(m_timings.minSettleMs, m_timings.maxSettleMs));
        return;

    case State::Settling:
        finish(true);
        return;
    }
}

void InjectionTask::finish(bool success)
{
    if (m_state == State::Done) {
        return;
    }
    m_stepTimer->stop();
    m_state = State::Done;
    Q_EMIT finished(success && m_submitted);
}

void InjectionTask::cancel()
{
    if (m_state == State::Done) {
        return;
    }
    m_cancelled = true;
    finish(false);
}

void InjectionTask::pause()
{
    if (m_paused || m_state == State::Done) {
        return;
    }
    m_paused = true;
    m_stepTimer->stop();
}

void InjectionTask::resume()
{
    if (!m_paused) {
        return;
    }
    m_paused = false;
    if (m_state == State::Typing || m_state == State::Submitting || m_state == State::Settling) {
        scheduleStep(0);
    }
}

} // namespace Promptline

#include "moc_InjectionTask.cpp"
