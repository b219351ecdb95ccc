/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AUTOINJECTOR_H
#define AUTOINJECTOR_H

#include "promptline_export.h"

#include "InjectionContext.h"

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QStringList>

namespace Promptline
{

class ActionLog;
class AutoContinueResponder;
class InjectionScheduler;
class Injector;
class KeywordRuleEngine;
class MessageQueue;
class Notifier;
class Preferences;
class QueueStore;
class SessionChannel;
class SessionRegistry;
class TimerService;
class UsageLimitTracker;

/**
 * AutoInjector wires the injection components together.
 *
 * It feeds session output to the detectors, routes usage-limit and prompt
 * signals, connects timer expiry to the scheduler and exposes the control
 * surface on D-Bus as org.promptline.Injector.
 *
 * Features:
 * - Queue messages per session with an optional delay
 * - Drain on timer expiry or on request
 * - Auto-continue and keyword rules for prompts
 * - Usage-limit tracking with timer sync
 */
class PROMPTLINE_EXPORT AutoInjector : public QObject
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.promptline.Injector")

public:
    /**
     * @param channel Transport into the sessions (not owned)
     * @param preferences Option set (not owned)
     * @param store Queue persistence (not owned, may be null)
     */
    AutoInjector(SessionChannel *channel, Preferences *preferences, QueueStore *store, QObject *parent = nullptr);
    ~AutoInjector() override;

    /**
     * Restore the persisted timer; an expiry that happened while we were
     * not running starts a drain right away
     */
    void restoreTimer();

    /**
     * Feed output of a session into the detectors.
     *
     * @param replaceWindow True for full-screen captures, false for stream chunks
     */
    void processOutput(const QString &sessionId, const QString &text, bool replaceWindow = false);

    /**
     * Queue a message; special commands are executed instead of queued
     *
     * @return The message id, or an empty string if nothing was queued
     */
    QString enqueueMessage(const QString &sessionId,
                           const QString &content,
                           const QDateTime &executeAt = QDateTime(),
                           const QStringList &attachments = QStringList());

    /**
     * Run /help, /debug or /usage-limit-reset
     *
     * @return false if @p content is not a special command
     */
    bool handleSpecialCommand(const QString &content);

    /**
     * Re-read tunables from the preferences
     */
    void applyPreferences();

    bool registerOnSessionBus();

    SessionRegistry *sessions() const
    {
        return m_sessions;
    }
    MessageQueue *queue() const
    {
        return m_queue;
    }
    ActionLog *actionLog() const
    {
        return m_log;
    }
    Notifier *notifier() const
    {
        return m_notifier;
    }
    KeywordRuleEngine *keywordRules() const
    {
        return m_keywordRules;
    }
    AutoContinueResponder *responder() const
    {
        return m_responder;
    }
    UsageLimitTracker *usageLimitTracker() const
    {
        return m_tracker;
    }
    TimerService *timer() const
    {
        return m_timer;
    }
    Injector *injector() const
    {
        return m_injector;
    }
    InjectionScheduler *scheduler() const
    {
        return m_scheduler;
    }

public Q_SLOTS:
    // D-Bus methods
    Q_SCRIPTABLE QString enqueue(const QString &sessionId, const QString &content, int delaySeconds);
    Q_SCRIPTABLE bool updateMessage(const QString &messageId, const QString &content);
    Q_SCRIPTABLE bool removeMessage(const QString &messageId);
    Q_SCRIPTABLE void clearQueue();
    Q_SCRIPTABLE int queueSize() const;
    Q_SCRIPTABLE void drainNow();
    Q_SCRIPTABLE void cancelInjection();
    Q_SCRIPTABLE void pauseInjection();
    Q_SCRIPTABLE void resumeInjection();
    Q_SCRIPTABLE void setTimer(int hours, int minutes, int seconds);
    Q_SCRIPTABLE bool startTimer();
    Q_SCRIPTABLE void stopTimer();
    Q_SCRIPTABLE void resetTimer();
    Q_SCRIPTABLE void armTimerSync();
    Q_SCRIPTABLE QString timerState() const;
    Q_SCRIPTABLE void setAutoContinueEnabled(bool enabled);
    Q_SCRIPTABLE bool addKeywordRule(const QString &keyword, const QString &response);
    Q_SCRIPTABLE QString keywordStatistics() const;
    Q_SCRIPTABLE QString usageLimitStatus() const;
    Q_SCRIPTABLE QString sessionStatus() const;

private:
    void logUsageLimitStatus();

    Preferences *m_preferences = nullptr;
    SessionChannel *m_channel = nullptr;

    ActionLog *m_log = nullptr;
    Notifier *m_notifier = nullptr;
    SessionRegistry *m_sessions = nullptr;
    MessageQueue *m_queue = nullptr;
    KeywordRuleEngine *m_keywordRules = nullptr;

    InjectionContext m_context;

    AutoContinueResponder *m_responder = nullptr;
    UsageLimitTracker *m_tracker = nullptr;
    TimerService *m_timer = nullptr;
    Injector *m_injector = nullptr;
    InjectionScheduler *m_scheduler = nullptr;

    int m_outputWindowChars = 5000;
    int m_detectionWindowChars = 2000;
};

} // namespace Promptline

#endif // AUTOINJECTOR_H
