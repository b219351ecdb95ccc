/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AutoInjector.h"

#include "ActionLog.h"
#include "AutoContinueResponder.h"
#include "InjectionScheduler.h"
#include "Injector.h"
#include "KeywordRuleEngine.h"
#include "MessageQueue.h"
#include "Notifier.h"
#include "Preferences.h"
#include "SessionRegistry.h"
#include "TimerService.h"
#include "UsageLimitTracker.h"

#include <QDBusConnection>
#include <QDBusError>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace Promptline
{

AutoInjector::AutoInjector(SessionChannel *channel, Preferences *preferences, QueueStore *store, QObject *parent)
    : QObject(parent)
    , m_preferences(preferences)
    , m_channel(channel)
    , m_log(new ActionLog(this))
    , m_notifier(new Notifier(this))
    , m_sessions(new SessionRegistry(this))
    , m_queue(new MessageQueue(store, this))
    , m_keywordRules(new KeywordRuleEngine(this))
{
    m_context.sessions = m_sessions;
    m_context.queue = m_queue;
    m_context.channel = m_channel;
    m_context.log = m_log;
    m_context.preferences = m_preferences;
    m_context.notifier = m_notifier;

    m_responder = new AutoContinueResponder(m_context, m_keywordRules, this);
    m_tracker = new UsageLimitTracker(m_context, this);
    m_timer = new TimerService(m_preferences, m_log, this);
    m_injector = new Injector(m_context, this);
    m_scheduler = new InjectionScheduler(m_context, m_injector, this);

    m_queue->load();
    m_keywordRules->setRules(m_preferences->keywordRules());
    applyPreferences();

    connect(m_tracker, &UsageLimitTracker::resetInstantResolved, this, [this](const QDateTime &resetInstant) {
        m_timer->syncToResetInstant(resetInstant);
    });

    connect(m_timer, &TimerService::expired, m_scheduler, &InjectionScheduler::onTimerExpired);
    connect(m_timer, &TimerService::stateChanged, this, [this](TimerService::State state) {
        if (state == TimerService::State::Idle) {
            m_scheduler->stopDrain();
        }
    });

    connect(m_keywordRules, &KeywordRuleEngine::rulesChanged, this, [this]() {
        m_preferences->setKeywordRules(m_keywordRules->rules());
        m_preferences->save();
    });
}

AutoInjector::~AutoInjector() = default;

void AutoInjector::applyPreferences()
{
    m_responder->setAutoContinueEnabled(m_preferences->autoContinueEnabled());
    m_notifier->setEnabled(m_preferences->showNotifications());

    SchedulerTimings timings = m_scheduler->timings();
    timings.safetyCheckIntervalMs = m_preferences->safetyCheckIntervalMs();
    timings.maxSafetyCheckAttempts = m_preferences->maxSafetyCheckAttempts();
    timings.readyStableMs = m_preferences->readyStableMs();
    m_scheduler->setTimings(timings);

    m_outputWindowChars = m_preferences->outputWindowChars();
    m_detectionWindowChars = m_preferences->detectionWindowChars();
}

void AutoInjector::restoreTimer()
{
    m_timer->reset();
}

void AutoInjector::processOutput(const QString &sessionId, const QString &text, bool replaceWindow)
{
    if (sessionId.isEmpty()) {
        return;
    }

    const SignalReport report = replaceWindow ? m_sessions->replaceOutput(sessionId, text, m_outputWindowChars, m_detectionWindowChars)
                                              : m_sessions->appendOutput(sessionId, text, m_outputWindowChars, m_detectionWindowChars);

    if (report.usageLimit) {
        m_tracker->handleDetection(sessionId, *report.usageLimit);
    }
    if (report.promptArea) {
        m_responder->handlePromptArea(sessionId, *report.promptArea);
    }
}

QString AutoInjector::enqueueMessage(const QString &sessionId, const QString &content, const QDateTime &executeAt, const QStringList &attachments)
{
    if (handleSpecialCommand(content)) {
        return QString();
    }

    const QString id = m_queue->enqueue(sessionId, content, executeAt, attachments);
    if (id.isEmpty()) {
        m_log->warning(QStringLiteral("Message for %1 was not queued").arg(sessionId));
        return id;
    }

    m_log->info(QStringLiteral("Queued message %1 for %2").arg(id, sessionId));
    return id;
}

bool AutoInjector::handleSpecialCommand(const QString &content)
{
    const QString command = content.trimmed().toLower();

    if (command == QLatin1String("/help")) {
        m_log->info(QStringLiteral("Available commands: /help (this list), /debug (usage limit status), "
                                   "/usage-limit-reset (restart usage limit detection)"));
        return true;
    }
    if (command == QLatin1String("/debug")) {
        logUsageLimitStatus();
        return true;
    }
    if (command == QLatin1String("/usage-limit-reset")) {
        m_tracker->resetCycle();
        return true;
    }
    return false;
}

void AutoInjector::logUsageLimitStatus()
{
    const QDateTime now = QDateTime::currentDateTime();
    const QDateTime first = m_tracker->firstDetectedAt();

    if (!first.isValid()) {
        m_log->info(QStringLiteral("Usage limit: no detection in this cycle%1")
                        .arg(m_tracker->isAutoDisabled() ? QStringLiteral(" (detection auto-disabled)") : QString()));
    } else {
        const qint64 window = qint64(m_preferences->usageLimitAutoDisableHours()) * 3600;
        const qint64 remaining = qMax<qint64>(0, window - first.secsTo(now));
        m_log->info(QStringLiteral("Usage limit first detected at %1, auto-disable in %2h %3m")
                        .arg(first.toString(Qt::ISODate))
                        .arg(remaining / 3600)
                        .arg((remaining % 3600) / 60));
    }

    m_log->info(QStringLiteral("Usage limit cooldown: %1 minutes remaining").arg((m_tracker->cooldownRemainingSeconds(now) + 59) / 60));

    const QStringList awaiting = m_sessions->sessionsAwaitingContinue();
    m_log->info(QStringLiteral("Sessions awaiting continue: %1")
                    .arg(awaiting.isEmpty() ? QStringLiteral("none") : awaiting.join(QStringLiteral(", "))));
}

bool AutoInjector::registerOnSessionBus()
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qWarning() << "AutoInjector: No session bus";
        return false;
    }
    if (!bus.registerService(QStringLiteral("org.promptline.Injector"))) {
        qWarning() << "AutoInjector: Could not register service:" << bus.lastError().message();
        return false;
    }
    if (!bus.registerObject(QStringLiteral("/Injector"), this, QDBusConnection::ExportScriptableSlots)) {
        qWarning() << "AutoInjector: Could not register /Injector";
        return false;
    }
    return true;
}

// D-Bus methods
QString AutoInjector::enqueue(const QString &sessionId, const QString &content, int delaySeconds)
{
    const QDateTime executeAt = QDateTime::currentDateTime().addSecs(qMax(0, delaySeconds));
    return enqueueMessage(sessionId, content, executeAt);
}

bool AutoInjector::updateMessage(const QString &messageId, const QString &content)
{
    return m_queue->update(messageId, content);
}

bool AutoInjector::removeMessage(const QString &messageId)
{
    const bool removed = m_queue->remove(messageId);
    if (removed) {
        m_log->info(QStringLiteral("Removed message %1").arg(messageId));
    }
    return removed;
}

void AutoInjector::clearQueue()
{
    const int count = m_queue->size();
    m_queue->clear();
    m_log->info(QStringLiteral("Cleared %1 queued message(s)").arg(count));
}

int AutoInjector::queueSize() const
{
    return m_queue->size();
}

void AutoInjector::drainNow()
{
    m_scheduler->startDrain();
}

void AutoInjector::cancelInjection()
{
    m_responder->cancelAll();
    m_scheduler->cancel();
}

void AutoInjector::pauseInjection()
{
    m_scheduler->pause();
}

void AutoInjector::resumeInjection()
{
    m_scheduler->resume();
}

void AutoInjector::setTimer(int hours, int minutes, int seconds)
{
    m_timer->setTimer(hours, minutes, seconds);
}

bool AutoInjector::startTimer()
{
    return m_timer->start();
}

void AutoInjector::stopTimer()
{
    m_timer->stop();
}

void AutoInjector::resetTimer()
{
    m_timer->reset();
}

void AutoInjector::armTimerSync()
{
    m_timer->armAutoSync();
}

QString AutoInjector::timerState() const
{
    return QString::fromUtf8(QJsonDocument(m_timer->toJson()).toJson(QJsonDocument::Compact));
}

void AutoInjector::setAutoContinueEnabled(bool enabled)
{
    m_responder->setAutoContinueEnabled(enabled);
    m_preferences->setAutoContinueEnabled(enabled);
    m_preferences->save();
}

bool AutoInjector::addKeywordRule(const QString &keyword, const QString &response)
{
    return m_keywordRules->addRule(keyword, response);
}

QString AutoInjector::keywordStatistics() const
{
    const KeywordRuleStats stats = m_keywordRules->statistics();

    QJsonObject obj;
    obj[QStringLiteral("totalRules")] = stats.totalRules;
    obj[QStringLiteral("totalTriggers")] = stats.totalTriggers;
    obj[QStringLiteral("rulesWithResponse")] = stats.rulesWithResponse;
    obj[QStringLiteral("rulesEscapeOnly")] = stats.rulesEscapeOnly;
    obj[QStringLiteral("mostTriggeredKeyword")] = stats.mostTriggeredKeyword;
    obj[QStringLiteral("mostTriggeredCount")] = stats.mostTriggeredCount;
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString AutoInjector::usageLimitStatus() const
{
    return QString::fromUtf8(QJsonDocument(m_tracker->status()).toJson(QJsonDocument::Compact));
}

QString AutoInjector::sessionStatus() const
{
    QJsonArray sessions;
    const QStringList ids = m_sessions->sessionIds();
    for (const QString &id : ids) {
        if (const SessionState *state = m_sessions->session(id)) {
            sessions.append(state->toJson());
        }
    }
    return QString::fromUtf8(QJsonDocument(sessions).toJson(QJsonDocument::Compact));
}

} // namespace Promptline

#include "moc_AutoInjector.cpp"
