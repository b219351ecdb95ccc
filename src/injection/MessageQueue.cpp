/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "MessageQueue.h"

#include "QueueStore.h"

#include <QDebug>
#include <QSet>

namespace Promptline
{

MessageQueue::MessageQueue(QueueStore *store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
}

MessageQueue::~MessageQueue() = default;

QString MessageQueue::generateId()
{
    return QStringLiteral("msg_%1_%2").arg(++m_idCounter).arg(QDateTime::currentMSecsSinceEpoch());
}

int MessageQueue::indexOf(const QString &id) const
{
    for (int i = 0; i < m_messages.size(); ++i) {
        if (m_messages[i].id == id) {
            return i;
        }
    }
    return -1;
}

QString MessageQueue::enqueue(const QString &sessionId,
                              const QString &content,
                              const QDateTime &executeAt,
                              const QStringList &attachments,
                              bool isAutoContinue)
{
    if (sessionId.isEmpty()) {
        qWarning() << "MessageQueue: Refusing message without target session";
        return QString();
    }
    if (content.trimmed().isEmpty() && attachments.isEmpty()) {
        qWarning() << "MessageQueue: Refusing empty message for session" << sessionId;
        return QString();
    }

    const QDateTime now = QDateTime::currentDateTime();

    Message message;
    message.id = generateId();
    message.content = content;
    message.attachments = attachments;
    message.processedContent = Message::buildProcessedContent(content, attachments);
    message.targetSessionId = sessionId;
    message.createdAt = now;
    message.executeAt = executeAt.isValid() ? executeAt : now;
    message.sequence = ++m_sequenceCounter;
    message.isAutoContinue = isAutoContinue;

    m_messages.append(message);

    Q_EMIT messageAdded(message.id);
    Q_EMIT sizeChanged(m_messages.size());
    persist();
    return message.id;
}

bool MessageQueue::remove(const QString &id)
{
    return take(id).has_value();
}

std::optional<Message> MessageQueue::take(const QString &id)
{
    const int index = indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }

    Message message = m_messages.takeAt(index);
    Q_EMIT messageRemoved(id);
    Q_EMIT sizeChanged(m_messages.size());
    persist();
    return message;
}

bool MessageQueue::update(const QString &id, const QString &content)
{
    const int index = indexOf(id);
    if (index < 0) {
        qWarning() << "MessageQueue: Cannot update unknown message" << id;
        return false;
    }
    if (content.trimmed().isEmpty()) {
        qWarning() << "MessageQueue: Refusing to clear content of" << id;
        return false;
    }

    Message &message = m_messages[index];
    message.content = content;
    message.processedContent = Message::buildProcessedContent(content, message.attachments);
    persist();
    return true;
}

bool MessageQueue::updateExecuteAt(const QString &id, const QDateTime &executeAt)
{
    const int index = indexOf(id);
    if (index < 0 || !executeAt.isValid()) {
        qWarning() << "MessageQueue: Cannot reschedule message" << id;
        return false;
    }

    m_messages[index].executeAt = executeAt;
    persist();
    return true;
}

void MessageQueue::clear()
{
    if (m_messages.isEmpty()) {
        return;
    }

    const QVector<Message> removed = m_messages;
    m_messages.clear();
    for (const Message &message : removed) {
        Q_EMIT messageRemoved(message.id);
    }
    Q_EMIT sizeChanged(0);
    persist();
}

const Message *MessageQueue::find(const QString &id) const
{
    const int index = indexOf(id);
    return index < 0 ? nullptr : &m_messages[index];
}

int MessageQueue::validateIds()
{
    QSet<QString> seen;
    int regenerated = 0;

    for (Message &message : m_messages) {
        if (message.id.isEmpty() || seen.contains(message.id)) {
            const QString oldId = message.id;
            message.id = generateId();
            qDebug() << "MessageQueue: Regenerated duplicate id" << oldId << "->" << message.id;
            ++regenerated;
        }
        seen.insert(message.id);
    }

    if (regenerated > 0) {
        persist();
    }
    return regenerated;
}

void MessageQueue::load()
{
    if (!m_store) {
        return;
    }

    m_messages = m_store->loadQueue();
    m_history = m_store->loadHistory();
    while (m_history.size() > m_historyCapacity) {
        m_history.removeFirst();
    }

    // Continue counting after the highest loaded values
    for (const Message &message : std::as_const(m_messages)) {
        m_sequenceCounter = qMax(m_sequenceCounter, message.sequence);
        const QStringList parts = message.id.split(QLatin1Char('_'));
        if (parts.size() == 3) {
            bool ok = false;
            const qint64 counter = parts[1].toLongLong(&ok);
            if (ok) {
                m_idCounter = qMax(m_idCounter, counter);
            }
        }
    }

    validateIds();

    qDebug() << "MessageQueue: Loaded" << m_messages.size() << "messages and" << m_history.size() << "history entries";
    Q_EMIT sizeChanged(m_messages.size());
    Q_EMIT historyChanged();
}

void MessageQueue::recordHistory(const Message &message, const QDateTime &injectedAt)
{
    HistoryEntry entry;
    entry.id = message.id;
    entry.content = message.content;
    entry.targetSessionId = message.targetSessionId;
    entry.injectedAt = injectedAt;
    entry.originalTimestamp = message.createdAt;

    m_history.append(entry);
    while (m_history.size() > m_historyCapacity) {
        m_history.removeFirst();
    }

    Q_EMIT historyChanged();
    persistHistory();
}

void MessageQueue::clearHistory()
{
    m_history.clear();
    Q_EMIT historyChanged();
    persistHistory();
}

void MessageQueue::setHistoryCapacity(int capacity)
{
    m_historyCapacity = qMax(1, capacity);
    while (m_history.size() > m_historyCapacity) {
        m_history.removeFirst();
    }
}

void MessageQueue::persist()
{
    if (m_store && !m_store->saveQueue(m_messages)) {
        qWarning() << "MessageQueue: Failed to persist queue; keeping in-memory state";
    }
}

void MessageQueue::persistHistory()
{
    if (m_store && !m_store->saveHistory(m_history)) {
        qWarning() << "MessageQueue: Failed to persist history";
    }
}

} // namespace Promptline

#include "moc_MessageQueue.cpp"
