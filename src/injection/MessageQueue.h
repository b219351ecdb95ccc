/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MESSAGEQUEUE_H
#define MESSAGEQUEUE_H

#include "promptline_export.h"

#include "Message.h"

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace Promptline
{

class QueueStore;

/**
 * MessageQueue holds the pending messages of all sessions.
 *
 * Storage order is insertion order; delivery order is computed by the
 * scheduler from (executeAt, sequence). Every mutation is persisted
 * through the QueueStore, if one is set.
 */
class PROMPTLINE_EXPORT MessageQueue : public QObject
{
    Q_OBJECT

public:
    explicit MessageQueue(QueueStore *store = nullptr, QObject *parent = nullptr);
    ~MessageQueue() override;

    /**
     * Append a message.
     *
     * @param executeAt Earliest injection time; invalid means "now"
     * @return The new message id, or an empty string if rejected
     */
    QString enqueue(const QString &sessionId,
                    const QString &content,
                    const QDateTime &executeAt = QDateTime(),
                    const QStringList &attachments = QStringList(),
                    bool isAutoContinue = false);

    /**
     * Remove a message if present
     */
    bool remove(const QString &id);

    /**
     * Remove a message and hand it to the caller (dispatch)
     */
    std::optional<Message> take(const QString &id);

    bool update(const QString &id, const QString &content);
    bool updateExecuteAt(const QString &id, const QDateTime &executeAt);

    void clear();

    /**
     * Give fresh ids to messages whose id is empty or already used
     *
     * @return Number of ids regenerated
     */
    int validateIds();

    const QVector<Message> &messages() const
    {
        return m_messages;
    }

    const Message *find(const QString &id) const;

    int size() const
    {
        return m_messages.size();
    }
    bool isEmpty() const
    {
        return m_messages.isEmpty();
    }

    /**
     * Load queue and history from the store, replacing the current content
     */
    void load();

    /**
     * Append an injected message to the history
     */
    void recordHistory(const Message &message, const QDateTime &injectedAt = QDateTime::currentDateTime());

    const QVector<HistoryEntry> &history() const
    {
        return m_history;
    }
    void clearHistory();

    int historyCapacity() const
    {
        return m_historyCapacity;
    }
    void setHistoryCapacity(int capacity);

Q_SIGNALS:
    void sizeChanged(int size);
    void messageAdded(const QString &id);
    void messageRemoved(const QString &id);
    void historyChanged();

private:
    QString generateId();
    void persist();
    void persistHistory();
    int indexOf(const QString &id) const;

    QueueStore *m_store = nullptr;
    QVector<Message> m_messages;
    QVector<HistoryEntry> m_history;
    int m_historyCapacity = 1000;

    qint64 m_idCounter = 0;
    qint64 m_sequenceCounter = 0;
};

} // namespace Promptline

#endif // MESSAGEQUEUE_H
