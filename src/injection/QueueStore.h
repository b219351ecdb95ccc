/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef QUEUESTORE_H
#define QUEUESTORE_H

#include "promptline_export.h"

#include "Message.h"

#include <QString>
#include <QVector>

namespace Promptline
{

/**
 * Persistence for the message queue and the injection history.
 *
 * All operations are best effort; a failed save leaves the in-memory
 * queue authoritative.
 */
class PROMPTLINE_EXPORT QueueStore
{
public:
    virtual ~QueueStore() = default;

    virtual bool saveQueue(const QVector<Message> &messages) = 0;
    virtual QVector<Message> loadQueue() = 0;

    virtual bool saveHistory(const QVector<HistoryEntry> &history) = 0;
    virtual QVector<HistoryEntry> loadHistory() = 0;
};

/**
 * QueueStore writing queue.json and history.json into one directory
 */
class PROMPTLINE_EXPORT JsonQueueStore : public QueueStore
{
public:
    /**
     * @param directory Target directory, defaults to <GenericDataLocation>/promptline
     */
    explicit JsonQueueStore(const QString &directory = QString());
    ~JsonQueueStore() override;

    QString queueFilePath() const;
    QString historyFilePath() const;

    bool saveQueue(const QVector<Message> &messages) override;
    QVector<Message> loadQueue() override;

    bool saveHistory(const QVector<HistoryEntry> &history) override;
    QVector<HistoryEntry> loadHistory() override;

    static QString defaultDirectory();

private:
    QString m_directory;
};

} // namespace Promptline

#endif // QUEUESTORE_H
