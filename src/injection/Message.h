/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MESSAGE_H
#define MESSAGE_H

#include "promptline_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace Promptline
{

/**
 * A queued piece of text waiting to be typed into one session
 */
class PROMPTLINE_EXPORT Message
{
public:
    QString id;                 // "msg_<counter>_<msecs>", unique within the queue
    QString content;            // What the user typed
    QString processedContent;   // content with attachment references prepended
    QStringList attachments;    // File paths referenced as "@<path> "
    QString targetSessionId;

    QDateTime createdAt;
    QDateTime executeAt;        // Earliest time the message may be injected
    qint64 sequence = 0;        // Tie-break for equal executeAt

    bool isAutoContinue = false; // Synthetic "continue" after a usage limit lifted

    bool isValid() const
    {
        return !id.isEmpty() && !targetSessionId.isEmpty();
    }

    bool isDue(const QDateTime &now) const
    {
        return !executeAt.isValid() || executeAt <= now;
    }

    /**
     * Delivery order within one session.
     *
     * Auto-continue messages go first, then (executeAt, sequence) ascending.
     */
    static bool precedes(const Message &a, const Message &b);

    /**
     * Build processedContent from content and attachments
     */
    static QString buildProcessedContent(const QString &content, const QStringList &attachments);

    QJsonObject toJson() const;
    static Message fromJson(const QJsonObject &obj);
};

/**
 * Record of a message after it was typed into its session
 */
struct PROMPTLINE_EXPORT HistoryEntry {
    QString id;
    QString content;
    QString targetSessionId;
    QDateTime injectedAt;
    QDateTime originalTimestamp; // Message creation time

    QJsonObject toJson() const;
    static HistoryEntry fromJson(const QJsonObject &obj);
};

} // namespace Promptline

#endif // MESSAGE_H
