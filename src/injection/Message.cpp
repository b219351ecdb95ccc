/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Message.h"

#include <QJsonArray>

namespace Promptline
{

bool Message::precedes(const Message &a, const Message &b)
{
    if (a.isAutoContinue != b.isAutoContinue) {
        return a.isAutoContinue;
    }
    if (a.executeAt != b.executeAt) {
        return a.executeAt < b.executeAt;
    }
    return a.sequence < b.sequence;
}

QString Message::buildProcessedContent(const QString &content, const QStringList &attachments)
{
    QString result;
    for (const QString &path : attachments) {
        if (!path.isEmpty()) {
            result += QLatin1Char('@') + path + QLatin1Char(' ');
        }
    }
    return result + content;
}

QJsonObject Message::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("content")] = content;
    obj[QStringLiteral("processedContent")] = processedContent;
    if (!attachments.isEmpty()) {
        obj[QStringLiteral("attachments")] = QJsonArray::fromStringList(attachments);
    }
    obj[QStringLiteral("targetSessionId")] = targetSessionId;
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODateWithMs);
    obj[QStringLiteral("executeAt")] = executeAt.toString(Qt::ISODateWithMs);
    obj[QStringLiteral("sequence")] = sequence;
    if (isAutoContinue) {
        obj[QStringLiteral("isAutoContinue")] = true;
    }
    return obj;
}

Message Message::fromJson(const QJsonObject &obj)
{
    Message message;
    message.id = obj.value(QStringLiteral("id")).toString();
    message.content = obj.value(QStringLiteral("content")).toString();
    message.processedContent = obj.value(QStringLiteral("processedContent")).toString();
    const QJsonArray attachments = obj.value(QStringLiteral("attachments")).toArray();
    for (const QJsonValue &value : attachments) {
        message.attachments.append(value.toString());
    }
    message.targetSessionId = obj.value(QStringLiteral("targetSessionId")).toString();
    message.createdAt = QDateTime::fromString(obj.value(QStringLiteral("createdAt")).toString(), Qt::ISODateWithMs);
    message.executeAt = QDateTime::fromString(obj.value(QStringLiteral("executeAt")).toString(), Qt::ISODateWithMs);
    message.sequence = obj.value(QStringLiteral("sequence")).toInteger();
    message.isAutoContinue = obj.value(QStringLiteral("isAutoContinue")).toBool();

    if (message.processedContent.isEmpty()) {
        message.processedContent = buildProcessedContent(message.content, message.attachments);
    }
    return message;
}

QJsonObject HistoryEntry::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("content")] = content;
    obj[QStringLiteral("targetSessionId")] = targetSessionId;
    obj[QStringLiteral("injectedAt")] = injectedAt.toString(Qt::ISODateWithMs);
    obj[QStringLiteral("originalTimestamp")] = originalTimestamp.toString(Qt::ISODateWithMs);
    return obj;
}

HistoryEntry HistoryEntry::fromJson(const QJsonObject &obj)
{
    HistoryEntry entry;
    entry.id = obj.value(QStringLiteral("id")).toString();
    entry.content = obj.value(QStringLiteral("content")).toString();
    entry.targetSessionId = obj.value(QStringLiteral("targetSessionId")).toString();
    entry.injectedAt = QDateTime::fromString(obj.value(QStringLiteral("injectedAt")).toString(), Qt::ISODateWithMs);
    entry.originalTimestamp = QDateTime::fromString(obj.value(QStringLiteral("originalTimestamp")).toString(), Qt::ISODateWithMs);
    return entry;
}

} // namespace Promptline
