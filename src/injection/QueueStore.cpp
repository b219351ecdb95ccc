/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "QueueStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>

namespace Promptline
{

namespace
{
bool writeDocument(const QString &filePath, const QString &key, const QJsonArray &items)
{
    QFileInfo fileInfo(filePath);
    QDir().mkpath(fileInfo.absolutePath());

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "JsonQueueStore: Cannot open" << filePath << "for writing:" << file.errorString();
        return false;
    }

    QJsonObject root;
    root[QStringLiteral("version")] = 1;
    root[key] = items;

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "JsonQueueStore: Failed to write" << filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

QJsonArray readDocument(const QString &filePath, const QString &key)
{
    QFile file(filePath);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return {};
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        qWarning() << "JsonQueueStore: Failed to parse" << filePath << ":" << error.errorString();
        return {};
    }
    if (!doc.isObject()) {
        return {};
    }

    return doc.object().value(key).toArray();
}
}

JsonQueueStore::JsonQueueStore(const QString &directory)
    : m_directory(directory.isEmpty() ? defaultDirectory() : directory)
{
}

JsonQueueStore::~JsonQueueStore() = default;

QString JsonQueueStore::defaultDirectory()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataDir + QStringLiteral("/promptline");
}

QString JsonQueueStore::queueFilePath() const
{
    return m_directory + QStringLiteral("/queue.json");
}

QString JsonQueueStore::historyFilePath() const
{
    return m_directory + QStringLiteral("/history.json");
}

bool JsonQueueStore::saveQueue(const QVector<Message> &messages)
{
    QJsonArray items;
    for (const Message &message : messages) {
        items.append(message.toJson());
    }
    return writeDocument(queueFilePath(), QStringLiteral("messages"), items);
}

QVector<Message> JsonQueueStore::loadQueue()
{
    QVector<Message> messages;
    const QJsonArray items = readDocument(queueFilePath(), QStringLiteral("messages"));
    for (const QJsonValue &value : items) {
        if (!value.isObject()) {
            continue;
        }
        Message message = Message::fromJson(value.toObject());
        if (message.targetSessionId.isEmpty()) {
            qWarning() << "JsonQueueStore: Dropping message without target session" << message.id;
            continue;
        }
        messages.append(message);
    }
    return messages;
}

bool JsonQueueStore::saveHistory(const QVector<HistoryEntry> &history)
{
    QJsonArray items;
    for (const HistoryEntry &entry : history) {
        items.append(entry.toJson());
    }
    return writeDocument(historyFilePath(), QStringLiteral("history"), items);
}

QVector<HistoryEntry> JsonQueueStore::loadHistory()
{
    QVector<HistoryEntry> history;
    const QJsonArray items = readDocument(historyFilePath(), QStringLiteral("history"));
    for (const QJsonValue &value : items) {
        if (value.isObject()) {
            history.append(HistoryEntry::fromJson(value.toObject()));
        }
    }
    return history;
}

} // namespace Promptline
