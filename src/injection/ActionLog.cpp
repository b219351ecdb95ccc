/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ActionLog.h"

#include <QDebug>

namespace Promptline
{

QString ActionLogEntry::levelName(Level level)
{
    switch (level) {
    case Level::Info:
        return QStringLiteral("info");
    case Level::Success:
        return QStringLiteral("success");
    case Level::Warning:
        return QStringLiteral("warning");
    case Level::Error:
        return QStringLiteral("error");
    }
    return QStringLiteral("info");
}

ActionLog::ActionLog(QObject *parent)
    : QObject(parent)
{
}

ActionLog::~ActionLog() = default;

void ActionLog::log(ActionLogEntry::Level level, const QString &message)
{
    ActionLogEntry entry;
    entry.timestamp = QDateTime::currentDateTime();
    entry.message = message;
    entry.level = level;

    switch (level) {
    case ActionLogEntry::Level::Warning:
    case ActionLogEntry::Level::Error:
        qWarning().noquote() << "ActionLog:" << message;
        break;
    case ActionLogEntry::Level::Info:
    case ActionLogEntry::Level::Success:
        qInfo().noquote() << "ActionLog:" << message;
        break;
    }

    m_entries.append(entry);
    while (m_entries.size() > m_capacity) {
        m_entries.removeFirst();
    }

    Q_EMIT entryAdded(entry);
}

void ActionLog::setCapacity(int capacity)
{
    m_capacity = qMax(1, capacity);
    while (m_entries.size() > m_capacity) {
        m_entries.removeFirst();
    }
}

void ActionLog::clear()
{
    m_entries.clear();
}

} // namespace Promptline

#include "moc_ActionLog.cpp"
