/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACTIONLOG_H
#define ACTIONLOG_H

#include "promptline_export.h"

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QVector>

namespace Promptline
{

/**
 * One user-facing log event
 */
struct PROMPTLINE_EXPORT ActionLogEntry {
    enum class Level {
        Info,
        Success,
        Warning,
        Error
    };

    QDateTime timestamp;
    QString message;
    Level level = Level::Info;

    static QString levelName(Level level);
};

/**
 * ActionLog collects the structured events shown to the user
 * ("Injecting message to ...", "Usage limit detected ...").
 *
 * Entries are kept in a bounded ring and forwarded to the Qt logging
 * macros so that they also end up in the diagnostic log.
 */
class PROMPTLINE_EXPORT ActionLog : public QObject
{
    Q_OBJECT

public:
    explicit ActionLog(QObject *parent = nullptr);
    ~ActionLog() override;

    void log(ActionLogEntry::Level level, const QString &message);

    void info(const QString &message)
    {
        log(ActionLogEntry::Level::Info, message);
    }
    void success(const QString &message)
    {
        log(ActionLogEntry::Level::Success, message);
    }
    void warning(const QString &message)
    {
        log(ActionLogEntry::Level::Warning, message);
    }
    void error(const QString &message)
    {
        log(ActionLogEntry::Level::Error, message);
    }

    const QVector<ActionLogEntry> &entries() const
    {
        return m_entries;
    }

    /**
     * Maximum number of retained entries; older entries are dropped first
     */
    int capacity() const
    {
        return m_capacity;
    }
    void setCapacity(int capacity);

    void clear();

Q_SIGNALS:
    void entryAdded(const Promptline::ActionLogEntry &entry);

private:
    QVector<ActionLogEntry> m_entries;
    int m_capacity = 500;
};

} // namespace Promptline

#endif // ACTIONLOG_H
