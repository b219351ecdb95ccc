/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKESESSIONCHANNEL_H
#define FAKESESSIONCHANNEL_H

#include "../injection/SessionChannel.h"

#include <QFile>
#include <QHash>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVector>

#include <functional>

namespace Promptline
{

/**
 * In-process SessionChannel recording everything written per session
 */
class FakeSessionChannel : public SessionChannel
{
public:
    struct Write {
        QString sessionId;
        QString kind; // "text", "submit" or "key"
        QString data;
    };

    bool write(const QString &sessionId, const QString &text) override
    {
        return record(sessionId, QStringLiteral("text"), text);
    }

    bool submit(const QString &sessionId) override
    {
        return record(sessionId, QStringLiteral("submit"), QString());
    }

    bool sendKey(const QString &sessionId, const QString &keyName) override
    {
        return record(sessionId, QStringLiteral("key"), keyName);
    }

    QString typed(const QString &sessionId) const
    {
        QString text;
        for (const Write &w : writes) {
            if (w.sessionId == sessionId && w.kind == QLatin1String("text")) {
                text += w.data;
            }
        }
        return text;
    }

    int submitCount(const QString &sessionId) const
    {
        int count = 0;
        for (const Write &w : writes) {
            if (w.sessionId == sessionId && w.kind == QLatin1String("submit")) {
                ++count;
            }
        }
        return count;
    }

    QStringList keys(const QString &sessionId) const
    {
        QStringList result;
        for (const Write &w : writes) {
            if (w.sessionId == sessionId && w.kind == QLatin1String("key")) {
                result.append(w.data);
            }
        }
        return result;
    }

    QVector<Write> writes;
    bool failing = false;

    // Called before each write is recorded
    std::function<void(const QString &sessionId)> onWrite;

private:
    bool record(const QString &sessionId, const QString &kind, const QString &data)
    {
        if (failing) {
            return false;
        }
        if (onWrite) {
            onWrite(sessionId);
        }
        writes.append({sessionId, kind, data});
        return true;
    }
};

/**
 * A config file name not used by any earlier test run
 */
inline QString freshConfigName()
{
    return QStringLiteral("promptline-test-%1rc").arg(QUuid::createUuid().toString(QUuid::Id128));
}

inline void removeConfig(const QString &name)
{
    QFile::remove(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + QLatin1Char('/') + name);
}

} // namespace Promptline

#endif // FAKESESSIONCHANNEL_H
