/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONCHANNEL_H
#define SESSIONCHANNEL_H

#include "promptline_export.h"

#include <QString>

namespace Promptline
{

/**
 * SessionChannel carries input bytes into a session.
 *
 * Writes are fire-and-forget: a true return only means the bytes were
 * handed to the transport, not that the program in the session read them.
 */
class PROMPTLINE_EXPORT SessionChannel
{
public:
    virtual ~SessionChannel() = default;

    /**
     * Write literal text (no key name interpretation)
     */
    virtual bool write(const QString &sessionId, const QString &text) = 0;

    /**
     * Press the submit key
     */
    virtual bool submit(const QString &sessionId) = 0;

    /**
     * Press a named key such as "Escape" or "Tab"
     */
    virtual bool sendKey(const QString &sessionId, const QString &keyName) = 0;
};

} // namespace Promptline

#endif // SESSIONCHANNEL_H
