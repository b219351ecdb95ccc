/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INJECTIONCONTEXT_H
#define INJECTIONCONTEXT_H

namespace Promptline
{

class ActionLog;
class MessageQueue;
class Notifier;
class Preferences;
class SessionChannel;
class SessionRegistry;

/**
 * The shared collaborators handed to each component at construction.
 *
 * Components keep a copy; the pointed-to objects must outlive them.
 * Only notifier may be null.
 */
struct InjectionContext {
    SessionRegistry *sessions = nullptr;
    MessageQueue *queue = nullptr;
    SessionChannel *channel = nullptr;
    ActionLog *log = nullptr;
    Preferences *preferences = nullptr;
    Notifier *notifier = nullptr;
};

} // namespace Promptline

#endif // INJECTIONCONTEXT_H
