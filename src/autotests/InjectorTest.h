/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INJECTORTEST_H
#define INJECTORTEST_H

#include <QObject>

namespace Promptline
{

class InjectorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testTypesThenSubmits();
    void testAttachmentsTypedFirst();
    void testSurrogatePairsKeptTogether();
    void testOneInjectionPerSession();
    void testSessionOwnedByResponder();
    void testUnknownSessionRefused();
    void testWriteFailureReleasesSession();
    void testCancelStopsTyping();
    void testPauseResume();
    void testRandomDelayBounds();
};

} // namespace Promptline

#endif // INJECTORTEST_H
