/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INJECTIONSCHEDULERTEST_H
#define INJECTIONSCHEDULERTEST_H

#include <QObject>
#include <QString>

namespace Promptline
{

class InjectionSchedulerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    // Dispatch
    void testConcurrentSessionsDrain();
    void testNothingBeforeDrain();
    void testOrderByExecuteAt();
    void testEqualExecuteAtUsesSequence();
    void testSingleFlightPerSession();
    void testBusySessionSkipped();

    // Waking up
    void testNextWakeForFutureMessage();
    void testNextWakeFloor();
    void testMessageAddedWhileDraining();

    // Usage limit and timer
    void testUsageLimitedSessionHeldBack();
    void testHoldBackEndsAtResetInstant();
    void testBannerAfterExpiryDoesNotStall();
    void testSessionReturnsDuringInjection();
    void testContinueFirstOnTimerExpiry();
    void testTimerExpiryStartsDrain();
    void testExpiryWithEmptyQueueWarns();

    // Safety checks
    void testWaitsForReadySession();
    void testSafetyCheckExhausted();
    void testRemovedMessageDropsSafetyCheck();

    // Control
    void testPauseResume();
    void testCancel();
    void testDrainComplete();

private:
    QString m_configName;
};

} // namespace Promptline

#endif // INJECTIONSCHEDULERTEST_H
