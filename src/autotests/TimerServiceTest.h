/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TIMERSERVICETEST_H
#define TIMERSERVICETEST_H

#include <QObject>
#include <QString>

namespace Promptline
{

class TimerServiceTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    void testSetTimerClamps();
    void testZeroDurationDoesNotStart();
    void testCountdownExpiresOnce();
    void testTickBorrows();
    void testPauseResume();
    void testStop();
    void testResetRestoresStoredDuration();
    void testResetExpiresPassedTarget();
    void testSyncToResetInstant();
    void testSyncNowCorrectsDrift();
    void testManualTimerBlocksSync();
    void testArmAutoSync();
    void testRunsOnEventLoop();
    void testToJson();

private:
    QString m_configName;
};

} // namespace Promptline

#endif // TIMERSERVICETEST_H
