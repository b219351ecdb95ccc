/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "TimerServiceTest.h"

// Qt
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// Promptline
#include "../injection/ActionLog.h"
#include "../injection/Preferences.h"
#include "../injection/TimerService.h"
#include "FakeSessionChannel.h"

using namespace Promptline;

using State = TimerService::State;

namespace
{
// Keeps the real tick timer out of tests that drive tick() by hand
const int kManualTicks = 3600 * 1000;
}

void TimerServiceTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void TimerServiceTest::init()
{
    m_configName = freshConfigName();
}

void TimerServiceTest::cleanup()
{
    removeConfig(m_configName);
}

void TimerServiceTest::testSetTimerClamps()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);

    timer.setTimer(30, 75, 99);
    QCOMPARE(timer.formatted(), QStringLiteral("23:59:59"));

    timer.setTimer(-1, 5, 0);
    QCOMPARE(timer.formatted(), QStringLiteral("00:05:00"));
    QCOMPARE(timer.state(), State::Idle);
    QCOMPARE(timer.syncSource(), TimerService::SyncSource::Manual);
    QCOMPARE(log.entries().last().message, QStringLiteral("Timer set to: 00:05:00"));

    // The chosen duration survives a restart
    QCOMPARE(prefs.timerDuration().minutes, 5);
    TimerService restarted(&prefs, &log);
    QCOMPARE(restarted.formatted(), QStringLiteral("00:05:00"));
}

void TimerServiceTest::testZeroDurationDoesNotStart()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);

    timer.setTimer(0, 0, 0);
    QVERIFY(!timer.start());
    QCOMPARE(timer.state(), State::Idle);
    QCOMPARE(log.entries().last().level, ActionLogEntry::Level::Warning);
}

void TimerServiceTest::testCountdownExpiresOnce()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);
    QSignalSpy expired(&timer, &TimerService::expired);

    timer.setTimer(0, 0, 2);
    QVERIFY(timer.start());
    QVERIFY(timer.isActive());
    QVERIFY(prefs.timerTarget().isValid());

    timer.tick();
    QCOMPARE(timer.formatted(), QStringLiteral("00:00:01"));
    QCOMPARE(expired.count(), 0);

    timer.tick();
    QCOMPARE(timer.state(), State::Expired);
    QCOMPARE(expired.count(), 1);
    QVERIFY(!prefs.timerTarget().isValid());
    QCOMPARE(log.entries().last().message, QStringLiteral("Timer expired - starting injection"));

    timer.tick();
    QCOMPARE(expired.count(), 1);
}

void TimerServiceTest::testTickBorrows()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);

    timer.setTimer(1, 0, 0);
    QVERIFY(timer.start());
    timer.tick();
    QCOMPARE(timer.formatted(), QStringLiteral("00:59:59"));

    timer.setTimer(0, 1, 0);
    QVERIFY(timer.start());
    timer.tick();
    QCOMPARE(timer.formatted(), QStringLiteral("00:00:59"));
}

void TimerServiceTest::testPauseResume()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);

    timer.setTimer(0, 0, 10);
    QVERIFY(timer.start());
    timer.tick();
    timer.pause();
    QCOMPARE(timer.state(), State::Paused);

    timer.tick();
    QCOMPARE(timer.remainingSeconds(), 9);

    timer.resume();
    QCOMPARE(timer.state(), State::Active);
    timer.tick();
    QCOMPARE(timer.remainingSeconds(), 8);
}

void TimerServiceTest::testStop()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);
    QSignalSpy stateChanged(&timer, &TimerService::stateChanged);

    timer.setTimer(0, 0, 10);
    QVERIFY(timer.start());
    timer.stop();

    QCOMPARE(timer.state(), State::Idle);
    QVERIFY(!prefs.timerTarget().isValid());
    QCOMPARE(stateChanged.last().first().value<State>(), State::Idle);
}

void TimerServiceTest::testResetRestoresStoredDuration()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);

    timer.setTimer(0, 2, 0);
    QVERIFY(timer.start());
    timer.tick();
    timer.reset();

    QCOMPARE(timer.state(), State::Idle);
    QCOMPARE(timer.formatted(), QStringLiteral("00:02:00"));
}

void TimerServiceTest::testResetExpiresPassedTarget()
{
    Preferences prefs(m_configName);
    prefs.setTimerDuration({0, 30, 0});
    prefs.setTimerTarget(QDateTime::currentDateTime().addSecs(-60));

    ActionLog log;
    TimerService timer(&prefs, &log);
    QSignalSpy expired(&timer, &TimerService::expired);

    timer.reset();

    QCOMPARE(expired.count(), 1);
    QCOMPARE(timer.state(), State::Expired);
    QCOMPARE(timer.remainingSeconds(), 0);
    QVERIFY(!prefs.timerTarget().isValid());
    QVERIFY(prefs.timerDuration().isZero());
}

void TimerServiceTest::testSyncToResetInstant()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);
    timer.setSyncInterval(kManualTicks);

    const QDateTime now = QDateTime::currentDateTime();
    timer.syncToResetInstant(now.addSecs(2 * 3600 + 5), now);

    QCOMPARE(timer.state(), State::Active);
    QCOMPARE(timer.syncSource(), TimerService::SyncSource::UsageLimitSync);
    QCOMPARE(timer.formatted(), QStringLiteral("02:00:05"));
}

void TimerServiceTest::testSyncNowCorrectsDrift()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);
    timer.setSyncInterval(kManualTicks);
    QSignalSpy expired(&timer, &TimerService::expired);

    const QDateTime now = QDateTime::currentDateTime();
    const QDateTime reset = now.addSecs(3600);
    timer.syncToResetInstant(reset, now);

    timer.syncNow(now.addSecs(1800));
    QCOMPARE(timer.remainingSeconds(), 1800);

    timer.syncNow(reset.addSecs(1));
    QCOMPARE(expired.count(), 1);
    QCOMPARE(timer.state(), State::Expired);
}

void TimerServiceTest::testManualTimerBlocksSync()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);

    timer.setTimer(0, 10, 0);
    QVERIFY(timer.start());

    const QDateTime now = QDateTime::currentDateTime();
    timer.syncToResetInstant(now.addSecs(3600), now);

    QVERIFY(!timer.isAutoSyncEnabled());
    QCOMPARE(timer.formatted(), QStringLiteral("00:10:00"));
    QCOMPARE(timer.syncSource(), TimerService::SyncSource::Manual);
}

void TimerServiceTest::testArmAutoSync()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(kManualTicks);
    timer.setSyncInterval(kManualTicks);

    timer.setTimer(0, 10, 0);
    const QDateTime reset = QDateTime::currentDateTime().addSecs(3600);
    timer.syncToResetInstant(reset);
    QCOMPARE(timer.state(), State::Idle);

    timer.armAutoSync();
    QVERIFY(timer.isAutoSyncEnabled());
    QCOMPARE(timer.state(), State::Active);
    QCOMPARE(timer.syncSource(), TimerService::SyncSource::UsageLimitSync);
    QVERIFY(qAbs(timer.remainingSeconds() - 3600) <= 2);
}

void TimerServiceTest::testRunsOnEventLoop()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTickInterval(10);
    QSignalSpy expired(&timer, &TimerService::expired);

    timer.setTimer(0, 0, 3);
    QVERIFY(timer.start());
    QTRY_COMPARE(expired.count(), 1);
    QCOMPARE(timer.formatted(), QStringLiteral("00:00:00"));
}

void TimerServiceTest::testToJson()
{
    Preferences prefs(m_configName);
    ActionLog log;
    TimerService timer(&prefs, &log);
    timer.setTimer(1, 2, 3);

    const QJsonObject obj = timer.toJson();
    QCOMPARE(obj.value(QStringLiteral("formatted")).toString(), QStringLiteral("01:02:03"));
    QCOMPARE(obj.value(QStringLiteral("state")).toString(), QStringLiteral("idle"));
    QCOMPARE(obj.value(QStringLiteral("syncSource")).toString(), QStringLiteral("manual"));
    QCOMPARE(obj.value(QStringLiteral("active")).toBool(), false);
}

QTEST_GUILESS_MAIN(TimerServiceTest)

#include "moc_TimerServiceTest.cpp"
