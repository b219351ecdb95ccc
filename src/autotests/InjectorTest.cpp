/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "InjectorTest.h"

// Qt
#include <QSignalSpy>
#include <QTest>

// Promptline
#include "../injection/ActionLog.h"
#include "../injection/Injector.h"
#include "../injection/MessageQueue.h"
#include "../injection/Notifier.h"
#include "../injection/SessionRegistry.h"
#include "FakeSessionChannel.h"

using namespace Promptline;

using Phase = SessionState::Phase;

namespace
{
InjectorTimings fastTimings()
{
    InjectorTimings timings;
    timings.minCharDelayMs = 0;
    timings.maxCharDelayMs = 1;
    timings.minSubmitDelayMs = 0;
    timings.maxSubmitDelayMs = 1;
    timings.minSettleMs = 0;
    timings.maxSettleMs = 1;
    return timings;
}

struct Fixture {
    Fixture()
        : injector(nullptr)
    {
        context.sessions = &sessions;
        context.queue = &queue;
        context.channel = &channel;
        context.log = &log;
        notifier.setEnabled(false);
        context.notifier = &notifier;
        injector = new Injector(context);
        injector->setTimings(fastTimings());
        sessions.setStatus(QStringLiteral("1"), SessionStatus::Ready);
        sessions.setStatus(QStringLiteral("2"), SessionStatus::Ready);
    }
    ~Fixture()
    {
        delete injector;
    }

    Message take(const QString &sessionId, const QString &content, const QStringList &attachments = QStringList())
    {
        const QString id = queue.enqueue(sessionId, content, QDateTime(), attachments);
        return *queue.take(id);
    }

    SessionRegistry sessions;
    MessageQueue queue;
    FakeSessionChannel channel;
    ActionLog log;
    Notifier notifier;
    InjectionContext context;
    Injector *injector;
};
}

void InjectorTest::testTypesThenSubmits()
{
    Fixture f;
    QSignalSpy started(f.injector, &Injector::injectionStarted);
    QSignalSpy finished(f.injector, &Injector::injectionFinished);
    const Message message = f.take(QStringLiteral("1"), QStringLiteral("status"));

    QVERIFY(f.injector->inject(message));
    QCOMPARE(started.count(), 1);
    QVERIFY(f.injector->isInjecting(QStringLiteral("1")));
    QVERIFY(f.sessions.isBusy(QStringLiteral("1")));

    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(0).toString(), message.id);
    QCOMPARE(finished.first().at(2).toBool(), true);

    // One write per character, then Enter
    QCOMPARE(f.channel.writes.size(), 7);
    QCOMPARE(f.channel.writes.at(0).data, QStringLiteral("s"));
    QCOMPARE(f.channel.typed(QStringLiteral("1")), QStringLiteral("status"));
    QCOMPARE(f.channel.writes.last().kind, QStringLiteral("submit"));

    QVERIFY(!f.sessions.isBusy(QStringLiteral("1")));
    QCOMPARE(f.injector->activeCount(), 0);
    QCOMPARE(f.queue.history().size(), 1);
    QCOMPARE(f.queue.history().first().id, message.id);
}

void InjectorTest::testAttachmentsTypedFirst()
{
    Fixture f;
    QSignalSpy finished(f.injector, &Injector::injectionFinished);

    QVERIFY(f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("check"), {QStringLiteral("/tmp/a.log")})));
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(f.channel.typed(QStringLiteral("1")), QStringLiteral("@/tmp/a.log check"));
    QCOMPARE(f.queue.history().first().content, QStringLiteral("check"));
}

void InjectorTest::testSurrogatePairsKeptTogether()
{
    Fixture f;
    QSignalSpy finished(f.injector, &Injector::injectionFinished);
    const QString text = QStringLiteral("ok ") + QString::fromUtf8("\xF0\x9F\x9A\x80");

    QVERIFY(f.injector->inject(f.take(QStringLiteral("1"), text)));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(f.channel.typed(QStringLiteral("1")), text);
    QCOMPARE(f.channel.writes.at(3).data.size(), 2);
}

void InjectorTest::testOneInjectionPerSession()
{
    Fixture f;
    QSignalSpy finished(f.injector, &Injector::injectionFinished);

    QVERIFY(f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("first"))));
    QVERIFY(!f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("second"))));
    QVERIFY(f.injector->inject(f.take(QStringLiteral("2"), QStringLiteral("other"))));
    QCOMPARE(f.injector->activeCount(), 2);

    QTRY_COMPARE(finished.count(), 2);
    QCOMPARE(f.channel.typed(QStringLiteral("1")), QStringLiteral("first"));
    QCOMPARE(f.channel.typed(QStringLiteral("2")), QStringLiteral("other"));
}

void InjectorTest::testSessionOwnedByResponder()
{
    Fixture f;
    QVERIFY(f.sessions.tryEnterPhase(QStringLiteral("1"), Phase::KeywordBlocked));

    QVERIFY(!f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("hello"))));
    QCOMPARE(f.sessions.session(QStringLiteral("1"))->phase, Phase::KeywordBlocked);
    QTest::qWait(20);
    QVERIFY(f.channel.writes.isEmpty());
}

void InjectorTest::testUnknownSessionRefused()
{
    Fixture f;
    QVERIFY(!f.injector->inject(f.take(QStringLiteral("ghost"), QStringLiteral("hello"))));
    QCOMPARE(f.injector->activeCount(), 0);
}

void InjectorTest::testWriteFailureReleasesSession()
{
    Fixture f;
    f.channel.failing = true;
    QSignalSpy finished(f.injector, &Injector::injectionFinished);
    QSignalSpy notified(&f.notifier, &Notifier::notified);

    QVERIFY(f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("lost"))));
    QTRY_COMPARE(finished.count(), 1);

    QCOMPARE(finished.first().at(2).toBool(), false);
    QVERIFY(!f.sessions.isBusy(QStringLiteral("1")));
    QVERIFY(f.queue.history().isEmpty());
    QCOMPARE(f.log.entries().last().level, ActionLogEntry::Level::Error);
    QCOMPARE(notified.count(), 1);
    QCOMPARE(notified.first().first().toString(), QStringLiteral("Injection failed"));

    // The session accepts the next message
    f.channel.failing = false;
    QVERIFY(f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("next"))));
    QTRY_COMPARE(finished.count(), 2);
    QCOMPARE(finished.last().at(2).toBool(), true);
    QCOMPARE(notified.count(), 1);
}

void InjectorTest::testCancelStopsTyping()
{
    Fixture f;
    InjectorTimings slow = fastTimings();
    slow.minCharDelayMs = 20;
    slow.maxCharDelayMs = 20;
    f.injector->setTimings(slow);
    QSignalSpy finished(f.injector, &Injector::injectionFinished);
    QSignalSpy notified(&f.notifier, &Notifier::notified);

    QVERIFY(f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("a long message that takes a while"))));
    QTRY_VERIFY(!f.channel.typed(QStringLiteral("1")).isEmpty());

    f.injector->cancelAll();
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(2).toBool(), false);
    QVERIFY(!f.sessions.isBusy(QStringLiteral("1")));
    QCOMPARE(f.injector->activeCount(), 0);

    const int typed = f.channel.typed(QStringLiteral("1")).size();
    QTest::qWait(100);
    QCOMPARE(f.channel.typed(QStringLiteral("1")).size(), typed);
    QCOMPARE(f.channel.submitCount(QStringLiteral("1")), 0);
    QVERIFY(f.queue.history().isEmpty());
    QCOMPARE(notified.count(), 0);
}

void InjectorTest::testPauseResume()
{
    Fixture f;
    QSignalSpy finished(f.injector, &Injector::injectionFinished);

    f.injector->pause();
    QVERIFY(f.injector->isPaused());
    QVERIFY(f.injector->inject(f.take(QStringLiteral("1"), QStringLiteral("later"))));

    QTest::qWait(50);
    QVERIFY(f.channel.writes.isEmpty());
    QVERIFY(f.sessions.isBusy(QStringLiteral("1")));

    f.injector->resume();
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(f.channel.typed(QStringLiteral("1")), QStringLiteral("later"));
}

void InjectorTest::testRandomDelayBounds()
{
    for (int i = 0; i < 200; ++i) {
        const int delay = InjectionTask::randomDelay(30, 80);
        QVERIFY(delay >= 30);
        QVERIFY(delay <= 80);
    }
    QCOMPARE(InjectionTask::randomDelay(50, 50), 50);
    QCOMPARE(InjectionTask::randomDelay(-5, -10), 0);
}

QTEST_GUILESS_MAIN(InjectorTest)

#include "moc_InjectorTest.cpp"
