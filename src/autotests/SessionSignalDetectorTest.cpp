/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionSignalDetectorTest.h"

// Qt
#include <QTest>

// Promptline
#include "../injection/SessionSignalDetector.h"

using namespace Promptline;

namespace
{
const QString kCorner = QString(QChar(0x256D));
const QString kSafetyPrompt = QStringLiteral("No, and tell Claude what to do differently");
}

void SessionSignalDetectorTest::testEmptyWindowIsReady()
{
    QCOMPARE(SessionSignalDetector::classify(QString()), SessionStatus::Ready);
}

void SessionSignalDetectorTest::testRunningMarkers()
{
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("* Thinking... (esc to interrupt)")), SessionStatus::Running);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("Working ESC to interrupt")), SessionStatus::Running);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("Retrying (offline)")), SessionStatus::Running);
}

void SessionSignalDetectorTest::testRunningBeatsPrompt()
{
    const QString window = QStringLiteral("Do you want to proceed?\n* Running tool (esc to interrupt)");
    QCOMPARE(SessionSignalDetector::classify(window), SessionStatus::Running);
}

void SessionSignalDetectorTest::testPromptPhrases()
{
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("1. Yes\n2. %1\n").arg(kSafetyPrompt)), SessionStatus::Prompting);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("1. Yes\n2. No, keep planning\n")), SessionStatus::Prompting);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("Do you trust the files in this folder?\n> 1. Yes")), SessionStatus::Prompting);
}

void SessionSignalDetectorTest::testPromptPatterns()
{
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("Overwrite file? [y/N] ")), SessionStatus::Prompting);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("Really delete (n/Y)")), SessionStatus::Prompting);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("DO YOU WANT TO PROCEED? 1. Yes")), SessionStatus::Prompting);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("continue? >")), SessionStatus::Prompting);
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("What should I work on next?  \n")), SessionStatus::Prompting);
}

void SessionSignalDetectorTest::testPlainInputLineIsReady()
{
    QCOMPARE(SessionSignalDetector::classify(QStringLiteral("Done. All tests pass.\n> ")), SessionStatus::Ready);
}

void SessionSignalDetectorTest::testOnlyRecentOutputClassified()
{
    // The running marker scrolled out of the detection window
    const QString window = QStringLiteral("(esc to interrupt)") + QString(3000, QLatin1Char('x')) + QStringLiteral("\n> ");
    QCOMPARE(SessionSignalDetector::classify(window, 2000), SessionStatus::Ready);
    QCOMPARE(SessionSignalDetector::classify(window, 0), SessionStatus::Running);
}

void SessionSignalDetectorTest::testStripAnsi()
{
    const QString colored = QStringLiteral("\x1b[1;32mready\x1b[0m \x1b[?25hnow");
    QCOMPARE(SessionSignalDetector::stripAnsi(colored), QStringLiteral("ready now"));
    QCOMPARE(SessionSignalDetector::stripAnsi(QStringLiteral("plain")), QStringLiteral("plain"));
}

void SessionSignalDetectorTest::testAppendOutputTruncates()
{
    QString window = QStringLiteral("abc");
    window = SessionSignalDetector::appendOutput(window, QStringLiteral("defgh"), 5);
    QCOMPARE(window, QStringLiteral("defgh"));

    window = SessionSignalDetector::appendOutput(window, QStringLiteral("ij"), 5);
    QCOMPARE(window, QStringLiteral("fghij"));

    QCOMPARE(SessionSignalDetector::appendOutput(QStringLiteral("ab"), QStringLiteral("cd"), 10), QStringLiteral("abcd"));
}

void SessionSignalDetectorTest::testAppendOutputClearScreen()
{
    const QString before = QStringLiteral("old (esc to interrupt)");

    QString window = SessionSignalDetector::appendOutput(before, QStringLiteral("\x1b[2Jfresh"), 100);
    QCOMPARE(window, QStringLiteral("\x1b[2Jfresh"));

    window = SessionSignalDetector::appendOutput(before, QStringLiteral("\x1b[3Jscrollback gone"), 100);
    QVERIFY(!window.contains(QStringLiteral("old")));

    window = SessionSignalDetector::appendOutput(before, QStringLiteral("\x1b[Hhome only"), 100);
    QVERIFY(window.startsWith(QStringLiteral("old")));
}

void SessionSignalDetectorTest::testPromptAreaFromLastCorner()
{
    const QString window = kCorner + QStringLiteral("first box\n") + QStringLiteral("noise\n") + kCorner + QStringLiteral("second box [Claude Code]");
    const auto area = SessionSignalDetector::findPromptArea(window);
    QVERIFY(area.has_value());
    QCOMPARE(*area, kCorner + QStringLiteral("second box [Claude Code]"));
}

void SessionSignalDetectorTest::testPromptAreaFallback()
{
    const QString window = QString(2000, QLatin1Char('.')) + QStringLiteral("\n1. Yes\n2. ") + kSafetyPrompt;
    const auto area = SessionSignalDetector::findPromptArea(window);
    QVERIFY(area.has_value());
    QCOMPARE(area->size(), 1000);
    QVERIFY(area->endsWith(kSafetyPrompt));
}

void SessionSignalDetectorTest::testNoPromptArea()
{
    QVERIFY(!SessionSignalDetector::findPromptArea(QStringLiteral("just some output\n> ")).has_value());

    // The safety phrase is too far back for the fallback
    const QString window = kSafetyPrompt + QString(1500, QLatin1Char('.'));
    QVERIFY(!SessionSignalDetector::findPromptArea(window).has_value());
}

void SessionSignalDetectorTest::testContinuationPrompt()
{
    QVERIFY(SessionSignalDetector::isContinuationPrompt(QStringLiteral("2. no, AND TELL CLAUDE what to do differently")));
    QVERIFY(!SessionSignalDetector::isContinuationPrompt(QStringLiteral("Do you want to proceed?")));
}

void SessionSignalDetectorTest::testUsageLimitDetected()
{
    const auto match = SessionSignalDetector::detectUsageLimit(QStringLiteral("Claude usage limit reached. Your limit will reset at 3pm (Europe/Berlin)."));
    QVERIFY(match.has_value());
    QCOMPARE(match->hour, 3);
    QVERIFY(match->pm);
    QCOMPARE(match->resetText, QStringLiteral("3pm"));
}

void SessionSignalDetectorTest::testUsageLimitCaseInsensitiveAndAnsi()
{
    const auto match = SessionSignalDetector::detectUsageLimit(QStringLiteral("\x1b[33mclaude USAGE limit reached. your limit will reset at 11AM\x1b[0m"));
    QVERIFY(match.has_value());
    QCOMPARE(match->hour, 11);
    QVERIFY(!match->pm);
    QCOMPARE(match->resetText, QStringLiteral("11am"));
}

void SessionSignalDetectorTest::testUsageLimitRejectsBadHour()
{
    QVERIFY(!SessionSignalDetector::detectUsageLimit(QStringLiteral("Claude usage limit reached. Your limit will reset at 13pm")).has_value());
    QVERIFY(!SessionSignalDetector::detectUsageLimit(QStringLiteral("Claude usage limit reached. Your limit will reset at 0am")).has_value());
}

void SessionSignalDetectorTest::testNoUsageLimit()
{
    QVERIFY(!SessionSignalDetector::detectUsageLimit(QStringLiteral("Approaching usage limit")).has_value());
}

void SessionSignalDetectorTest::testAnalyze()
{
    const QString window = QStringLiteral("Claude usage limit reached. Your limit will reset at 9pm\n") + kCorner
        + QStringLiteral(" Do you want to proceed?\n1. Yes\n2. ") + kSafetyPrompt + QStringLiteral("\n");

    const SignalReport report = SessionSignalDetector::analyze(window);
    QCOMPARE(report.status, SessionStatus::Prompting);
    QVERIFY(report.usageLimit.has_value());
    QCOMPARE(report.usageLimit->resetText, QStringLiteral("9pm"));
    QVERIFY(report.promptArea.has_value());
    QVERIFY(report.promptArea->startsWith(kCorner));
    QVERIFY(report.continuationPrompt);

    QCOMPARE(SessionSignalDetector::statusName(SessionStatus::Ready), QStringLiteral("ready"));
    QCOMPARE(SessionSignalDetector::statusName(SessionStatus::Running), QStringLiteral("running"));
    QCOMPARE(SessionSignalDetector::statusName(SessionStatus::Prompting), QStringLiteral("prompting"));
}

QTEST_GUILESS_MAIN(SessionSignalDetectorTest)

#include "moc_SessionSignalDetectorTest.cpp"
