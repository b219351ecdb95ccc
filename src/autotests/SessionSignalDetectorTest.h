/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSIGNALDETECTORTEST_H
#define SESSIONSIGNALDETECTORTEST_H

#include <QObject>

namespace Promptline
{

class SessionSignalDetectorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // Classification
    void testEmptyWindowIsReady();
    void testRunningMarkers();
    void testRunningBeatsPrompt();
    void testPromptPhrases();
    void testPromptPatterns();
    void testPlainInputLineIsReady();
    void testOnlyRecentOutputClassified();

    // Output window
    void testStripAnsi();
    void testAppendOutputTruncates();
    void testAppendOutputClearScreen();

    // Prompt area
    void testPromptAreaFromLastCorner();
    void testPromptAreaFallback();
    void testNoPromptArea();
    void testContinuationPrompt();

    // Usage limit banner
    void testUsageLimitDetected();
    void testUsageLimitCaseInsensitiveAndAnsi();
    void testUsageLimitRejectsBadHour();
    void testNoUsageLimit();

    void testAnalyze();
};

} // namespace Promptline

#endif // SESSIONSIGNALDETECTORTEST_H
