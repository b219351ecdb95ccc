/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSIGNALDETECTOR_H
#define SESSIONSIGNALDETECTOR_H

#include "promptline_export.h"

#include <QString>

#include <optional>

namespace Promptline
{

/**
 * Coarse classification of what a session is doing right now
 */
enum class SessionStatus {
    Ready,     ///< Waiting at its input line
    Running,   ///< Busy producing output ("esc to interrupt")
    Prompting  ///< Asking a question that needs an answer
};

/**
 * Hour and meridiem extracted from a usage-limit banner
 */
struct PROMPTLINE_EXPORT UsageLimitMatch {
    int hour = 0;          ///< 1..12 as printed
    bool pm = false;
    QString resetText;     ///< e.g. "3pm", used for duplicate checks
};

/**
 * Everything the detectors found in one output window
 */
struct PROMPTLINE_EXPORT SignalReport {
    SessionStatus status = SessionStatus::Ready;
    std::optional<UsageLimitMatch> usageLimit;
    /// Prompt box text (from the last box corner to the end), if one is on screen
    std::optional<QString> promptArea;
    bool continuationPrompt = false;
};

/**
 * SessionSignalDetector holds the pattern tables used to read session output.
 *
 * All functions are pure: they look only at the text they are given.
 */
class PROMPTLINE_EXPORT SessionSignalDetector
{
public:
    /**
     * Remove ANSI CSI sequences (colors, cursor movement)
     */
    static QString stripAnsi(const QString &text);

    /**
     * Append a new output chunk to a session's window.
     *
     * A screen clear in the chunk discards the old window. The result is
     * truncated to its last @p maxChars characters.
     */
    static QString appendOutput(const QString &window, const QString &chunk, int maxChars);

    /**
     * Classify the trailing @p detectionChars characters of @p window
     */
    static SessionStatus classify(const QString &window, int detectionChars = 2000);

    /**
     * Locate the prompt box at the bottom of the output.
     *
     * Returns the text from the last box corner to the end. Without a
     * corner, falls back to the last 1000 characters but only when they
     * contain the safety prompt phrase.
     */
    static std::optional<QString> findPromptArea(const QString &window);

    /**
     * Whether a prompt area shows the generic "continue?" question
     */
    static bool isContinuationPrompt(const QString &promptArea);

    /**
     * Parse "Claude usage limit reached. Your limit will reset at 3pm"
     */
    static std::optional<UsageLimitMatch> detectUsageLimit(const QString &text);

    /**
     * Run every detector over one window
     */
    static SignalReport analyze(const QString &window, int detectionChars = 2000);

    static QString statusName(SessionStatus status);
};

} // namespace Promptline

#endif // SESSIONSIGNALDETECTOR_H
