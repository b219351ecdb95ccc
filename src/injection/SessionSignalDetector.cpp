/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionSignalDetector.h"

#include <QRegularExpression>
#include <QStringList>

namespace Promptline
{

namespace
{
const QChar kPromptBoxCorner(0x256D); // ╭
const QString kSafetyPromptPhrase = QStringLiteral("No, and tell Claude what to do differently");
const int kPromptFallbackChars = 1000;

const QStringList &runningMarkers()
{
    static const QStringList markers = {
        QStringLiteral("esc to interrupt"),
        QStringLiteral("(esc to interrupt)"),
        QStringLiteral("ESC to interrupt"),
        QStringLiteral("offline)"),
    };
    return markers;
}

const QStringList &promptPhrases()
{
    static const QStringList phrases = {
        kSafetyPromptPhrase,
        QStringLiteral("No, keep planning"),
        QStringLiteral("Do you trust the files in this folder?"),
    };
    return phrases;
}

const QList<QRegularExpression> &promptPatterns()
{
    static const QList<QRegularExpression> patterns = {
        QRegularExpression(QStringLiteral("\\b[yY]/[nN]\\b")),
        QRegularExpression(QStringLiteral("\\b[nN]/[yY]\\b")),
        QRegularExpression(QStringLiteral("Do you want to proceed\\?"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("Continue\\?"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("\\?\\s*$")),
    };
    return patterns;
}
}

QString SessionSignalDetector::stripAnsi(const QString &text)
{
    static const QRegularExpression csi(QStringLiteral("\\x1b\\[[0-9;?]*[a-zA-Z]"));
    QString result = text;
    result.remove(csi);
    return result;
}

QString SessionSignalDetector::appendOutput(const QString &window, const QString &chunk, int maxChars)
{
    static const QStringList clearSequences = {
        QStringLiteral("\x1b[2J"),
        QStringLiteral("\x1b[H\x1b[2J"),
        QStringLiteral("\x1b[3J"),
    };

    bool cleared = false;
    for (const QString &seq : clearSequences) {
        if (chunk.contains(seq)) {
            cleared = true;
            break;
        }
    }

    QString result = cleared ? chunk : window + chunk;
    if (maxChars > 0 && result.size() > maxChars) {
        result = result.right(maxChars);
    }
    return result;
}

SessionStatus SessionSignalDetector::classify(const QString &window, int detectionChars)
{
    if (window.isEmpty()) {
        return SessionStatus::Ready;
    }

    QString recent = stripAnsi(window);
    if (detectionChars > 0 && recent.size() > detectionChars) {
        recent = recent.right(detectionChars);
    }

    for (const QString &marker : runningMarkers()) {
        if (recent.contains(marker)) {
            return SessionStatus::Running;
        }
    }

    for (const QString &phrase : promptPhrases()) {
        if (recent.contains(phrase)) {
            return SessionStatus::Prompting;
        }
    }
    for (const QRegularExpression &pattern : promptPatterns()) {
        if (pattern.match(recent).hasMatch()) {
            return SessionStatus::Prompting;
        }
    }

    return SessionStatus::Ready;
}

std::optional<QString> SessionSignalDetector::findPromptArea(const QString &window)
{
    const QString clean = stripAnsi(window);

    const int corner = clean.lastIndexOf(kPromptBoxCorner);
    if (corner >= 0) {
        return clean.mid(corner);
    }

    const QString tail = clean.right(kPromptFallbackChars);
    if (tail.contains(kSafetyPromptPhrase)) {
        return tail;
    }
    return std::nullopt;
}

bool SessionSignalDetector::isContinuationPrompt(const QString &promptArea)
{
    return promptArea.contains(kSafetyPromptPhrase, Qt::CaseInsensitive);
}

std::optional<UsageLimitMatch> SessionSignalDetector::detectUsageLimit(const QString &text)
{
    static const QRegularExpression pattern(QStringLiteral("Claude usage limit reached\\. Your limit will reset at (\\d{1,2})(am|pm)"),
                                            QRegularExpression::CaseInsensitiveOption);

    const QRegularExpressionMatch match = pattern.match(stripAnsi(text));
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    bool ok = false;
    const int hour = match.captured(1).toInt(&ok);
    if (!ok || hour < 1 || hour > 12) {
        return std::nullopt;
    }

    UsageLimitMatch result;
    result.hour = hour;
    result.pm = match.captured(2).compare(QLatin1String("pm"), Qt::CaseInsensitive) == 0;
    result.resetText = QString::number(hour) + (result.pm ? QStringLiteral("pm") : QStringLiteral("am"));
    return result;
}

SignalReport SessionSignalDetector::analyze(const QString &window, int detectionChars)
{
    SignalReport report;
    report.status = classify(window, detectionChars);

    QString recent = window;
    if (detectionChars > 0 && recent.size() > detectionChars) {
        recent = recent.right(detectionChars);
    }
    report.usageLimit = detectUsageLimit(recent);

    report.promptArea = findPromptArea(window);
    if (report.promptArea) {
        report.continuationPrompt = isContinuationPrompt(*report.promptArea);
    }
    return report;
}

QString SessionSignalDetector::statusName(SessionStatus status)
{
    switch (status) {
    case SessionStatus::Ready:
        return QStringLiteral("ready");
    case SessionStatus::Running:
        return QStringLiteral("running");
    case SessionStatus::Prompting:
        return QStringLiteral("prompting");
    }
    return QStringLiteral("unknown");
}

} // namespace Promptline
