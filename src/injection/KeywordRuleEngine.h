/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef KEYWORDRULEENGINE_H
#define KEYWORDRULEENGINE_H

#include "promptline_export.h"

#include <QObject>
#include <QString>
#include <QVector>

#include <optional>

namespace Promptline
{

/**
 * A keyword that blocks auto-continue and answers the prompt instead
 */
struct PROMPTLINE_EXPORT KeywordRule {
    QString id;
    QString keyword;
    QString response; // Empty: dismiss the prompt with Escape
    int timesTriggered = 0;

    bool escapeOnly() const
    {
        return response.isEmpty();
    }

    static QString generateId();
};

/**
 * Aggregate counters over all rules
 */
struct PROMPTLINE_EXPORT KeywordRuleStats {
    int totalRules = 0;
    int totalTriggers = 0;
    int rulesWithResponse = 0;
    int rulesEscapeOnly = 0;
    QString mostTriggeredKeyword;
    int mostTriggeredCount = 0;
};

/**
 * KeywordRuleEngine matches the ordered rule table against a prompt area.
 *
 * Matching is a case-insensitive substring test of the trimmed keyword;
 * the first matching rule wins.
 */
class PROMPTLINE_EXPORT KeywordRuleEngine : public QObject
{
    Q_OBJECT

public:
    explicit KeywordRuleEngine(QObject *parent = nullptr);
    ~KeywordRuleEngine() override;

    const QVector<KeywordRule> &rules() const
    {
        return m_rules;
    }
    void setRules(const QVector<KeywordRule> &rules);

    /**
     * Append a rule; rejects an empty keyword
     */
    bool addRule(const QString &keyword, const QString &response);

    bool removeRule(const QString &id);

    /**
     * Find the first rule matching @p promptArea without counting it
     */
    std::optional<KeywordRule> findMatch(const QString &promptArea) const;

    /**
     * Find the first matching rule and bump its trigger counter
     */
    std::optional<KeywordRule> matchAndCount(const QString &promptArea);

    KeywordRuleStats statistics() const;

Q_SIGNALS:
    /**
     * Rules were added, removed or a counter changed
     */
    void rulesChanged();

private:
    int findMatchIndex(const QString &promptArea) const;

    QVector<KeywordRule> m_rules;
};

} // namespace Promptline

#endif // KEYWORDRULEENGINE_H
