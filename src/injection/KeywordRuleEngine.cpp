/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "KeywordRuleEngine.h"

#include "SessionSignalDetector.h"

#include <QDebug>
#include <QUuid>

namespace Promptline
{

QString KeywordRule::generateId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

KeywordRuleEngine::KeywordRuleEngine(QObject *parent)
    : QObject(parent)
{
}

KeywordRuleEngine::~KeywordRuleEngine() = default;

void KeywordRuleEngine::setRules(const QVector<KeywordRule> &rules)
{
    m_rules = rules;
    Q_EMIT rulesChanged();
}

bool KeywordRuleEngine::addRule(const QString &keyword, const QString &response)
{
    if (keyword.trimmed().isEmpty()) {
        qWarning() << "KeywordRuleEngine: Refusing rule with empty keyword";
        return false;
    }

    KeywordRule rule;
    rule.id = KeywordRule::generateId();
    rule.keyword = keyword;
    rule.response = response;
    m_rules.append(rule);

    qDebug() << "KeywordRuleEngine: Added rule" << keyword << "->" << (rule.escapeOnly() ? QStringLiteral("(Escape only)") : response);
    Q_EMIT rulesChanged();
    return true;
}

bool KeywordRuleEngine::removeRule(const QString &id)
{
    for (int i = 0; i < m_rules.size(); ++i) {
        if (m_rules[i].id == id) {
            m_rules.removeAt(i);
            Q_EMIT rulesChanged();
            return true;
        }
    }
    return false;
}

int KeywordRuleEngine::findMatchIndex(const QString &promptArea) const
{
    if (promptArea.isEmpty()) {
        return -1;
    }

    const QString area = SessionSignalDetector::stripAnsi(promptArea);
    for (int i = 0; i < m_rules.size(); ++i) {
        const QString keyword = m_rules[i].keyword.trimmed();
        if (keyword.isEmpty()) {
            continue;
        }
        if (area.contains(keyword, Qt::CaseInsensitive)) {
            return i;
        }
    }
    return -1;
}

std::optional<KeywordRule> KeywordRuleEngine::findMatch(const QString &promptArea) const
{
    const int index = findMatchIndex(promptArea);
    if (index < 0) {
        return std::nullopt;
    }
    return m_rules[index];
}

std::optional<KeywordRule> KeywordRuleEngine::matchAndCount(const QString &promptArea)
{
    const int index = findMatchIndex(promptArea);
    if (index < 0) {
        return std::nullopt;
    }

    m_rules[index].timesTriggered++;
    Q_EMIT rulesChanged();
    return m_rules[index];
}

KeywordRuleStats KeywordRuleEngine::statistics() const
{
    KeywordRuleStats stats;
    stats.totalRules = m_rules.size();

    for (const KeywordRule &rule : m_rules) {
        stats.totalTriggers += rule.timesTriggered;
        if (!rule.escapeOnly()) {
            stats.rulesWithResponse++;
        }
        if (rule.timesTriggered > stats.mostTriggeredCount) {
            stats.mostTriggeredCount = rule.timesTriggered;
            stats.mostTriggeredKeyword = rule.keyword;
        }
    }
    stats.rulesEscapeOnly = stats.totalRules - stats.rulesWithResponse;

    return stats;
}

} // namespace Promptline

#include "moc_KeywordRuleEngine.cpp"
