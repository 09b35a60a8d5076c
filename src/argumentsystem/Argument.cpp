#include "Argument.h"
#include "KnowledgeBase.h"

namespace ArgumentSystem
{
    void EvidenceSet::addClause(int clauseId)
    {
        clauseIds.insert(clauseId);
    }

    void EvidenceSet::addRule(int ruleId)
    {
        ruleIds.insert(ruleId);
    }

    void EvidenceSet::merge(const EvidenceSet &other)
    {
        clauseIds.insert(other.clauseIds.begin(), other.clauseIds.end());
        ruleIds.insert(other.ruleIds.begin(), other.ruleIds.end());
    }

    const std::set<int> &EvidenceSet::getClauseIds() const
    {
        return clauseIds;
    }

    const std::set<int> &EvidenceSet::getRuleIds() const
    {
        return ruleIds;
    }

    bool EvidenceSet::containsClause(int clauseId) const
    {
        return clauseIds.count(clauseId) > 0;
    }

    bool EvidenceSet::containsRule(int ruleId) const
    {
        return ruleIds.count(ruleId) > 0;
    }

    size_t EvidenceSet::size() const
    {
        return clauseIds.size() + ruleIds.size();
    }

    bool EvidenceSet::empty() const
    {
        return clauseIds.empty() && ruleIds.empty();
    }

    std::string EvidenceSet::toString(const KnowledgeBase &kb) const
    {
        std::string result = "{";
        bool first = true;
        for (int id : clauseIds)
        {
            result += (first ? "" : " ") + kb.getClause(id).toString();
            first = false;
        }
        for (int id : ruleIds)
        {
            result += (first ? "" : " ") + kb.getRule(id).toString();
            first = false;
        }
        result += "}";
        return result;
    }

    bool EvidenceSet::operator==(const EvidenceSet &other) const
    {
        return clauseIds == other.clauseIds && ruleIds == other.ruleIds;
    }

    bool EvidenceSet::operator!=(const EvidenceSet &other) const
    {
        return !(*this == other);
    }

    bool EvidenceSet::operator<(const EvidenceSet &other) const
    {
        if (clauseIds != other.clauseIds)
        {
            return clauseIds < other.clauseIds;
        }
        return ruleIds < other.ruleIds;
    }

    std::string Argument::toString(const KnowledgeBase &kb) const
    {
        return "(" + support.toString(kb) + ", " + claim->toString() + ")";
    }
}
