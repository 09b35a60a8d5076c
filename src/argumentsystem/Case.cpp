#include "Case.h"
#include "KnowledgeBase.h"

namespace ArgumentSystem
{
    std::string caseStatusToString(CaseStatus status)
    {
        switch (status)
        {
        case CaseStatus::CONTAINED:
            return "contained";
        case CaseStatus::ENTAILED:
            return "entailed";
        case CaseStatus::UNSUPPORTED:
            return "unsupported";
        }
        return "unknown";
    }

    Case::Case(const LiteralPtr &claim) : claim(claim) {}

    const LiteralPtr &Case::getClaim() const
    {
        return claim;
    }

    const std::vector<int> &Case::getAssertingClauses() const
    {
        return assertingClauses;
    }

    const std::vector<int> &Case::getAssertingRules() const
    {
        return assertingRules;
    }

    bool Case::isContained() const
    {
        return !assertingClauses.empty();
    }

    bool Case::isEntailed() const
    {
        return assertingClauses.empty() && !assertingRules.empty();
    }

    bool Case::isUnsupported() const
    {
        return assertingClauses.empty() && assertingRules.empty();
    }

    CaseStatus Case::getStatus() const
    {
        if (isContained())
        {
            return CaseStatus::CONTAINED;
        }
        if (isEntailed())
        {
            return CaseStatus::ENTAILED;
        }
        return CaseStatus::UNSUPPORTED;
    }

    std::string Case::toString(const KnowledgeBase &kb) const
    {
        std::string result = "({";
        bool first = true;
        for (int clauseId : assertingClauses)
        {
            result += (first ? "" : " ") + kb.getClause(clauseId).toString();
            first = false;
        }
        for (int ruleId : assertingRules)
        {
            result += (first ? "" : " ") + kb.getRule(ruleId).toString();
            first = false;
        }
        result += "}, " + claim->toString() + ")";
        return result;
    }
}
