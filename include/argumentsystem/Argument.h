#ifndef ARGUMENT_SYSTEM_ARGUMENT_H
#define ARGUMENT_SYSTEM_ARGUMENT_H

#include <set>
#include <string>
#include "Literal.h"

namespace ArgumentSystem
{
    class KnowledgeBase;

    // 一组子句和规则的 id，共同支持某个文字
    class EvidenceSet
    {
    public:
        void addClause(int clauseId);
        void addRule(int ruleId);
        void merge(const EvidenceSet &other);

        const std::set<int> &getClauseIds() const;
        const std::set<int> &getRuleIds() const;
        bool containsClause(int clauseId) const;
        bool containsRule(int ruleId) const;

        size_t size() const;
        bool empty() const;

        // "{sunny, stay_home. happy :- stay_home.}"
        std::string toString(const KnowledgeBase &kb) const;

        bool operator==(const EvidenceSet &other) const;
        bool operator!=(const EvidenceSet &other) const;
        bool operator<(const EvidenceSet &other) const;

    private:
        std::set<int> clauseIds;
        std::set<int> ruleIds;
    };

    // (support, claim)
    struct Argument
    {
        LiteralPtr claim;
        EvidenceSet support;

        std::string toString(const KnowledgeBase &kb) const;
    };
}

#endif // ARGUMENT_SYSTEM_ARGUMENT_H
