#ifndef ARGUMENT_SYSTEM_CASE_H
#define ARGUMENT_SYSTEM_CASE_H

#include <vector>
#include <string>
#include "Literal.h"

namespace ArgumentSystem
{
    class KnowledgeBase;

    enum class CaseStatus
    {
        CONTAINED,  // 至少一个子句断言它
        ENTAILED,   // 没有子句，但至少一条规则以它为结论
        UNSUPPORTED // 两者都没有
    };

    std::string caseStatusToString(CaseStatus status);

    // 驻留文字在知识库中的支持索引
    class Case
    {
    public:
        explicit Case(const LiteralPtr &claim);

        const LiteralPtr &getClaim() const;
        const std::vector<int> &getAssertingClauses() const;
        const std::vector<int> &getAssertingRules() const;

        bool isContained() const;
        bool isEntailed() const;
        bool isUnsupported() const;
        CaseStatus getStatus() const;

        std::string toString(const KnowledgeBase &kb) const;

    private:
        friend class KnowledgeBase;

        LiteralPtr claim;
        std::vector<int> assertingClauses; // 子句 id
        std::vector<int> assertingRules;   // 规则 id
    };
}

#endif // ARGUMENT_SYSTEM_CASE_H
