#ifndef ARGUMENT_SYSTEM_KNOWLEDGE_BASE_H
#define ARGUMENT_SYSTEM_KNOWLEDGE_BASE_H

#include <vector>
#include <string>
#include <optional>
#include "LiteralTable.h"
#include "Clause.h"
#include "Rule.h"
#include "Case.h"
#include "Program.h"
#include "Argument.h"
#include "EvidenceEnumerator.h"

namespace ArgumentSystem
{
    /*
     * 合并后的知识库。构造时一次性完成：
     *   1. 为每个 (原子, 极性) 建一个驻留文字
     *   2. 用驻留文字重建所有子句和规则（重复的只保留一份）
     *   3. 建立每个文字的断言子句、断言规则索引
     * 之后只读。
     */
    class KnowledgeBase
    {
    public:
        KnowledgeBase() = default;
        explicit KnowledgeBase(const Program &program);

        const std::vector<Clause> &getClauses() const;
        const std::vector<Rule> &getRules() const;
        const Clause &getClause(int id) const;
        const Rule &getRule(int id) const;

        size_t literalCount() const;
        LiteralPtr getLiteral(int id) const;
        std::vector<LiteralPtr> getLiterals() const;
        std::optional<int> getLiteralId(const Literal &literal) const;
        bool hasLiteral(const Literal &literal) const;

        // 找不到文字时抛出 NotFoundError
        const Case &getCase(const Literal &literal) const;
        const Case &getCase(int literalId) const;

        int getRuleHeadId(int ruleId) const;
        const std::vector<int> &getRuleBodyIds(int ruleId) const;

        // 支持性分析（最小不动点）
        bool isSupported(const Literal &literal) const;
        bool isRuleSupported(int ruleId) const;
        std::vector<int> getSupportingRules(const Literal &literal) const;

        // 证据集枚举，文字不在知识库中时抛出 NotFoundError
        // 枚举器引用本知识库，知识库必须比枚举器活得长；临时对象上调用被禁止
        EvidenceEnumerator enumerateEvidence(const Literal &literal,
                                             const EvidenceOptions &options = EvidenceOptions()) const &;
        EvidenceEnumerator enumerateEvidence(const Literal &literal,
                                             const EvidenceOptions &options = EvidenceOptions()) const && = delete;
        std::vector<Argument> getArguments(const Literal &literal,
                                           const EvidenceOptions &options = EvidenceOptions()) const;

        // 转回文法文本
        std::string toString() const;
        void print() const;

        // 结构相等：子句集合与规则集合相同
        bool operator==(const KnowledgeBase &other) const;
        bool operator!=(const KnowledgeBase &other) const;

    private:
        LiteralTable literalTable;
        std::vector<Case> cases; // 与 literalTable 的 id 一一对应
        std::vector<Clause> clauses;
        std::vector<Rule> rules;

        std::vector<int> ruleHeads;
        std::vector<std::vector<int>> ruleBodies;

        std::vector<bool> literalSupported;
        std::vector<bool> ruleSupported;

        int intern(const Literal &literal);
        LiteralPtr internPtr(const LiteralPtr &literal);
        void consolidate(const Program &program);
        void computeSupport();
        int requireLiteralId(const Literal &literal) const;
    };
}

#endif // ARGUMENT_SYSTEM_KNOWLEDGE_BASE_H
