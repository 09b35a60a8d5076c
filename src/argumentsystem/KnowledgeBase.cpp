#include "KnowledgeBase.h"
#include "Errors.h"
#include <iostream>
#include <algorithm>
#include <queue>
#include <unordered_set>

namespace ArgumentSystem
{
    KnowledgeBase::KnowledgeBase(const Program &program)
    {
        consolidate(program);
        computeSupport();
    }

    int KnowledgeBase::intern(const Literal &literal)
    {
        int id = literalTable.insert(literal);
        if (id == static_cast<int>(cases.size()))
        {
            cases.emplace_back(literalTable.get(id));
        }
        return id;
    }

    LiteralPtr KnowledgeBase::internPtr(const LiteralPtr &literal)
    {
        if (!literal)
        {
            throw StructuralError("statement contains a null literal");
        }
        if (!Literal::isValidAtom(literal->getAtom()))
        {
            throw StructuralError("invalid atom name: '" + literal->getAtom() + "'");
        }
        return literalTable.get(intern(*literal));
    }

    void KnowledgeBase::consolidate(const Program &program)
    {
        std::unordered_set<Clause> seenClauses;
        std::unordered_set<Rule> seenRules;

        for (const auto &input : program.clauses)
        {
            std::vector<LiteralPtr> pooled;
            for (const auto &lit : input.getLiterals())
            {
                pooled.push_back(internPtr(lit));
            }
            Clause clause(pooled);
            if (!seenClauses.insert(clause).second)
            {
                continue;
            }
            int clauseId = static_cast<int>(clauses.size());
            for (const auto &lit : clause.getLiterals())
            {
                cases[literalTable.getId(*lit)].assertingClauses.push_back(clauseId);
            }
            clauses.push_back(std::move(clause));
        }

        for (const auto &input : program.rules)
        {
            LiteralPtr head = internPtr(input.getHead());
            std::vector<LiteralPtr> body;
            for (const auto &lit : input.getBody())
            {
                body.push_back(internPtr(lit));
            }
            Rule rule(head, body);
            if (!seenRules.insert(rule).second)
            {
                continue;
            }
            int ruleId = static_cast<int>(rules.size());
            int headId = literalTable.getId(*head);
            cases[headId].assertingRules.push_back(ruleId);

            std::vector<int> bodyIds;
            for (const auto &lit : rule.getBody())
            {
                bodyIds.push_back(literalTable.getId(*lit));
            }
            ruleHeads.push_back(headId);
            ruleBodies.push_back(std::move(bodyIds));
            rules.push_back(std::move(rule));
        }
    }

    // 规则被支持当且仅当前件全部被支持；文字被支持当且仅当被子句断言或有被支持的断言规则
    // 用计数器做前向传播，环上的文字不会被错误地标记
    void KnowledgeBase::computeSupport()
    {
        literalSupported.assign(cases.size(), false);
        ruleSupported.assign(rules.size(), false);

        std::vector<size_t> pending(rules.size());
        std::vector<std::vector<int>> occurrences(cases.size()); // 文字 -> 前件中包含它的规则
        for (size_t r = 0; r < rules.size(); ++r)
        {
            pending[r] = ruleBodies[r].size();
            for (int lit : ruleBodies[r])
            {
                occurrences[lit].push_back(static_cast<int>(r));
            }
        }

        std::queue<int> queue;
        for (size_t id = 0; id < cases.size(); ++id)
        {
            if (cases[id].isContained())
            {
                literalSupported[id] = true;
                queue.push(static_cast<int>(id));
            }
        }

        while (!queue.empty())
        {
            int lit = queue.front();
            queue.pop();
            for (int r : occurrences[lit])
            {
                if (--pending[r] != 0)
                {
                    continue;
                }
                ruleSupported[r] = true;
                int head = ruleHeads[r];
                if (!literalSupported[head])
                {
                    literalSupported[head] = true;
                    queue.push(head);
                }
            }
        }
    }

    const std::vector<Clause> &KnowledgeBase::getClauses() const
    {
        return clauses;
    }

    const std::vector<Rule> &KnowledgeBase::getRules() const
    {
        return rules;
    }

    const Clause &KnowledgeBase::getClause(int id) const
    {
        return clauses.at(id);
    }

    const Rule &KnowledgeBase::getRule(int id) const
    {
        return rules.at(id);
    }

    size_t KnowledgeBase::literalCount() const
    {
        return literalTable.size();
    }

    LiteralPtr KnowledgeBase::getLiteral(int id) const
    {
        return literalTable.get(id);
    }

    std::vector<LiteralPtr> KnowledgeBase::getLiterals() const
    {
        std::vector<LiteralPtr> result;
        for (size_t id = 0; id < literalTable.size(); ++id)
        {
            result.push_back(literalTable.get(static_cast<int>(id)));
        }
        return result;
    }

    std::optional<int> KnowledgeBase::getLiteralId(const Literal &literal) const
    {
        int id = literalTable.getId(literal);
        if (id == -1)
        {
            return std::nullopt;
        }
        return id;
    }

    bool KnowledgeBase::hasLiteral(const Literal &literal) const
    {
        return getLiteralId(literal).has_value();
    }

    int KnowledgeBase::requireLiteralId(const Literal &literal) const
    {
        auto id = getLiteralId(literal);
        if (!id)
        {
            throw NotFoundError("literal " + literal.toString() + " is not in the knowledge base");
        }
        return *id;
    }

    const Case &KnowledgeBase::getCase(const Literal &literal) const
    {
        return cases[requireLiteralId(literal)];
    }

    const Case &KnowledgeBase::getCase(int literalId) const
    {
        return cases.at(literalId);
    }

    int KnowledgeBase::getRuleHeadId(int ruleId) const
    {
        return ruleHeads.at(ruleId);
    }

    const std::vector<int> &KnowledgeBase::getRuleBodyIds(int ruleId) const
    {
        return ruleBodies.at(ruleId);
    }

    bool KnowledgeBase::isSupported(const Literal &literal) const
    {
        return literalSupported[requireLiteralId(literal)];
    }

    bool KnowledgeBase::isRuleSupported(int ruleId) const
    {
        return ruleSupported.at(ruleId);
    }

    std::vector<int> KnowledgeBase::getSupportingRules(const Literal &literal) const
    {
        std::vector<int> result;
        for (int ruleId : getCase(literal).getAssertingRules())
        {
            if (ruleSupported[ruleId])
            {
                result.push_back(ruleId);
            }
        }
        return result;
    }

    EvidenceEnumerator KnowledgeBase::enumerateEvidence(const Literal &literal,
                                                        const EvidenceOptions &options) const &
    {
        return EvidenceEnumerator(*this, requireLiteralId(literal), options);
    }

    std::vector<Argument> KnowledgeBase::getArguments(const Literal &literal,
                                                      const EvidenceOptions &options) const
    {
        int id = requireLiteralId(literal);
        EvidenceEnumerator enumerator(*this, id, options);
        std::vector<Argument> arguments;
        while (auto evidence = enumerator.next())
        {
            arguments.push_back(Argument{literalTable.get(id), std::move(*evidence)});
        }
        return arguments;
    }

    std::string KnowledgeBase::toString() const
    {
        std::string result;
        for (const auto &clause : clauses)
        {
            result += clause.toString() + "\n";
        }
        for (const auto &rule : rules)
        {
            result += rule.toString() + "\n";
        }
        return result;
    }

    void KnowledgeBase::print() const
    {
        std::cout << "Knowledge Base:\n";
        std::cout << "Clauses:\n";
        for (const auto &clause : clauses)
        {
            std::cout << "  " << clause.toString() << "\n";
        }
        std::cout << "Rules:\n";
        for (const auto &rule : rules)
        {
            std::cout << "  " << rule.toString() << "\n";
        }
        std::cout << "Cases:\n";
        for (const auto &c : cases)
        {
            std::cout << "  " << c.getClaim()->toString() << " [" << caseStatusToString(c.getStatus()) << "] "
                      << c.toString(*this) << "\n";
        }
    }

    bool KnowledgeBase::operator==(const KnowledgeBase &other) const
    {
        if (clauses.size() != other.clauses.size() || rules.size() != other.rules.size())
        {
            return false;
        }
        std::unordered_set<Clause> clauseSet(clauses.begin(), clauses.end());
        for (const auto &clause : other.clauses)
        {
            if (clauseSet.count(clause) == 0)
            {
                return false;
            }
        }
        std::unordered_set<Rule> ruleSet(rules.begin(), rules.end());
        for (const auto &rule : other.rules)
        {
            if (ruleSet.count(rule) == 0)
            {
                return false;
            }
        }
        return true;
    }

    bool KnowledgeBase::operator!=(const KnowledgeBase &other) const
    {
        return !(*this == other);
    }
}
