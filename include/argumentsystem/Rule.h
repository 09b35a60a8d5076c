#ifndef ARGUMENT_SYSTEM_RULE_H
#define ARGUMENT_SYSTEM_RULE_H

#include <vector>
#include <string>
#include "Literal.h"

namespace ArgumentSystem
{
    // head :- body. 前件是非空文字集合
    // head 出现在自身前件中不算错误，环由证据搜索处理
    class Rule
    {
    public:
        Rule(const Literal &head, const std::vector<Literal> &body);
        Rule(const LiteralPtr &head, const std::vector<LiteralPtr> &body);

        const LiteralPtr &getHead() const;
        const std::vector<LiteralPtr> &getBody() const;
        bool bodyContains(const Literal &lit) const;

        // 文法形式: "h :- a, ~b."
        std::string toString() const;

        size_t hash() const;
        bool operator==(const Rule &other) const;
        bool operator!=(const Rule &other) const;

    private:
        LiteralPtr head;
        std::vector<LiteralPtr> body; // 排序去重

        void addBodyLiteral(const LiteralPtr &lit);
    };
}

namespace std
{
    template <>
    struct hash<ArgumentSystem::Rule>
    {
        size_t operator()(const ArgumentSystem::Rule &rule) const
        {
            return rule.hash();
        }
    };
}

#endif // ARGUMENT_SYSTEM_RULE_H
