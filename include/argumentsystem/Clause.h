#ifndef ARGUMENT_SYSTEM_CLAUSE_H
#define ARGUMENT_SYSTEM_CLAUSE_H

#include <vector>
#include <string>
#include "Literal.h"

namespace ArgumentSystem
{
    // 无条件断言的文字合取，文字无序且不重复
    class Clause
    {
    public:
        // 空列表抛出 StructuralError，重复文字直接去重
        explicit Clause(const std::vector<Literal> &literals);
        explicit Clause(const std::vector<LiteralPtr> &literals);

        const std::vector<LiteralPtr> &getLiterals() const;
        size_t size() const;
        bool contains(const Literal &lit) const;

        // 文法形式: "a, ~b."
        std::string toString() const;

        size_t hash() const;
        bool operator==(const Clause &other) const;
        bool operator!=(const Clause &other) const;

    private:
        std::vector<LiteralPtr> literals; // 按 Literal::operator< 排序

        void addLiteral(const LiteralPtr &lit);

        mutable size_t hashValue = 0;
        mutable bool hashComputed = false;
    };
}

namespace std
{
    template <>
    struct hash<ArgumentSystem::Clause>
    {
        size_t operator()(const ArgumentSystem::Clause &clause) const
        {
            return clause.hash();
        }
    };
}

#endif // ARGUMENT_SYSTEM_CLAUSE_H
