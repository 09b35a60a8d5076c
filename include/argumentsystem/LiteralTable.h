#ifndef ARGUMENT_SYSTEM_LITERAL_TABLE_H
#define ARGUMENT_SYSTEM_LITERAL_TABLE_H
#include <vector>
#include <string>
#include <unordered_map>
#include "Literal.h"

namespace ArgumentSystem
{
    // 文字驻留池：每个 (原子, 极性) 只对应一个实例
    class LiteralTable
    {
    private:
        std::vector<LiteralPtr> literals;
        std::unordered_map<Literal, int> literalToId;

    public:
        int insert(const Literal &literal);

        LiteralPtr get(int id) const;

        int getId(const Literal &literal) const;

        size_t size() const { return literals.size(); }
    };
}

#endif
