#include "LiteralTable.h"

namespace ArgumentSystem
{
    int LiteralTable::insert(const Literal &literal)
    {
        auto it = literalToId.find(literal);
        if (it != literalToId.end())
        {
            return it->second;
        }
        int newId = static_cast<int>(literals.size());
        literals.push_back(std::make_shared<const Literal>(literal));
        literalToId.emplace(literal, newId);
        return newId;
    }

    LiteralPtr LiteralTable::get(int id) const
    {
        if (id >= 0 && id < static_cast<int>(literals.size()))
        {
            return literals[id];
        }
        return nullptr;
    }

    int LiteralTable::getId(const Literal &literal) const
    {
        auto it = literalToId.find(literal);
        if (it != literalToId.end())
        {
            return it->second;
        }
        return -1;
    }
}
