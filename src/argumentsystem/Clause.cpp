#include "Clause.h"
#include "Errors.h"
#include <algorithm>

namespace ArgumentSystem
{
    Clause::Clause(const std::vector<Literal> &input)
    {
        for (const auto &lit : input)
        {
            addLiteral(std::make_shared<const Literal>(lit));
        }
        if (literals.empty())
        {
            throw StructuralError("clause must contain at least one literal");
        }
    }

    Clause::Clause(const std::vector<LiteralPtr> &input)
    {
        for (const auto &lit : input)
        {
            if (!lit)
            {
                throw StructuralError("clause contains a null literal");
            }
            addLiteral(lit);
        }
        if (literals.empty())
        {
            throw StructuralError("clause must contain at least one literal");
        }
    }

    void Clause::addLiteral(const LiteralPtr &lit)
    {
        auto pos = std::lower_bound(literals.begin(), literals.end(), lit,
                                    [](const LiteralPtr &a, const LiteralPtr &b)
                                    { return *a < *b; });
        // 相同的文字只保留第一个
        if (pos != literals.end() && **pos == *lit)
        {
            return;
        }
        literals.insert(pos, lit);
    }

    const std::vector<LiteralPtr> &Clause::getLiterals() const
    {
        return literals;
    }

    size_t Clause::size() const
    {
        return literals.size();
    }

    bool Clause::contains(const Literal &lit) const
    {
        return std::any_of(literals.begin(), literals.end(),
                           [&lit](const LiteralPtr &l)
                           { return *l == lit; });
    }

    std::string Clause::toString() const
    {
        std::string result;
        for (size_t i = 0; i < literals.size(); ++i)
        {
            result += literals[i]->toString();
            if (i < literals.size() - 1)
            {
                result += ", ";
            }
        }
        result += ".";
        return result;
    }

    size_t Clause::hash() const
    {
        if (!hashComputed)
        {
            // literals 已排序，顺序无关
            hashValue = 0;
            for (const auto &lit : literals)
            {
                hashValue ^= lit->hash() + 0x9e3779b9 + (hashValue << 6) + (hashValue >> 2);
            }
            hashComputed = true;
        }
        return hashValue;
    }

    bool Clause::operator==(const Clause &other) const
    {
        if (literals.size() != other.literals.size())
            return false;

        for (size_t i = 0; i < literals.size(); ++i)
        {
            if (*literals[i] != *other.literals[i])
            {
                return false;
            }
        }
        return true;
    }

    bool Clause::operator!=(const Clause &other) const
    {
        return !(*this == other);
    }
}
