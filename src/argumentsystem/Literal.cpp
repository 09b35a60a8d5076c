#include "Literal.h"

namespace ArgumentSystem
{
    Literal::Literal(const std::string &atom, bool positive)
        : atom(atom), positive(positive) {}

    const std::string &Literal::getAtom() const
    {
        return atom;
    }

    bool Literal::isPositive() const
    {
        return positive;
    }

    bool Literal::isNegationOf(const Literal &other) const
    {
        return atom == other.atom && positive != other.positive;
    }

    Literal Literal::negation() const
    {
        return Literal(atom, !positive);
    }

    std::string Literal::key() const
    {
        return positive ? atom : "~" + atom;
    }

    std::string Literal::toString() const
    {
        return key();
    }

    bool Literal::isValidAtom(const std::string &atom)
    {
        if (atom.empty())
        {
            return false;
        }
        auto isLetter = [](char c)
        { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); };
        if (!isLetter(atom[0]))
        {
            return false;
        }
        for (char c : atom)
        {
            if (!isLetter(c) && !(c >= '0' && c <= '9') && c != '_')
            {
                return false;
            }
        }
        return true;
    }

    bool Literal::operator==(const Literal &other) const
    {
        // 1. 极性
        if (this->positive != other.positive)
        {
            return false;
        }
        // 2. 原子名
        return this->atom == other.atom;
    }

    bool Literal::operator!=(const Literal &other) const
    {
        return !(*this == other);
    }

    // 按渲染结果排序，输出稳定
    bool Literal::operator<(const Literal &other) const
    {
        if (atom != other.atom)
        {
            return atom < other.atom;
        }
        return positive && !other.positive;
    }
}
