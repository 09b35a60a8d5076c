#include "Rule.h"
#include "Errors.h"
#include <algorithm>

namespace ArgumentSystem
{
    Rule::Rule(const Literal &head, const std::vector<Literal> &input)
        : head(std::make_shared<const Literal>(head))
    {
        for (const auto &lit : input)
        {
            addBodyLiteral(std::make_shared<const Literal>(lit));
        }
        if (body.empty())
        {
            throw StructuralError("rule " + head.toString() + " has no body literals");
        }
    }

    Rule::Rule(const LiteralPtr &head, const std::vector<LiteralPtr> &input)
        : head(head)
    {
        if (!head)
        {
            throw StructuralError("rule has a null head literal");
        }
        for (const auto &lit : input)
        {
            if (!lit)
            {
                throw StructuralError("rule " + head->toString() + " contains a null body literal");
            }
            addBodyLiteral(lit);
        }
        if (body.empty())
        {
            throw StructuralError("rule " + head->toString() + " has no body literals");
        }
    }

    void Rule::addBodyLiteral(const LiteralPtr &lit)
    {
        auto pos = std::lower_bound(body.begin(), body.end(), lit,
                                    [](const LiteralPtr &a, const LiteralPtr &b)
                                    { return *a < *b; });
        if (pos != body.end() && **pos == *lit)
        {
            return;
        }
        body.insert(pos, lit);
    }

    const LiteralPtr &Rule::getHead() const
    {
        return head;
    }

    const std::vector<LiteralPtr> &Rule::getBody() const
    {
        return body;
    }

    bool Rule::bodyContains(const Literal &lit) const
    {
        return std::any_of(body.begin(), body.end(),
                           [&lit](const LiteralPtr &l)
                           { return *l == lit; });
    }

    std::string Rule::toString() const
    {
        std::string result = head->toString() + " :- ";
        for (size_t i = 0; i < body.size(); ++i)
        {
            result += body[i]->toString();
            if (i < body.size() - 1)
            {
                result += ", ";
            }
        }
        result += ".";
        return result;
    }

    size_t Rule::hash() const
    {
        size_t h = head->hash();
        for (const auto &lit : body)
        {
            h ^= lit->hash() + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }

    bool Rule::operator==(const Rule &other) const
    {
        if (*head != *other.head || body.size() != other.body.size())
        {
            return false;
        }
        for (size_t i = 0; i < body.size(); ++i)
        {
            if (*body[i] != *other.body[i])
            {
                return false;
            }
        }
        return true;
    }

    bool Rule::operator!=(const Rule &other) const
    {
        return !(*this == other);
    }
}
