#include "Program.h"

namespace ArgumentSystem
{
    std::string Program::toString() const
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
}
