#ifndef ARGUMENT_SYSTEM_PROGRAM_H
#define ARGUMENT_SYSTEM_PROGRAM_H

#include <vector>
#include <string>
#include "Clause.h"
#include "Rule.h"

namespace ArgumentSystem
{
    // 解析器或调用方给出的子句与规则，文字尚未合并
    struct Program
    {
        std::vector<Clause> clauses;
        std::vector<Rule> rules;

        bool empty() const { return clauses.empty() && rules.empty(); }

        // 每条语句一行，可被重新解析
        std::string toString() const;
    };
}

#endif // ARGUMENT_SYSTEM_PROGRAM_H
