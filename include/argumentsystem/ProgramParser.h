#ifndef ARGUMENT_SYSTEM_PROGRAM_PARSER_H
#define ARGUMENT_SYSTEM_PROGRAM_PARSER_H

#include <string>
#include <vector>
#include <unordered_set>
#include "Program.h"

namespace ArgumentSystem
{
    // Bison 动作在解析过程中填充的状态
    struct ParseState
    {
        Program program;
        bool failed = false;
        std::string error;
        int errorLine = 0;
        std::unordered_set<Clause> seenClauses;
        std::unordered_set<Rule> seenRules;

        void addClause(const std::vector<Literal> &literals);
        void addRule(const Literal &head, const std::vector<Literal> &body);
        void fail(const std::string &message, int line);
    };

    class ProgramParser
    {
    public:
        // 解析文法文本，出错时抛出 SyntaxError
        static Program parse(const std::string &text);
    };
}

#endif // ARGUMENT_SYSTEM_PROGRAM_PARSER_H
