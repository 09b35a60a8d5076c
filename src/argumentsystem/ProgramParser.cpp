#include "ProgramParser.h"
#include "Errors.h"
#include "program.tab.hh" // Bison 生成的头文件
#include "program.lex.hh" // Flex 生成的头文件
#include <stdexcept>

namespace ArgumentSystem
{
    void ParseState::addClause(const std::vector<Literal> &literals)
    {
        Clause clause(literals);
        if (seenClauses.insert(clause).second)
        {
            program.clauses.push_back(std::move(clause));
        }
    }

    void ParseState::addRule(const Literal &head, const std::vector<Literal> &body)
    {
        Rule rule(head, body);
        if (seenRules.insert(rule).second)
        {
            program.rules.push_back(std::move(rule));
        }
    }

    void ParseState::fail(const std::string &message, int line)
    {
        // 只保留第一个错误
        if (!failed)
        {
            failed = true;
            error = message;
            errorLine = line;
        }
    }

    Program ProgramParser::parse(const std::string &text)
    {
        yyscan_t scanner;
        if (yylex_init(&scanner) != 0)
        {
            throw std::runtime_error("无法初始化词法分析器");
        }

        ParseState state;
        // 按长度扫描，文本中的 NUL 字节交给词法分析器报错
        YY_BUFFER_STATE buffer = yy_scan_bytes(text.data(), static_cast<int>(text.size()), scanner);
        int status = yyparse(scanner, state);
        yy_delete_buffer(buffer, scanner);
        yylex_destroy(scanner);

        if (status != 0 || state.failed)
        {
            throw SyntaxError(state.error.empty() ? "syntax error" : state.error, state.errorLine);
        }
        return std::move(state.program);
    }
}
