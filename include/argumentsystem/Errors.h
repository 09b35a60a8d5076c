#ifndef ARGUMENT_SYSTEM_ERRORS_H
#define ARGUMENT_SYSTEM_ERRORS_H

#include <stdexcept>
#include <string>

namespace ArgumentSystem
{
    // 构造知识库或查询时的错误基类
    class KnowledgeBaseError : public std::runtime_error
    {
    public:
        explicit KnowledgeBaseError(const std::string &message)
            : std::runtime_error(message) {}
    };

    // 文本不符合文法
    class SyntaxError : public KnowledgeBaseError
    {
    public:
        SyntaxError(const std::string &message, int line)
            : KnowledgeBaseError("line " + std::to_string(line) + ": " + message), detail(message), line(line) {}

        const std::string &getDetail() const { return detail; }
        int getLine() const { return line; }

    private:
        std::string detail;
        int line;
    };

    // 文件不存在，或者文字不在知识库中
    class NotFoundError : public KnowledgeBaseError
    {
    public:
        explicit NotFoundError(const std::string &message)
            : KnowledgeBaseError(message) {}
    };

    // 对象输入不合法，例如空子句、没有前件的规则
    class StructuralError : public KnowledgeBaseError
    {
    public:
        explicit StructuralError(const std::string &message)
            : KnowledgeBaseError(message) {}
    };
}

#endif // ARGUMENT_SYSTEM_ERRORS_H
