#ifndef ARGUMENT_SYSTEM_KNOWLEDGE_BASE_BUILDER_H
#define ARGUMENT_SYSTEM_KNOWLEDGE_BASE_BUILDER_H

#include <string>
#include <variant>
#include "KnowledgeBase.h"
#include "EngineConfig.h"

namespace ArgumentSystem
{
    struct PathInput
    {
        std::string path;
    };

    struct TextInput
    {
        std::string text;
    };

    struct ObjectInput
    {
        Program program;
    };

    using ProgramInput = std::variant<PathInput, TextInput, ObjectInput>;

    // 三种输入最终都走同一个合并流程；任何错误都直接抛出，不会得到半成品知识库
    class KnowledgeBaseBuilder
    {
    public:
        explicit KnowledgeBaseBuilder(const EngineConfig &config = EngineConfig());

        KnowledgeBase build(const ProgramInput &input) const;

        // 按 config.inputPolicy 解释字符串。默认先当作路径：
        // 恰好与已存在文件同名的文法文本会被当作路径读取
        KnowledgeBase fromString(const std::string &source) const;

        KnowledgeBase fromFile(const std::string &filename) const;
        KnowledgeBase fromText(const std::string &text) const;
        KnowledgeBase fromProgram(const Program &program) const;

        // 读取并解析文件，不做合并
        Program readProgram(const std::string &filename) const;

        const EngineConfig &getConfig() const { return config; }

    private:
        EngineConfig config;

        KnowledgeBase consolidate(const Program &program, const std::string &origin) const;
    };
}

#endif // ARGUMENT_SYSTEM_KNOWLEDGE_BASE_BUILDER_H
