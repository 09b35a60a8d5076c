#include "KnowledgeBaseBuilder.h"
#include "ProgramParser.h"
#include "Errors.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

namespace ArgumentSystem
{
    KnowledgeBaseBuilder::KnowledgeBaseBuilder(const EngineConfig &config) : config(config) {}

    KnowledgeBase KnowledgeBaseBuilder::build(const ProgramInput &input) const
    {
        if (const auto *path = std::get_if<PathInput>(&input))
        {
            return fromFile(path->path);
        }
        if (const auto *text = std::get_if<TextInput>(&input))
        {
            return fromText(text->text);
        }
        return fromProgram(std::get<ObjectInput>(input).program);
    }

    KnowledgeBase KnowledgeBaseBuilder::fromString(const std::string &source) const
    {
        switch (config.inputPolicy)
        {
        case InputPolicy::TEXT_ONLY:
            return fromText(source);
        case InputPolicy::PATH_ONLY:
            return fromFile(source);
        case InputPolicy::PATH_THEN_TEXT:
            break;
        }

        std::error_code ec;
        if (fs::exists(source, ec))
        {
            return fromFile(source);
        }

        try
        {
            return fromText(source);
        }
        catch (const SyntaxError &e)
        {
            // 既不是文件也不是合法文本
            throw NotFoundError("'" + source + "' is neither an existing file nor valid syntax (" + e.what() + ")");
        }
    }

    KnowledgeBase KnowledgeBaseBuilder::fromFile(const std::string &filename) const
    {
        return consolidate(readProgram(filename), filename);
    }

    KnowledgeBase KnowledgeBaseBuilder::fromText(const std::string &text) const
    {
        Program program;
        try
        {
            program = ProgramParser::parse(text);
        }
        catch (const SyntaxError &e)
        {
            if (config.verbose)
            {
                std::cerr << "解析文本失败: " << e.what() << std::endl;
            }
            throw;
        }
        return consolidate(program, "<text>");
    }

    KnowledgeBase KnowledgeBaseBuilder::fromProgram(const Program &program) const
    {
        return consolidate(program, "<objects>");
    }

    Program KnowledgeBaseBuilder::readProgram(const std::string &filename) const
    {
        // 目录等非普通文件也能被 ifstream 打开，需要先排除
        std::error_code ec;
        if (!fs::is_regular_file(filename, ec))
        {
            if (config.verbose)
            {
                std::cerr << "不是普通文件: " << filename << std::endl;
            }
            throw NotFoundError("不是普通文件: " + filename);
        }

        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open())
        {
            if (config.verbose)
            {
                std::cerr << "无法打开文件: " << filename << std::endl;
            }
            throw NotFoundError("无法打开文件: " + filename);
        }

        std::stringstream content;
        content << file.rdbuf();
        if (file.bad())
        {
            if (config.verbose)
            {
                std::cerr << "读取文件失败: " << filename << std::endl;
            }
            throw NotFoundError("读取文件失败: " + filename);
        }
        file.close();

        try
        {
            return ProgramParser::parse(content.str());
        }
        catch (const SyntaxError &e)
        {
            if (config.verbose)
            {
                std::cerr << "处理文件 " << filename << " 时出错: " << e.what() << std::endl;
            }
            throw SyntaxError(filename + ": " + e.getDetail(), e.getLine());
        }
    }

    KnowledgeBase KnowledgeBaseBuilder::consolidate(const Program &program, const std::string &origin) const
    {
        KnowledgeBase kb(program);
        if (config.verbose)
        {
            std::cout << "从 " << origin << " 构建知识库: "
                      << kb.literalCount() << " 个文字, "
                      << kb.getClauses().size() << " 个子句, "
                      << kb.getRules().size() << " 条规则" << std::endl;
        }
        return kb;
    }
}
