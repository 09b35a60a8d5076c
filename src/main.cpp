#include <iostream>
#include <string>
#include <vector>
#include "KnowledgeBaseBuilder.h"
#include "ArgumentSerializer.h"
#include "EngineConfig.h"
#include "Errors.h"

using namespace ArgumentSystem;

namespace
{
    void printUsage()
    {
        std::cerr << "usage: argkb [--config FILE] [--literal LIT]... [--json] PROGRAM\n"
                  << "  PROGRAM  path of a program file, or the program text itself\n";
    }

    Literal literalFromText(const std::string &text)
    {
        if (!text.empty() && text[0] == '~')
        {
            return Literal(text.substr(1), false);
        }
        return Literal(text, true);
    }

    void printCase(const KnowledgeBase &kb, const Literal &literal, const EvidenceOptions &options)
    {
        const Case &c = kb.getCase(literal);
        std::cout << literal.toString() << " [" << caseStatusToString(c.getStatus()) << "]" << std::endl;
        for (const auto &argument : kb.getArguments(literal, options))
        {
            std::cout << "  " << argument.toString(kb) << std::endl;
        }
    }
}

int main(int argc, char **argv)
{
    std::string configFile;
    std::string source;
    std::vector<std::string> literals;
    bool asJson = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--literal")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "缺少参数值: " << arg << std::endl;
                printUsage();
                return 2;
            }
            if (arg == "--config")
            {
                configFile = argv[++i];
            }
            else
            {
                literals.push_back(argv[++i]);
            }
        }
        else if (arg == "--json")
        {
            asJson = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (source.empty())
        {
            source = arg;
        }
        else
        {
            printUsage();
            return 2;
        }
    }

    if (source.empty())
    {
        printUsage();
        return 2;
    }

    try
    {
        EngineConfig config;
        if (!configFile.empty())
        {
            config = EngineConfig::fromJsonFile(configFile);
        }

        KnowledgeBaseBuilder builder(config);
        KnowledgeBase kb = builder.fromString(source);
        EvidenceOptions options = config.evidenceOptions();

        if (asJson)
        {
            if (literals.empty())
            {
                std::cout << ArgumentSerializer::serializeKnowledgeBase(kb, true, options).dump(2) << std::endl;
            }
            else
            {
                json result = json::array();
                for (const auto &text : literals)
                {
                    Literal literal = literalFromText(text);
                    json case_json = ArgumentSerializer::serializeCase(kb, kb.getCase(literal));
                    case_json["arguments"] = ArgumentSerializer::serializeArguments(kb, kb.getArguments(literal, options));
                    result.push_back(case_json);
                }
                std::cout << result.dump(2) << std::endl;
            }
            return 0;
        }

        if (literals.empty())
        {
            for (const auto &literal : kb.getLiterals())
            {
                printCase(kb, *literal, options);
            }
        }
        else
        {
            for (const auto &text : literals)
            {
                printCase(kb, literalFromText(text), options);
            }
        }
    }
    catch (const KnowledgeBaseError &e)
    {
        std::cerr << "argkb: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
