#ifndef ARGUMENT_SYSTEM_ARGUMENT_SERIALIZER_H
#define ARGUMENT_SYSTEM_ARGUMENT_SERIALIZER_H

#include <nlohmann/json.hpp>
#include "KnowledgeBase.h"
#include <fstream>
#include <iostream>
#include <vector>
#include <string>

using json = nlohmann::json;

namespace ArgumentSystem
{
    // 把知识库、case 和论证导出为 JSON，交给外部的论证语义求解器
    class ArgumentSerializer
    {
    public:
        ////////////////////////////
        // 单个文字
        static json serializeLiteral(const Literal &literal)
        {
            return {{"atom", literal.getAtom()},
                    {"positive", literal.isPositive()},
                    {"text", literal.toString()}};
        }

        ////////////////////////////
        // 文字的支持索引
        static json serializeCase(const KnowledgeBase &kb, const Case &c)
        {
            json case_json;
            case_json["literal"] = c.getClaim()->toString();
            case_json["status"] = caseStatusToString(c.getStatus());
            case_json["supported"] = kb.isSupported(*c.getClaim());

            std::vector<std::string> clauses;
            for (int id : c.getAssertingClauses())
            {
                clauses.push_back(kb.getClause(id).toString());
            }
            case_json["asserting_clauses"] = clauses;

            std::vector<std::string> rules;
            for (int id : c.getAssertingRules())
            {
                rules.push_back(kb.getRule(id).toString());
            }
            case_json["asserting_rules"] = rules;
            return case_json;
        }

        ////////////////////////////
        // 一个论证: (support, claim)
        static json serializeArgument(const KnowledgeBase &kb, const Argument &argument)
        {
            json arg_json;
            arg_json["claim"] = argument.claim->toString();

            std::vector<std::string> clauses;
            for (int id : argument.support.getClauseIds())
            {
                clauses.push_back(kb.getClause(id).toString());
            }
            arg_json["clauses"] = clauses;

            std::vector<std::string> rules;
            for (int id : argument.support.getRuleIds())
            {
                rules.push_back(kb.getRule(id).toString());
            }
            arg_json["rules"] = rules;
            return arg_json;
        }

        static json serializeArguments(const KnowledgeBase &kb, const std::vector<Argument> &arguments)
        {
            json list = json::array();
            for (const auto &argument : arguments)
            {
                list.push_back(serializeArgument(kb, argument));
            }
            return list;
        }

        ////////////////////////////
        // 整个知识库；withArguments 为 true 时附带每个文字的全部论证
        static json serializeKnowledgeBase(const KnowledgeBase &kb, bool withArguments,
                                           const EvidenceOptions &options = EvidenceOptions())
        {
            json kb_json;
            kb_json["clauses"] = json::array();
            for (const auto &clause : kb.getClauses())
            {
                kb_json["clauses"].push_back(clause.toString());
            }
            kb_json["rules"] = json::array();
            for (const auto &rule : kb.getRules())
            {
                kb_json["rules"].push_back(rule.toString());
            }
            kb_json["cases"] = json::array();
            for (const auto &literal : kb.getLiterals())
            {
                json case_json = serializeCase(kb, kb.getCase(*literal));
                if (withArguments)
                {
                    case_json["arguments"] = serializeArguments(kb, kb.getArguments(*literal, options));
                }
                kb_json["cases"].push_back(case_json);
            }
            return kb_json;
        }

        static bool saveToFile(const json &data, const std::string &filename)
        {
            std::ofstream file(filename);
            if (!file.is_open())
            {
                std::cerr << "无法写入文件: " << filename << std::endl;
                return false;
            }
            file << data.dump(2) << std::endl;
            return true;
        }
    };
}

#endif // ARGUMENT_SYSTEM_ARGUMENT_SERIALIZER_H
