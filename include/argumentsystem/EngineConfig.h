#ifndef ARGUMENT_SYSTEM_ENGINE_CONFIG_H
#define ARGUMENT_SYSTEM_ENGINE_CONFIG_H

#include <string>
#include <nlohmann/json.hpp>
#include "EvidenceEnumerator.h"

using json = nlohmann::json;

namespace ArgumentSystem
{
    // 单个字符串输入的解释方式
    enum class InputPolicy
    {
        PATH_THEN_TEXT, // 先当作文件路径，文件不存在时当作文法文本
        TEXT_ONLY,
        PATH_ONLY
    };

    std::string inputPolicyToString(InputPolicy policy);
    InputPolicy inputPolicyFromString(const std::string &name);

    struct EngineConfig
    {
        bool deduplicate = false;
        size_t maxArguments = 0; // 0 表示不限
        bool verbose = false;
        InputPolicy inputPolicy = InputPolicy::PATH_THEN_TEXT;

        EvidenceOptions evidenceOptions() const;

        // 未知的键忽略，类型不对抛出 StructuralError
        static EngineConfig fromJson(const json &config);
        // 文件不存在抛出 NotFoundError
        static EngineConfig fromJsonFile(const std::string &filename);
        json toJson() const;
    };
}

#endif // ARGUMENT_SYSTEM_ENGINE_CONFIG_H
