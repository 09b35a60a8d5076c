#include "EngineConfig.h"
#include "Errors.h"
#include <fstream>

namespace ArgumentSystem
{
    std::string inputPolicyToString(InputPolicy policy)
    {
        switch (policy)
        {
        case InputPolicy::PATH_THEN_TEXT:
            return "path-then-text";
        case InputPolicy::TEXT_ONLY:
            return "text";
        case InputPolicy::PATH_ONLY:
            return "path";
        }
        return "path-then-text";
    }

    InputPolicy inputPolicyFromString(const std::string &name)
    {
        if (name == "path-then-text")
        {
            return InputPolicy::PATH_THEN_TEXT;
        }
        if (name == "text")
        {
            return InputPolicy::TEXT_ONLY;
        }
        if (name == "path")
        {
            return InputPolicy::PATH_ONLY;
        }
        throw StructuralError("unknown input policy: " + name);
    }

    EvidenceOptions EngineConfig::evidenceOptions() const
    {
        EvidenceOptions options;
        options.deduplicate = deduplicate;
        options.maxArguments = maxArguments;
        return options;
    }

    EngineConfig EngineConfig::fromJson(const json &config)
    {
        if (!config.is_object())
        {
            throw StructuralError("engine config must be a JSON object");
        }

        EngineConfig result;
        try
        {
            if (config.contains("deduplicate"))
            {
                result.deduplicate = config.at("deduplicate").get<bool>();
            }
            if (config.contains("max_arguments"))
            {
                if (!config.at("max_arguments").is_number_unsigned())
                {
                    throw StructuralError("max_arguments must be a non-negative integer");
                }
                result.maxArguments = config.at("max_arguments").get<size_t>();
            }
            if (config.contains("verbose"))
            {
                result.verbose = config.at("verbose").get<bool>();
            }
            if (config.contains("input_policy"))
            {
                result.inputPolicy = inputPolicyFromString(config.at("input_policy").get<std::string>());
            }
        }
        catch (const json::type_error &e)
        {
            throw StructuralError(std::string("invalid engine config: ") + e.what());
        }
        return result;
    }

    EngineConfig EngineConfig::fromJsonFile(const std::string &filename)
    {
        std::ifstream file(filename);
        if (!file.is_open())
        {
            throw NotFoundError("无法打开配置文件: " + filename);
        }

        json config;
        try
        {
            file >> config;
        }
        catch (const json::parse_error &e)
        {
            throw StructuralError("解析配置文件 " + filename + " 失败: " + e.what());
        }
        return fromJson(config);
    }

    json EngineConfig::toJson() const
    {
        return {{"deduplicate", deduplicate},
                {"max_arguments", maxArguments},
                {"verbose", verbose},
                {"input_policy", inputPolicyToString(inputPolicy)}};
    }
}
