#include <gtest/gtest.h>
#include "EngineConfig.h"
#include "Errors.h"
#include <filesystem>
#include <fstream>

namespace ArgumentSystem
{
    TEST(EngineConfigTest, Defaults)
    {
        EngineConfig config;
        EXPECT_FALSE(config.deduplicate);
        EXPECT_EQ(config.maxArguments, 0);
        EXPECT_FALSE(config.verbose);
        EXPECT_EQ(config.inputPolicy, InputPolicy::PATH_THEN_TEXT);
    }

    TEST(EngineConfigTest, FromJson)
    {
        json data = {{"deduplicate", true},
                     {"max_arguments", 25},
                     {"verbose", true},
                     {"input_policy", "text"},
                     {"unknown_key", 1}};
        EngineConfig config = EngineConfig::fromJson(data);
        EXPECT_TRUE(config.deduplicate);
        EXPECT_EQ(config.maxArguments, 25);
        EXPECT_TRUE(config.verbose);
        EXPECT_EQ(config.inputPolicy, InputPolicy::TEXT_ONLY);

        EvidenceOptions options = config.evidenceOptions();
        EXPECT_TRUE(options.deduplicate);
        EXPECT_EQ(options.maxArguments, 25);
    }

    TEST(EngineConfigTest, JsonRoundTrip)
    {
        EngineConfig config;
        config.deduplicate = true;
        config.inputPolicy = InputPolicy::PATH_ONLY;
        EngineConfig copy = EngineConfig::fromJson(config.toJson());
        EXPECT_EQ(copy.deduplicate, config.deduplicate);
        EXPECT_EQ(copy.maxArguments, config.maxArguments);
        EXPECT_EQ(copy.inputPolicy, config.inputPolicy);
    }

    TEST(EngineConfigTest, WrongTypes)
    {
        EXPECT_THROW(EngineConfig::fromJson({{"deduplicate", "yes"}}), StructuralError);
        EXPECT_THROW(EngineConfig::fromJson({{"max_arguments", -1}}), StructuralError);
        EXPECT_THROW(EngineConfig::fromJson({{"input_policy", "guess"}}), StructuralError);
        EXPECT_THROW(EngineConfig::fromJson(json::array()), StructuralError);
    }

    TEST(EngineConfigTest, FromFile)
    {
        const std::string filename = "engine_config_test.json";
        {
            std::ofstream file(filename);
            file << R"({"deduplicate": true, "max_arguments": 3})";
        }
        EngineConfig config = EngineConfig::fromJsonFile(filename);
        std::filesystem::remove(filename);

        EXPECT_TRUE(config.deduplicate);
        EXPECT_EQ(config.maxArguments, 3);
    }

    TEST(EngineConfigTest, MissingOrBrokenFile)
    {
        EXPECT_THROW(EngineConfig::fromJsonFile("no_such_config.json"), NotFoundError);

        const std::string filename = "broken_config_test.json";
        {
            std::ofstream file(filename);
            file << "{ deduplicate: ";
        }
        EXPECT_THROW(EngineConfig::fromJsonFile(filename), StructuralError);
        std::filesystem::remove(filename);
    }
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
