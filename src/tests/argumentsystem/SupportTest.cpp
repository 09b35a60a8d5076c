#include <gtest/gtest.h>
#include "KnowledgeBaseBuilder.h"

namespace ArgumentSystem
{
    class SupportTest : public ::testing::Test
    {
    protected:
        KnowledgeBaseBuilder builder;
    };

    TEST_F(SupportTest, ContainedLiteralsAreSupported)
    {
        KnowledgeBase kb = builder.fromText("a, b. c :- a.");
        EXPECT_TRUE(kb.isSupported(Literal("a")));
        EXPECT_TRUE(kb.isSupported(Literal("b")));
        EXPECT_TRUE(kb.isSupported(Literal("c")));
        EXPECT_TRUE(kb.isRuleSupported(0));
        EXPECT_EQ(kb.getSupportingRules(Literal("c")), std::vector<int>{0});
    }

    TEST_F(SupportTest, RuleNeedsEveryBodyLiteral)
    {
        KnowledgeBase kb = builder.fromText("a. c :- a, b. c :- a.");
        // b 没有任何支持，第一条规则不被支持
        EXPECT_FALSE(kb.isSupported(Literal("b")));
        EXPECT_FALSE(kb.isRuleSupported(0));
        EXPECT_TRUE(kb.isRuleSupported(1));
        EXPECT_TRUE(kb.isSupported(Literal("c")));
        EXPECT_EQ(kb.getSupportingRules(Literal("c")), std::vector<int>{1});
    }

    TEST_F(SupportTest, CycleIsNotSelfSupporting)
    {
        KnowledgeBase kb = builder.fromText("p :- q. q :- p. r :- r.");
        EXPECT_FALSE(kb.isSupported(Literal("p")));
        EXPECT_FALSE(kb.isSupported(Literal("q")));
        EXPECT_FALSE(kb.isSupported(Literal("r")));
        EXPECT_TRUE(kb.getSupportingRules(Literal("p")).empty());
    }

    TEST_F(SupportTest, CycleWithExitIsSupported)
    {
        KnowledgeBase kb = builder.fromText("d. a :- b. b :- c. c :- a. c :- d.");
        EXPECT_TRUE(kb.isSupported(Literal("a")));
        EXPECT_TRUE(kb.isSupported(Literal("b")));
        EXPECT_TRUE(kb.isSupported(Literal("c")));
    }

    TEST_F(SupportTest, SupportMatchesEvidence)
    {
        // 被支持当且仅当至少有一个证据集
        KnowledgeBase kb = builder.fromText(
            "sunny, stay_home.\n"
            "~happy :- sunny, stay_home.\n"
            "~work_well :- stay_home.\n"
            "happy :- stay_home.\n"
            "work_well :- happy.\n"
            "rich :- lottery.\n"
            "p :- q. q :- p, sunny.\n"
            "famous :- rich, happy.\n");

        for (const auto &literal : kb.getLiterals())
        {
            auto enumerator = kb.enumerateEvidence(*literal);
            bool hasEvidence = enumerator.next().has_value();
            EXPECT_EQ(kb.isSupported(*literal), hasEvidence) << literal->toString();
        }
    }
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
