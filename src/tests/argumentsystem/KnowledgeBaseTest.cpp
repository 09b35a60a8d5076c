#include <gtest/gtest.h>
#include "KnowledgeBase.h"
#include "Errors.h"
#include "LiteralTable.h"
#include <unordered_map>

namespace ArgumentSystem
{
    class KnowledgeBaseTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            // sunny, stay_home.
            // ~happy :- sunny, stay_home.
            // ~work_well :- stay_home.
            // happy :- stay_home.
            // work_well :- happy.
            program.clauses.push_back(Clause({Literal("sunny"), Literal("stay_home")}));
            program.rules.push_back(Rule(Literal("happy", false), {Literal("sunny"), Literal("stay_home")}));
            program.rules.push_back(Rule(Literal("work_well", false), {Literal("stay_home")}));
            program.rules.push_back(Rule(Literal("happy"), {Literal("stay_home")}));
            program.rules.push_back(Rule(Literal("work_well"), {Literal("happy")}));
        }

        Program program;
    };

    TEST_F(KnowledgeBaseTest, LiteralPool)
    {
        KnowledgeBase kb(program);
        // sunny, stay_home, ~happy, ~work_well, happy, work_well
        EXPECT_EQ(kb.literalCount(), 6);
        EXPECT_EQ(kb.getClauses().size(), 1);
        EXPECT_EQ(kb.getRules().size(), 4);
        EXPECT_TRUE(kb.hasLiteral(Literal("happy", false)));
        EXPECT_FALSE(kb.hasLiteral(Literal("sunny", false)));
        EXPECT_FALSE(kb.getLiteralId(Literal("rainy")).has_value());
    }

    TEST_F(KnowledgeBaseTest, ConsolidationIdentity)
    {
        KnowledgeBase kb(program);

        // 同一个 (原子, 极性) 在知识库里只有一个实例
        std::unordered_map<std::string, const Literal *> seen;
        auto check = [&](const LiteralPtr &lit)
        {
            auto id = kb.getLiteralId(*lit);
            ASSERT_TRUE(id.has_value());
            EXPECT_EQ(kb.getLiteral(*id).get(), lit.get());
            auto it = seen.find(lit->key());
            if (it == seen.end())
            {
                seen[lit->key()] = lit.get();
            }
            else
            {
                EXPECT_EQ(it->second, lit.get());
            }
        };

        for (const auto &clause : kb.getClauses())
        {
            for (const auto &lit : clause.getLiterals())
            {
                check(lit);
            }
        }
        for (const auto &rule : kb.getRules())
        {
            check(rule.getHead());
            for (const auto &lit : rule.getBody())
            {
                check(lit);
            }
        }
        for (const auto &lit : kb.getLiterals())
        {
            EXPECT_EQ(kb.getCase(*lit).getClaim().get(), lit.get());
        }
        EXPECT_EQ(seen.size(), 6);
    }

    TEST_F(KnowledgeBaseTest, CallerObjectsAreNotReused)
    {
        KnowledgeBase kb(program);
        const Clause &inner = kb.getClause(0);
        EXPECT_EQ(inner, program.clauses[0]);
        EXPECT_NE(inner.getLiterals()[0].get(), program.clauses[0].getLiterals()[0].get());
    }

    TEST_F(KnowledgeBaseTest, CaseClassification)
    {
        KnowledgeBase kb(program);

        const Case &stayHome = kb.getCase(Literal("stay_home"));
        EXPECT_TRUE(stayHome.isContained());
        EXPECT_EQ(stayHome.getStatus(), CaseStatus::CONTAINED);
        EXPECT_EQ(stayHome.getAssertingClauses().size(), 1);
        EXPECT_TRUE(stayHome.getAssertingRules().empty());

        const Case &happy = kb.getCase(Literal("happy"));
        EXPECT_TRUE(happy.isEntailed());
        EXPECT_FALSE(happy.isContained());
        ASSERT_EQ(happy.getAssertingRules().size(), 1);
        EXPECT_EQ(kb.getRule(happy.getAssertingRules()[0]).toString(), "happy :- stay_home.");

        const Case &workWell = kb.getCase(Literal("work_well"));
        EXPECT_EQ(workWell.getStatus(), CaseStatus::ENTAILED);
    }

    TEST_F(KnowledgeBaseTest, UnsupportedLiteral)
    {
        // 只在规则前件中出现的文字
        program.rules.push_back(Rule(Literal("rich"), {Literal("lottery")}));
        KnowledgeBase kb(program);
        const Case &lottery = kb.getCase(Literal("lottery"));
        EXPECT_TRUE(lottery.isUnsupported());
        EXPECT_EQ(caseStatusToString(lottery.getStatus()), "unsupported");
    }

    TEST_F(KnowledgeBaseTest, ContainedWinsOverRules)
    {
        program.clauses.push_back(Clause({Literal("happy")}));
        KnowledgeBase kb(program);
        const Case &happy = kb.getCase(Literal("happy"));
        EXPECT_TRUE(happy.isContained());
        EXPECT_FALSE(happy.isEntailed());
        EXPECT_EQ(happy.getAssertingRules().size(), 1);
    }

    TEST_F(KnowledgeBaseTest, DuplicateStatementsAreMerged)
    {
        program.clauses.push_back(Clause({Literal("stay_home"), Literal("sunny")}));
        program.rules.push_back(Rule(Literal("happy"), {Literal("stay_home")}));
        KnowledgeBase kb(program);
        EXPECT_EQ(kb.getClauses().size(), 1);
        EXPECT_EQ(kb.getRules().size(), 4);
        EXPECT_EQ(kb.getCase(Literal("sunny")).getAssertingClauses().size(), 1);
    }

    TEST_F(KnowledgeBaseTest, MissingLiteralThrowsNotFound)
    {
        KnowledgeBase kb(program);
        EXPECT_THROW(kb.getCase(Literal("rainy")), NotFoundError);
        EXPECT_THROW(kb.enumerateEvidence(Literal("rainy")), NotFoundError);
        EXPECT_THROW(kb.getArguments(Literal("sunny", false)), NotFoundError);
        EXPECT_THROW(kb.isSupported(Literal("rainy")), NotFoundError);
    }

    TEST_F(KnowledgeBaseTest, StructuralEquality)
    {
        KnowledgeBase kb1(program);

        Program reordered;
        reordered.rules.push_back(Rule(Literal("work_well"), {Literal("happy")}));
        reordered.rules.push_back(Rule(Literal("happy"), {Literal("stay_home")}));
        reordered.rules.push_back(Rule(Literal("work_well", false), {Literal("stay_home")}));
        reordered.rules.push_back(Rule(Literal("happy", false), {Literal("stay_home"), Literal("sunny")}));
        reordered.clauses.push_back(Clause({Literal("stay_home"), Literal("sunny")}));
        KnowledgeBase kb2(reordered);

        EXPECT_EQ(kb1, kb2);

        reordered.rules.pop_back();
        EXPECT_NE(kb1, KnowledgeBase(reordered));
    }

    TEST_F(KnowledgeBaseTest, EmptyKnowledgeBase)
    {
        KnowledgeBase kb;
        EXPECT_EQ(kb.literalCount(), 0);
        EXPECT_TRUE(kb.getClauses().empty());
        EXPECT_EQ(kb.toString(), "");
        EXPECT_EQ(kb, KnowledgeBase(Program()));
    }

    TEST(LiteralTableTest, KeyedOnAtomAndPolarity)
    {
        LiteralTable table;
        int tilde = table.insert(Literal("~x", true));
        int negated = table.insert(Literal("x", false));
        EXPECT_NE(tilde, negated);
        EXPECT_EQ(table.getId(Literal("x", false)), negated);
        EXPECT_EQ(table.get(negated)->getAtom(), "x");
        EXPECT_FALSE(table.get(negated)->isPositive());
        EXPECT_EQ(table.getId(Literal("x")), -1);
    }

    TEST_F(KnowledgeBaseTest, InvalidAtomNamesAreRejected)
    {
        Program tilde;
        tilde.clauses.push_back(Clause({Literal("~x", true)}));
        tilde.rules.push_back(Rule(Literal("x", false), {Literal("y")}));
        EXPECT_THROW(KnowledgeBase{tilde}, StructuralError);

        for (const std::string atom : {"", "stay home", "1bad", "a-b"})
        {
            Program bad;
            bad.clauses.push_back(Clause({Literal(atom)}));
            EXPECT_THROW(KnowledgeBase{bad}, StructuralError) << "atom: '" << atom << "'";

            Program badRule;
            badRule.rules.push_back(Rule(Literal("x", false), {Literal(atom)}));
            EXPECT_THROW(KnowledgeBase{badRule}, StructuralError) << "atom: '" << atom << "'";
        }

        EXPECT_TRUE(Literal::isValidAtom("work_well2"));
        EXPECT_TRUE(Literal::isValidAtom("X"));
    }
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
