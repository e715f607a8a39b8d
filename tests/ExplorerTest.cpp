#include "Circuits.h"
#include "Explorer.h"
#include <gtest/gtest.h>

using namespace sec;
using namespace sec::test;

TEST(ExplorerTest, InputAlphabetEnumeratesEveryAssignment) {
    vector<InputAssignment> alphabet = InputAlphabet({{"a", 1}, {"b", 2}});
    ASSERT_EQ(alphabet.size(), 8u);
    EXPECT_EQ(alphabet[0].at("a").Value(), 0u);
    EXPECT_EQ(alphabet[0].at("b").Value(), 0u);
    EXPECT_EQ(alphabet[1].at("a").Value(), 1u);
    EXPECT_EQ(alphabet[1].at("b").Value(), 0u);
    EXPECT_EQ(alphabet[2].at("a").Value(), 0u);
    EXPECT_EQ(alphabet[2].at("b").Value(), 1u);
    EXPECT_EQ(alphabet[7].at("b").Value(), 3u);

    EXPECT_EQ(InputAlphabet({}).size(), 1u);
    EXPECT_THROW(InputAlphabet({{"wide", 32}}), UnsupportedConstruct);
    EXPECT_THROW(InputAlphabet({{"a", 13}, {"b", 13}}), UnsupportedConstruct);
    EXPECT_EQ(InputAlphabet({{"a", 4}, {"b", 4}}).size(), 256u);
}

TEST(ExplorerTest, SymbolicInputsAreNamedByCycle) {
    SymbolTable table;
    InputAssignment in = SymbolicInputs({{"en", 1}, {"rst_n", 1}}, table, 3);
    EXPECT_TRUE(in.at("en").IsSymbolic());
    EXPECT_EQ(table.NumVars(), 2);
    EXPECT_EQ(table.Name(0), "en@3");
    EXPECT_EQ(table.Name(1), "rst_n@3");
}

TEST(ExplorerTest, CounterClosesAfterFourStates) {
    Explorer explorer(DefaultSettings(), GoldCounter(), QuietLog());
    ExplorationResult res = explorer.RunEnumerated();
    EXPECT_TRUE(res.closed);
    EXPECT_FALSE(res.boundExhausted);
    EXPECT_FALSE(res.symbolic);
    EXPECT_EQ(res.depth, 4);
    EXPECT_EQ(res.numStates, 4u);

    const vector<State> &states = explorer.ReachableStates();
    ASSERT_EQ(states.size(), 4u);
    for (uint64_t i = 0; i < 4; i++) EXPECT_EQ(states[i].Get("q").Value(), i);
}

TEST(ExplorerTest, BoundExhaustedWhileStatesAreNew) {
    Settings settings = DefaultSettings();
    settings.maxDepth = 2;
    Explorer explorer(settings, GateCounter(), QuietLog());
    ExplorationResult res = explorer.RunEnumerated();
    EXPECT_FALSE(res.closed);
    EXPECT_TRUE(res.boundExhausted);
    EXPECT_EQ(res.depth, 2);
    EXPECT_EQ(res.numStates, 3u);
}

TEST(ExplorerTest, RunsAreIndependent) {
    Explorer explorer(DefaultSettings(), GateCounter(), QuietLog());
    ExplorationResult first = explorer.RunEnumerated();
    ExplorationResult second = explorer.RunEnumerated();
    EXPECT_EQ(first.numStates, second.numStates);
    EXPECT_EQ(first.depth, second.depth);
}

TEST(ExplorerTest, SymbolicStatesAreNotDeduplicated) {
    Settings settings = DefaultSettings();
    settings.maxDepth = 3;
    Explorer explorer(settings, GoldCounter(), QuietLog());
    ExplorationResult res = explorer.RunSymbolic();
    EXPECT_TRUE(res.symbolic);
    EXPECT_TRUE(res.boundExhausted);
    EXPECT_EQ(res.depth, 3);
    EXPECT_EQ(res.numSymbolic, 3u);
    EXPECT_EQ(res.numStates, 1u);
}

TEST(ExplorerTest, ConcreteSuccessorsOfSymbolicStepsAreDeduplicated) {
    // the register is loaded with a constant whatever the input
    ExprRef r = Expr::Reg("r", 2);
    ExprRef a = Expr::Input("a", 2);
    shared_ptr<CircuitModel> m = CircuitModel::Build("m", {Register("r", 2, 0)}, {{"a", 2}},
                                                     {{"r", Expr::Const(1, 2)}}, {{"o", Expr::Xor(r, a)}});
    Explorer explorer(DefaultSettings(), m, QuietLog());
    ExplorationResult res = explorer.RunSymbolic();
    EXPECT_TRUE(res.closed);
    EXPECT_EQ(res.depth, 2);
    EXPECT_EQ(res.numStates, 2u);
    EXPECT_EQ(res.numSymbolic, 0u);
}

TEST(ExplorerTest, RunPicksModeFromInputWidth) {
    Settings settings = DefaultSettings();
    settings.enumLimit = 1;
    settings.maxDepth = 2;
    Explorer explorer(settings, GateCounter(), QuietLog());
    EXPECT_TRUE(explorer.Run().symbolic);

    settings.enumLimit = 2;
    Explorer enumerating(settings, GateCounter(), QuietLog());
    EXPECT_FALSE(enumerating.Run().symbolic);
}
