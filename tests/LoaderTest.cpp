#include "AigerLoader.h"
#include "Btor2Loader.h"
#include "Circuits.h"
#include "EquivalenceEngine.h"
#include <gtest/gtest.h>

using namespace sec;
using namespace sec::test;

static string Data(const string &file) {
    return string(SEC_TEST_DATA_DIR) + "/" + file;
}

static shared_ptr<CircuitModel> LoadBtor2(const string &file) {
    Btor2Loader loader(QuietLog());
    return loader.Load(Data(file));
}

static EquivalenceResult CheckFiles(shared_ptr<CircuitModel> gate, shared_ptr<CircuitModel> gold) {
    EquivalenceEngine engine(DefaultSettings(), gate, gold, QuietLog());
    return engine.Check();
}

TEST(LoaderTest, Btor2CounterShape) {
    shared_ptr<CircuitModel> gate = LoadBtor2("counter_gate.btor2");
    EXPECT_EQ(gate->Name(), "counter_gate");
    EXPECT_EQ(gate->GetNumInputs(), 2);
    EXPECT_EQ(gate->GetNumRegisters(), 2);
    ASSERT_EQ(gate->Outputs().count("q"), 1u);
    EXPECT_EQ(gate->Outputs().at("q")->Width(), 2u);
    EXPECT_EQ(gate->ResetState().Get("q1").Value(), 0u);

    shared_ptr<CircuitModel> gold = LoadBtor2("counter_gold.btor2");
    EXPECT_EQ(gold->TotalStateWidth(), 2u);
    EXPECT_EQ(gold->Inputs().at("rst_n"), 1u);
}

TEST(LoaderTest, Btor2CountersAreEquivalent) {
    EquivalenceResult res = CheckFiles(LoadBtor2("counter_gate.btor2"), LoadBtor2("counter_gold.btor2"));
    EXPECT_EQ(res.verdict, CheckResult::Pass);
    EXPECT_EQ(res.proof, ProofKind::Exhaustive);
    EXPECT_GE(res.boundedProofDepth, 4);
}

TEST(LoaderTest, Btor2MutatedGoldDiverges) {
    EquivalenceResult res = CheckFiles(LoadBtor2("counter_gate.btor2"), LoadBtor2("counter_gold_always.btor2"));
    ASSERT_EQ(res.verdict, CheckResult::Fail);
    EXPECT_EQ(res.divergence.cycle, 1);
    EXPECT_EQ(res.divergence.output, "q");
    EXPECT_EQ(res.trace[0].inputs.at("en").Value(), 0u);
}

TEST(LoaderTest, Btor2WidthMismatchOfInputs) {
    EXPECT_THROW(CheckFiles(LoadBtor2("counter_gate.btor2"), LoadBtor2("counter_gold_wide_en.btor2")), InterfaceMismatch);
}

TEST(LoaderTest, AigerAgainstBtor2) {
    AigerLoader loader(QuietLog());
    shared_ptr<CircuitModel> gate = loader.Load(Data("counter_gate.aag"));
    EXPECT_EQ(gate->Name(), "counter_gate");
    EXPECT_EQ(gate->GetNumRegisters(), 2);
    EXPECT_EQ(gate->Inputs().count("rst_n"), 1u);
    EXPECT_EQ(gate->Outputs().size(), 2u);

    EquivalenceResult res = CheckFiles(gate, LoadBtor2("counter_bits_gold.btor2"));
    EXPECT_EQ(res.verdict, CheckResult::Pass);
    EXPECT_GE(res.boundedProofDepth, 4);
}

TEST(LoaderTest, ModelNameFromPath) {
    EXPECT_EQ(ModelName("rtl/counter_gate.btor2"), "counter_gate");
    EXPECT_EQ(ModelName("C:\\work\\gold.aag"), "gold");
    EXPECT_EQ(ModelName("plain"), "plain");
    EXPECT_EQ(ModelName("dir.v1/plain"), "plain");
}

TEST(LoaderTest, Rejections) {
    EXPECT_THROW(LoadBtor2("counter_bad.btor2"), UnsupportedConstruct);
    EXPECT_THROW(LoadBtor2("malformed.btor2"), LoadError);
    EXPECT_THROW(LoadBtor2("does_not_exist.btor2"), LoadError);

    AigerLoader loader(QuietLog());
    EXPECT_THROW(loader.Load(Data("does_not_exist.aag")), LoadError);
}
