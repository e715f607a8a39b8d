#include "Circuits.h"
#include <gtest/gtest.h>

using namespace sec;
using namespace sec::test;

static InputAssignment Inputs(uint64_t en, uint64_t rst_n) {
    return {{"en", BitVector::Constant(en, 1)}, {"rst_n", BitVector::Constant(rst_n, 1)}};
}

TEST(CircuitTest, ResetStateIsIdempotent) {
    shared_ptr<CircuitModel> gate = GateCounter();
    State a = gate->ResetState();
    State b = gate->ResetState();
    EXPECT_TRUE(a.Identical(b));
    EXPECT_EQ(a.Key(), b.Key());
    EXPECT_EQ(a.ToString(), "q0=1'b0 q1=1'b0");
}

TEST(CircuitTest, ActiveLowResetExposesLogicalValue) {
    vector<Register> regs{Register("r", 3, 5, ResetPolarity::ActiveLow, "rst_n")};
    ExprRef r = Expr::Reg("r", 3);
    shared_ptr<CircuitModel> m = CircuitModel::Build("m", regs, {{"rst_n", 1}}, {{"r", r}}, {{"o", r}});
    EXPECT_EQ(m->ResetState().Get("r").Value(), 5u);
}

TEST(CircuitTest, EvaluateCountsAndResets) {
    shared_ptr<CircuitModel> gate = GateCounter();
    State s = gate->ResetState();
    for (uint64_t expected = 1; expected <= 5; expected++) {
        StepResult step = gate->Evaluate(s, Inputs(1, 1));
        s = step.next;
        uint64_t q = (s.Get("q1").Value() << 1) | s.Get("q0").Value();
        EXPECT_EQ(q, expected % 4);
    }
    StepResult hold = gate->Evaluate(s, Inputs(0, 1));
    EXPECT_TRUE(hold.next.Identical(s));
    EXPECT_EQ(hold.outputs.at("q").Value(), 1u);

    StepResult reset = gate->Evaluate(s, Inputs(1, 0));
    EXPECT_TRUE(reset.next.Identical(gate->ResetState()));
}

TEST(CircuitTest, EvaluateIsPure) {
    shared_ptr<CircuitModel> gold = GoldCounter();
    State s = gold->ResetState();
    StepResult a = gold->Evaluate(s, Inputs(1, 1));
    StepResult b = gold->Evaluate(s, Inputs(1, 1));
    EXPECT_TRUE(a.next.Identical(b.next));
    EXPECT_EQ(s.Get("q").Value(), 0u);
}

TEST(CircuitTest, EvaluateRequiresEveryInput) {
    shared_ptr<CircuitModel> gold = GoldCounter();
    InputAssignment partial{{"en", BitVector::Constant(1, 1)}};
    EXPECT_THROW(gold->Evaluate(gold->ResetState(), partial), InternalInconsistency);
    InputAssignment wide{{"en", BitVector::Constant(1, 2)}, {"rst_n", BitVector::Constant(1, 1)}};
    EXPECT_THROW(gold->Evaluate(gold->ResetState(), wide), WidthMismatch);
}

TEST(CircuitTest, BuildRejectsUndeclaredReferences) {
    ExprRef r = Expr::Reg("r", 1);
    ExprRef ghost = Expr::Reg("ghost", 1);
    ExprRef missing = Expr::Input("missing", 1);
    vector<Register> regs{Register("r", 1, 0)};

    EXPECT_THROW(CircuitModel::Build("m", regs, {}, {{"r", ghost}}, {}), UnknownReference);
    EXPECT_THROW(CircuitModel::Build("m", regs, {}, {{"r", r}}, {{"o", missing}}), UnknownReference);
    EXPECT_THROW(CircuitModel::Build("m", regs, {}, {}, {}), MissingNextState);
    EXPECT_THROW(CircuitModel::Build("m", regs, {}, {{"r", r}, {"s", r}}, {}), UnknownReference);
}

TEST(CircuitTest, BuildRejectsNameCollisions) {
    ExprRef r = Expr::Reg("r", 1);
    vector<Register> twice{Register("r", 1, 0), Register("r", 1, 1)};
    EXPECT_THROW(CircuitModel::Build("m", twice, {}, {{"r", r}}, {}), DuplicateName);

    vector<Register> regs{Register("r", 1, 0)};
    EXPECT_THROW(CircuitModel::Build("m", regs, {{"r", 1}}, {{"r", r}}, {}), DuplicateName);
}

TEST(CircuitTest, BuildRejectsWidthErrors) {
    ExprRef r = Expr::Reg("r", 2);
    vector<Register> regs{Register("r", 2, 0)};
    EXPECT_THROW(CircuitModel::Build("m", regs, {}, {{"r", Expr::Const(0, 3)}}, {}), WidthMismatch);
    // a leaf read with a width other than its declaration
    EXPECT_THROW(CircuitModel::Build("m", regs, {}, {{"r", r}}, {{"o", Expr::Reg("r", 1)}}), WidthMismatch);
    EXPECT_THROW(Register("r", 2, 4), WidthOverflow);
    EXPECT_THROW(Expr::Add(r, Expr::Const(1, 3)), WidthMismatch);
}

TEST(CircuitTest, StructuralEquality) {
    EXPECT_TRUE(CircuitModel::StructurallyEqual(*GateCounter(), *GateCounter()));
    EXPECT_TRUE(CircuitModel::StructurallyEqual(*GoldCounter(), *GoldCounter()));
    EXPECT_FALSE(CircuitModel::StructurallyEqual(*GateCounter(), *GoldCounter()));
    EXPECT_FALSE(CircuitModel::StructurallyEqual(*GoldCounter(), *GoldCounter(true)));
}

TEST(CircuitTest, Widths) {
    shared_ptr<CircuitModel> gate = GateCounter();
    EXPECT_EQ(gate->TotalInputWidth(), 2u);
    EXPECT_EQ(gate->TotalStateWidth(), 2u);
    EXPECT_EQ(gate->GetNumRegisters(), 2);
    EXPECT_EQ(GoldCounter(false, 2)->TotalInputWidth(), 3u);
}
