#include "BitBlaster.h"
#include "SATSolver.h"
#include <gtest/gtest.h>

using namespace sec;

class BitBlasterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_solver = make_shared<SATSolver>(SATBackend::minisat);
        m_blaster = make_shared<BitBlaster>(m_solver);
        x = m_table.Fresh(4, "x");
        y = m_table.Fresh(4, "y");
    }

    void Require(const BitVector &cond) {
        m_solver->AddClause({m_blaster->EncodeBit(cond)});
    }

    void Fix(const BitVector &var, uint64_t value) {
        Require(Equals(var, BitVector::Constant(value, var.Width())));
    }

    shared_ptr<SATSolver> m_solver;
    shared_ptr<BitBlaster> m_blaster;
    SymbolTable m_table;
    BitVector x;
    BitVector y;
};

TEST_F(BitBlasterTest, SolvesForMissingOperand) {
    Require(Equals(x + y, BitVector::Constant(3, 4)));
    Fix(x, 1);
    ASSERT_TRUE(m_solver->Solve());
    EXPECT_EQ(m_blaster->ModelValue(y), 2u);
    EXPECT_EQ(m_blaster->VarValue(0, 4), 1u);
}

TEST_F(BitBlasterTest, WrapAroundIsModelled) {
    // 13 + y = 2 only through overflow
    Fix(x, 13);
    Require(Equals(x + y, BitVector::Constant(2, 4)));
    ASSERT_TRUE(m_solver->Solve());
    EXPECT_EQ(m_blaster->ModelValue(y), 5u);
}

TEST_F(BitBlasterTest, UnsatisfiableQuery) {
    int lit = m_blaster->EncodeBit(Ult(x, x));
    EXPECT_FALSE(m_solver->Solve(make_shared<cube>(cube{lit})));

    int gt = m_blaster->EncodeBit(Ugt(x, BitVector::Constant(15, 4)));
    EXPECT_FALSE(m_solver->Solve(make_shared<cube>(cube{gt})));
}

TEST_F(BitBlasterTest, ConstantsNeedNoVariables) {
    EXPECT_EQ(m_blaster->EncodeBit(BitVector::Constant(1, 1)), m_blaster->True());
    EXPECT_EQ(m_blaster->EncodeBit(BitVector::Constant(0, 1)), m_blaster->False());
    EXPECT_THROW(m_blaster->EncodeBit(x), WidthMismatch);
}

TEST_F(BitBlasterTest, AgreesWithConcreteEvaluation) {
    BitVector one = BitVector::Constant(1, 4);
    vector<BitVector> terms{
        x * y,
        x - y,
        -x,
        Shl(x, y),
        Shr(x, y & BitVector::Constant(3, 4)),
        Concat(Slice(x, 1, 0), Slice(y, 3, 2)),
        Sext(Slice(x, 2, 0), 1),
        Uext(RedXor(y), 3),
        Ite(Ule(x, y), x | y, x ^ one),
        Uext(Concat(RedAnd(x), RedOr(y)), 2),
    };

    vector<pair<uint64_t, uint64_t>> samples{{0, 0}, {3, 5}, {13, 2}, {15, 15}, {6, 1}};
    for (auto &s : samples) {
        auto solver = make_shared<SATSolver>(SATBackend::minisat);
        BitBlaster blaster(solver);
        solver->AddClause({blaster.EncodeBit(Equals(x, BitVector::Constant(s.first, 4)))});
        solver->AddClause({blaster.EncodeBit(Equals(y, BitVector::Constant(s.second, 4)))});
        // gates must exist before the solver call to be part of its model
        for (auto &t : terms) blaster.Encode(t);
        ASSERT_TRUE(solver->Solve());

        VarAssignment a{{0, s.first}, {1, s.second}};
        for (auto &t : terms) {
            EXPECT_EQ(blaster.ModelValue(t), Substitute(t, a).Value())
                << t.ToString() << " at x=" << s.first << " y=" << s.second;
        }
    }
}

TEST_F(BitBlasterTest, IncrementalAssumptions) {
    int lit = m_blaster->EncodeBit(Equals(x, y));
    EXPECT_TRUE(m_solver->Solve(make_shared<cube>(cube{lit})));
    EXPECT_EQ(m_blaster->ModelValue(x), m_blaster->ModelValue(y));

    m_solver->AddClause({-lit});
    EXPECT_TRUE(m_solver->Solve(make_shared<cube>(cube{-lit})));
    EXPECT_NE(m_blaster->ModelValue(x), m_blaster->ModelValue(y));
    EXPECT_FALSE(m_solver->Solve(make_shared<cube>(cube{lit})));
}
