#include "BitVector.h"
#include <gtest/gtest.h>

using namespace sec;

TEST(BitVectorTest, ConstantMustFitWidth) {
    EXPECT_EQ(BitVector::Constant(3, 2).Value(), 3u);
    EXPECT_THROW(BitVector::Constant(4, 2), WidthOverflow);
    EXPECT_THROW(BitVector::Constant(0, 0), UnsupportedConstruct);
    EXPECT_THROW(BitVector::Constant(0, 65), UnsupportedConstruct);
    EXPECT_EQ(BitVector::Constant(~0ULL, 64).Value(), ~0ULL);
}

TEST(BitVectorTest, ArithmeticWrapsModuloWidth) {
    BitVector three = BitVector::Constant(3, 2);
    BitVector one = BitVector::Constant(1, 2);
    EXPECT_EQ((three + one).Value(), 0u);
    EXPECT_EQ((one - three).Value(), 2u);
    EXPECT_EQ((three * three).Value(), 1u);
    EXPECT_EQ((-one).Value(), 3u);
    EXPECT_EQ((~one).Value(), 2u);
    EXPECT_EQ((three + one).Width(), 2u);
}

TEST(BitVectorTest, ShiftsPastWidthGiveZero) {
    BitVector a = BitVector::Constant(0b1011, 4);
    EXPECT_EQ(Shl(a, BitVector::Constant(1, 4)).Value(), 0b0110u);
    EXPECT_EQ(Shr(a, BitVector::Constant(2, 4)).Value(), 0b0010u);
    EXPECT_EQ(Shl(a, BitVector::Constant(4, 4)).Value(), 0u);
    EXPECT_EQ(Shr(a, BitVector::Constant(9, 4)).Value(), 0u);
}

TEST(BitVectorTest, ComparisonsAreOneBit) {
    BitVector a = BitVector::Constant(2, 3);
    BitVector b = BitVector::Constant(5, 3);
    EXPECT_EQ(Equals(a, b).Width(), 1u);
    EXPECT_EQ(Equals(a, a).Value(), 1u);
    EXPECT_EQ(NotEquals(a, b).Value(), 1u);
    EXPECT_EQ(Ult(a, b).Value(), 1u);
    EXPECT_EQ(Ule(b, b).Value(), 1u);
    EXPECT_EQ(Ugt(a, b).Value(), 0u);
    EXPECT_EQ(Uge(a, b).Value(), 0u);
}

TEST(BitVectorTest, Reductions) {
    EXPECT_EQ(RedAnd(BitVector::Constant(7, 3)).Value(), 1u);
    EXPECT_EQ(RedAnd(BitVector::Constant(6, 3)).Value(), 0u);
    EXPECT_EQ(RedOr(BitVector::Constant(0, 3)).Value(), 0u);
    EXPECT_EQ(RedXor(BitVector::Constant(0b1101, 4)).Value(), 1u);
}

TEST(BitVectorTest, WidthChangingOperations) {
    BitVector hi = BitVector::Constant(0b10, 2);
    BitVector lo = BitVector::Constant(0b01, 2);
    BitVector c = Concat(hi, lo);
    EXPECT_EQ(c.Width(), 4u);
    EXPECT_EQ(c.Value(), 0b1001u);
    EXPECT_EQ(Slice(c, 2, 1).Value(), 0b00u);
    EXPECT_EQ(Slice(c, 3, 3).Value(), 1u);
    EXPECT_EQ(Uext(hi, 2).Value(), 0b0010u);
    EXPECT_EQ(Sext(hi, 2).Value(), 0b1110u);
    EXPECT_EQ(Ite(BitVector::Constant(0, 1), hi, lo).Value(), 0b01u);
    EXPECT_THROW(Slice(c, 4, 0), WidthMismatch);
}

TEST(BitVectorTest, MixedWidthsAreRejected) {
    BitVector a = BitVector::Constant(1, 2);
    BitVector b = BitVector::Constant(1, 3);
    EXPECT_THROW(a + b, WidthMismatch);
    EXPECT_THROW(Equals(a, b), WidthMismatch);
    EXPECT_THROW(Ite(a, b, b), WidthMismatch);
}

TEST(BitVectorTest, SymbolicOperandsDeferEvaluation) {
    SymbolTable table;
    BitVector x = table.Fresh(4, "x");
    BitVector y = table.Fresh(4, "y");
    EXPECT_EQ(table.NumVars(), 2);
    EXPECT_EQ(table.Name(1), "y");

    BitVector sum = x + y;
    EXPECT_TRUE(sum.IsSymbolic());
    EXPECT_EQ(sum.Node()->op, BvOp::Add);
    EXPECT_THROW(sum.Value(), InternalInconsistency);

    // two distinct symbols are never assumed equal
    BitVector eq = Equals(x, y);
    EXPECT_TRUE(eq.IsSymbolic());
    EXPECT_EQ(eq.Width(), 1u);
}

TEST(BitVectorTest, SimpleIdentitiesFold) {
    SymbolTable table;
    BitVector x = table.Fresh(4, "x");
    BitVector zero = BitVector::Constant(0, 4);
    EXPECT_TRUE((x ^ x).IsConcrete());
    EXPECT_EQ((x ^ x).Value(), 0u);
    EXPECT_EQ((x & zero).Value(), 0u);
    EXPECT_TRUE((x + zero).Identical(x));
    EXPECT_TRUE((~~x).Identical(x));
    EXPECT_EQ(Equals(x, x).Value(), 1u);
    EXPECT_TRUE(Ite(BitVector::Constant(1, 1), x, zero).Identical(x));
}

TEST(BitVectorTest, SubstituteEvaluatesTerms) {
    SymbolTable table;
    BitVector x = table.Fresh(4, "x");
    BitVector y = table.Fresh(4, "y");
    BitVector term = Ite(Ult(x, y), y - x, x * y);

    VarAssignment a{{0, 3}, {1, 5}};
    EXPECT_EQ(Substitute(term, a).Value(), 2u);
    VarAssignment b{{0, 5}, {1, 3}};
    EXPECT_EQ(Substitute(term, b).Value(), 15u);
    // y unassigned reads as zero
    VarAssignment c{{0, 7}};
    EXPECT_EQ(Substitute(term, c).Value(), 0u);
}

TEST(BitVectorTest, ToString) {
    EXPECT_EQ(BitVector::Constant(1, 2).ToString(), "2'b01");
    EXPECT_EQ(BitVector::Constant(5, 4).ToBinaryString(), "0101");
}
