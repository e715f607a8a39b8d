#ifndef EXPR_H
#define EXPR_H

#include "BitVector.h"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

namespace sec {

class Expr;
typedef shared_ptr<const Expr> ExprRef;

// register or input name -> current value
typedef map<string, BitVector> Valuation;

// immutable expression tree, a pure function of registers and inputs
class Expr {
  public:
    enum Kind { REGISTER,
                INPUT,
                CONSTANT,
                OPERATION };

    static ExprRef Reg(const string &name, unsigned width);
    static ExprRef Input(const string &name, unsigned width);
    static ExprRef Const(uint64_t value, unsigned width);

    // width checked here, so a built tree is always well formed
    static ExprRef Op(BvOp op, const vector<ExprRef> &args, unsigned hi = 0, unsigned lo = 0);

    static ExprRef Not(const ExprRef &a) { return Op(BvOp::Not, {a}); }
    static ExprRef Neg(const ExprRef &a) { return Op(BvOp::Neg, {a}); }
    static ExprRef And(const ExprRef &a, const ExprRef &b) { return Op(BvOp::And, {a, b}); }
    static ExprRef Or(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Or, {a, b}); }
    static ExprRef Xor(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Xor, {a, b}); }
    static ExprRef Add(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Add, {a, b}); }
    static ExprRef Sub(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Sub, {a, b}); }
    static ExprRef Mul(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Mul, {a, b}); }
    static ExprRef Eq(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Eq, {a, b}); }
    static ExprRef Ne(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Ne, {a, b}); }
    static ExprRef Ult(const ExprRef &a, const ExprRef &b) { return Op(BvOp::Ult, {a, b}); }
    static ExprRef Concat(const ExprRef &high, const ExprRef &low) { return Op(BvOp::Concat, {high, low}); }
    static ExprRef Slice(const ExprRef &a, unsigned hi, unsigned lo) { return Op(BvOp::Slice, {a}, hi, lo); }
    static ExprRef Uext(const ExprRef &a, unsigned extra) { return Op(BvOp::Uext, {a}, extra); }
    static ExprRef Ite(const ExprRef &c, const ExprRef &t, const ExprRef &e) { return Op(BvOp::Ite, {c, t, e}); }

    inline Kind GetKind() const { return m_kind; }
    inline unsigned Width() const { return m_width; }
    inline const string &Name() const { return m_name; }
    inline BvOp GetOp() const { return m_op; }
    inline uint64_t Value() const { return m_value; }
    inline unsigned Hi() const { return m_hi; }
    inline unsigned Lo() const { return m_lo; }
    inline const vector<ExprRef> &Args() const { return m_args; }

    string ToString() const;

    // register and input names the tree reads
    static void CollectRefs(const ExprRef &e, set<string> &registers, set<string> &inputs);

    static bool SameAs(const ExprRef &a, const ExprRef &b);

  private:
    Expr(Kind kind, unsigned width) : m_kind(kind), m_width(width), m_op(BvOp::Const), m_value(0), m_hi(0), m_lo(0) {}

    Kind m_kind;
    unsigned m_width;
    string m_name;
    BvOp m_op;
    uint64_t m_value;
    unsigned m_hi;
    unsigned m_lo;
    vector<ExprRef> m_args;
};


// evaluates expressions over one register/input valuation, sharing subterms
class ExprEvaluator {
  public:
    ExprEvaluator(const Valuation &registers, const Valuation &inputs)
        : m_registers(registers), m_inputs(inputs) {}

    BitVector Eval(const ExprRef &e);

  private:
    const Valuation &m_registers;
    const Valuation &m_inputs;
    unordered_map<const Expr *, BitVector> m_cache;
};

} // namespace sec

#endif
