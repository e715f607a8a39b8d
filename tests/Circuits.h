#ifndef TEST_CIRCUITS_H
#define TEST_CIRCUITS_H

#include "Circuit.h"
#include "Log.h"
#include "Settings.h"
#include <memory>

namespace sec {
namespace test {

inline shared_ptr<Log> QuietLog() {
    return make_shared<Log>(0);
}

inline Settings DefaultSettings() {
    Settings s;
    s.verbosity = 0;
    return s;
}

// 2-bit counter from toggle and carry equations, q1 q0 as separate flops
inline shared_ptr<CircuitModel> GateCounter() {
    ExprRef en = Expr::Input("en", 1);
    ExprRef rst_n = Expr::Input("rst_n", 1);
    ExprRef q0 = Expr::Reg("q0", 1);
    ExprRef q1 = Expr::Reg("q1", 1);

    vector<Register> regs{Register("q0", 1, 0, ResetPolarity::ActiveLow, "rst_n"),
                          Register("q1", 1, 0, ResetPolarity::ActiveLow, "rst_n")};
    map<string, ExprRef> next{
        {"q0", Expr::And(rst_n, Expr::Xor(q0, en))},
        {"q1", Expr::And(rst_n, Expr::Xor(q1, Expr::And(q0, en)))}};
    map<string, ExprRef> outputs{{"q", Expr::Concat(q1, q0)}};
    return CircuitModel::Build("gate", regs, {{"en", 1}, {"rst_n", 1}}, next, outputs);
}

// same counter written with an adder; countAlways ignores en
inline shared_ptr<CircuitModel> GoldCounter(bool countAlways = false, unsigned enWidth = 1) {
    ExprRef en = Expr::Input("en", enWidth);
    ExprRef rst_n = Expr::Input("rst_n", 1);
    ExprRef q = Expr::Reg("q", 2);

    ExprRef inc = Expr::Add(q, Expr::Const(1, 2));
    ExprRef enabled = Expr::Ne(en, Expr::Const(0, enWidth));
    ExprRef count = countAlways ? inc : Expr::Ite(enabled, inc, q);
    map<string, ExprRef> next{{"q", Expr::Ite(rst_n, count, Expr::Const(0, 2))}};
    map<string, ExprRef> outputs{{"q", q}};
    return CircuitModel::Build("gold", {Register("q", 2, 0, ResetPolarity::ActiveLow, "rst_n")},
                               {{"en", enWidth}, {"rst_n", 1}}, next, outputs);
}

// no registers, y = a + b over 2-bit inputs, written two ways
inline shared_ptr<CircuitModel> Combinational(const string &name, bool useSub) {
    ExprRef a = Expr::Input("a", 2);
    ExprRef b = Expr::Input("b", 2);
    ExprRef y = useSub ? Expr::Sub(a, Expr::Neg(b)) : Expr::Add(a, b);
    return CircuitModel::Build(name, {}, {{"a", 2}, {"b", 2}}, {}, {{"y", y}});
}

} // namespace test
} // namespace sec

#endif
