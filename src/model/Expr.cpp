#include "Expr.h"
#include <sstream>

namespace sec {

ExprRef Expr::Reg(const string &name, unsigned width) {
    CheckWidth(width);
    shared_ptr<Expr> e(new Expr(REGISTER, width));
    e->m_name = name;
    return e;
}


ExprRef Expr::Input(const string &name, unsigned width) {
    CheckWidth(width);
    shared_ptr<Expr> e(new Expr(INPUT, width));
    e->m_name = name;
    return e;
}


ExprRef Expr::Const(uint64_t value, unsigned width) {
    BitVector bv = BitVector::Constant(value, width);
    shared_ptr<Expr> e(new Expr(CONSTANT, width));
    e->m_value = bv.Value();
    return e;
}


ExprRef Expr::Op(BvOp op, const vector<ExprRef> &args, unsigned hi, unsigned lo) {
    // type the node by applying op to placeholder constants of the operand widths
    vector<BitVector> shapes;
    shapes.reserve(args.size());
    for (auto &a : args) {
        if (a == nullptr) throw InternalInconsistency(string("null operand of ") + OpName(op));
        shapes.emplace_back(BitVector::Constant(0, a->Width()));
    }
    BitVector shape = Apply(op, shapes, hi, lo);

    shared_ptr<Expr> e(new Expr(OPERATION, shape.Width()));
    e->m_op = op;
    e->m_hi = hi;
    e->m_lo = lo;
    e->m_args = args;
    return e;
}


string Expr::ToString() const {
    ostringstream oss;
    switch (m_kind) {
    case REGISTER:
    case INPUT:
        oss << m_name;
        break;
    case CONSTANT:
        oss << m_width << "'d" << m_value;
        break;
    case OPERATION:
        oss << "(" << OpName(m_op);
        if (m_op == BvOp::Slice) oss << " " << m_hi << " " << m_lo;
        if (m_op == BvOp::Uext || m_op == BvOp::Sext) oss << " " << m_hi;
        for (auto &a : m_args) oss << " " << a->ToString();
        oss << ")";
        break;
    }
    return oss.str();
}


void Expr::CollectRefs(const ExprRef &e, set<string> &registers, set<string> &inputs) {
    set<const Expr *> visited;
    vector<const Expr *> todo_stack{e.get()};
    while (!todo_stack.empty()) {
        const Expr *cur = todo_stack.back();
        todo_stack.pop_back();
        if (!visited.insert(cur).second) continue;
        if (cur->m_kind == REGISTER)
            registers.insert(cur->m_name);
        else if (cur->m_kind == INPUT)
            inputs.insert(cur->m_name);
        for (auto &a : cur->m_args) todo_stack.emplace_back(a.get());
    }
}


static bool SameAsRec(const Expr *a, const Expr *b, set<pair<const Expr *, const Expr *>> &proven) {
    if (a == b) return true;
    if (proven.count({a, b})) return true;
    if (a->GetKind() != b->GetKind() || a->Width() != b->Width()) return false;
    switch (a->GetKind()) {
    case Expr::REGISTER:
    case Expr::INPUT:
        if (a->Name() != b->Name()) return false;
        break;
    case Expr::CONSTANT:
        if (a->Value() != b->Value()) return false;
        break;
    case Expr::OPERATION:
        if (a->GetOp() != b->GetOp() || a->Hi() != b->Hi() || a->Lo() != b->Lo()) return false;
        if (a->Args().size() != b->Args().size()) return false;
        for (size_t i = 0; i < a->Args().size(); i++) {
            if (!SameAsRec(a->Args()[i].get(), b->Args()[i].get(), proven)) return false;
        }
        break;
    }
    proven.insert({a, b});
    return true;
}


bool Expr::SameAs(const ExprRef &a, const ExprRef &b) {
    set<pair<const Expr *, const Expr *>> proven;
    return SameAsRec(a.get(), b.get(), proven);
}


BitVector ExprEvaluator::Eval(const ExprRef &e) {
    auto it = m_cache.find(e.get());
    if (it != m_cache.end()) return it->second;

    BitVector res;
    switch (e->GetKind()) {
    case Expr::REGISTER: {
        auto r = m_registers.find(e->Name());
        if (r == m_registers.end())
            throw InternalInconsistency("register " + e->Name() + " has no value in the evaluated state");
        res = r->second;
        break;
    }
    case Expr::INPUT: {
        auto i = m_inputs.find(e->Name());
        if (i == m_inputs.end())
            throw InternalInconsistency("input " + e->Name() + " has no value in the input assignment");
        res = i->second;
        break;
    }
    case Expr::CONSTANT:
        res = BitVector::Constant(e->Value(), e->Width());
        break;
    case Expr::OPERATION: {
        vector<BitVector> args;
        args.reserve(e->Args().size());
        for (auto &a : e->Args()) args.emplace_back(Eval(a));
        res = Apply(e->GetOp(), args, e->Hi(), e->Lo());
        break;
    }
    }
    if (res.Width() != e->Width())
        throw InternalInconsistency(e->ToString() + " evaluated to width " + to_string(res.Width()));
    m_cache.emplace(e.get(), res);
    return res;
}

} // namespace sec
