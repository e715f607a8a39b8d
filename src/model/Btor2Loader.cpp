#include "Btor2Loader.h"
#include <cstdio>

namespace sec {

void btor2Deleter(Btor2Parser *parser) {
    btor2parser_delete(parser);
}


void Btor2Loader::Clear() {
    m_exprs.clear();
    m_stateNames.clear();
    m_inputs.clear();
    m_states.clear();
    m_inits.clear();
    m_nexts.clear();
    m_outputs.clear();
}


shared_ptr<CircuitModel> Btor2Loader::Load(const string &path) {
    Clear();
    m_path = path;

    FILE *file = fopen(path.c_str(), "r");
    if (file == nullptr) throw LoadError("cannot open " + path);
    m_parser = shared_ptr<Btor2Parser>(btor2parser_new(), btor2Deleter);
    bool ok = btor2parser_read_lines(m_parser.get(), file);
    fclose(file);
    if (!ok) throw LoadError("parse error in '" + path + "' at " + btor2parser_error(m_parser.get()));

    Btor2LineIterator it = btor2parser_iter_init(m_parser.get());
    Btor2Line *line;
    while ((line = btor2parser_iter_next(&it))) CollectLine(line);

    vector<Register> registers;
    map<string, ExprRef> nextState;
    for (int64_t s : m_states) {
        const string &name = m_stateNames[s];
        unsigned width = m_exprs[s]->Width();

        uint64_t reset = 0;
        auto init = m_inits.find(s);
        if (init == m_inits.end()) {
            m_log->L(1, "Warning: ", path, ": state ", name, " has no init, reset to zero");
        } else {
            ExprRef value = GetExpr(init->second);
            set<string> regs, ins;
            Expr::CollectRefs(value, regs, ins);
            if (!regs.empty() || !ins.empty())
                throw UnsupportedConstruct(path + ": state " + name + " has a non-constant init");
            Valuation none;
            ExprEvaluator evaluator(none, none);
            BitVector v = evaluator.Eval(value);
            if (v.Width() != width)
                throw WidthMismatch(path + ": init of " + name + " has width " + to_string(v.Width()));
            reset = v.Value();
        }
        registers.emplace_back(name, width, reset);

        auto next = m_nexts.find(s);
        if (next == m_nexts.end())
            throw UnsupportedConstruct(path + ": state " + name + " has no next function");
        nextState[name] = GetExpr(next->second);
    }

    m_log->L(2, "Loaded ", path, ": ", m_inputs.size(), " inputs, ", registers.size(), " states, ", m_outputs.size(), " outputs.");
    shared_ptr<CircuitModel> model = CircuitModel::Build(ModelName(path), registers, m_inputs, nextState, m_outputs);
    m_parser.reset();
    return model;
}


void Btor2Loader::CollectLine(Btor2Line *l) {
    switch (l->tag) {
    case BTOR2_TAG_sort:
        if (l->sort.tag != BTOR2_TAG_SORT_bitvec)
            throw UnsupportedConstruct(m_path + ": array sorts are not supported (line " + to_string(l->lineno) + ")");
        break;
    case BTOR2_TAG_input: {
        string name = LineSymbol(l, "input");
        if (!m_inputs.emplace(name, SortWidth(l)).second)
            throw DuplicateName(m_path + ": input " + name + " declared twice");
        m_exprs[l->id] = Expr::Input(name, SortWidth(l));
        break;
    }
    case BTOR2_TAG_state: {
        string name = LineSymbol(l, "state");
        m_stateNames[l->id] = name;
        m_states.emplace_back(l->id);
        m_exprs[l->id] = Expr::Reg(name, SortWidth(l));
        break;
    }
    case BTOR2_TAG_init:
        m_inits[l->args[0]] = l->args[1];
        break;
    case BTOR2_TAG_next:
        m_nexts[l->args[0]] = l->args[1];
        break;
    case BTOR2_TAG_output: {
        string name = LineSymbol(l, "output");
        if (m_outputs.count(name))
            throw DuplicateName(m_path + ": output " + name + " declared twice");
        m_outputs[name] = GetExpr(l->args[0]);
        break;
    }
    case BTOR2_TAG_bad:
    case BTOR2_TAG_constraint:
    case BTOR2_TAG_fair:
    case BTOR2_TAG_justice:
        throw UnsupportedConstruct(m_path + ": properties are not part of an equivalence check (line " + to_string(l->lineno) + ")");
    default:
        // operators are translated on demand
        break;
    }
}


ExprRef Btor2Loader::GetExpr(int64_t id) {
    if (id < 0) return Expr::Not(GetExpr(-id));
    auto it = m_exprs.find(id);
    if (it != m_exprs.end()) return it->second;
    Btor2Line *l = btor2parser_get_line_by_id(m_parser.get(), id);
    if (l == nullptr) throw LoadError(m_path + ": reference to undefined node " + to_string(id));
    ExprRef e = Translate(l);
    m_exprs[id] = e;
    return e;
}


unsigned Btor2Loader::SortWidth(Btor2Line *l) {
    if (l->sort.tag != BTOR2_TAG_SORT_bitvec)
        throw UnsupportedConstruct(m_path + ": array sorts are not supported (line " + to_string(l->lineno) + ")");
    return l->sort.bitvec.width;
}


string Btor2Loader::LineSymbol(Btor2Line *l, const string &prefix) {
    if (l->symbol != nullptr) return l->symbol;
    return prefix + to_string(l->id);
}


ExprRef Btor2Loader::ParseConstant(Btor2Line *l, unsigned width) {
    string text = l->constant;
    uint64_t value = 0;
    if (l->tag == BTOR2_TAG_const) {
        if (text.size() > MAX_WIDTH) throw UnsupportedConstruct(m_path + ": constant wider than 64 bits");
        for (char c : text) value = (value << 1) | (c == '1');
    } else {
        try {
            if (l->tag == BTOR2_TAG_consth) {
                value = stoull(text, nullptr, 16);
            } else {
                bool negative = !text.empty() && text[0] == '-';
                value = stoull(negative ? text.substr(1) : text, nullptr, 10);
                if (negative) value = ~value + 1;
            }
        } catch (const std::logic_error &e) {
            throw UnsupportedConstruct(m_path + ": constant " + text + " does not fit in 64 bits (line " + to_string(l->lineno) + ")");
        }
    }
    return Expr::Const(value & WidthMask(width), width);
}


ExprRef Btor2Loader::Translate(Btor2Line *l) {
    unsigned width = SortWidth(l);
    auto arg = [&](int i) { return GetExpr(l->args[i]); };

    switch (l->tag) {
    case BTOR2_TAG_const:
    case BTOR2_TAG_constd:
    case BTOR2_TAG_consth:
        return ParseConstant(l, width);
    case BTOR2_TAG_zero:
        return Expr::Const(0, width);
    case BTOR2_TAG_one:
        return Expr::Const(1, width);
    case BTOR2_TAG_ones:
        return Expr::Const(WidthMask(width), width);

    case BTOR2_TAG_not: return Expr::Not(arg(0));
    case BTOR2_TAG_neg: return Expr::Neg(arg(0));
    case BTOR2_TAG_inc: return Expr::Add(arg(0), Expr::Const(1, width));
    case BTOR2_TAG_dec: return Expr::Sub(arg(0), Expr::Const(1, width));
    case BTOR2_TAG_redand: return Expr::Op(BvOp::RedAnd, {arg(0)});
    case BTOR2_TAG_redor: return Expr::Op(BvOp::RedOr, {arg(0)});
    case BTOR2_TAG_redxor: return Expr::Op(BvOp::RedXor, {arg(0)});

    case BTOR2_TAG_and: return Expr::And(arg(0), arg(1));
    case BTOR2_TAG_or: return Expr::Or(arg(0), arg(1));
    case BTOR2_TAG_xor: return Expr::Xor(arg(0), arg(1));
    case BTOR2_TAG_nand: return Expr::Not(Expr::And(arg(0), arg(1)));
    case BTOR2_TAG_nor: return Expr::Not(Expr::Or(arg(0), arg(1)));
    case BTOR2_TAG_xnor: return Expr::Not(Expr::Xor(arg(0), arg(1)));
    case BTOR2_TAG_implies: return Expr::Or(Expr::Not(arg(0)), arg(1));
    case BTOR2_TAG_iff: return Expr::Eq(arg(0), arg(1));
    case BTOR2_TAG_add: return Expr::Add(arg(0), arg(1));
    case BTOR2_TAG_sub: return Expr::Sub(arg(0), arg(1));
    case BTOR2_TAG_mul: return Expr::Mul(arg(0), arg(1));
    case BTOR2_TAG_sll: return Expr::Op(BvOp::Shl, {arg(0), arg(1)});
    case BTOR2_TAG_srl: return Expr::Op(BvOp::Shr, {arg(0), arg(1)});
    case BTOR2_TAG_eq: return Expr::Eq(arg(0), arg(1));
    case BTOR2_TAG_neq: return Expr::Ne(arg(0), arg(1));
    case BTOR2_TAG_ult: return Expr::Op(BvOp::Ult, {arg(0), arg(1)});
    case BTOR2_TAG_ulte: return Expr::Op(BvOp::Ule, {arg(0), arg(1)});
    case BTOR2_TAG_ugt: return Expr::Op(BvOp::Ugt, {arg(0), arg(1)});
    case BTOR2_TAG_ugte: return Expr::Op(BvOp::Uge, {arg(0), arg(1)});

    case BTOR2_TAG_slt:
    case BTOR2_TAG_slte:
    case BTOR2_TAG_sgt:
    case BTOR2_TAG_sgte: {
        // signed order is unsigned order with the sign bits flipped
        ExprRef a = arg(0), b = arg(1);
        ExprRef sign = Expr::Const(1ULL << (a->Width() - 1), a->Width());
        ExprRef fa = Expr::Xor(a, sign), fb = Expr::Xor(b, sign);
        if (l->tag == BTOR2_TAG_slt) return Expr::Op(BvOp::Ult, {fa, fb});
        if (l->tag == BTOR2_TAG_slte) return Expr::Op(BvOp::Ule, {fa, fb});
        if (l->tag == BTOR2_TAG_sgt) return Expr::Op(BvOp::Ugt, {fa, fb});
        return Expr::Op(BvOp::Uge, {fa, fb});
    }

    case BTOR2_TAG_concat: return Expr::Concat(arg(0), arg(1));
    case BTOR2_TAG_slice: return Expr::Slice(arg(0), l->args[1], l->args[2]);
    case BTOR2_TAG_uext: return Expr::Uext(arg(0), l->args[1]);
    case BTOR2_TAG_sext: return Expr::Op(BvOp::Sext, {arg(0)}, l->args[1]);
    case BTOR2_TAG_ite: return Expr::Ite(arg(0), arg(1), arg(2));

    default:
        throw UnsupportedConstruct(m_path + ": operator '" + l->name + "' is not supported (line " + to_string(l->lineno) + ")");
    }
}

} // namespace sec
