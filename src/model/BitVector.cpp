#include "BitVector.h"
#include <sstream>

namespace sec {

const char *OpName(BvOp op) {
    switch (op) {
    case BvOp::Const: return "const";
    case BvOp::Var: return "var";
    case BvOp::Not: return "not";
    case BvOp::Neg: return "neg";
    case BvOp::And: return "and";
    case BvOp::Or: return "or";
    case BvOp::Xor: return "xor";
    case BvOp::Add: return "add";
    case BvOp::Sub: return "sub";
    case BvOp::Mul: return "mul";
    case BvOp::Shl: return "sll";
    case BvOp::Shr: return "srl";
    case BvOp::Eq: return "eq";
    case BvOp::Ne: return "neq";
    case BvOp::Ult: return "ult";
    case BvOp::Ule: return "ulte";
    case BvOp::Ugt: return "ugt";
    case BvOp::Uge: return "ugte";
    case BvOp::RedAnd: return "redand";
    case BvOp::RedOr: return "redor";
    case BvOp::RedXor: return "redxor";
    case BvOp::Concat: return "concat";
    case BvOp::Slice: return "slice";
    case BvOp::Uext: return "uext";
    case BvOp::Sext: return "sext";
    case BvOp::Ite: return "ite";
    }
    return "?";
}


void CheckWidth(unsigned width) {
    if (width == 0 || width > MAX_WIDTH)
        throw UnsupportedConstruct("bit-vector width " + to_string(width) + " outside 1.." + to_string(MAX_WIDTH));
}


BitVector BitVector::Constant(uint64_t value, unsigned width) {
    CheckWidth(width);
    if ((value & ~WidthMask(width)) != 0)
        throw WidthOverflow("literal " + to_string(value) + " does not fit in " + to_string(width) + " bits");
    return BitVector(value, width);
}


BitVector BitVector::FromNode(const SymNodeRef &node) {
    if (node->op == BvOp::Const) return Constant(node->value, node->width);
    BitVector bv;
    bv.m_width = node->width;
    bv.m_node = node;
    return bv;
}


uint64_t BitVector::Value() const {
    if (IsSymbolic())
        throw InternalInconsistency("value of a symbolic bit-vector requested");
    return m_value;
}


SymNodeRef BitVector::AsNode() const {
    if (IsSymbolic()) return m_node;
    shared_ptr<SymNode> n = make_shared<SymNode>();
    n->op = BvOp::Const;
    n->width = m_width;
    n->value = m_value;
    return n;
}


bool BitVector::Identical(const BitVector &other) const {
    if (m_width != other.m_width) return false;
    if (IsConcrete() && other.IsConcrete()) return m_value == other.m_value;
    return m_node == other.m_node;
}


string BitVector::ToBinaryString() const {
    string s;
    s.reserve(m_width);
    for (int i = m_width - 1; i >= 0; i--)
        s += ((Value() >> i) & 1) ? '1' : '0';
    return s;
}


static void DumpNode(ostringstream &oss, const SymNodeRef &n, int depth) {
    if (n->op == BvOp::Const) {
        oss << n->width << "'d" << n->value;
        return;
    }
    if (n->op == BvOp::Var) {
        oss << n->name;
        return;
    }
    if (depth > 4) {
        oss << "...";
        return;
    }
    oss << "(" << OpName(n->op);
    if (n->op == BvOp::Slice) oss << " " << n->hi << " " << n->lo;
    if (n->op == BvOp::Uext || n->op == BvOp::Sext) oss << " " << n->hi;
    for (auto &a : n->args) {
        oss << " ";
        DumpNode(oss, a, depth + 1);
    }
    oss << ")";
}


string BitVector::ToString() const {
    if (!IsValid()) return "<invalid>";
    if (IsConcrete()) return to_string(m_width) + "'b" + ToBinaryString();
    ostringstream oss;
    DumpNode(oss, m_node, 0);
    return oss.str();
}


static void RequireSameWidth(BvOp op, const BitVector &a, const BitVector &b) {
    if (a.Width() != b.Width())
        throw WidthMismatch(string(OpName(op)) + " on widths " + to_string(a.Width()) + " and " + to_string(b.Width()));
}


static void RequireArity(BvOp op, const vector<BitVector> &args, size_t n) {
    if (args.size() != n)
        throw InternalInconsistency(string(OpName(op)) + " expects " + to_string(n) + " operands");
    for (auto &a : args) {
        if (!a.IsValid())
            throw InternalInconsistency(string(OpName(op)) + " on an unset bit-vector");
    }
}


static unsigned ResultWidth(BvOp op, const vector<BitVector> &args, unsigned hi, unsigned lo) {
    switch (op) {
    case BvOp::Not:
    case BvOp::Neg:
        RequireArity(op, args, 1);
        return args[0].Width();
    case BvOp::RedAnd:
    case BvOp::RedOr:
    case BvOp::RedXor:
        RequireArity(op, args, 1);
        return 1;
    case BvOp::And:
    case BvOp::Or:
    case BvOp::Xor:
    case BvOp::Add:
    case BvOp::Sub:
    case BvOp::Mul:
    case BvOp::Shl:
    case BvOp::Shr:
        RequireArity(op, args, 2);
        RequireSameWidth(op, args[0], args[1]);
        return args[0].Width();
    case BvOp::Eq:
    case BvOp::Ne:
    case BvOp::Ult:
    case BvOp::Ule:
    case BvOp::Ugt:
    case BvOp::Uge:
        RequireArity(op, args, 2);
        RequireSameWidth(op, args[0], args[1]);
        return 1;
    case BvOp::Concat:
        RequireArity(op, args, 2);
        CheckWidth(args[0].Width() + args[1].Width());
        return args[0].Width() + args[1].Width();
    case BvOp::Slice:
        RequireArity(op, args, 1);
        if (hi < lo || hi >= args[0].Width())
            throw WidthMismatch("slice [" + to_string(hi) + ":" + to_string(lo) + "] of a " + to_string(args[0].Width()) + "-bit vector");
        return hi - lo + 1;
    case BvOp::Uext:
    case BvOp::Sext:
        RequireArity(op, args, 1);
        CheckWidth(args[0].Width() + hi);
        return args[0].Width() + hi;
    case BvOp::Ite:
        RequireArity(op, args, 3);
        if (args[0].Width() != 1)
            throw WidthMismatch("ite condition has width " + to_string(args[0].Width()));
        RequireSameWidth(op, args[1], args[2]);
        return args[1].Width();
    case BvOp::Const:
    case BvOp::Var:
        break;
    }
    throw InternalInconsistency(string("cannot apply ") + OpName(op));
}


static uint64_t Fold(BvOp op, unsigned width, const vector<BitVector> &args, unsigned hi, unsigned lo) {
    uint64_t m = WidthMask(width);
    uint64_t a = args[0].Value();
    uint64_t b = args.size() > 1 ? args[1].Value() : 0;
    switch (op) {
    case BvOp::Not: return ~a & m;
    case BvOp::Neg: return (~a + 1) & m;
    case BvOp::And: return a & b;
    case BvOp::Or: return a | b;
    case BvOp::Xor: return a ^ b;
    case BvOp::Add: return (a + b) & m;
    case BvOp::Sub: return (a - b) & m;
    case BvOp::Mul: return (a * b) & m;
    case BvOp::Shl: return b >= width ? 0 : (a << b) & m;
    case BvOp::Shr: return b >= width ? 0 : a >> b;
    case BvOp::Eq: return a == b;
    case BvOp::Ne: return a != b;
    case BvOp::Ult: return a < b;
    case BvOp::Ule: return a <= b;
    case BvOp::Ugt: return a > b;
    case BvOp::Uge: return a >= b;
    case BvOp::RedAnd: return a == WidthMask(args[0].Width());
    case BvOp::RedOr: return a != 0;
    case BvOp::RedXor: {
        uint64_t parity = 0;
        for (; a != 0; a &= a - 1) parity ^= 1;
        return parity;
    }
    case BvOp::Concat: return (a << args[1].Width()) | b;
    case BvOp::Slice: return (a >> lo) & m;
    case BvOp::Uext: return a;
    case BvOp::Sext: {
        unsigned w = args[0].Width();
        if ((a >> (w - 1)) & 1) return a | (m & ~WidthMask(w));
        return a;
    }
    case BvOp::Ite: return a ? b : args[2].Value();
    case BvOp::Const:
    case BvOp::Var:
        break;
    }
    throw InternalInconsistency(string("cannot fold ") + OpName(op));
}


static bool IsConst(const BitVector &bv, uint64_t value) {
    return bv.IsConcrete() && bv.Value() == value;
}


static bool IsOnes(const BitVector &bv) {
    return bv.IsConcrete() && bv.Value() == WidthMask(bv.Width());
}


// local rewrites when at least one operand is symbolic
static bool Simplify(BvOp op, unsigned width, const vector<BitVector> &args, unsigned hi, unsigned lo, BitVector &res) {
    switch (op) {
    case BvOp::Not:
        if (args[0].Node()->op == BvOp::Not) {
            res = BitVector::FromNode(args[0].Node()->args[0]);
            return true;
        }
        return false;
    case BvOp::And:
        for (int i = 0; i < 2; i++) {
            if (IsConst(args[i], 0)) {
                res = args[i];
                return true;
            }
            if (IsOnes(args[i])) {
                res = args[1 - i];
                return true;
            }
        }
        if (args[0].Identical(args[1])) {
            res = args[0];
            return true;
        }
        return false;
    case BvOp::Or:
        for (int i = 0; i < 2; i++) {
            if (IsOnes(args[i])) {
                res = args[i];
                return true;
            }
            if (IsConst(args[i], 0)) {
                res = args[1 - i];
                return true;
            }
        }
        if (args[0].Identical(args[1])) {
            res = args[0];
            return true;
        }
        return false;
    case BvOp::Xor:
        for (int i = 0; i < 2; i++) {
            if (IsConst(args[i], 0)) {
                res = args[1 - i];
                return true;
            }
        }
        if (args[0].Identical(args[1])) {
            res = BitVector::Constant(0, width);
            return true;
        }
        return false;
    case BvOp::Add:
        for (int i = 0; i < 2; i++) {
            if (IsConst(args[i], 0)) {
                res = args[1 - i];
                return true;
            }
        }
        return false;
    case BvOp::Sub:
        if (IsConst(args[1], 0)) {
            res = args[0];
            return true;
        }
        if (args[0].Identical(args[1])) {
            res = BitVector::Constant(0, width);
            return true;
        }
        return false;
    case BvOp::Mul:
        for (int i = 0; i < 2; i++) {
            if (IsConst(args[i], 0)) {
                res = args[i];
                return true;
            }
            if (IsConst(args[i], 1)) {
                res = args[1 - i];
                return true;
            }
        }
        return false;
    case BvOp::Eq:
    case BvOp::Ne:
        if (args[0].Identical(args[1])) {
            res = BitVector::Constant(op == BvOp::Eq ? 1 : 0, 1);
            return true;
        }
        return false;
    case BvOp::Slice:
        if (lo == 0 && hi + 1 == args[0].Width()) {
            res = args[0];
            return true;
        }
        return false;
    case BvOp::Uext:
    case BvOp::Sext:
        if (hi == 0) {
            res = args[0];
            return true;
        }
        return false;
    case BvOp::Ite:
        if (args[0].IsConcrete()) {
            res = args[0].Value() ? args[1] : args[2];
            return true;
        }
        if (args[1].Identical(args[2])) {
            res = args[1];
            return true;
        }
        if (width == 1 && IsConst(args[1], 1) && IsConst(args[2], 0)) {
            res = args[0];
            return true;
        }
        return false;
    default:
        return false;
    }
}


BitVector Apply(BvOp op, const vector<BitVector> &args, unsigned hi, unsigned lo) {
    unsigned width = ResultWidth(op, args, hi, lo);

    bool concrete = true;
    for (auto &a : args) concrete = concrete && a.IsConcrete();
    if (concrete) return BitVector::Constant(Fold(op, width, args, hi, lo) & WidthMask(width), width);

    BitVector res;
    if (Simplify(op, width, args, hi, lo, res)) return res;

    shared_ptr<SymNode> n = make_shared<SymNode>();
    n->op = op;
    n->width = width;
    n->hi = hi;
    n->lo = lo;
    n->args.reserve(args.size());
    for (auto &a : args) n->args.emplace_back(a.AsNode());
    return BitVector::FromNode(n);
}


BitVector operator~(const BitVector &a) { return Apply(BvOp::Not, {a}); }
BitVector operator-(const BitVector &a) { return Apply(BvOp::Neg, {a}); }
BitVector operator&(const BitVector &a, const BitVector &b) { return Apply(BvOp::And, {a, b}); }
BitVector operator|(const BitVector &a, const BitVector &b) { return Apply(BvOp::Or, {a, b}); }
BitVector operator^(const BitVector &a, const BitVector &b) { return Apply(BvOp::Xor, {a, b}); }
BitVector operator+(const BitVector &a, const BitVector &b) { return Apply(BvOp::Add, {a, b}); }
BitVector operator-(const BitVector &a, const BitVector &b) { return Apply(BvOp::Sub, {a, b}); }
BitVector operator*(const BitVector &a, const BitVector &b) { return Apply(BvOp::Mul, {a, b}); }

BitVector Shl(const BitVector &a, const BitVector &amount) { return Apply(BvOp::Shl, {a, amount}); }
BitVector Shr(const BitVector &a, const BitVector &amount) { return Apply(BvOp::Shr, {a, amount}); }

BitVector Equals(const BitVector &a, const BitVector &b) { return Apply(BvOp::Eq, {a, b}); }
BitVector NotEquals(const BitVector &a, const BitVector &b) { return Apply(BvOp::Ne, {a, b}); }
BitVector Ult(const BitVector &a, const BitVector &b) { return Apply(BvOp::Ult, {a, b}); }
BitVector Ule(const BitVector &a, const BitVector &b) { return Apply(BvOp::Ule, {a, b}); }
BitVector Ugt(const BitVector &a, const BitVector &b) { return Apply(BvOp::Ugt, {a, b}); }
BitVector Uge(const BitVector &a, const BitVector &b) { return Apply(BvOp::Uge, {a, b}); }

BitVector RedAnd(const BitVector &a) { return Apply(BvOp::RedAnd, {a}); }
BitVector RedOr(const BitVector &a) { return Apply(BvOp::RedOr, {a}); }
BitVector RedXor(const BitVector &a) { return Apply(BvOp::RedXor, {a}); }

BitVector Concat(const BitVector &high, const BitVector &low) { return Apply(BvOp::Concat, {high, low}); }
BitVector Slice(const BitVector &a, unsigned hi, unsigned lo) { return Apply(BvOp::Slice, {a}, hi, lo); }
BitVector Uext(const BitVector &a, unsigned extra) { return Apply(BvOp::Uext, {a}, extra); }
BitVector Sext(const BitVector &a, unsigned extra) { return Apply(BvOp::Sext, {a}, extra); }

BitVector Ite(const BitVector &cond, const BitVector &then, const BitVector &otherwise) {
    return Apply(BvOp::Ite, {cond, then, otherwise});
}


BitVector SymbolTable::Fresh(unsigned width, const string &name) {
    CheckWidth(width);
    shared_ptr<SymNode> n = make_shared<SymNode>();
    n->op = BvOp::Var;
    n->width = width;
    n->var = m_names.size();
    n->name = name;
    m_names.emplace_back(name);
    m_widths.emplace_back(width);
    return BitVector::FromNode(n);
}


static BitVector SubstituteNode(const SymNodeRef &n, const VarAssignment &assignment,
                                unordered_map<const SymNode *, BitVector> &cache) {
    auto it = cache.find(n.get());
    if (it != cache.end()) return it->second;

    BitVector res;
    if (n->op == BvOp::Const) {
        res = BitVector::Constant(n->value, n->width);
    } else if (n->op == BvOp::Var) {
        auto a = assignment.find(n->var);
        if (a == assignment.end())
            res = BitVector::Constant(0, n->width);
        else
            res = BitVector::Constant(a->second & WidthMask(n->width), n->width);
    } else {
        vector<BitVector> args;
        args.reserve(n->args.size());
        for (auto &arg : n->args) args.emplace_back(SubstituteNode(arg, assignment, cache));
        res = Apply(n->op, args, n->hi, n->lo);
    }
    cache.emplace(n.get(), res);
    return res;
}


BitVector Substitute(const BitVector &bv, const VarAssignment &assignment) {
    if (bv.IsConcrete()) return bv;
    unordered_map<const SymNode *, BitVector> cache;
    return SubstituteNode(bv.Node(), assignment, cache);
}

} // namespace sec
