#include "BitBlaster.h"

namespace sec {

BitBlaster::BitBlaster(shared_ptr<ISolver> solver) : m_solver(solver) {
    m_trueId = m_solver->GetNewVar();
    m_solver->AddClause({m_trueId});
}


vector<int> BitBlaster::Encode(const BitVector &bv) {
    if (bv.IsSymbolic()) return EncodeNode(bv.Node());
    vector<int> bits;
    bits.reserve(bv.Width());
    for (unsigned i = 0; i < bv.Width(); i++)
        bits.emplace_back(((bv.Value() >> i) & 1) ? True() : False());
    return bits;
}


int BitBlaster::EncodeBit(const BitVector &bv) {
    if (bv.Width() != 1)
        throw WidthMismatch("expected a 1-bit vector, got " + to_string(bv.Width()) + " bits");
    return Encode(bv)[0];
}


const vector<int> &BitBlaster::EncodeNode(const SymNodeRef &n) {
    auto it = m_cache.find(n);
    if (it != m_cache.end()) return it->second;

    vector<int> bits;
    if (n->op == BvOp::Const) {
        for (unsigned i = 0; i < n->width; i++)
            bits.emplace_back(((n->value >> i) & 1) ? True() : False());
    } else if (n->op == BvOp::Var) {
        for (unsigned i = 0; i < n->width; i++)
            bits.emplace_back(m_solver->GetNewVar());
        m_varBits[n->var] = bits;
    } else {
        vector<const vector<int> *> args;
        for (auto &a : n->args) args.emplace_back(&EncodeNode(a));
        bits = EncodeOp(*n, args);
    }
    if (bits.size() != n->width)
        throw InternalInconsistency(string("encoding of ") + OpName(n->op) + " has " + to_string(bits.size()) + " bits");
    return m_cache.emplace(n, bits).first->second;
}


vector<int> BitBlaster::EncodeOp(const SymNode &n, const vector<const vector<int> *> &args) {
    const vector<int> &a = *args[0];
    vector<int> res;
    switch (n.op) {
    case BvOp::Not:
        for (int l : a) res.emplace_back(-l);
        return res;
    case BvOp::Neg: {
        vector<int> inv;
        for (int l : a) inv.emplace_back(-l);
        return Adder(inv, vector<int>(a.size(), False()), True());
    }
    case BvOp::And:
        for (size_t i = 0; i < a.size(); i++) res.emplace_back(And(a[i], (*args[1])[i]));
        return res;
    case BvOp::Or:
        for (size_t i = 0; i < a.size(); i++) res.emplace_back(Or(a[i], (*args[1])[i]));
        return res;
    case BvOp::Xor:
        for (size_t i = 0; i < a.size(); i++) res.emplace_back(Xor(a[i], (*args[1])[i]));
        return res;
    case BvOp::Add:
        return Adder(a, *args[1], False());
    case BvOp::Sub: {
        vector<int> inv;
        for (int l : *args[1]) inv.emplace_back(-l);
        return Adder(a, inv, True());
    }
    case BvOp::Mul:
        return Multiplier(a, *args[1]);
    case BvOp::Shl:
        return Shifter(a, *args[1], true);
    case BvOp::Shr:
        return Shifter(a, *args[1], false);
    case BvOp::Eq:
        return {Equal(a, *args[1])};
    case BvOp::Ne:
        return {-Equal(a, *args[1])};
    case BvOp::Ult:
        return {LessThan(a, *args[1])};
    case BvOp::Ule:
        return {-LessThan(*args[1], a)};
    case BvOp::Ugt:
        return {LessThan(*args[1], a)};
    case BvOp::Uge:
        return {-LessThan(a, *args[1])};
    case BvOp::RedAnd:
        return {AndAll(a)};
    case BvOp::RedOr:
        return {OrAll(a)};
    case BvOp::RedXor: {
        int x = False();
        for (int l : a) x = Xor(x, l);
        return {x};
    }
    case BvOp::Concat:
        res = *args[1];
        res.insert(res.end(), a.begin(), a.end());
        return res;
    case BvOp::Slice:
        return vector<int>(a.begin() + n.lo, a.begin() + n.hi + 1);
    case BvOp::Uext:
        res = a;
        res.resize(a.size() + n.hi, False());
        return res;
    case BvOp::Sext:
        res = a;
        res.resize(a.size() + n.hi, a.back());
        return res;
    case BvOp::Ite:
        for (size_t i = 0; i < args[1]->size(); i++) res.emplace_back(Mux(a[0], (*args[1])[i], (*args[2])[i]));
        return res;
    case BvOp::Const:
    case BvOp::Var:
        break;
    }
    throw InternalInconsistency(string("cannot encode ") + OpName(n.op));
}


int BitBlaster::And(int a, int b) {
    if (a == False() || b == False()) return False();
    if (a == True()) return b;
    if (b == True()) return a;
    if (a == b) return a;
    if (a == -b) return False();
    int g = m_solver->GetNewVar();
    m_solver->AddClause({-g, a});
    m_solver->AddClause({-g, b});
    m_solver->AddClause({g, -a, -b});
    return g;
}


int BitBlaster::Or(int a, int b) {
    return -And(-a, -b);
}


int BitBlaster::Xor(int a, int b) {
    if (a == False()) return b;
    if (b == False()) return a;
    if (a == True()) return -b;
    if (b == True()) return -a;
    if (a == b) return False();
    if (a == -b) return True();
    int g = m_solver->GetNewVar();
    m_solver->AddClause({-g, a, b});
    m_solver->AddClause({-g, -a, -b});
    m_solver->AddClause({g, -a, b});
    m_solver->AddClause({g, a, -b});
    return g;
}


int BitBlaster::Mux(int c, int t, int e) {
    if (c == True()) return t;
    if (c == False()) return e;
    if (t == e) return t;
    int g = m_solver->GetNewVar();
    m_solver->AddClause({-c, -t, g});
    m_solver->AddClause({-c, t, -g});
    m_solver->AddClause({c, -e, g});
    m_solver->AddClause({c, e, -g});
    return g;
}


int BitBlaster::AndAll(const vector<int> &bits) {
    int r = True();
    for (int l : bits) r = And(r, l);
    return r;
}


int BitBlaster::OrAll(const vector<int> &bits) {
    int r = False();
    for (int l : bits) r = Or(r, l);
    return r;
}


vector<int> BitBlaster::Adder(const vector<int> &a, const vector<int> &b, int carry) {
    vector<int> sum;
    sum.reserve(a.size());
    for (size_t i = 0; i < a.size(); i++) {
        int x = Xor(a[i], b[i]);
        sum.emplace_back(Xor(x, carry));
        carry = Or(And(a[i], b[i]), And(carry, x));
    }
    return sum;
}


vector<int> BitBlaster::Multiplier(const vector<int> &a, const vector<int> &b) {
    size_t w = a.size();
    vector<int> acc(w, False());
    for (size_t i = 0; i < w; i++) {
        vector<int> partial(w, False());
        for (size_t j = 0; j + i < w; j++) partial[j + i] = And(a[j], b[i]);
        acc = Adder(acc, partial, False());
    }
    return acc;
}


vector<int> BitBlaster::Shifter(const vector<int> &a, const vector<int> &amount, bool left) {
    size_t w = a.size();
    vector<int> cur = a;
    vector<int> overflow;
    for (size_t i = 0; i < amount.size(); i++) {
        if (i >= 63 || (1ULL << i) >= w) {
            overflow.emplace_back(amount[i]);
            continue;
        }
        size_t step = 1ULL << i;
        vector<int> shifted(w, False());
        for (size_t j = 0; j < w; j++) {
            if (left && j >= step) shifted[j] = cur[j - step];
            if (!left && j + step < w) shifted[j] = cur[j + step];
        }
        vector<int> next;
        for (size_t j = 0; j < w; j++) next.emplace_back(Mux(amount[i], shifted[j], cur[j]));
        cur = next;
    }
    int ovf = OrAll(overflow);
    for (size_t j = 0; j < w; j++) cur[j] = And(-ovf, cur[j]);
    return cur;
}


int BitBlaster::LessThan(const vector<int> &a, const vector<int> &b) {
    int lt = False();
    for (size_t i = 0; i < a.size(); i++) {
        int here = And(-a[i], b[i]);
        int same = -Xor(a[i], b[i]);
        lt = Or(here, And(same, lt));
    }
    return lt;
}


int BitBlaster::Equal(const vector<int> &a, const vector<int> &b) {
    int eq = True();
    for (size_t i = 0; i < a.size(); i++) eq = And(eq, -Xor(a[i], b[i]));
    return eq;
}


bool BitBlaster::LitValue(int lit) {
    if (lit == True()) return true;
    if (lit == False()) return false;
    bool v = m_solver->GetModel(abs(lit));
    return lit > 0 ? v : !v;
}


uint64_t BitBlaster::ModelValue(const BitVector &bv) {
    if (bv.IsConcrete()) return bv.Value();
    const vector<int> &bits = EncodeNode(bv.Node());
    uint64_t v = 0;
    for (size_t i = 0; i < bits.size(); i++) {
        if (LitValue(bits[i])) v |= 1ULL << i;
    }
    return v;
}


uint64_t BitBlaster::VarValue(int var, unsigned width) {
    auto it = m_varBits.find(var);
    if (it == m_varBits.end()) return 0;
    uint64_t v = 0;
    for (size_t i = 0; i < it->second.size() && i < width; i++) {
        if (LitValue(it->second[i])) v |= 1ULL << i;
    }
    return v;
}

} // namespace sec
