#ifndef BITVECTOR_H
#define BITVECTOR_H

#include "Errors.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

namespace sec {

enum class BvOp { Const,
                  Var,
                  Not,
                  Neg,
                  And,
                  Or,
                  Xor,
                  Add,
                  Sub,
                  Mul,
                  Shl,
                  Shr,
                  Eq,
                  Ne,
                  Ult,
                  Ule,
                  Ugt,
                  Uge,
                  RedAnd,
                  RedOr,
                  RedXor,
                  Concat,
                  Slice,
                  Uext,
                  Sext,
                  Ite };

const char *OpName(BvOp op);

constexpr unsigned MAX_WIDTH = 64;

inline uint64_t WidthMask(unsigned width) {
    return width >= 64 ? ~0ULL : ((1ULL << width) - 1);
}

void CheckWidth(unsigned width);

struct SymNode;
typedef shared_ptr<const SymNode> SymNodeRef;

// deferred term over free variables, built only when an operand is symbolic
struct SymNode {
    BvOp op;
    unsigned width;
    uint64_t value = 0; // Const
    int var = -1;       // Var
    string name;        // Var
    unsigned hi = 0;    // Slice upper bit, extension amount for Uext/Sext
    unsigned lo = 0;    // Slice lower bit
    vector<SymNodeRef> args;
};


class BitVector {
  public:
    BitVector() : m_width(0), m_value(0) {}

    // throws WidthOverflow when value needs more than width bits
    static BitVector Constant(uint64_t value, unsigned width);

    static BitVector FromNode(const SymNodeRef &node);

    inline unsigned Width() const { return m_width; }
    inline bool IsConcrete() const { return m_node == nullptr; }
    inline bool IsSymbolic() const { return m_node != nullptr; }
    inline bool IsValid() const { return m_width != 0; }

    uint64_t Value() const;

    inline const SymNodeRef &Node() const { return m_node; }

    // the node view of this vector, a Const node when concrete
    SymNodeRef AsNode() const;

    // same width and same value, or the very same symbolic term
    bool Identical(const BitVector &other) const;

    // "2'b01" for concrete, a term dump for symbolic
    string ToString() const;

    string ToBinaryString() const;

  private:
    BitVector(uint64_t value, unsigned width) : m_width(width), m_value(value) {}

    unsigned m_width;
    uint64_t m_value;
    SymNodeRef m_node;
};

BitVector operator~(const BitVector &a);
BitVector operator-(const BitVector &a);
BitVector operator&(const BitVector &a, const BitVector &b);
BitVector operator|(const BitVector &a, const BitVector &b);
BitVector operator^(const BitVector &a, const BitVector &b);
BitVector operator+(const BitVector &a, const BitVector &b);
BitVector operator-(const BitVector &a, const BitVector &b);
BitVector operator*(const BitVector &a, const BitVector &b);

BitVector Shl(const BitVector &a, const BitVector &amount);
BitVector Shr(const BitVector &a, const BitVector &amount);

// 1-bit results; a symbolic operand gives a constraint, never a boolean
BitVector Equals(const BitVector &a, const BitVector &b);
BitVector NotEquals(const BitVector &a, const BitVector &b);
BitVector Ult(const BitVector &a, const BitVector &b);
BitVector Ule(const BitVector &a, const BitVector &b);
BitVector Ugt(const BitVector &a, const BitVector &b);
BitVector Uge(const BitVector &a, const BitVector &b);

BitVector RedAnd(const BitVector &a);
BitVector RedOr(const BitVector &a);
BitVector RedXor(const BitVector &a);

// high is the most significant part of the result
BitVector Concat(const BitVector &high, const BitVector &low);
BitVector Slice(const BitVector &a, unsigned hi, unsigned lo);
BitVector Uext(const BitVector &a, unsigned extra);
BitVector Sext(const BitVector &a, unsigned extra);
BitVector Ite(const BitVector &cond, const BitVector &then, const BitVector &otherwise);

// rebuilds op over args, the single entry used by all operations above
BitVector Apply(BvOp op, const vector<BitVector> &args, unsigned hi = 0, unsigned lo = 0);


// owns the free variables of one exploration run
class SymbolTable {
  public:
    SymbolTable() {}

    BitVector Fresh(unsigned width, const string &name);

    inline int NumVars() const { return m_names.size(); }
    inline const string &Name(int var) const { return m_names.at(var); }
    inline unsigned Width(int var) const { return m_widths.at(var); }

  private:
    vector<string> m_names;
    vector<unsigned> m_widths;
};

typedef unordered_map<int, uint64_t> VarAssignment;

// replaces variables by values, unassigned variables read as zero
BitVector Substitute(const BitVector &bv, const VarAssignment &assignment);

} // namespace sec

#endif
