#ifndef BITBLASTER_H
#define BITBLASTER_H

#include "BitVector.h"
#include "ISolver.h"
#include <memory>
#include <unordered_map>
#include <vector>

namespace sec {

// Tseitin encoding of symbolic bit-vectors, bit 0 first in every literal vector
class BitBlaster {
  public:
    explicit BitBlaster(shared_ptr<ISolver> solver);

    vector<int> Encode(const BitVector &bv);

    // the single literal of a 1-bit vector
    int EncodeBit(const BitVector &bv);

    inline int True() const { return m_trueId; }
    inline int False() const { return -m_trueId; }

    // value of a vector under the last satisfying assignment
    uint64_t ModelValue(const BitVector &bv);

    // value of a variable of the symbol table, zero if it was never encoded
    uint64_t VarValue(int var, unsigned width);

  private:
    const vector<int> &EncodeNode(const SymNodeRef &n);

    vector<int> EncodeOp(const SymNode &n, const vector<const vector<int> *> &args);

    int And(int a, int b);
    int Or(int a, int b);
    int Xor(int a, int b);
    int Mux(int c, int t, int e);
    int AndAll(const vector<int> &bits);
    int OrAll(const vector<int> &bits);

    vector<int> Adder(const vector<int> &a, const vector<int> &b, int carry);
    vector<int> Multiplier(const vector<int> &a, const vector<int> &b);
    vector<int> Shifter(const vector<int> &a, const vector<int> &amount, bool left);
    int LessThan(const vector<int> &a, const vector<int> &b);
    int Equal(const vector<int> &a, const vector<int> &b);

    bool LitValue(int lit);

    shared_ptr<ISolver> m_solver;
    int m_trueId;
    unordered_map<SymNodeRef, vector<int>> m_cache;
    unordered_map<int, vector<int>> m_varBits;
};

} // namespace sec

#endif
