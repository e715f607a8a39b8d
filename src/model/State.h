#ifndef STATE_H
#define STATE_H

#include "BitVector.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace std;

namespace sec {

// name -> value of every input, applied during one cycle
typedef map<string, BitVector> InputAssignment;

// name -> value of every output, observed during one cycle
typedef map<string, BitVector> OutputValues;

// dedup key of a concrete state, values in register name order
typedef vector<uint64_t> StateKey;

struct StateKeyHash {
    std::size_t operator()(const StateKey &k) const {
        std::size_t h = k.size();
        std::hash<uint64_t> hasher;
        for (uint64_t v : k) {
            h ^= hasher(v) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};

// register valuation of one circuit, replaced as a whole on every clock edge
class State {
  public:
    State() {}
    explicit State(map<string, BitVector> values) : m_values(std::move(values)) {}

    const BitVector &Get(const string &reg) const;

    inline const map<string, BitVector> &Values() const { return m_values; }

    bool IsConcrete() const;

    bool Identical(const State &other) const;

    // only defined for concrete states
    StateKey Key() const;

    // "q=2'b01 r=1'b0", registers in name order
    string ToString() const;

  private:
    map<string, BitVector> m_values;
};

string AssignmentToString(const map<string, BitVector> &values);

} // namespace sec

#endif
