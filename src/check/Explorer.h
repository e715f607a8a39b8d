#ifndef EXPLORER_H
#define EXPLORER_H

#include "BaseChecker.h"
#include "Circuit.h"
#include "Log.h"
#include "Settings.h"
#include <memory>
#include <unordered_set>
#include <vector>

namespace sec {

// widest input vector that is ever enumerated
const unsigned MAX_ENUM_WIDTH = 20;

// every assignment of the inputs, the first input in name order on the low bits;
// UnsupportedConstruct above MAX_ENUM_WIDTH bits
vector<InputAssignment> InputAlphabet(const map<string, unsigned> &inputs);

// fresh variables "name@cycle" for every input
InputAssignment SymbolicInputs(const map<string, unsigned> &inputs, SymbolTable &table, int cycle);

// breadth-first reachability of one circuit from its reset state
class Explorer {
  public:
    Explorer(Settings settings,
             shared_ptr<CircuitModel> model,
             shared_ptr<Log> log,
             shared_ptr<Budget> budget = nullptr);

    // enumerates when the inputs fit the enumeration limit, symbolic otherwise
    ExplorationResult Run();

    ExplorationResult RunEnumerated();

    ExplorationResult RunSymbolic();

    // concrete states in discovery order
    inline const vector<State> &ReachableStates() const { return m_reached; }

  private:
    bool Visit(const State &s);

    Settings m_settings;
    shared_ptr<CircuitModel> m_model;
    shared_ptr<Log> m_log;
    shared_ptr<Budget> m_budget;

    // owned by the current run only
    unordered_set<StateKey, StateKeyHash> m_visited;
    vector<State> m_reached;
};

} // namespace sec

#endif
