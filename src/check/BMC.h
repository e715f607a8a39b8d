#ifndef BMC_H
#define BMC_H

#include "BaseChecker.h"
#include "BitBlaster.h"
#include "Log.h"
#include "SATSolver.h"
#include <unordered_set>

namespace sec {

// disjunction of the per-output differences, outputs in name order
BitVector BuildMiter(const OutputValues &gate, const OutputValues &gold);

// runs both circuits from reset on concrete inputs, true on the first divergence
bool Replay(const CircuitModel &gate, const CircuitModel &gold,
            const vector<TraceStep> &trace, Divergence &d);

// bounded unrolling of both circuits on shared symbolic inputs
class BMC : public BaseChecker {
  public:
    BMC(Settings settings,
        shared_ptr<CircuitModel> gate,
        shared_ptr<CircuitModel> gold,
        shared_ptr<Log> log,
        shared_ptr<Budget> budget = nullptr);

    EquivalenceResult Run() override;

    // smallest k <= maxK for which k agreeing cycles from any product state
    // force agreement on the next one, -1 if none; stopReason is set when
    // the budget ends the search
    int Induction(int maxK, string *stopReason = nullptr);

  private:
    void Init();
    bool CheckDepth(int k, const BitVector &miter);
    vector<TraceStep> GetTrace(int k);

    Settings m_settings;
    shared_ptr<CircuitModel> m_gate;
    shared_ptr<CircuitModel> m_gold;
    shared_ptr<Log> m_log;
    shared_ptr<Budget> m_budget;

    shared_ptr<SATSolver> m_solver;
    shared_ptr<BitBlaster> m_blaster;
    SymbolTable m_table;
    // symbolic inputs of every unrolled cycle
    vector<InputAssignment> m_inputs;
    unordered_set<StateKey, StateKeyHash> m_visited;
};

} // namespace sec

#endif
