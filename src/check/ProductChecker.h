#ifndef PRODUCTCHECKER_H
#define PRODUCTCHECKER_H

#include "BaseChecker.h"
#include "ProductState.h"
#include <memory>
#include <unordered_set>

namespace sec {

// compares outputs by name; false and d filled on the first difference
bool CompareOutputs(int cycle, const OutputValues &gate, const OutputValues &gold, Divergence &d);

// breadth-first search of the product of both circuits over every input assignment
class ProductChecker : public BaseChecker {
  public:
    ProductChecker(Settings settings,
                   shared_ptr<CircuitModel> gate,
                   shared_ptr<CircuitModel> gold,
                   shared_ptr<Log> log,
                   shared_ptr<Budget> budget = nullptr);

    EquivalenceResult Run() override;

  private:
    vector<TraceStep> GetTrace(const shared_ptr<ProductState> &s, const InputAssignment &last);

    Settings m_settings;
    shared_ptr<CircuitModel> m_gate;
    shared_ptr<CircuitModel> m_gold;
    shared_ptr<Log> m_log;
    shared_ptr<Budget> m_budget;

    unordered_set<StateKey, StateKeyHash> m_visited;
};

} // namespace sec

#endif
