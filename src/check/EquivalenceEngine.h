#ifndef EQUIVALENCEENGINE_H
#define EQUIVALENCEENGINE_H

#include "BaseChecker.h"
#include "Circuit.h"
#include "Log.h"
#include "Settings.h"
#include <memory>

namespace sec {

// throws InterfaceMismatch unless inputs and outputs agree in names and widths
void CheckInterfaces(const CircuitModel &gate, const CircuitModel &gold);

// picks and runs the checkers for one pair of circuits
class EquivalenceEngine {
  public:
    EquivalenceEngine(Settings settings,
                      shared_ptr<CircuitModel> gate,
                      shared_ptr<CircuitModel> gold,
                      shared_ptr<Log> log);

    EquivalenceResult Check();

  private:
    bool UseEnumeration() const;
    void LogModel(const CircuitModel &model);
    void Explore(EquivalenceResult &res, shared_ptr<Budget> budget);

    Settings m_settings;
    shared_ptr<CircuitModel> m_gate;
    shared_ptr<CircuitModel> m_gold;
    shared_ptr<Log> m_log;
};

} // namespace sec

#endif
