#ifndef CADICALSOLVER_H
#define CADICALSOLVER_H

#include "ISolver.h"
#include "cadical.hpp"
#include <memory>

namespace sec {

class CadicalSolver : public ISolver, public CaDiCaL::Solver {
  public:
    CadicalSolver();
    ~CadicalSolver();

    void AddClause(const cube &cls) override;
    bool Solve() override;
    bool Solve(const shared_ptr<cube> assumption) override;
    inline int GetNewVar() override {
        return ++m_maxId;
    }
    inline bool GetModel(int id) override {
        if (id > vars()) return false;
        return val(id) > 0;
    }

  protected:
    int m_maxId;
    shared_ptr<cube> m_assumptions;
};

} // namespace sec

#endif
