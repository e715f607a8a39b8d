#ifndef MINISATSOLVER_H
#define MINISATSOLVER_H

#include "ISolver.h"
#include "minisat/core/Solver.h"
#include <memory>

namespace sec {

class MinisatSolver : public ISolver, public Minisat::Solver {
  public:
    MinisatSolver();
    ~MinisatSolver();

    void AddClause(const cube &cls) override;
    bool Solve() override;
    bool Solve(const shared_ptr<cube> assumption) override;
    inline int GetNewVar() override {
        return ++m_maxId;
    }
    inline bool GetModel(int id) override {
        if (id >= model.size()) return false;
        return model[id] == Minisat::l_True;
    }

  protected:
    inline Minisat::Lit GetLit(int id) {
        int v = abs(id);
        while (v >= nVars()) newVar();
        return ((id > 0) ? Minisat::mkLit(v) : ~Minisat::mkLit(v));
    };

    int m_maxId;
    Minisat::vec<Minisat::Lit> m_assumptions;
};

} // namespace sec

#endif
