#ifndef SATSOLVER_H
#define SATSOLVER_H

#ifdef CADICAL
#include "CadicalSolver.h"
#endif
#include "ISolver.h"
#include "MinisatSolver.h"
#include "Settings.h"
#include <memory>

namespace sec {

// backend selected by settings, every call forwarded
class SATSolver : public ISolver {
  public:
    explicit SATSolver(SATBackend slv_kind);
    ~SATSolver() {}

    void AddClause(const cube &cls) override {
        m_slv->AddClause(cls);
    }

    bool Solve() override {
        return m_slv->Solve();
    }

    bool Solve(const shared_ptr<cube> assumption) override {
        return m_slv->Solve(assumption);
    }

    int GetNewVar() override {
        return m_slv->GetNewVar();
    }

    bool GetModel(int id) override {
        return m_slv->GetModel(id);
    }

    inline SATBackend Kind() const { return m_slvKind; }

  protected:
    SATBackend m_slvKind;
    shared_ptr<ISolver> m_slv;
};

} // namespace sec

#endif
