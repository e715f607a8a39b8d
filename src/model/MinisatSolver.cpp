#include "MinisatSolver.h"
#include "Errors.h"

namespace sec {

MinisatSolver::MinisatSolver() {
    m_maxId = 0;
}

MinisatSolver::~MinisatSolver() {}

bool MinisatSolver::Solve() {
    Minisat::lbool result = solveLimited(m_assumptions);
    if (result == Minisat::l_True) {
        return true;
    } else if (result == Minisat::l_False) {
        return false;
    }
    throw InternalInconsistency("minisat returned undefined without a budget");
}


bool MinisatSolver::Solve(const shared_ptr<cube> assumption) {
    m_assumptions.clear();
    for (auto it : *assumption) {
        m_assumptions.push(GetLit(it));
    }
    return Solve();
}


void MinisatSolver::AddClause(const cube &cls) {
    Minisat::vec<Minisat::Lit> literals;
    for (int l : cls) {
        literals.push(GetLit(l));
        if (abs(l) > m_maxId) m_maxId = abs(l);
    }
    // false only when the clause set is already unsatisfiable
    addClause(literals);
}

} // namespace sec
