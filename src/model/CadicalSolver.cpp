#include "CadicalSolver.h"
#include "Errors.h"
#include <algorithm>

namespace sec {

CadicalSolver::CadicalSolver() {
    m_maxId = 0;
    m_assumptions = make_shared<cube>();
}

CadicalSolver::~CadicalSolver() {}

bool CadicalSolver::Solve() {
    for (auto it : *m_assumptions) {
        assume(it);
    }
    int result = solve();
    if (result == 10) {
        return true;
    } else if (result == 20) {
        return false;
    }
    throw InternalInconsistency("cadical returned " + to_string(result));
}


bool CadicalSolver::Solve(const shared_ptr<cube> assumption) {
    m_assumptions->clear();
    m_assumptions->resize(assumption->size());
    std::copy(assumption->begin(), assumption->end(), m_assumptions->begin());
    return Solve();
}


void CadicalSolver::AddClause(const cube &cls) {
    for (int l : cls)
        if (abs(l) > m_maxId) m_maxId = abs(l);
    clause(cls);
}

} // namespace sec
