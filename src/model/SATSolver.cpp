#include "SATSolver.h"
#include "Errors.h"

namespace sec {

SATSolver::SATSolver(SATBackend slv_kind) : m_slvKind(slv_kind) {
    switch (slv_kind) {
    case SATBackend::minisat:
        m_slv = make_shared<MinisatSolver>();
        break;
    case SATBackend::cadical:
#ifdef CADICAL
        m_slv = make_shared<CadicalSolver>();
        break;
#else
        throw UnsupportedConstruct("built without CaDiCaL support");
#endif
    default:
        throw InternalInconsistency("unknown SAT backend");
    }
}

} // namespace sec
