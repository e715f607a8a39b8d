#include "BaseChecker.h"

namespace sec {

const char *CheckResultName(CheckResult r) {
    switch (r) {
    case CheckResult::Pass: return "PASS";
    case CheckResult::Fail: return "FAIL";
    case CheckResult::Unknown: return "UNKNOWN";
    }
    return "?";
}


const char *ProofKindName(ProofKind p) {
    switch (p) {
    case ProofKind::None: return "none";
    case ProofKind::Structural: return "structural";
    case ProofKind::Exhaustive: return "exhaustive";
    case ProofKind::Induction: return "induction";
    }
    return "?";
}


bool Budget::Exhausted(string &reason) const {
    if (Interrupted()) {
        reason = "interrupted";
        return true;
    }
    if (m_seconds > 0) {
        double spent = chrono::duration_cast<chrono::duration<double>>(chrono::steady_clock::now() - m_start).count();
        if (spent >= m_seconds) {
            reason = "timeout";
            return true;
        }
    }
    return false;
}

} // namespace sec
