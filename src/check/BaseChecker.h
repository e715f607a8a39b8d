#ifndef BASECHECKER_H
#define BASECHECKER_H

#include "Circuit.h"
#include "Log.h"
#include "Settings.h"
#include <chrono>
#include <string>
#include <vector>

namespace sec {

enum class CheckResult { Pass,
                         Fail,
                         Unknown };

enum class ProofKind { None,
                       Structural, // identical models
                       Exhaustive, // reachable product states closed
                       Induction };

const char *CheckResultName(CheckResult r);
const char *ProofKindName(ProofKind p);

// inputs applied during one cycle, cycle 0 starts from the reset state
struct TraceStep {
    int cycle;
    InputAssignment inputs;
};

struct Divergence {
    int cycle = -1;
    string output;
    BitVector gateValue;
    BitVector goldValue;
};

// reachability of a single model
struct ExplorationResult {
    bool closed = false;
    bool boundExhausted = false;
    bool symbolic = false;
    int depth = 0;          // levels expanded
    size_t numStates = 0;   // distinct concrete states
    size_t numSymbolic = 0; // symbolic states kept without dedup
};

struct EquivalenceResult {
    CheckResult verdict = CheckResult::Unknown;
    ProofKind proof = ProofKind::None;
    string method;

    // depth covered by the proof, -1 without one
    int boundedProofDepth = -1;
    // k of a successful induction step, -1 otherwise
    int inductionDepth = -1;
    // last cycle whose outputs were compared
    int depthReached = -1;
    string stopReason;

    // FAIL only: cycles 0..divergence.cycle
    vector<TraceStep> trace;
    Divergence divergence;

    string gateName;
    string goldName;
    ExplorationResult gateReach;
    ExplorationResult goldReach;
    size_t productStates = 0;
};

// cooperative limits, polled between exploration levels; one budget
// covers every phase of a check
class Budget {
  public:
    explicit Budget(double seconds) : m_seconds(seconds), m_start(chrono::steady_clock::now()) {}

    bool Exhausted(string &reason) const;

  private:
    double m_seconds;
    chrono::time_point<chrono::steady_clock> m_start;
};

class BaseChecker {
  public:
    virtual ~BaseChecker() {}
    virtual EquivalenceResult Run() = 0;
};

} // namespace sec


#endif
