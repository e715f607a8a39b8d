#include "Reporter.h"
#include <fstream>
#include <sstream>

namespace sec {

static string ReachText(const ExplorationResult &r) {
    ostringstream oss;
    oss << r.numStates << " states";
    if (r.symbolic) oss << " (" << r.numSymbolic << " symbolic)";
    oss << ", " << (r.closed ? "closed" : "open") << " at depth " << r.depth;
    return oss.str();
}


string Reporter::ToText(const EquivalenceResult &res) {
    ostringstream oss;
    oss << "Verdict: " << CheckResultName(res.verdict) << endl;
    oss << "Circuits: " << res.gateName << " (gate) vs " << res.goldName << " (gold)" << endl;
    oss << "Method: " << res.method << endl;

    switch (res.verdict) {
    case CheckResult::Pass:
        oss << "Proof: " << ProofKindName(res.proof) << ", boundedProofDepth " << res.boundedProofDepth;
        if (res.inductionDepth > 0) oss << ", inductionDepth " << res.inductionDepth;
        oss << endl;
        break;
    case CheckResult::Unknown:
        // a check stopped before its first level has no depth to show
        if (res.depthReached >= 0)
            oss << "Depth reached: " << res.depthReached << " (" << res.stopReason << ")" << endl;
        else
            oss << "Stopped before depth 0 (" << res.stopReason << ")" << endl;
        break;
    case CheckResult::Fail: {
        const Divergence &d = res.divergence;
        oss << "Divergence at cycle " << d.cycle << " on output " << d.output << ": "
            << "gate " << d.gateValue.ToString() << ", gold " << d.goldValue.ToString() << endl;
        oss << "Trace:" << endl;
        for (auto &step : res.trace)
            oss << "  cycle " << step.cycle << ": " << AssignmentToString(step.inputs) << endl;
        break;
    }
    }

    if (res.productStates > 0) oss << "Product states: " << res.productStates << endl;
    if (res.gateReach.depth > 0 || res.goldReach.depth > 0) {
        oss << "Reachable (gate): " << ReachText(res.gateReach) << endl;
        oss << "Reachable (gold): " << ReachText(res.goldReach) << endl;
    }
    return oss.str();
}


string Reporter::WriteWitness(const EquivalenceResult &res, const string &dir, const string &name) {
    string cexPath = dir;
    if (!cexPath.empty() && cexPath.back() != '/') cexPath += "/";
    cexPath += name + ".cex";

    std::ofstream cexFile(cexPath);
    if (!cexFile) throw LoadError("cannot write witness " + cexPath);

    if (res.verdict != CheckResult::Fail) {
        cexFile << (res.verdict == CheckResult::Pass ? "0" : "2") << endl;
    } else {
        cexFile << "1" << endl
                << "o " << res.divergence.output << " " << res.divergence.cycle << endl;
        for (auto &step : res.trace) {
            // inputs in name order, most significant bit first
            for (auto &kv : step.inputs) cexFile << kv.second.ToBinaryString();
            cexFile << endl;
        }
    }
    cexFile << "." << endl;
    cexFile.close();
    return cexPath;
}


string Reporter::ErrorText(const SecError &e) {
    string category = "circuit error";
    if (dynamic_cast<const InterfaceMismatch *>(&e) != nullptr)
        category = "interface error";
    else if (dynamic_cast<const InternalInconsistency *>(&e) != nullptr)
        category = "internal error (checker defect)";
    else if (dynamic_cast<const LoadError *>(&e) != nullptr || dynamic_cast<const UnsupportedConstruct *>(&e) != nullptr)
        category = "input error";
    return category + ": " + e.Kind() + ": " + e.what();
}


int Reporter::ExitCode(const EquivalenceResult &res) {
    return res.verdict == CheckResult::Pass ? 0 : 1;
}


int Reporter::ExitCode(const SecError &e) {
    return dynamic_cast<const InternalInconsistency *>(&e) != nullptr ? 3 : 2;
}

} // namespace sec
