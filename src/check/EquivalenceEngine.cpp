#include "EquivalenceEngine.h"
#include "BMC.h"
#include "Explorer.h"
#include "ProductChecker.h"
#include <algorithm>

namespace sec {

void CheckInterfaces(const CircuitModel &gate, const CircuitModel &gold) {
    const string pair = gate.Name() + " vs " + gold.Name();
    for (auto &kv : gate.Inputs()) {
        auto it = gold.Inputs().find(kv.first);
        if (it == gold.Inputs().end())
            throw InterfaceMismatch(pair + ": input " + kv.first + " missing in " + gold.Name());
        if (it->second != kv.second)
            throw InterfaceMismatch(pair + ": input " + kv.first + " has width " + to_string(kv.second) + " and " + to_string(it->second));
    }
    for (auto &kv : gold.Inputs()) {
        if (gate.Inputs().find(kv.first) == gate.Inputs().end())
            throw InterfaceMismatch(pair + ": input " + kv.first + " missing in " + gate.Name());
    }

    for (auto &kv : gate.Outputs()) {
        auto it = gold.Outputs().find(kv.first);
        if (it == gold.Outputs().end())
            throw InterfaceMismatch(pair + ": output " + kv.first + " missing in " + gold.Name());
        if (it->second->Width() != kv.second->Width())
            throw InterfaceMismatch(pair + ": output " + kv.first + " has width " + to_string(kv.second->Width()) + " and " + to_string(it->second->Width()));
    }
    for (auto &kv : gold.Outputs()) {
        if (gate.Outputs().find(kv.first) == gate.Outputs().end())
            throw InterfaceMismatch(pair + ": output " + kv.first + " missing in " + gate.Name());
    }
}


EquivalenceEngine::EquivalenceEngine(Settings settings,
                                     shared_ptr<CircuitModel> gate,
                                     shared_ptr<CircuitModel> gold,
                                     shared_ptr<Log> log) : m_settings(settings),
                                                            m_gate(gate),
                                                            m_gold(gold),
                                                            m_log(log) {}


bool EquivalenceEngine::UseEnumeration() const {
    switch (m_settings.mode) {
    case CheckMode::Enum:
        if (m_gate->TotalInputWidth() > MAX_ENUM_WIDTH)
            throw UnsupportedConstruct("cannot enumerate " + to_string(m_gate->TotalInputWidth()) + " input bits, at most " +
                                       to_string(MAX_ENUM_WIDTH) + " (use --mode bmc)");
        return true;
    case CheckMode::BMC:
        return false;
    case CheckMode::Auto:
        break;
    }
    return (int)m_gate->TotalInputWidth() <= m_settings.enumLimit;
}


void EquivalenceEngine::LogModel(const CircuitModel &model) {
    m_log->L(1, model.Summary());
    for (auto &r : model.Registers()) {
        m_log->L(2, "  register ", r.name, " [", r.width, "] reset ", r.resetValue.ToString(),
                 r.resetInput.empty() ? "" : " on ", r.resetInput,
                 r.resetInput.empty() ? "" : (r.polarity == ResetPolarity::ActiveLow ? " (active low)" : " (active high)"));
    }
}


void EquivalenceEngine::Explore(EquivalenceResult &res, shared_ptr<Budget> budget) {
    Explorer gate(m_settings, m_gate, m_log, budget);
    res.gateReach = gate.Run();
    Explorer gold(m_settings, m_gold, m_log, budget);
    res.goldReach = gold.Run();
}


EquivalenceResult EquivalenceEngine::Check() {
    shared_ptr<Budget> budget = make_shared<Budget>(m_settings.timeout);
    CheckInterfaces(*m_gate, *m_gold);
    LogModel(*m_gate);
    LogModel(*m_gold);

    EquivalenceResult res;
    if (CircuitModel::StructurallyEqual(*m_gate, *m_gold)) {
        m_log->L(1, "Models are structurally equal");
        res.verdict = CheckResult::Pass;
        res.proof = ProofKind::Structural;
        res.method = "structural";
        res.boundedProofDepth = 0;
        res.depthReached = 0;
    } else if (UseEnumeration()) {
        ProductChecker checker(m_settings, m_gate, m_gold, m_log, budget);
        res = checker.Run();
        if (res.verdict == CheckResult::Unknown && res.stopReason == "bound exhausted" && m_settings.induction) {
            int maxK = m_settings.inductionDepth < 0 ? m_settings.maxDepth : m_settings.inductionDepth;
            maxK = min(maxK, res.depthReached + 1);
            BMC bmc(m_settings, m_gate, m_gold, m_log, budget);
            string reason;
            int k = bmc.Induction(maxK, &reason);
            if (k > 0) {
                res.verdict = CheckResult::Pass;
                res.proof = ProofKind::Induction;
                res.boundedProofDepth = res.depthReached + 1;
                res.inductionDepth = k;
                res.method = "product-bfs+induction";
                res.stopReason.clear();
            } else if (!reason.empty()) {
                res.stopReason = reason;
            }
        }
    } else {
        BMC checker(m_settings, m_gate, m_gold, m_log, budget);
        res = checker.Run();
    }

    res.gateName = m_gate->Name();
    res.goldName = m_gold->Name();
    if (res.verdict != CheckResult::Fail) Explore(res, budget);
    m_log->L(1, "Verdict ", CheckResultName(res.verdict), " by ", res.method);
    return res;
}

} // namespace sec
