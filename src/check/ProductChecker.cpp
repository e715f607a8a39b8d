#include "ProductChecker.h"
#include "Explorer.h"
#include <algorithm>

namespace sec {

bool CompareOutputs(int cycle, const OutputValues &gate, const OutputValues &gold, Divergence &d) {
    if (gate.size() != gold.size())
        throw InternalInconsistency("circuits produced " + to_string(gate.size()) + " and " + to_string(gold.size()) + " outputs");
    for (auto &kv : gate) {
        auto it = gold.find(kv.first);
        if (it == gold.end())
            throw InternalInconsistency("output " + kv.first + " missing on one side");
        if (kv.second.IsSymbolic() || it->second.IsSymbolic())
            throw InternalInconsistency("symbolic value of output " + kv.first + " in a concrete comparison");
        if (kv.second.Value() != it->second.Value()) {
            d.cycle = cycle;
            d.output = kv.first;
            d.gateValue = kv.second;
            d.goldValue = it->second;
            return false;
        }
    }
    return true;
}


ProductChecker::ProductChecker(Settings settings,
                               shared_ptr<CircuitModel> gate,
                               shared_ptr<CircuitModel> gold,
                               shared_ptr<Log> log,
                               shared_ptr<Budget> budget) : m_settings(settings),
                                                            m_gate(gate),
                                                            m_gold(gold),
                                                            m_log(log),
                                                            m_budget(budget) {
    if (m_budget == nullptr) m_budget = make_shared<Budget>(settings.timeout);
}


EquivalenceResult ProductChecker::Run() {
    EquivalenceResult res;
    res.method = "product-bfs";
    m_visited.clear();

    vector<InputAssignment> alphabet = InputAlphabet(m_gate->Inputs());
    bool stateless = m_gate->GetNumRegisters() == 0 && m_gold->GetNumRegisters() == 0;

    // synchronized reset, both circuits in their logical reset state
    shared_ptr<ProductState> root = make_shared<ProductState>(nullptr, InputAssignment(), m_gate->ResetState(), m_gold->ResetState(), 0);
    m_visited.insert(root->Key());
    vector<shared_ptr<ProductState>> frontier{root};

    for (int depth = 0;; depth++) {
        string reason;
        if (m_budget->Exhausted(reason)) {
            res.verdict = CheckResult::Unknown;
            res.stopReason = reason;
            break;
        }

        m_log->Tick();
        vector<shared_ptr<ProductState>> next;
        for (auto &ps : frontier) {
            for (auto &in : alphabet) {
                StepResult g = m_gate->Evaluate(ps->gate, in);
                StepResult o = m_gold->Evaluate(ps->gold, in);
                m_log->StatEvaluation();

                Divergence d;
                if (!CompareOutputs(depth, g.outputs, o.outputs, d)) {
                    res.verdict = CheckResult::Fail;
                    res.depthReached = depth;
                    res.divergence = d;
                    res.trace = GetTrace(ps, in);
                    res.productStates = m_visited.size();
                    m_log->L(1, "Divergence on ", d.output, " at cycle ", depth);
                    return res;
                }
                if (stateless) continue;

                shared_ptr<ProductState> succ = make_shared<ProductState>(ps, in, g.next, o.next, depth + 1);
                if (m_visited.insert(succ->Key()).second) next.emplace_back(succ);
            }
        }
        m_log->StatLevel(next.size());
        res.depthReached = depth;
        m_log->L(2, "Product level ", depth, ": ", frontier.size(), " states checked, ", next.size(), " new");

        if (stateless) {
            // no clock edge to traverse
            res.verdict = CheckResult::Pass;
            res.proof = ProofKind::Exhaustive;
            res.boundedProofDepth = 0;
            break;
        }
        if (next.empty()) {
            res.verdict = CheckResult::Pass;
            res.proof = ProofKind::Exhaustive;
            res.boundedProofDepth = depth + 1;
            break;
        }
        if (depth >= m_settings.maxDepth) {
            res.verdict = CheckResult::Unknown;
            res.stopReason = "bound exhausted";
            break;
        }
        frontier.swap(next);
    }
    res.productStates = m_visited.size();
    return res;
}


vector<TraceStep> ProductChecker::GetTrace(const shared_ptr<ProductState> &s, const InputAssignment &last) {
    vector<TraceStep> trace;
    trace.push_back({s->depth, last});
    shared_ptr<ProductState> state = s;
    while (state->preState != nullptr) {
        trace.push_back({state->preState->depth, state->inputs});
        state = state->preState;
    }
    reverse(trace.begin(), trace.end());
    return trace;
}

} // namespace sec
