#include "BMC.h"
#include "Explorer.h"
#include "ProductChecker.h"
#include <algorithm>

namespace sec {

BitVector BuildMiter(const OutputValues &gate, const OutputValues &gold) {
    BitVector miter = BitVector::Constant(0, 1);
    for (auto &kv : gate) {
        auto it = gold.find(kv.first);
        if (it == gold.end())
            throw InternalInconsistency("output " + kv.first + " missing on one side");
        miter = miter | NotEquals(kv.second, it->second);
    }
    return miter;
}


bool Replay(const CircuitModel &gate, const CircuitModel &gold,
            const vector<TraceStep> &trace, Divergence &d) {
    State g = gate.ResetState();
    State o = gold.ResetState();
    for (auto &step : trace) {
        StepResult sg = gate.Evaluate(g, step.inputs);
        StepResult so = gold.Evaluate(o, step.inputs);
        if (!CompareOutputs(step.cycle, sg.outputs, so.outputs, d)) return true;
        g = sg.next;
        o = so.next;
    }
    return false;
}


BMC::BMC(Settings settings,
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


void BMC::Init() {
    m_solver = make_shared<SATSolver>(m_settings.solver);
    m_blaster = make_shared<BitBlaster>(m_solver);
    m_table = SymbolTable();
    m_inputs.clear();
    m_visited.clear();
}


EquivalenceResult BMC::Run() {
    EquivalenceResult res;
    res.method = "bmc";
    Init();
    bool stateless = m_gate->GetNumRegisters() == 0 && m_gold->GetNumRegisters() == 0;

    State g = m_gate->ResetState();
    State o = m_gold->ResetState();
    ProductState reset(nullptr, InputAssignment(), g, o, 0);
    m_visited.insert(reset.Key());

    for (int k = 0;; k++) {
        string reason;
        if (m_budget->Exhausted(reason)) {
            res.verdict = CheckResult::Unknown;
            res.stopReason = reason;
            return res;
        }
        m_log->L(1, "BMC Bound: ", k);

        m_inputs.emplace_back(SymbolicInputs(m_gate->Inputs(), m_table, k));
        StepResult sg = m_gate->Evaluate(g, m_inputs.back());
        StepResult so = m_gold->Evaluate(o, m_inputs.back());
        m_log->StatEvaluation();

        if (CheckDepth(k, BuildMiter(sg.outputs, so.outputs))) {
            res.verdict = CheckResult::Fail;
            res.depthReached = k;
            res.trace = GetTrace(k);
            // the solver model must reproduce on the concrete circuits
            if (!Replay(*m_gate, *m_gold, res.trace, res.divergence) || res.divergence.cycle != k)
                throw InternalInconsistency("counterexample of depth " + to_string(k) + " does not replay");
            m_log->L(1, "Divergence on ", res.divergence.output, " at cycle ", k);
            return res;
        }
        res.depthReached = k;

        if (stateless) {
            res.verdict = CheckResult::Pass;
            res.proof = ProofKind::Exhaustive;
            res.boundedProofDepth = 0;
            return res;
        }

        g = sg.next;
        o = so.next;
        // input independent states that repeat close the unrolling
        if (g.IsConcrete() && o.IsConcrete()) {
            ProductState ps(nullptr, InputAssignment(), g, o, k + 1);
            if (!m_visited.insert(ps.Key()).second) {
                m_log->L(1, "BMC closed at bound ", k + 1);
                res.verdict = CheckResult::Pass;
                res.proof = ProofKind::Exhaustive;
                res.boundedProofDepth = k + 1;
                return res;
            }
        }

        if (k >= m_settings.maxDepth) break;
    }

    res.verdict = CheckResult::Unknown;
    res.stopReason = "bound exhausted";
    if (m_settings.induction) {
        int maxK = m_settings.inductionDepth < 0 ? m_settings.maxDepth : m_settings.inductionDepth;
        maxK = min(maxK, res.depthReached + 1);
        string reason;
        int k = Induction(maxK, &reason);
        if (k > 0) {
            res.verdict = CheckResult::Pass;
            res.proof = ProofKind::Induction;
            // every cycle up to the bound was checked from reset
            res.boundedProofDepth = res.depthReached + 1;
            res.inductionDepth = k;
            res.method = "bmc+induction";
            res.stopReason.clear();
        } else if (!reason.empty()) {
            res.stopReason = reason;
        }
    }
    return res;
}


bool BMC::CheckDepth(int k, const BitVector &miter) {
    int lit = m_blaster->EncodeBit(miter);
    if (lit == m_blaster->False()) return false;

    shared_ptr<cube> assumptions(new cube{lit});
    m_log->L(3, "Assumption: ", lit);
    m_log->Tick();
    bool sat = m_solver->Solve(assumptions);
    m_log->StatSolver();
    if (sat) return true;

    // outputs agree at cycle k on every path
    m_solver->AddClause({-lit});
    return false;
}


vector<TraceStep> BMC::GetTrace(int k) {
    vector<TraceStep> trace;
    for (int c = 0; c <= k; c++) {
        TraceStep step;
        step.cycle = c;
        for (auto &kv : m_inputs[c]) {
            const BitVector &var = kv.second;
            uint64_t v = var.IsSymbolic() ? m_blaster->VarValue(var.Node()->var, var.Width()) : var.Value();
            step.inputs.emplace(kv.first, BitVector::Constant(v, var.Width()));
        }
        trace.emplace_back(step);
    }
    return trace;
}


static State FreshState(const CircuitModel &model, SymbolTable &table) {
    map<string, BitVector> values;
    for (auto &r : model.Registers())
        values.emplace(r.name, table.Fresh(r.width, model.Name() + "." + r.name + "@0"));
    return State(values);
}


int BMC::Induction(int maxK, string *stopReason) {
    if (maxK < 1) return -1;
    shared_ptr<SATSolver> solver = make_shared<SATSolver>(m_settings.solver);
    BitBlaster blaster(solver);
    SymbolTable table;

    State g = FreshState(*m_gate, table);
    State o = FreshState(*m_gold, table);
    for (int j = 0; j <= maxK; j++) {
        string reason;
        if (m_budget->Exhausted(reason)) {
            m_log->L(1, "Induction stopped: ", reason);
            if (stopReason != nullptr) *stopReason = reason;
            return -1;
        }
        m_log->Tick();
        InputAssignment in = SymbolicInputs(m_gate->Inputs(), table, j);
        StepResult sg = m_gate->Evaluate(g, in);
        StepResult so = m_gold->Evaluate(o, in);
        int lit = blaster.EncodeBit(BuildMiter(sg.outputs, so.outputs));

        if (j >= 1) {
            bool sat = lit != blaster.False() && solver->Solve(make_shared<cube>(cube{lit}));
            m_log->StatInduction();
            m_log->L(1, "Induction k=", j, sat ? ": step fails" : ": proved");
            if (!sat) return j;
        }
        solver->AddClause({-lit});
        g = sg.next;
        o = so.next;
    }
    return -1;
}

} // namespace sec
