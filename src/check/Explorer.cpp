#include "Explorer.h"

namespace sec {

vector<InputAssignment> InputAlphabet(const map<string, unsigned> &inputs) {
    unsigned bits = 0;
    for (auto &kv : inputs) bits += kv.second;
    if (bits > MAX_ENUM_WIDTH)
        throw UnsupportedConstruct("cannot enumerate " + to_string(bits) + " input bits, at most " + to_string(MAX_ENUM_WIDTH));

    vector<InputAssignment> alphabet;
    alphabet.reserve(1ULL << bits);
    for (uint64_t n = 0; n < (1ULL << bits); n++) {
        InputAssignment a;
        unsigned shift = 0;
        for (auto &kv : inputs) {
            a.emplace(kv.first, BitVector::Constant((n >> shift) & WidthMask(kv.second), kv.second));
            shift += kv.second;
        }
        alphabet.emplace_back(a);
    }
    return alphabet;
}


InputAssignment SymbolicInputs(const map<string, unsigned> &inputs, SymbolTable &table, int cycle) {
    InputAssignment a;
    for (auto &kv : inputs)
        a.emplace(kv.first, table.Fresh(kv.second, kv.first + "@" + to_string(cycle)));
    return a;
}


Explorer::Explorer(Settings settings,
                   shared_ptr<CircuitModel> model,
                   shared_ptr<Log> log,
                   shared_ptr<Budget> budget) : m_settings(settings),
                                                m_model(model),
                                                m_log(log),
                                                m_budget(budget) {
    if (m_budget == nullptr) m_budget = make_shared<Budget>(settings.timeout);
}


ExplorationResult Explorer::Run() {
    if ((int)m_model->TotalInputWidth() <= m_settings.enumLimit)
        return RunEnumerated();
    return RunSymbolic();
}


bool Explorer::Visit(const State &s) {
    if (!m_visited.insert(s.Key()).second) return false;
    m_reached.emplace_back(s);
    return true;
}


ExplorationResult Explorer::RunEnumerated() {
    m_visited.clear();
    m_reached.clear();
    ExplorationResult res;

    vector<InputAssignment> alphabet = InputAlphabet(m_model->Inputs());
    vector<State> frontier;
    State reset = m_model->ResetState();
    Visit(reset);
    frontier.emplace_back(reset);

    while (true) {
        string reason;
        if (res.depth >= m_settings.maxDepth || m_budget->Exhausted(reason)) {
            res.boundExhausted = true;
            break;
        }
        m_log->Tick();
        vector<State> next;
        for (auto &s : frontier) {
            for (auto &in : alphabet) {
                StepResult step = m_model->Evaluate(s, in);
                m_log->StatEvaluation();
                if (Visit(step.next)) next.emplace_back(step.next);
            }
        }
        m_log->StatLevel(next.size());
        res.depth++;
        m_log->L(2, m_model->Name(), " level ", res.depth, ": ", next.size(), " new states");
        if (next.empty()) {
            res.closed = true;
            break;
        }
        frontier.swap(next);
    }
    res.numStates = m_reached.size();
    m_log->L(1, m_model->Name(), ": ", res.numStates, " reachable states, ",
             res.closed ? "closed" : "bound exhausted", " at depth ", res.depth);
    return res;
}


ExplorationResult Explorer::RunSymbolic() {
    m_visited.clear();
    m_reached.clear();
    ExplorationResult res;
    res.symbolic = true;

    SymbolTable table;
    vector<State> frontier;
    State reset = m_model->ResetState();
    Visit(reset);
    frontier.emplace_back(reset);

    while (true) {
        string reason;
        if (res.depth >= m_settings.maxDepth || m_budget->Exhausted(reason)) {
            res.boundExhausted = true;
            break;
        }
        m_log->Tick();
        InputAssignment inputs = SymbolicInputs(m_model->Inputs(), table, res.depth);
        vector<State> next;
        for (auto &s : frontier) {
            StepResult step = m_model->Evaluate(s, inputs);
            m_log->StatEvaluation();
            if (!step.next.IsConcrete()) {
                // no subsumption check, every symbolic path is kept
                res.numSymbolic++;
                next.emplace_back(step.next);
            } else if (Visit(step.next)) {
                next.emplace_back(step.next);
            }
        }
        m_log->StatLevel(next.size());
        res.depth++;
        m_log->L(2, m_model->Name(), " symbolic level ", res.depth, ": ", next.size(), " states");
        if (next.empty()) {
            res.closed = true;
            break;
        }
        frontier.swap(next);
    }
    res.numStates = m_reached.size();
    m_log->L(1, m_model->Name(), ": ", res.numStates, " concrete and ", res.numSymbolic, " symbolic states, ",
             res.closed ? "closed" : "bound exhausted", " at depth ", res.depth);
    return res;
}

} // namespace sec
