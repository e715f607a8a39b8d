#include "Circuit.h"
#include <set>
#include <sstream>

namespace sec {

static void CheckReferences(const string &model, const string &what, const ExprRef &e,
                            const map<string, unsigned> &registerWidths,
                            const map<string, unsigned> &inputs) {
    set<string> regs, ins;
    Expr::CollectRefs(e, regs, ins);
    for (auto &r : regs) {
        if (registerWidths.find(r) == registerWidths.end())
            throw UnknownReference(model + ": " + what + " reads undeclared register " + r);
    }
    for (auto &i : ins) {
        if (inputs.find(i) == inputs.end())
            throw UnknownReference(model + ": " + what + " reads undeclared input " + i);
    }

    // every leaf must agree with its declaration
    vector<const Expr *> todo_stack{e.get()};
    set<const Expr *> visited;
    while (!todo_stack.empty()) {
        const Expr *cur = todo_stack.back();
        todo_stack.pop_back();
        if (!visited.insert(cur).second) continue;
        if (cur->GetKind() == Expr::REGISTER && registerWidths.at(cur->Name()) != cur->Width())
            throw WidthMismatch(model + ": " + what + " reads register " + cur->Name() + " as " + to_string(cur->Width()) + " bits");
        if (cur->GetKind() == Expr::INPUT && inputs.at(cur->Name()) != cur->Width())
            throw WidthMismatch(model + ": " + what + " reads input " + cur->Name() + " as " + to_string(cur->Width()) + " bits");
        for (auto &a : cur->Args()) todo_stack.emplace_back(a.get());
    }
}


shared_ptr<CircuitModel> CircuitModel::Build(const string &name,
                                             const vector<Register> &registers,
                                             const map<string, unsigned> &inputs,
                                             const map<string, ExprRef> &nextStateExprs,
                                             const map<string, ExprRef> &outputExprs) {
    shared_ptr<CircuitModel> model(new CircuitModel());
    model->m_name = name;

    for (auto &kv : inputs) CheckWidth(kv.second);

    map<string, unsigned> registerWidths;
    for (auto &r : registers) {
        if (inputs.count(r.name))
            throw DuplicateName(name + ": " + r.name + " is both an input and a register");
        if (!registerWidths.emplace(r.name, r.width).second)
            throw DuplicateName(name + ": register " + r.name + " declared twice");
        CheckWidth(r.width);
        if (!r.resetValue.IsValid() || r.resetValue.IsSymbolic())
            throw UnsupportedConstruct(name + ": register " + r.name + " has no concrete reset value");
        if (r.resetValue.Width() != r.width)
            throw WidthMismatch(name + ": reset value of " + r.name + " has width " + to_string(r.resetValue.Width()));
        if (!r.resetInput.empty() && inputs.find(r.resetInput) == inputs.end())
            throw UnknownReference(name + ": register " + r.name + " is reset by undeclared input " + r.resetInput);
    }

    for (auto &kv : nextStateExprs) {
        if (registerWidths.find(kv.first) == registerWidths.end())
            throw UnknownReference(name + ": next-state function for undeclared register " + kv.first);
    }
    for (auto &r : registers) {
        auto it = nextStateExprs.find(r.name);
        if (it == nextStateExprs.end() || it->second == nullptr)
            throw MissingNextState(name + ": register " + r.name + " has no next-state function");
        if (it->second->Width() != r.width)
            throw WidthMismatch(name + ": next-state function of " + r.name + " has width " + to_string(it->second->Width()));
        CheckReferences(name, "next(" + r.name + ")", it->second, registerWidths, inputs);
    }

    for (auto &kv : outputExprs) {
        if (kv.second == nullptr)
            throw UnknownReference(name + ": output " + kv.first + " has no function");
        CheckReferences(name, "output " + kv.first, kv.second, registerWidths, inputs);
    }

    model->m_registers = registers;
    model->m_inputs = inputs;
    model->m_nextState = nextStateExprs;
    model->m_outputs = outputExprs;
    return model;
}


State CircuitModel::ResetState() const {
    map<string, BitVector> values;
    for (auto &r : m_registers) values.emplace(r.name, r.resetValue);
    return State(values);
}


StepResult CircuitModel::Evaluate(const State &state, const InputAssignment &inputs) const {
    for (auto &kv : m_inputs) {
        auto it = inputs.find(kv.first);
        if (it == inputs.end())
            throw InternalInconsistency(m_name + ": no value for input " + kv.first);
        if (it->second.Width() != kv.second)
            throw WidthMismatch(m_name + ": input " + kv.first + " driven with width " + to_string(it->second.Width()));
    }

    ExprEvaluator evaluator(state.Values(), inputs);
    StepResult res;
    map<string, BitVector> next;
    for (auto &r : m_registers) next.emplace(r.name, evaluator.Eval(m_nextState.at(r.name)));
    res.next = State(next);
    for (auto &kv : m_outputs) res.outputs.emplace(kv.first, evaluator.Eval(kv.second));
    return res;
}


unsigned CircuitModel::TotalInputWidth() const {
    unsigned w = 0;
    for (auto &kv : m_inputs) w += kv.second;
    return w;
}


unsigned CircuitModel::TotalStateWidth() const {
    unsigned w = 0;
    for (auto &r : m_registers) w += r.width;
    return w;
}


bool CircuitModel::StructurallyEqual(const CircuitModel &a, const CircuitModel &b) {
    if (a.m_inputs != b.m_inputs) return false;
    if (a.m_registers.size() != b.m_registers.size()) return false;
    if (a.m_outputs.size() != b.m_outputs.size()) return false;

    map<string, const Register *> bRegs;
    for (auto &r : b.m_registers) bRegs[r.name] = &r;
    for (auto &r : a.m_registers) {
        auto it = bRegs.find(r.name);
        if (it == bRegs.end()) return false;
        if (it->second->width != r.width || !it->second->resetValue.Identical(r.resetValue)) return false;
        if (!Expr::SameAs(a.m_nextState.at(r.name), b.m_nextState.at(r.name))) return false;
    }
    for (auto &kv : a.m_outputs) {
        auto it = b.m_outputs.find(kv.first);
        if (it == b.m_outputs.end()) return false;
        if (!Expr::SameAs(kv.second, it->second)) return false;
    }
    return true;
}


string CircuitModel::Summary() const {
    ostringstream oss;
    oss << m_name << ": " << m_inputs.size() << " inputs (" << TotalInputWidth() << " bits), "
        << m_registers.size() << " registers (" << TotalStateWidth() << " bits), "
        << m_outputs.size() << " outputs";
    return oss.str();
}


string ModelName(const string &path) {
    auto startIndex = path.find_last_of("/\\");
    startIndex = (startIndex == string::npos) ? 0 : startIndex + 1;
    auto endIndex = path.find_last_of(".");
    if (endIndex == string::npos || endIndex < startIndex) endIndex = path.size();
    return path.substr(startIndex, endIndex - startIndex);
}

} // namespace sec
