#include "AigerLoader.h"

namespace sec {

void aigerDeleter(aiger *aig) {
    aiger_reset(aig);
}


static string SymbolOr(const char *name, const string &fallback) {
    return name != nullptr ? string(name) : fallback;
}


shared_ptr<CircuitModel> AigerLoader::Load(const string &path) {
    m_path = path;
    m_exprs.clear();
    m_aiger = shared_ptr<aiger>(aiger_init(), aigerDeleter);
    aiger_open_and_read_from_file(m_aiger.get(), path.c_str());
    if (aiger_error(m_aiger.get()))
        throw LoadError("aiger parse error in '" + path + "': " + aiger_error(m_aiger.get()));

    aiger *aig = m_aiger.get();
    if (aig->num_bad > 0 || aig->num_constraints > 0 || aig->num_justice > 0 || aig->num_fairness > 0)
        throw UnsupportedConstruct(path + ": properties are not part of an equivalence check");

    // I L O A
    map<string, unsigned> inputs;
    for (unsigned i = 0; i < aig->num_inputs; i++) {
        string name = SymbolOr(aig->inputs[i].name, "i" + to_string(i));
        if (!inputs.emplace(name, 1).second)
            throw DuplicateName(path + ": input " + name + " declared twice");
        m_exprs[aig->inputs[i].lit] = Expr::Input(name, 1);
    }

    vector<Register> registers;
    for (unsigned i = 0; i < aig->num_latches; i++) {
        aiger_symbol &l = aig->latches[i];
        string name = SymbolOr(l.name, "l" + to_string(i));
        if (l.reset != aiger_false && l.reset != aiger_true)
            throw UnsupportedConstruct(path + ": latch " + name + " is uninitialized");
        registers.emplace_back(name, 1, l.reset == aiger_true ? 1 : 0);
        m_exprs[l.lit] = Expr::Reg(name, 1);
    }

    map<string, ExprRef> nextState;
    for (unsigned i = 0; i < aig->num_latches; i++)
        nextState[registers[i].name] = GetExpr(aig->latches[i].next);

    map<string, ExprRef> outputs;
    for (unsigned i = 0; i < aig->num_outputs; i++) {
        string name = SymbolOr(aig->outputs[i].name, "o" + to_string(i));
        if (outputs.count(name))
            throw DuplicateName(path + ": output " + name + " declared twice");
        outputs[name] = GetExpr(aig->outputs[i].lit);
    }

    m_log->L(2, "Loaded ", path, ": ", aig->num_inputs, " inputs, ", aig->num_latches, " latches, ",
             aig->num_ands, " gates, ", aig->num_outputs, " outputs.");

    shared_ptr<CircuitModel> model = CircuitModel::Build(ModelName(path), registers, inputs, nextState, outputs);
    m_aiger.reset();
    return model;
}


ExprRef AigerLoader::GetExpr(unsigned lit) {
    if (lit == aiger_false) return Expr::Const(0, 1);
    if (lit == aiger_true) return Expr::Const(1, 1);
    if (aiger_sign(lit)) return Expr::Not(GetExpr(aiger_strip(lit)));

    auto it = m_exprs.find(lit);
    if (it != m_exprs.end()) return it->second;

    aiger_and *a = aiger_is_and(m_aiger.get(), lit);
    if (a == nullptr)
        throw LoadError(m_path + ": literal " + to_string(lit) + " is not defined");
    ExprRef e = Expr::And(GetExpr(a->rhs0), GetExpr(a->rhs1));
    m_exprs[lit] = e;
    return e;
}

} // namespace sec
