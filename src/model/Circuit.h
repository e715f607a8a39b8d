#ifndef CIRCUIT_H
#define CIRCUIT_H

#include "Expr.h"
#include "State.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace std;

namespace sec {

enum class ResetPolarity { ActiveHigh,
                           ActiveLow };

struct Register {
    Register() : width(0), polarity(ResetPolarity::ActiveHigh) {}

    Register(const string &inName, unsigned inWidth, uint64_t inReset,
             ResetPolarity inPolarity = ResetPolarity::ActiveHigh, const string &inResetInput = "")
        : name(inName),
          width(inWidth),
          resetValue(BitVector::Constant(inReset, inWidth)),
          polarity(inPolarity),
          resetInput(inResetInput) {}

    string name;
    unsigned width;
    BitVector resetValue; // logical value, independent of polarity
    ResetPolarity polarity;
    string resetInput; // input driving the synchronous reset, empty if none
};

struct StepResult {
    State next;
    OutputValues outputs;
};

class CircuitModel {
  public:
    // validates references, names and widths; throws UnknownReference,
    // DuplicateName or WidthMismatch
    static shared_ptr<CircuitModel> Build(const string &name,
                                          const vector<Register> &registers,
                                          const map<string, unsigned> &inputs,
                                          const map<string, ExprRef> &nextStateExprs,
                                          const map<string, ExprRef> &outputExprs);

    // logical reset state, whatever the reset polarity
    State ResetState() const;

    // next state and outputs of one clock cycle, no state is kept between calls
    StepResult Evaluate(const State &state, const InputAssignment &inputs) const;

    inline const string &Name() const { return m_name; }
    inline const vector<Register> &Registers() const { return m_registers; }
    inline const map<string, unsigned> &Inputs() const { return m_inputs; }
    inline const map<string, ExprRef> &Outputs() const { return m_outputs; }

    inline int GetNumRegisters() const { return m_registers.size(); }
    inline int GetNumInputs() const { return m_inputs.size(); }

    unsigned TotalInputWidth() const;
    unsigned TotalStateWidth() const;

    static bool StructurallyEqual(const CircuitModel &a, const CircuitModel &b);

    string Summary() const;

  private:
    CircuitModel() {}

    string m_name;
    vector<Register> m_registers;
    map<string, unsigned> m_inputs;
    map<string, ExprRef> m_nextState;
    map<string, ExprRef> m_outputs;
};

// model name of a circuit file: the base name without directory and extension
string ModelName(const string &path);

} // namespace sec

#endif
