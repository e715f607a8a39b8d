#ifndef AIGERLOADER_H
#define AIGERLOADER_H

extern "C" {
#include "aiger.h"
}

#include "Circuit.h"
#include "Log.h"
#include <memory>
#include <string>
#include <unordered_map>

namespace sec {

void aigerDeleter(aiger *aig);

// bit-level circuits, every input, latch and output one bit wide
class AigerLoader {
  public:
    explicit AigerLoader(shared_ptr<Log> log) : m_log(log) {}

    shared_ptr<CircuitModel> Load(const string &path);

  private:
    ExprRef GetExpr(unsigned lit);

    shared_ptr<Log> m_log;
    shared_ptr<aiger> m_aiger;
    string m_path;
    unordered_map<unsigned, ExprRef> m_exprs; // stripped literal -> expression
};

} // namespace sec

#endif
