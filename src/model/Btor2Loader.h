#ifndef BTOR2LOADER_H
#define BTOR2LOADER_H

extern "C" {
#include "btor2parser/btor2parser.h"
}

#include "Circuit.h"
#include "Log.h"
#include <memory>
#include <string>
#include <unordered_map>

namespace sec {

void btor2Deleter(Btor2Parser *parser);

// word-level circuits as written by `yosys write_btor`
class Btor2Loader {
  public:
    explicit Btor2Loader(shared_ptr<Log> log) : m_log(log) {}

    shared_ptr<CircuitModel> Load(const string &path);

  private:
    void Clear();

    void CollectLine(Btor2Line *l);

    ExprRef GetExpr(int64_t id);

    ExprRef Translate(Btor2Line *l);

    ExprRef ParseConstant(Btor2Line *l, unsigned width);

    unsigned SortWidth(Btor2Line *l);

    string LineSymbol(Btor2Line *l, const string &prefix);

    shared_ptr<Log> m_log;
    shared_ptr<Btor2Parser> m_parser;
    string m_path;

    unordered_map<int64_t, ExprRef> m_exprs;
    unordered_map<int64_t, string> m_stateNames;
    map<string, unsigned> m_inputs;
    vector<int64_t> m_states;
    unordered_map<int64_t, int64_t> m_inits;
    unordered_map<int64_t, int64_t> m_nexts;
    map<string, ExprRef> m_outputs;
};

} // namespace sec

#endif
