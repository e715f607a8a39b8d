#ifndef ISOLVER_H
#define ISOLVER_H

#include <memory>
#include <vector>

using namespace std;
typedef vector<int> cube;

namespace sec {

// literals are DIMACS style ids, -id is the negation
class ISolver {
  public:
    virtual ~ISolver() {}
    virtual void AddClause(const cube &cls) = 0;
    virtual bool Solve() = 0;
    virtual bool Solve(const shared_ptr<cube> assumption) = 0;
    virtual int GetNewVar() = 0;
    virtual bool GetModel(int id) = 0;
};

} // namespace sec


#endif
