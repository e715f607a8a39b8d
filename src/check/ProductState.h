#ifndef PRODUCTSTATE_H
#define PRODUCTSTATE_H

#include "State.h"
#include <memory>

using namespace std;

namespace sec {

// joint state of the two circuits, linked back to reset through preState
class ProductState {
  public:
    ProductState(shared_ptr<ProductState> inPreState,
                 const InputAssignment &inInputs,
                 const State &inGate,
                 const State &inGold,
                 int inDepth) : depth(inDepth),
                                preState(inPreState),
                                inputs(inInputs),
                                gate(inGate),
                                gold(inGold) {}

    StateKey Key() const {
        StateKey k = gate.Key();
        StateKey o = gold.Key();
        k.insert(k.end(), o.begin(), o.end());
        return k;
    }

    int depth;
    shared_ptr<ProductState> preState = nullptr;
    InputAssignment inputs; // applied at preState to reach this state
    State gate;
    State gold;
};

} // namespace sec

#endif
