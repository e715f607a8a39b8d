#include "State.h"

namespace sec {

const BitVector &State::Get(const string &reg) const {
    auto it = m_values.find(reg);
    if (it == m_values.end())
        throw InternalInconsistency("state has no register " + reg);
    return it->second;
}


bool State::IsConcrete() const {
    for (auto &kv : m_values) {
        if (kv.second.IsSymbolic()) return false;
    }
    return true;
}


bool State::Identical(const State &other) const {
    if (m_values.size() != other.m_values.size()) return false;
    auto it = other.m_values.begin();
    for (auto &kv : m_values) {
        if (kv.first != it->first || !kv.second.Identical(it->second)) return false;
        ++it;
    }
    return true;
}


StateKey State::Key() const {
    StateKey key;
    key.reserve(m_values.size());
    for (auto &kv : m_values) key.emplace_back(kv.second.Value());
    return key;
}


string State::ToString() const {
    return AssignmentToString(m_values);
}


string AssignmentToString(const map<string, BitVector> &values) {
    string result = "";
    for (auto &kv : values) {
        if (!result.empty()) result += " ";
        result += kv.first + "=" + kv.second.ToString();
    }
    return result;
}

} // namespace sec
