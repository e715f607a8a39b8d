#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

using namespace std;

namespace sec {

// base of every error raised while building or checking circuits
class SecError : public runtime_error {
  public:
    SecError(const string &kind, const string &what) : runtime_error(what), m_kind(kind) {}

    const string &Kind() const { return m_kind; }

  private:
    string m_kind;
};

// literal does not fit in the declared width
class WidthOverflow : public SecError {
  public:
    explicit WidthOverflow(const string &what) : SecError("WidthOverflow", what) {}
};

class WidthMismatch : public SecError {
  public:
    explicit WidthMismatch(const string &what) : SecError("WidthMismatch", what) {}
};

class UnknownReference : public SecError {
  public:
    explicit UnknownReference(const string &what) : SecError("UnknownReference", what) {}
};

class MissingNextState : public UnknownReference {
  public:
    explicit MissingNextState(const string &what) : UnknownReference(what) {}
};

class DuplicateName : public SecError {
  public:
    explicit DuplicateName(const string &what) : SecError("DuplicateName", what) {}
};

// the two circuits do not expose the same inputs and outputs
class InterfaceMismatch : public SecError {
  public:
    explicit InterfaceMismatch(const string &what) : SecError("InterfaceMismatch", what) {}
};

class UnsupportedConstruct : public SecError {
  public:
    explicit UnsupportedConstruct(const string &what) : SecError("UnsupportedConstruct", what) {}
};

class LoadError : public SecError {
  public:
    explicit LoadError(const string &what) : SecError("LoadError", what) {}
};

// a checker invariant is broken, this is a defect and never a verdict
class InternalInconsistency : public SecError {
  public:
    explicit InternalInconsistency(const string &what) : SecError("InternalInconsistency", what) {}
};

} // namespace sec

#endif
