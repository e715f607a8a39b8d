#ifndef REPORTER_H
#define REPORTER_H

#include "BaseChecker.h"
#include "Errors.h"
#include <string>

namespace sec {

// formatting of check results, nothing here touches a checker
class Reporter {
  public:
    static string ToText(const EquivalenceResult &res);

    // writes <dir>/<name>.cex: one line of input bits per cycle, ended by "."
    // returns the path written, throws LoadError when it cannot be created
    static string WriteWitness(const EquivalenceResult &res, const string &dir, const string &name);

    static string ErrorText(const SecError &e);

    // 0 PASS, 1 FAIL or UNKNOWN
    static int ExitCode(const EquivalenceResult &res);

    // 2 for circuit and interface errors, 3 for checker defects
    static int ExitCode(const SecError &e);
};

} // namespace sec

#endif
