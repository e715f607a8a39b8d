#ifndef SETTINGS_H
#define SETTINGS_H

#include "CLI/CLI.hpp"
#include <string>

using namespace std;

namespace sec {

enum class CheckMode { Auto,
                       Enum,
                       BMC };

enum class SATBackend { minisat,
                        cadical };

struct Settings {
    int verbosity = 0;
    string gateFilePath;
    string goldFilePath;
    string witnessOutputDir = "";

    SATBackend solver = SATBackend::minisat;
    CheckMode mode = CheckMode::Auto;
    int maxDepth = 64;
    int enumLimit = 8;
    int inductionDepth = -1; // -1 follows maxDepth
    bool induction = true;
    double timeout = 0; // seconds, 0 for none
};

// false when the program should stop, exitCode then holds its status
bool ParseSettings(int argc, char **argv, Settings &settings, int &exitCode);

} // namespace sec

#endif
