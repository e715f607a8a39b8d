#include "AigerLoader.h"
#include "Btor2Loader.h"
#include "EquivalenceEngine.h"
#include "Log.h"
#include "Reporter.h"
#include "Settings.h"
#include <csignal>
#include <iostream>
#include <memory>

using namespace sec;

static string Extension(const string &path) {
    auto dot = path.find_last_of(".");
    auto slash = path.find_last_of("/\\");
    if (dot == string::npos || (slash != string::npos && dot < slash)) return "";
    return path.substr(dot + 1);
}


static shared_ptr<CircuitModel> LoadCircuit(const string &path, shared_ptr<Log> log) {
    string ext = Extension(path);
    if (ext == "btor" || ext == "btor2") {
        Btor2Loader loader(log);
        return loader.Load(path);
    }
    if (ext == "aag" || ext == "aig") {
        AigerLoader loader(log);
        return loader.Load(path);
    }
    throw LoadError("unknown circuit format '" + ext + "' of " + path);
}


int main(int argc, char **argv) {
    Settings settings;
    int exitCode = 0;
    if (!ParseSettings(argc, argv, settings, exitCode)) return exitCode;

    shared_ptr<Log> log(new Log(settings.verbosity));
    signal(SIGINT, signalHandler);

    try {
        log->Tick();
        shared_ptr<CircuitModel> gate = LoadCircuit(settings.gateFilePath, log);
        shared_ptr<CircuitModel> gold = LoadCircuit(settings.goldFilePath, log);
        log->StatInit();

        EquivalenceEngine engine(settings, gate, gold, log);
        EquivalenceResult res = engine.Check();
        cout << Reporter::ToText(res);
        log->PrintStatistics();

        if (settings.witnessOutputDir.size() > 0) {
            string path = Reporter::WriteWitness(res, settings.witnessOutputDir, gate->Name());
            log->L(1, "Witness written to ", path);
        }
        return Reporter::ExitCode(res);
    } catch (const SecError &e) {
        cerr << Reporter::ErrorText(e) << endl;
        return Reporter::ExitCode(e);
    }
}
