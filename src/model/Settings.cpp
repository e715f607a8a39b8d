#include "Settings.h"

namespace sec {

bool ParseSettings(int argc, char **argv, Settings &settings, int &exitCode) {
    CLI::App app{"simpleSEC: a Sequential Equivalence Checker"};

    app.add_option("-v", settings.verbosity, "Verbosity")
        ->default_val(0);

    app.add_option("gate_file", settings.gateFilePath, "Implementation (.btor2 or .aag/.aig)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("gold_file", settings.goldFilePath, "Reference model (.btor2 or .aag/.aig)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-w", settings.witnessOutputDir, "Witness Output Dir")
        ->check(CLI::ExistingDirectory);

    app.add_option("-m,--mode", settings.mode, "Checking strategy")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, CheckMode>{
                {"auto", CheckMode::Auto},
                {"enum", CheckMode::Enum},
                {"bmc", CheckMode::BMC}}))
        ->default_val("auto");

    app.add_option("-s", settings.solver, "SAT Solver")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, SATBackend>{
                {"minisat", SATBackend::minisat},
                {"cadical", SATBackend::cadical},
            }))
        ->default_val("minisat");

    app.add_option("-k", settings.maxDepth, "Exploration bound")
        ->default_val(64)
        ->check(CLI::NonNegativeNumber);

    app.add_option("--enum_limit", settings.enumLimit, "max input bits enumerated per cycle")
        ->default_val(8)
        ->check(CLI::Range(0, 20));

    auto induction = app.add_option("--induction", settings.inductionDepth, "max k for k-induction, -1 follows -k")
        ->default_val(-1);

    app.add_flag("!--no_induction", settings.induction, "disable k-induction")
        ->excludes(induction);

    app.add_option("-t,--timeout", settings.timeout, "wall-clock budget in seconds")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    try {
        app.parse(argc, argv);
        return true;
    } catch (const CLI::ParseError &e) {
        // --help is reported as a parse error with a zero status
        exitCode = app.exit(e) == 0 ? 0 : 2;
        return false;
    }
}

} // namespace sec
