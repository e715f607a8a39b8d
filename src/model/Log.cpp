#include "Log.h"

namespace sec {

static volatile sig_atomic_t g_interrupted = 0;

void signalHandler(int signum) {
    g_interrupted = 1;
}


bool Interrupted() {
    return g_interrupted != 0;
}


void ClearInterrupt() {
    g_interrupted = 0;
}


void Log::PrintStatistics() {
    if (m_verbosity == 0) return;

    double levelTime = GetTimeDouble(m_levelTime);
    cout << endl
         << "BFS levels     called: " << left << setw(12) << m_levels
         << "takes: " << fixed << setprecision(3) << setw(10) << levelTime
         << "per: " << fixed << setprecision(5) << (m_levels ? levelTime / m_levels : 0.0) << endl;

    cout << "States         reached: " << left << setw(11) << m_states
         << "evaluations: " << m_evaluations << endl;

    double solverTime = GetTimeDouble(m_solverTime);
    cout << "SATSolver      called: " << left << setw(12) << m_solverCalls
         << "takes: " << fixed << setprecision(3) << setw(10) << solverTime
         << "per: " << fixed << setprecision(5) << (m_solverCalls ? solverTime / m_solverCalls : 0.0) << endl;

    double inductionTime = GetTimeDouble(m_inductionTime);
    cout << "Induction      steps:  " << left << setw(12) << m_inductionSteps
         << "takes: " << fixed << setprecision(3) << setw(10) << inductionTime
         << "per: " << fixed << setprecision(5) << (m_inductionSteps ? inductionTime / m_inductionSteps : 0.0) << endl;

    cout << "Initialization takes: " << fixed << setprecision(5) << GetTimeDouble(m_initTime) << endl;
    cout << "Total Time     spent: " << fixed << setprecision(5) << Elapsed() << endl;
}

} // namespace sec
