#ifndef LOG_H
#define LOG_H

#include "Settings.h"
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace sec {

void signalHandler(int signum);

// set by SIGINT, polled by the checkers between exploration levels
bool Interrupted();

void ClearInterrupt();

class Log {
  public:
    Log(int verb) : m_verbosity(verb) {
        m_begin = chrono::steady_clock::now();
        m_tick = chrono::steady_clock::now();
    }

    ~Log() {}

    template <typename... Args>
    void L(int messageVerbosity, const Args &...args) {
        if (messageVerbosity <= m_verbosity) {
            ostringstream oss;
            logHelper(oss, args...);
            cout << oss.str() << endl;
        }
    }

    void PrintStatistics();

    inline void Tick() {
        m_tick = chrono::steady_clock::now();
    }

    inline void StatLevel(size_t states) {
        m_levelTime += chrono::duration_cast<std::chrono::microseconds>(
            chrono::steady_clock::now() - m_tick);
        m_levels++;
        m_states += states;
    }

    inline void StatSolver() {
        m_solverTime += chrono::duration_cast<std::chrono::microseconds>(
            chrono::steady_clock::now() - m_tick);
        m_solverCalls++;
    }

    inline void StatInduction() {
        m_inductionTime += chrono::duration_cast<std::chrono::microseconds>(
            chrono::steady_clock::now() - m_tick);
        m_inductionSteps++;
    }

    inline void StatEvaluation() {
        m_evaluations++;
    }

    void StatInit() {
        m_initTime += chrono::duration_cast<std::chrono::microseconds>(
            chrono::steady_clock::now() - m_tick);
    }

    inline double GetTimeDouble(chrono::microseconds time) {
        return chrono::duration_cast<chrono::duration<double>>(time).count();
    }

    // seconds since the log was created
    inline double Elapsed() {
        return GetTimeDouble(chrono::duration_cast<std::chrono::microseconds>(chrono::steady_clock::now() - m_begin));
    }

  private:
    template <typename T, typename... Args>
    void logHelper(std::ostringstream &oss, const T &first, const Args &...args) {
        oss << first;
        logHelper(oss, args...);
    }

    template <typename T>
    void logHelper(std::ostringstream &oss, const T &last) {
        oss << last;
    }

    int m_verbosity;

    uint32_t m_levels = 0;
    uint64_t m_states = 0;
    chrono::microseconds m_levelTime{0};
    uint32_t m_solverCalls = 0;
    chrono::microseconds m_solverTime{0};
    uint32_t m_inductionSteps = 0;
    chrono::microseconds m_inductionTime{0};
    uint64_t m_evaluations = 0;

    chrono::microseconds m_initTime{0};

    chrono::time_point<chrono::steady_clock> m_tick;
    chrono::time_point<chrono::steady_clock> m_begin;
};

} // namespace sec

#endif
