#pragma once
/*
===============================================================================
CALLBACKS — Observation hooks for generation runs
===============================================================================

Overview
--------
Generation runs are short batch computations, but large parameter sets can
produce thousands of candidate pairs. GenerationCallback lets callers follow
a run: when it starts, each emitted combination, progress snapshots, every
log message the run produces, and the finished table.

Key Components
--------------
• Progress           — Snapshot of a run (rows, pairs, queue, degraded seeds)
• GenerationCallback — Base class with named virtual hooks

Typical Usage
-------------
    class PrintProgress : public pairgen::GenerationCallback {
    protected:
        void onProgress(const pairgen::Progress& p) override {
            std::cout << p.combinations << " rows, "
                      << p.coverage() * 100 << "% pairs covered\n";
        }
        void onMessage(pairgen::LogLevel level, const std::string& msg) override {
            if (level >= pairgen::LogLevel::Warn)
                std::cerr << msg << '\n';
        }
    };

    PrintProgress cb;
    generator.setCallback(&cb);

Callback Points
---------------
| Method          | When Called                          |
|-----------------|--------------------------------------|
| onStart()       | Before candidate generation          |
| onCombination() | After a combination enters the table |
| onProgress()    | After each emitted combination       |
| onMessage()     | For every message the run logs       |
| onFinish()      | After the last combination           |

Thread Safety
-------------
• Hooks run on the thread that called generate()

Exception Safety
----------------
• Exceptions thrown by a hook propagate out of generate() and abort the run

===============================================================================
*/

#include <chrono>
#include <cstddef>
#include <string>

#include "logging.h"

namespace pairgen {

class Combination;
class CombinationTable;

// =============================================================================
// PROGRESS STRUCT
// =============================================================================

/**
 * @brief Generation progress metrics
 *
 * @note Pair counters are only maintained by the pairwise algorithms; the
 *       combinatorial algorithm reports zero for them.
 */
struct Progress {
    std::size_t combinations = 0;       ///< Combinations emitted so far
    std::size_t totalPairs = 0;         ///< Compatible pairs to cover
    std::size_t coveredPairs = 0;       ///< Pairs covered so far
    std::size_t pendingCandidates = 0;  ///< Candidates still in the queue
    std::size_t searchedSeeds = 0;      ///< Seeds the greedy pass missed, completed by search
    std::size_t degradedSeeds = 0;      ///< Seeds no completion exists for, dropped
    double runtime = 0.0;               ///< Seconds since the run started

    /// @brief Covered fraction in [0, 1]; 1 when there is nothing to cover
    double coverage() const noexcept {
        return totalPairs == 0 ? 1.0 : static_cast<double>(coveredPairs) / static_cast<double>(totalPairs);
    }

    bool complete() const noexcept {
        return coveredPairs >= totalPairs;
    }
};

// =============================================================================
// GENERATION CALLBACK BASE CLASS
// =============================================================================

/**
 * @brief Base class for generation observers
 *
 * @details Override any subset of the hooks. The algorithm holds a
 *          non-owning pointer; the callback must outlive the run.
 */
class GenerationCallback {
public:
    virtual ~GenerationCallback() = default;

    // Entry points used by the algorithms
    void notifyStart(const std::string& algorithm, std::size_t parameterCount) { onStart(algorithm, parameterCount); }
    void notifyCombination(const Combination& c, std::size_t index) { onCombination(c, index); }
    void notifyProgress(const Progress& p) { onProgress(p); }
    void notifyMessage(LogLevel level, const std::string& msg) { onMessage(level, msg); }
    void notifyFinish(const CombinationTable& table, const Progress& p) { onFinish(table, p); }

protected:
    // =========================================================================
    // OVERRIDE THESE IN YOUR DERIVED CLASS
    // =========================================================================

    virtual void onStart(const std::string& algorithm, std::size_t parameterCount) {
        (void)algorithm;
        (void)parameterCount;
    }

    /**
     * @brief Called after a combination has been added to the result
     * @param index Row index in the result table
     */
    virtual void onCombination(const Combination& combination, std::size_t index) {
        (void)combination;
        (void)index;
    }

    /// @note Called once per emitted combination; keep it lightweight
    virtual void onProgress(const Progress& p) {
        (void)p;
    }

    /**
     * @brief Called for each message the run logs, regardless of the
     *        logger threshold
     */
    virtual void onMessage(LogLevel level, const std::string& msg) {
        (void)level;
        (void)msg;
    }

    virtual void onFinish(const CombinationTable& table, const Progress& p) {
        (void)table;
        (void)p;
    }
};

// =============================================================================
// STOPWATCH
// =============================================================================

/// Elapsed wall time since construction, used for Progress::runtime
class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    double seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace pairgen
