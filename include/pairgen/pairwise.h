#pragma once
/*
===============================================================================
PAIRWISE — Seed-and-complete pairwise covering algorithm
===============================================================================

OVERVIEW
--------
Builds a table in which every compatible pair of partitions from two
different parameters appears in at least one row, without guaranteeing the
minimum number of rows.

ALGORITHM
---------
Phase 1 (PairCoverage): enumerate every compatible cross-parameter pair as a
two-slot candidate, all Pending.

Phase 2, repeated until the queue is empty:
    1. drop candidates whose pair is already Covered
    2. walk the queue from `offset` in steps of `jump` (skipping positions
       already visited in this walk) until a conflict-free candidate is found;
       if none is, fail with std::runtime_error
    3. remove that candidate and complete it slot by slot; up to `attempts`
       reshuffled completions are tried, then an exhaustive search
    4. filled: mark all its pairs Covered and append it to the table
       degraded (no completion exists): log a warning and drop the seed
    5. offset = position + jump

A parameter set of a single parameter has no pairs; each of its partitions
becomes one row.

USAGE EXAMPLES
--------------
    PairwiseAlgorithm algo;          // jump 3, 3 completion attempts
    algo.seed(7);
    CombinationTable t = algo.generate(std::move(params));

EXCEPTION SAFETY
----------------
• Constructor: std::invalid_argument if jump < 1 or attempts < 1
• generate(): std::runtime_error if every remaining candidate conflicts

===============================================================================
*/

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "combination.h"
#include "combination_table.h"
#include "generation_algorithm.h"
#include "naming.h"
#include "pair_coverage.h"
#include "parameter.h"

namespace pairgen {

    class PairwiseAlgorithm : public GenerationAlgorithm
    {
    public:
        static constexpr int DEFAULT_JUMP = 3;
        static constexpr int DEFAULT_ATTEMPTS = 3;

        /**
         * @param jump     Step between visited queue positions (>= 1)
         * @param attempts Completion retries per seed (>= 1)
         */
        explicit PairwiseAlgorithm(int jump = DEFAULT_JUMP, int attempts = DEFAULT_ATTEMPTS)
            : jump_(jump)
            , attempts_(attempts)
        {
            if (jump < 1)
                throw std::invalid_argument(naming::concat("Pairwise jump must be >= 1, got ", jump));
            if (attempts < 1)
                throw std::invalid_argument(naming::concat("Pairwise completion attempts must be >= 1, got ", attempts));
        }

        std::string name() const override { return "pairwise"; }

        int jump() const noexcept { return jump_; }
        int attempts() const noexcept { return attempts_; }

    protected:
        void run(const ParameterSet& params, CombinationTable& table) override
        {
            if (params.size() == 1) {
                for (const auto& p : params[0].partitions()) {
                    Combination single(params);
                    single.setValue(0, p.get());
                    emit(table, single);
                }
                return;
            }

            PairCoverage coverage(params, rng());
            progress_.totalPairs = coverage.totalPairs();
            log(LogLevel::Debug, naming::concat(name(), ": ", coverage.totalPairs(), " candidate pair(s)"));

            auto& queue = coverage.queue();
            std::size_t offset = 0;
            while (!queue.empty()) {
                coverage.purgeCovered();
                progress_.pendingCandidates = queue.size();
                if (queue.empty())
                    break;

                const std::size_t position = pickSeed(queue, offset);
                Combination seed = coverage.take(position);
                progress_.pendingCandidates = queue.size();

                auto [built, unfilled] = complete(seed);
                if (unfilled.empty()) {
                    coverage.markCovered(built);
                    progress_.coveredPairs = coverage.coveredPairs();
                    emit(table, built);
                } else {
                    ++progress_.degradedSeeds;
                    log(LogLevel::Warn, naming::concat(
                        name(), ": no compatible value for ", describeSlots(params, unfilled),
                        " in ", built.description(), "; seed ", seed.key(), " dropped"));
                }
                offset = position + static_cast<std::size_t>(jump_);
            }
            progress_.coveredPairs = coverage.coveredPairs();
        }

    private:
        /**
         * @brief Position of the next seed
         * @throws std::runtime_error if every queued candidate conflicts
         */
        std::size_t pickSeed(const std::vector<Combination>& queue, std::size_t offset)
        {
            const std::size_t n = queue.size();
            std::vector<bool> visited(n, false);
            std::size_t pos = offset % n;
            for (std::size_t step = 0; step < n; ++step) {
                while (visited[pos])
                    pos = (pos + 1) % n;
                visited[pos] = true;
                if (queue[pos].checkNoConflicts())
                    return pos;
                if (wants(LogLevel::Trace))
                    log(LogLevel::Trace, naming::concat(name(), ": skipping conflicting ", queue[pos].key()));
                pos = (pos + static_cast<std::size_t>(jump_)) % n;
            }
            throw std::runtime_error(naming::concat(
                name(), ": all ", n, " remaining candidate(s) are internally conflicting"));
        }

        /**
         * @brief Up to attempts_ reshuffled greedy completions, then a search
         * @return The filled combination, or the last greedy try with its empty slots
         */
        std::pair<Combination, std::vector<std::size_t>> complete(const Combination& seed)
        {
            Combination attempt = seed;
            std::vector<std::size_t> unfilled;
            for (int i = 0; i < attempts_; ++i) {
                attempt = seed;
                unfilled = completeCombination(attempt);
                if (unfilled.empty())
                    break;
                if (wants(LogLevel::Trace)) {
                    log(LogLevel::Trace, naming::concat(name(), ": completion attempt ", i + 1,
                                                        " left ", unfilled.size(), " slot(s) empty"));
                }
            }
            if (!unfilled.empty()) {
                Combination searched = seed;
                if (searchCompletion(searched)) {
                    ++progress_.searchedSeeds;
                    log(LogLevel::Debug, naming::concat(name(), ": seed ", seed.key(),
                                                        " completed by search as ", searched.key()));
                    return { std::move(searched), {} };
                }
            }
            return { std::move(attempt), std::move(unfilled) };
        }

        static std::string describeSlots(const ParameterSet& params, const std::vector<std::size_t>& slots)
        {
            std::vector<std::string> names;
            names.reserve(slots.size());
            for (std::size_t i : slots)
                names.push_back(params[i].name());
            return naming::join(names, ", ");
        }

        int jump_;
        int attempts_;
    };

} // namespace pairgen
