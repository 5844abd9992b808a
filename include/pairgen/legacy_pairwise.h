#pragma once
/*
===============================================================================
LEGACY PAIRWISE — Merge-based pairwise covering algorithm
===============================================================================

OVERVIEW
--------
The earlier pairwise builder, kept for comparison. Phase 1 is the same
candidate enumeration as PairwiseAlgorithm. Each row is then grown by merging
queued candidates into an initially empty combination instead of completing a
single seed.

ALGORITHM
---------
For each row:
    1. position = 0, then (position + jump) mod queue size; each visited
       candidate is removed from the queue
    2. covered candidates are discarded; conflicting candidates are discarded
       and counted
    3. the candidate is merged into the row; a slot disagreement or an
       incompatible merge result defers it to a put-back list
    4. stop once the row is filled or the queue is exhausted
    5. deferred candidates go back to the queue; remaining slots are completed
       greedily, then by exhaustive search
    6. filled: all pairs of the row are marked Covered and the row is emitted
       not filled: the merged candidates clash through the rules. All but the
       first return to the queue; the first starts the next row on its own
       and is dropped with a warning only if that row cannot be completed
       either

A row that nothing could be merged into, while conflicting candidates were
seen, is a hard failure (std::runtime_error).

USAGE EXAMPLES
--------------
    LegacyPairwiseAlgorithm legacy(5);
    CombinationTable t = legacy.generate(std::move(params));

===============================================================================
*/

#include <cstddef>
#include <optional>
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

    class LegacyPairwiseAlgorithm : public GenerationAlgorithm
    {
    public:
        static constexpr int DEFAULT_JUMP = 3;

        /// @throws std::invalid_argument if jump < 1
        explicit LegacyPairwiseAlgorithm(int jump = DEFAULT_JUMP)
            : jump_(jump)
        {
            if (jump < 1)
                throw std::invalid_argument(naming::concat("Legacy pairwise jump must be >= 1, got ", jump));
        }

        std::string name() const override { return "legacy-pairwise"; }

        int jump() const noexcept { return jump_; }

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

            solo_.reset();
            while (solo_ || !coverage.queue().empty()) {
                if (solo_)
                    buildSoloRow(coverage, table);
                else
                    buildRow(params, coverage, table);
            }

            progress_.pendingCandidates = 0;
            progress_.coveredPairs = coverage.coveredPairs();
        }

    private:
        void buildRow(const ParameterSet& params, PairCoverage& coverage, CombinationTable& table)
        {
            auto& queue = coverage.queue();
            Combination row(params);
            std::vector<Combination> merged;
            std::vector<Combination> deferred;
            std::size_t conflicting = 0;
            std::size_t position = 0;
            bool first = true;

            while (!row.isFilled() && !queue.empty()) {
                position = first ? 0 : (position + static_cast<std::size_t>(jump_)) % queue.size();
                first = false;
                Combination candidate = coverage.take(position);

                if (coverage.isCovered(candidate))
                    continue;
                if (!candidate.checkNoConflicts()) {
                    ++conflicting;
                    if (wants(LogLevel::Trace))
                        log(LogLevel::Trace, naming::concat(name(), ": discarding conflicting ", candidate.key()));
                    continue;
                }

                auto result = row.merge(candidate);
                if (!result || !result->checkNoConflicts()) {
                    if (wants(LogLevel::Trace)) {
                        log(LogLevel::Trace, naming::concat(name(), ": postponing ", candidate.key(),
                                                            result ? " (incompatible values)" : " (slot conflict)"));
                    }
                    deferred.push_back(std::move(candidate));
                    continue;
                }
                row = std::move(*result);
                merged.push_back(std::move(candidate));
            }

            coverage.putBack(std::move(deferred));
            progress_.pendingCandidates = queue.size();

            if (merged.empty()) {
                if (conflicting > 0) {
                    throw std::runtime_error(naming::concat(
                        name(), ": no candidate could start a combination; ", conflicting,
                        " remaining candidate(s) are internally conflicting"));
                }
                return;
            }

            if (fill(row)) {
                coverage.markCovered(row);
                progress_.coveredPairs = coverage.coveredPairs();
                emit(table, row);
                return;
            }

            if (merged.size() == 1) {
                dropDegraded(merged.front(), row);
                return;
            }
            log(LogLevel::Debug, naming::concat(
                name(), ": could not complete ", row.description(), "; retrying ", merged.front().key(),
                " alone and returning ", merged.size() - 1, " merged candidate(s) to the queue"));
            solo_ = std::move(merged.front());
            merged.erase(merged.begin());
            coverage.putBack(std::move(merged));
            progress_.pendingCandidates = queue.size();
        }

        /// Row grown from the candidate a failed merge singled out, without merging
        void buildSoloRow(PairCoverage& coverage, CombinationTable& table)
        {
            Combination seed = std::move(*solo_);
            solo_.reset();
            if (coverage.isCovered(seed))
                return;

            Combination row = seed;
            if (fill(row)) {
                coverage.markCovered(row);
                progress_.coveredPairs = coverage.coveredPairs();
                emit(table, row);
                return;
            }
            dropDegraded(seed, row);
        }

        /// Greedy completion, then search; false leaves `row` partially filled
        bool fill(Combination& row)
        {
            const Combination start = row;
            if (completeCombination(row).empty())
                return true;
            Combination searched = start;
            if (!searchCompletion(searched))
                return false;
            ++progress_.searchedSeeds;
            log(LogLevel::Debug, naming::concat(name(), ": ", start.key(), " completed by search as ",
                                                searched.key()));
            row = std::move(searched);
            return true;
        }

        void dropDegraded(const Combination& candidate, const Combination& attempt)
        {
            ++progress_.degradedSeeds;
            log(LogLevel::Warn, naming::concat(
                name(), ": no completion of ", attempt.description(), " exists; dropping ", candidate.key()));
        }

        std::optional<Combination> solo_;
        int jump_;
    };

} // namespace pairgen
