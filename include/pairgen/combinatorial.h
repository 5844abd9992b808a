#pragma once
/*
===============================================================================
COMBINATORIAL — Exhaustive generation of all compatible combinations
===============================================================================

OVERVIEW
--------
Enumerates every slot assignment that satisfies all rules, by depth-first
backtracking over parameter positions in declaration order. A candidate
partition is pruned as soon as it conflicts with any slot assigned before it.
When a limit below the number of valid combinations is set, the full result
is shuffled and truncated to the limit.

IMPLEMENTATION NOTES
--------------------
The search is GenerationAlgorithm::forEachCompletion() started from an empty
combination; the pairwise builders use the same search to rescue seeds their
greedy completion cannot finish. Every complete assignment is validated once
more before it is kept.

USAGE EXAMPLES
--------------
    CombinatorialAlgorithm all;              // no limit
    CombinatorialAlgorithm five(5);          // at most 5 rows, chosen at random

PERFORMANCE NOTES
-----------------
• Time is proportional to the number of partial assignments that survive
  pruning, which is bounded by ParameterSet::span()
• The complete valid set is held in memory before truncation

EXCEPTION SAFETY
----------------
• Constructor: std::invalid_argument if limit < 1

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "combination.h"
#include "combination_table.h"
#include "generation_algorithm.h"
#include "naming.h"
#include "parameter.h"

namespace pairgen {

    class CombinatorialAlgorithm : public GenerationAlgorithm
    {
    public:
        /// Limit meaning "keep every valid combination"
        static constexpr std::size_t UNLIMITED = std::numeric_limits<std::size_t>::max();

        CombinatorialAlgorithm() = default;

        /// @throws std::invalid_argument if limit < 1
        explicit CombinatorialAlgorithm(long long limit)
        {
            if (limit < 1)
                throw std::invalid_argument(naming::concat("Combinatorial limit must be >= 1, got ", limit));
            limit_ = static_cast<std::size_t>(limit);
        }

        std::string name() const override { return "combinatorial"; }

        std::size_t limit() const noexcept { return limit_; }

        /// @brief Number of valid combinations found by the last run, before truncation
        std::size_t validCount() const noexcept { return validCount_; }

    protected:
        void run(const ParameterSet& params, CombinationTable& table) override
        {
            std::vector<Combination> valid = enumerate(params);
            validCount_ = valid.size();
            log(LogLevel::Debug, naming::concat(name(), ": ", valid.size(), " valid combination(s) out of span ",
                                                params.span()));

            if (limit_ < valid.size()) {
                std::shuffle(valid.begin(), valid.end(), rng());
                valid.erase(valid.begin() + static_cast<std::ptrdiff_t>(limit_), valid.end());
                log(LogLevel::Info, naming::concat(name(), ": truncated to limit ", limit_));
            }
            for (const auto& c : valid)
                emit(table, c);
        }

    private:
        std::vector<Combination> enumerate(const ParameterSet& params)
        {
            std::vector<Combination> out;
            forEachCompletion(Combination(params), [&out](const Combination& c) {
                out.push_back(c);
                return true;
            });
            return out;
        }

        std::size_t limit_ = UNLIMITED;
        std::size_t validCount_ = 0;
    };

} // namespace pairgen
