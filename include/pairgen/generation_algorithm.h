#pragma once
/*
===============================================================================
GENERATION ALGORITHM — Common contract and shared machinery of generators
===============================================================================

OVERVIEW
--------
Every generator turns a ParameterSet into a CombinationTable. The base class
fixes the run skeleton (argument checks, seeding, callbacks, timing) and
offers the slot-completion step shared by both pairwise builders. Concrete
algorithms implement run().

KEY COMPONENTS
--------------
• GenerationAlgorithm::generate(): template method around run()
• completeCombination(): fill unassigned slots with compatible partitions
• forEachCompletion(): depth-first search over every valid completion
• searchCompletion(): first valid completion, when the greedy pass fails
• emit(): add to the table, update progress, notify the callback
• log(): write to the process logger and forward to the callback

CONTRACT
--------
Every combination an algorithm places in the table is filled and passes
checkNoConflicts(). A run is single-threaded and runs to completion.

USAGE EXAMPLES
--------------
    PairwiseAlgorithm algo(3);
    algo.seed(42);                       // reproducible order
    CombinationTable t = algo.generate(std::make_shared<const ParameterSet>(std::move(params)));

THREAD SAFETY
-------------
• One algorithm object must not run two generations concurrently

EXCEPTION SAFETY
----------------
• std::invalid_argument for a null or empty parameter set
• std::logic_error from completeCombination() for an inconsistent seed
• Algorithm-specific hard failures are std::runtime_error

===============================================================================
*/

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "callbacks.h"
#include "combination.h"
#include "combination_table.h"
#include "logging.h"
#include "naming.h"
#include "pair_coverage.h"
#include "parameter.h"

namespace pairgen {

    class GenerationAlgorithm
    {
    public:
        virtual ~GenerationAlgorithm() = default;

        /// @brief Short algorithm name used in logs ("pairwise", ...)
        virtual std::string name() const = 0;

        /**
         * @brief Generate the combination table for `params`
         *
         * @throws std::invalid_argument if params is null or empty
         */
        CombinationTable generate(std::shared_ptr<const ParameterSet> params)
        {
            if (!params)
                throw std::invalid_argument(naming::concat(name(), ": parameter set must not be null"));
            if (params->empty())
                throw std::invalid_argument(naming::concat(name(), ": parameter set must not be empty"));

            rng_.seed(seed_ ? *seed_ : static_cast<std::uint64_t>(std::random_device{}()));
            progress_ = Progress{};
            clock_ = Stopwatch{};

            if (callback_ != nullptr)
                callback_->notifyStart(name(), params->size());
            log(LogLevel::Info, naming::concat(name(), ": generating for ", params->size(),
                                               " parameter(s), span ", params->span()));

            CombinationTable table(params);
            if (const Parameter* empty = firstEmptyParameter(*params)) {
                log(LogLevel::Warn, naming::concat(name(), ": parameter '", empty->name(),
                                                   "' has no partitions; no combination can be filled"));
            } else {
                run(*params, table);
            }

            progress_.runtime = clock_.seconds();
            log(LogLevel::Info, naming::concat(name(), ": produced ", table.size(), " combination(s) in ",
                                               progress_.runtime, "s"));
            if (callback_ != nullptr)
                callback_->notifyFinish(table, progress_);
            return table;
        }

        /// @brief Convenience overload taking ownership of the set
        CombinationTable generate(ParameterSet&& params)
        {
            return generate(std::make_shared<const ParameterSet>(std::move(params)));
        }

        /// @brief Fix the random seed; every later generate() replays the same run
        void seed(std::uint64_t value) noexcept { seed_ = value; }

        std::optional<std::uint64_t> seed() const noexcept { return seed_; }

        /// @brief Attach a non-owning observer (nullptr detaches)
        void setCallback(GenerationCallback* callback) noexcept { callback_ = callback; }

        GenerationCallback* callback() const noexcept { return callback_; }

        /// @brief Metrics of the last run
        const Progress& progress() const noexcept { return progress_; }

        /// @brief Filled and free of conflicts
        static bool isValidCombination(const Combination& c) noexcept
        {
            return c.isFilled() && c.checkNoConflicts();
        }

    protected:
        /// @brief Algorithm body; `table` is empty on entry
        virtual void run(const ParameterSet& params, CombinationTable& table) = 0;

        /**
         * @brief Fill every unassigned slot of `combination`
         *
         * @details Unassigned slots are visited in order. For each, the
         *          partitions of that parameter are tried in shuffled order and
         *          the first one compatible with every assigned slot is kept.
         *          A slot with no compatible partition is left empty.
         *
         * @return Indices of slots that could not be filled (empty on success)
         * @throws std::logic_error if the assigned slots already conflict
         */
        std::vector<std::size_t> completeCombination(Combination& combination)
        {
            if (!combination.checkNoConflicts()) {
                throw std::logic_error(naming::concat(
                    name(), ": seed must be conflict-free before completion: ", combination.description()));
            }
            const ParameterSet* params = combination.parameters();
            if (params == nullptr)
                throw std::logic_error(naming::concat(name(), ": cannot complete an unbound combination"));

            std::vector<std::size_t> unfilled;
            for (std::size_t i = 0; i < combination.size(); ++i) {
                if (combination.value(i) != nullptr)
                    continue;
                bool placed = false;
                for (const ValuePartition* candidate : PairCoverage::shuffled((*params)[i], rng_)) {
                    if (combination.fitsWith(*candidate, i)) {
                        combination.setValue(i, candidate);
                        placed = true;
                        break;
                    }
                    if (wants(LogLevel::Trace)) {
                        log(LogLevel::Trace, naming::concat("  ", candidate->label(),
                                                            " rejected for ", combination.key()));
                    }
                }
                if (!placed)
                    unfilled.push_back(i);
            }
            return unfilled;
        }

        /**
         * @brief Visit every valid completion of `start`
         *
         * @details Depth-first backtracking over the unassigned slots in
         *          declaration order; `cursor[level]` holds the next partition
         *          to try for the level-th free slot, so the call stack does
         *          not grow with the number of parameters. A candidate is
         *          pruned as soon as it conflicts with an assigned slot.
         *          `visit(const Combination&)` returns false to stop the search.
         *
         * @note Worst case is exponential in the number of free slots.
         * @throws std::logic_error if `start` is not bound to a ParameterSet
         */
        template <typename Visitor>
        void forEachCompletion(const Combination& start, Visitor&& visit)
        {
            const ParameterSet* params = start.parameters();
            if (params == nullptr)
                throw std::logic_error(naming::concat(name(), ": cannot complete an unbound combination"));
            if (!start.checkNoConflicts())
                return;

            std::vector<std::size_t> free;
            for (std::size_t i = 0; i < start.size(); ++i) {
                if (start.value(i) == nullptr)
                    free.push_back(i);
            }
            if (free.empty()) {
                if (isValidCombination(start))
                    visit(start);
                return;
            }

            std::vector<std::size_t> cursor(free.size(), 0);
            Combination current(start);
            std::size_t level = 0;

            while (true) {
                const std::size_t slot = free[level];
                const Parameter& param = (*params)[slot];
                bool advanced = false;
                while (cursor[level] < param.size()) {
                    const ValuePartition& candidate = param.partition(cursor[level]++);
                    if (!current.fitsWith(candidate, slot)) {
                        if (wants(LogLevel::Trace))
                            log(LogLevel::Trace, naming::concat(name(), ": prune ", param.name(), ":",
                                                                candidate.name(), " at ", current.key()));
                        continue;
                    }
                    current.setValue(slot, candidate);
                    advanced = true;
                    break;
                }

                if (advanced && level + 1 == free.size()) {
                    if (isValidCombination(current) && !visit(static_cast<const Combination&>(current)))
                        return;
                    continue;
                }
                if (advanced) {
                    ++level;
                    cursor[level] = 0;
                    current.clearValue(free[level]);
                    continue;
                }

                // Level exhausted: backtrack
                current.clearValue(slot);
                if (level == 0)
                    break;
                --level;
            }
        }

        /**
         * @brief Replace `combination` with its first valid completion
         * @return false (and `combination` untouched) if none exists
         */
        bool searchCompletion(Combination& combination)
        {
            std::optional<Combination> found;
            forEachCompletion(combination, [&found](const Combination& full) {
                found = full;
                return false;
            });
            if (!found)
                return false;
            combination = std::move(*found);
            return true;
        }

        /**
         * @brief Add a finished combination to the table and report it
         * @return false if the table already held an identical combination
         */
        bool emit(CombinationTable& table, const Combination& combination)
        {
            if (!table.add(combination))
                return false;
            progress_.combinations = table.size();
            if (wants(LogLevel::Debug))
                log(LogLevel::Debug, naming::concat(name(), ": + ", combination.key()));
            if (callback_ != nullptr) {
                callback_->notifyCombination(combination, table.size() - 1);
                progress_.runtime = clock_.seconds();
                callback_->notifyProgress(progress_);
            }
            return true;
        }

        /// @brief True if a message at `level` reaches the logger or the callback
        bool wants(LogLevel level) const noexcept
        {
            return callback_ != nullptr || logger().enabled(level);
        }

        void log(LogLevel level, const std::string& message)
        {
            logger().log(level, message);
            if (callback_ != nullptr)
                callback_->notifyMessage(level, message);
        }

        std::mt19937_64& rng() noexcept { return rng_; }

        Progress progress_;

    private:
        static const Parameter* firstEmptyParameter(const ParameterSet& params) noexcept
        {
            for (const auto& p : params) {
                if (p->empty())
                    return p.get();
            }
            return nullptr;
        }

        std::mt19937_64 rng_;
        std::optional<std::uint64_t> seed_;
        GenerationCallback* callback_ = nullptr;
        Stopwatch clock_;
    };

} // namespace pairgen
