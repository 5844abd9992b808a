#pragma once
/*
===============================================================================
COMBINATION TABLE — Ordered, deduplicated result of a generation run
===============================================================================

OVERVIEW
--------
The table collects the filled combinations produced by a generation
algorithm in emission order, rejecting any combination whose key is already
present. It keeps the parameter set alive, so the partitions referenced by
its rows remain valid for as long as the table exists.

KEY COMPONENTS
--------------
• add(): append a filled combination unless its key is already present
• Iteration, at(), contains(key)
• asRows(): [description, value_0, ..., value_n-1] per combination
• asRowMaps(): parameter name -> value, plus "combination_description"
• breadth(), span(): width and number of distinct covered pairs

USAGE EXAMPLES
--------------
    CombinationTable table = pairgen::generatePairwise(params);
    for (const auto& c : table)
        std::cout << c.description() << '\n';

    for (const auto& row : table.asRows())
        runTest(row);

THREAD SAFETY
-------------
• Read-only use after generation is safe from any thread (reading values of
  cycling partitions advances their atomic cursors)

EXCEPTION SAFETY
----------------
• add(): std::invalid_argument for unfilled or mis-sized combinations
• at(): std::out_of_range

===============================================================================
*/

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "combination.h"
#include "naming.h"
#include "parameter.h"
#include "value.h"

namespace pairgen {

    class CombinationTable
    {
    public:
        /// Key of the description entry in asRowMaps()
        static constexpr const char* DESCRIPTION_KEY = "combination_description";

        /// @throws std::invalid_argument if params is null
        explicit CombinationTable(std::shared_ptr<const ParameterSet> params)
            : params_(std::move(params))
        {
            if (!params_)
                throw std::invalid_argument("CombinationTable requires a parameter set");
        }

        /**
         * @brief Append a combination unless an identical one is present
         *
         * @return true if appended, false if its key was already in the table
         * @throws std::invalid_argument if the combination is not filled or
         *         its width differs from the parameter set
         */
        bool add(const Combination& combination)
        {
            if (combination.size() != params_->size()) {
                throw std::invalid_argument(naming::concat(
                    "CombinationTable::add: combination has ", combination.size(),
                    " slots, parameter set has ", params_->size()));
            }
            if (!combination.isFilled()) {
                throw std::invalid_argument(naming::concat(
                    "CombinationTable::add: combination is not filled: ", combination.description()));
            }
            if (!keys_.insert(combination.key()).second)
                return false;
            rows_.push_back(combination);
            return true;
        }

        std::size_t size() const noexcept { return rows_.size(); }
        bool empty() const noexcept { return rows_.empty(); }

        auto begin() const noexcept { return rows_.cbegin(); }
        auto end() const noexcept { return rows_.cend(); }

        const std::vector<Combination>& combinations() const noexcept { return rows_; }

        /// @throws std::out_of_range if i >= size()
        const Combination& at(std::size_t i) const
        {
            if (i >= rows_.size()) {
                throw std::out_of_range(naming::concat(
                    "CombinationTable index ", i, " out of range (size ", rows_.size(), ")"));
            }
            return rows_[i];
        }

        const Combination& operator[](std::size_t i) const { return rows_[i]; }

        bool contains(const std::string& key) const { return keys_.count(key) > 0; }

        const ParameterSet& parameters() const noexcept { return *params_; }

        std::shared_ptr<const ParameterSet> sharedParameters() const noexcept { return params_; }

        // ====================================================================
        // EXPORT
        // ====================================================================

        /// @brief One [description, value_0, ..., value_n-1] row per combination
        std::vector<std::vector<Value>> asRows() const
        {
            std::vector<std::vector<Value>> out;
            out.reserve(rows_.size());
            for (const auto& c : rows_)
                out.push_back(c.asRow());
            return out;
        }

        /// @brief Parameter name -> value per combination, plus DESCRIPTION_KEY
        std::vector<std::map<std::string, Value>> asRowMaps() const
        {
            std::vector<std::map<std::string, Value>> out;
            out.reserve(rows_.size());
            for (const auto& c : rows_) {
                std::map<std::string, Value> row;
                for (std::size_t i = 0; i < c.size(); ++i)
                    row.emplace(params_->at(i).name(), c.value(i)->value());
                row.emplace(DESCRIPTION_KEY, c.description());
                out.push_back(std::move(row));
            }
            return out;
        }

        // ====================================================================
        // METRICS
        // ====================================================================

        /// @brief Slots per combination (0 for an empty table)
        std::size_t breadth() const noexcept { return rows_.empty() ? 0 : rows_.front().size(); }

        /// @brief Number of distinct (slot i, slot j) partition pairs covered
        std::size_t span() const
        {
            const std::size_t width = breadth();
            std::unordered_set<std::string> pairs;
            for (std::size_t i = 0; i < width; ++i) {
                for (std::size_t j = i + 1; j < width; ++j) {
                    for (const auto& c : rows_) {
                        Combination pair(width);
                        pair.setValue(i, c.value(i));
                        pair.setValue(j, c.value(j));
                        pairs.insert(pair.key());
                    }
                }
            }
            return pairs.size();
        }

        /// @brief "CombinationTable{3 combinations. First is: Combination{[...]}}"
        std::string toString() const
        {
            std::string out = naming::concat("CombinationTable{", rows_.size(), " combinations.");
            if (!rows_.empty())
                out += " First is: " + rows_.front().description();
            out += "}";
            return out;
        }

    private:
        std::shared_ptr<const ParameterSet> params_;
        std::vector<Combination> rows_;
        std::unordered_set<std::string> keys_;
    };

} // namespace pairgen
