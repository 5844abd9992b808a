#pragma once
/*
===============================================================================
PAIR COVERAGE — Candidate pairs and their coverage state
===============================================================================

OVERVIEW
--------
Both pairwise builders start from the same phase: enumerate every compatible
pair of partitions drawn from two different parameters, as a two-slot
partial combination. PairCoverage owns that candidate queue together with a
map from pair key to state (Pending or Covered).

KEY COMPONENTS
--------------
• PairState        — Pending, Covered
• PairCoverage     — queue of candidate combinations + key -> state map
• pairKey()        — key of the (i, a) / (j, b) two-slot combination

USAGE EXAMPLES
--------------
    PairCoverage coverage(params, rng);
    while (!coverage.queue().empty()) {
        Combination seed = coverage.take(index);
        ...
        coverage.markCovered(finished);
    }

THREAD SAFETY
-------------
• Not synchronized; owned by one generation run

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "combination.h"
#include "enum_utils.h"
#include "naming.h"
#include "parameter.h"

namespace pairgen {

PAIRGEN_DECLARE_ENUM_WITH_COUNT(PairState, Pending, Covered)

class PairCoverage {
public:
    /**
     * @brief Phase one: enumerate compatible cross-parameter pairs
     *
     * @details For every i < j, partitions of both parameters are visited in
     *          an order shuffled with `rng`; each mutually compatible,
     *          conflict-free pair becomes a Pending candidate.
     */
    PairCoverage(const ParameterSet& params, std::mt19937_64& rng)
    {
        const std::size_t n = params.size();
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                auto left = shuffled(params[i], rng);
                for (const ValuePartition* a : left) {
                    auto right = shuffled(params[j], rng);
                    for (const ValuePartition* b : right) {
                        if (!areCompatible(params[i], *a, params[j], *b))
                            continue;
                        Combination candidate(params);
                        candidate.setValue(i, a);
                        candidate.setValue(j, b);
                        if (!candidate.checkNoConflicts())
                            continue;
                        if (states_.emplace(candidate.key(), PairState::Pending).second)
                            queue_.push_back(std::move(candidate));
                    }
                }
            }
        }
    }

    /// @brief Partitions of `param` as pointers, in an order shuffled by `rng`
    static std::vector<const ValuePartition*> shuffled(const Parameter& param, std::mt19937_64& rng)
    {
        std::vector<const ValuePartition*> out;
        out.reserve(param.size());
        for (const auto& p : param.partitions())
            out.push_back(p.get());
        std::shuffle(out.begin(), out.end(), rng);
        return out;
    }

    // =========================================================================
    // QUEUE
    // =========================================================================

    std::vector<Combination>& queue() noexcept { return queue_; }
    const std::vector<Combination>& queue() const noexcept { return queue_; }

    /// @brief Remove and return the candidate at `index`
    /// @throws std::out_of_range if index >= queue().size()
    Combination take(std::size_t index)
    {
        if (index >= queue_.size()) {
            throw std::out_of_range(naming::concat(
                "PairCoverage::take: index ", index, " out of range (queue ", queue_.size(), ")"));
        }
        Combination c = std::move(queue_[index]);
        queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(index));
        return c;
    }

    /// @brief Append candidates (deferred or returned by a builder)
    void putBack(std::vector<Combination> candidates)
    {
        for (auto& c : candidates)
            queue_.push_back(std::move(c));
    }

    /// @brief Drop every queued candidate whose pair is already covered
    /// @return Number of candidates removed
    std::size_t purgeCovered()
    {
        const std::size_t before = queue_.size();
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [this](const Combination& c) { return isCovered(c); }),
                     queue_.end());
        return before - queue_.size();
    }

    // =========================================================================
    // COVERAGE
    // =========================================================================

    bool isCovered(const Combination& candidate) const
    {
        auto it = states_.find(candidate.key());
        return it != states_.end() && it->second == PairState::Covered;
    }

    /**
     * @brief Mark every pair of assigned slots of `combination` as covered
     * @return Number of pairs that changed from Pending to Covered
     */
    std::size_t markCovered(const Combination& combination)
    {
        std::size_t newly = 0;
        const std::size_t n = combination.size();
        for (std::size_t i = 0; i < n; ++i) {
            const ValuePartition* a = combination.value(i);
            if (a == nullptr)
                continue;
            for (std::size_t j = i + 1; j < n; ++j) {
                const ValuePartition* b = combination.value(j);
                if (b == nullptr)
                    continue;
                auto it = states_.find(pairKey(n, i, *a, j, *b));
                if (it != states_.end() && it->second == PairState::Pending) {
                    it->second = PairState::Covered;
                    ++covered_;
                    ++newly;
                }
            }
        }
        return newly;
    }

    std::size_t totalPairs() const noexcept { return states_.size(); }
    std::size_t coveredPairs() const noexcept { return covered_; }

    /// @brief Key of the two-slot combination {i: a, j: b} in a width-n set
    static std::string pairKey(std::size_t n, std::size_t i, const ValuePartition& a,
                               std::size_t j, const ValuePartition& b)
    {
        std::vector<std::optional<std::string_view>> slots(n);
        slots[i] = a.name();
        slots[j] = b.name();
        return naming::slot_key(slots);
    }

private:
    std::vector<Combination> queue_;
    std::unordered_map<std::string, PairState> states_;
    std::size_t covered_ = 0;
};

} // namespace pairgen
