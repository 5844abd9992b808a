#pragma once
/*
===============================================================================
DIAGNOSTICS — Input statistics, coverage and conflict analysis
===============================================================================

Overview
--------
Utilities for inspecting a generation problem and its result:

    * Input statistics (parameters, partitions, rules, compatible pairs)
    * Pair coverage of a result table, with the list of missing pairs
    * Conflict scan of a result table
    * One-line human readable summary

Design Philosophy
-----------------
1. Free functions over ParameterSet / CombinationTable, independent of any
   algorithm
2. Lightweight result structs
3. Pairs are matched by parameter and partition names, so a table produced
   from a propagated copy can be checked against the original input

Typical Usage
-------------
    auto table = pairgen::generatePairwise(params);

    auto stats = pairgen::computeStatistics(params);
    auto cov   = pairgen::computeCoverage(params, table);
    if (!cov.complete())
        for (const auto& m : cov.missing) std::cerr << "missing " << m << '\n';

    std::cout << pairgen::tableSummary(params, table) << '\n';

Dependencies
------------
• parameter.h, combination_table.h, pair_coverage.h

Performance Notes
-----------------
• computeStatistics() and computeCoverage() evaluate every cross-parameter
  partition pair once: O(sum over i<j of |Pi| * |Pj|) rule evaluations

===============================================================================
*/

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

#include "combination.h"
#include "combination_table.h"
#include "naming.h"
#include "pair_coverage.h"
#include "parameter.h"

namespace pairgen {

// =============================================================================
// INPUT STATISTICS
// =============================================================================

/**
 * @brief Size and constraint density of a parameter set
 */
struct InputStatistics {
    std::size_t numParameters = 0;      ///< Parameters in the set
    std::size_t numPartitions = 0;      ///< Partitions across all parameters
    std::size_t minPartitions = 0;      ///< Smallest parameter
    std::size_t maxPartitions = 0;      ///< Largest parameter
    std::size_t numRules = 0;           ///< Distinct rules
    std::size_t numRuleAttachments = 0; ///< Rules counted once per carrying parameter
    std::size_t span = 0;               ///< Unconstrained combination count (saturating)
    std::size_t compatiblePairs = 0;    ///< Cross-parameter pairs accepted by the rules
    std::size_t incompatiblePairs = 0;  ///< Cross-parameter pairs rejected by the rules
};

inline InputStatistics computeStatistics(const ParameterSet& params) {
    InputStatistics stats;
    stats.numParameters = params.size();
    stats.span = params.span();
    stats.minPartitions = params.empty() ? 0 : std::numeric_limits<std::size_t>::max();

    std::vector<Rule> distinct;
    for (std::size_t i = 0; i < params.size(); ++i) {
        const Parameter& p = params[i];
        stats.numPartitions += p.size();
        if (p.size() < stats.minPartitions) stats.minPartitions = p.size();
        if (p.size() > stats.maxPartitions) stats.maxPartitions = p.size();
        stats.numRuleAttachments += p.rules().size();
        for (const auto& r : p.rules()) {
            bool seen = false;
            for (const auto& d : distinct) {
                if (d == r) { seen = true; break; }
            }
            if (!seen) distinct.push_back(r);
        }

        for (std::size_t j = i + 1; j < params.size(); ++j) {
            for (const auto& a : p.partitions()) {
                for (const auto& b : params[j].partitions()) {
                    if (areCompatible(p, *a, params[j], *b))
                        ++stats.compatiblePairs;
                    else
                        ++stats.incompatiblePairs;
                }
            }
        }
    }
    stats.numRules = distinct.size();
    return stats;
}

// =============================================================================
// PAIR COVERAGE
// =============================================================================

/**
 * @brief Which compatible pairs a table covers
 */
struct CoverageReport {
    std::size_t requiredPairs = 0;      ///< Compatible cross-parameter pairs
    std::size_t coveredPairs = 0;       ///< Of those, present in some row
    std::vector<std::string> missing;   ///< "Browser:Safari + OS:macOS" labels

    bool complete() const noexcept { return missing.empty(); }

    double ratio() const noexcept {
        return requiredPairs == 0 ? 1.0
            : static_cast<double>(coveredPairs) / static_cast<double>(requiredPairs);
    }
};

/**
 * @brief Check pairwise coverage of `table` against the pairs of `params`
 *
 * @details `params` may be the set the table was generated from or a set
 *          with the same parameter and partition names (e.g. the input of
 *          a facade, which generates over a derived set). Slots are matched
 *          by position and compatibility is judged by `params`' rules.
 *
 * @example
 *     auto report = computeCoverage(params, generatePairwise(params));
 *     REQUIRE(report.complete());
 */
inline CoverageReport computeCoverage(const ParameterSet& params, const CombinationTable& table) {
    const std::size_t n = params.size();
    std::unordered_set<std::string> present;
    for (const auto& row : table) {
        if (row.size() != n)
            continue;
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j)
                present.insert(PairCoverage::pairKey(n, i, *row.value(i), j, *row.value(j)));
        }
    }

    CoverageReport report;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            for (const auto& a : params[i].partitions()) {
                for (const auto& b : params[j].partitions()) {
                    if (!areCompatible(params[i], *a, params[j], *b))
                        continue;
                    ++report.requiredPairs;
                    if (present.count(PairCoverage::pairKey(n, i, *a, j, *b)) > 0)
                        ++report.coveredPairs;
                    else
                        report.missing.push_back(naming::slot_label(params[i].name(), a->name()) + " + " +
                                                 naming::slot_label(params[j].name(), b->name()));
                }
            }
        }
    }
    return report;
}

/// @brief Coverage of a table against its own parameter set
inline CoverageReport computeCoverage(const CombinationTable& table) {
    return computeCoverage(table.parameters(), table);
}

// =============================================================================
// CONFLICTS
// =============================================================================

/**
 * @brief Pairs of slots that violate compatibility inside result rows
 *
 * @note A table produced by any generation algorithm has no conflicts; a
 *       non-empty report indicates rules whose answer changes between
 *       evaluations (value-based rules over cycling or computed partitions).
 */
struct ConflictReport {
    struct Entry {
        std::size_t row = 0;
        std::size_t first = 0;
        std::size_t second = 0;
        std::string description;    ///< "Browser:Safari x OS:Linux"
    };

    std::vector<Entry> entries;

    bool empty() const noexcept { return entries.empty(); }
    std::size_t size() const noexcept { return entries.size(); }
};

inline ConflictReport findConflicts(const CombinationTable& table) {
    ConflictReport report;
    const ParameterSet& params = table.parameters();
    for (std::size_t r = 0; r < table.size(); ++r) {
        const Combination& row = table[r];
        for (std::size_t i = 0; i < row.size(); ++i) {
            const ValuePartition* a = row.value(i);
            if (a == nullptr)
                continue;
            for (std::size_t j = i + 1; j < row.size(); ++j) {
                const ValuePartition* b = row.value(j);
                if (b != nullptr && !areCompatible(params[i], *a, params[j], *b)) {
                    report.entries.push_back({ r, i, j,
                        naming::slot_label(params[i].name(), a->name()) + " x " +
                        naming::slot_label(params[j].name(), b->name()) });
                }
            }
        }
    }
    return report;
}

// =============================================================================
// SUMMARY
// =============================================================================

/**
 * @brief One-line summary of a result
 * @return e.g. "9 combinations over 3 parameters (span 18); 27/27 pairs covered (100%)"
 */
inline std::string tableSummary(const ParameterSet& params, const CombinationTable& table) {
    const auto coverage = computeCoverage(params, table);
    const auto percent = static_cast<long long>(coverage.ratio() * 100.0 + 0.5);
    std::string result = naming::concat(table.size(), table.size() == 1 ? " combination" : " combinations",
                                        " over ", params.size(), params.size() == 1 ? " parameter" : " parameters",
                                        " (span ", params.span(), "); ",
                                        coverage.coveredPairs, "/", coverage.requiredPairs,
                                        " pairs covered (", percent, "%)");
    if (!coverage.complete())
        result += naming::concat(", ", coverage.missing.size(), " missing");
    return result;
}

inline std::string tableSummary(const CombinationTable& table) {
    return tableSummary(table.parameters(), table);
}

} // namespace pairgen
