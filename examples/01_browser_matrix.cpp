/*
================================================================================
EXAMPLE 01: PAIRWISE BROWSER MATRIX - Cross-Browser Smoke Tests
================================================================================
DIFFICULTY: Beginner
GENERATION TYPE: Pairwise (all compatible pairs covered)

PROBLEM DESCRIPTION
-------------------
A web application must be smoke-tested on several browsers, operating systems
and screen resolutions. Running every combination is wasteful; covering every
pair of values catches most interaction defects with far fewer runs. Safari is
only shipped for macOS, so no combination may pair Safari with another OS.

INPUT MODEL
-----------
Parameters:
    Browser     = {Chrome, Firefox, Safari, Edge}
    OS          = {Windows, macOS, Linux}
    Resolution  = {1366x768, 1920x1080, 2560x1440}

Rules:
    "Safari only with macOS"  (declared on Browser, propagated to OS)
    "Edge not on Linux"       (declared on OS)

Goal:
    Every compatible (Browser, OS), (Browser, Resolution) and
    (OS, Resolution) pair appears in at least one combination.

FEATURES DEMONSTRATED
---------------------
- constant()                      Fixed-value partitions
- rules::implies / rules::excludes Declarative compatibility rules
- ParameterSet::add()             Input declaration
- generatePairwise()              One-call facade
- computeStatistics()             Input size and constraint density
- computeCoverage(), findConflicts() Result verification
- tableSummary()                  One-line report

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <pairgen/pairgen.h>

using namespace pairgen;

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Pairwise Browser Matrix\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // INPUT MODEL
        // ====================================================================
        ParameterSet params;

        params.add("Browser",
                   { constant("Chrome"), constant("Firefox"), constant("Safari"), constant("Edge") },
                   { rules::implies("Safari only with macOS",
                                    predicates::nameIs("Safari"),
                                    predicates::parameterNameIs("OS"),
                                    predicates::nameIs("macOS")) });

        params.add("OS",
                   { constant("Windows"), constant("macOS"), constant("Linux") },
                   { rules::excludes("Edge not on Linux",
                                     predicates::nameIs("Edge"),
                                     predicates::nameIs("Linux")) });

        params.add("Resolution",
                   { constant("1366x768"), constant("1920x1080"), constant("2560x1440") });

        // ====================================================================
        // PRINT INPUT DESCRIPTION
        // ====================================================================
        InputStatistics stats = computeStatistics(params);

        std::cout << "INPUT\n";
        std::cout << "-----\n";
        for (std::size_t i = 0; i < params.size(); ++i) {
            const Parameter& p = params[i];
            std::cout << "  " << std::setw(12) << std::left << p.name() << ":";
            for (const auto& part : p.partitions())
                std::cout << " " << part->name();
            std::cout << "  (" << p.rules().size() << " rule(s))\n";
        }
        std::cout << "\n";
        std::cout << "Parameters:          " << stats.numParameters << "\n";
        std::cout << "Partitions:          " << stats.numPartitions << "\n";
        std::cout << "Distinct rules:      " << stats.numRules << "\n";
        std::cout << "Exhaustive span:     " << stats.span << " combinations\n";
        std::cout << "Compatible pairs:    " << stats.compatiblePairs << "\n";
        std::cout << "Incompatible pairs:  " << stats.incompatiblePairs << "\n\n";

        // ====================================================================
        // GENERATE
        // ====================================================================
        std::cout << "GENERATING...\n";
        std::cout << "-------------\n";

        CombinationTable table = generatePairwise(params);

        // ====================================================================
        // DISPLAY RESULTS
        // ====================================================================
        std::cout << std::left;
        for (std::size_t r = 0; r < table.size(); ++r) {
            const Combination& row = table[r];
            std::cout << "  " << std::setw(3) << (r + 1);
            for (std::size_t i = 0; i < row.size(); ++i)
                std::cout << std::setw(12) << row.value(i)->value().toString();
            std::cout << "\n";
        }
        std::cout << "\n";

        CoverageReport coverage = computeCoverage(params, table);
        ConflictReport conflicts = findConflicts(table);

        std::cout << "VERIFICATION\n";
        std::cout << "------------\n";
        std::cout << "Pairs covered:  " << coverage.coveredPairs << "/" << coverage.requiredPairs << "\n";
        std::cout << "Rule conflicts: " << conflicts.size() << "\n";
        std::cout << tableSummary(params, table) << "\n";

        std::cout << "\nINTERPRETATION\n";
        std::cout << "--------------\n";
        std::cout << "Each row is one test run. Together the rows exercise every\n";
        std::cout << "allowed pair of values at least once, using " << table.size()
                  << " runs instead of " << stats.span << ".\n";

    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
