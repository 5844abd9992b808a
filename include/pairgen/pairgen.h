#pragma once
/*
===============================================================================
PAIRGEN — Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header for pairgen, a constraint-aware generator of test input
combinations. Parameters hold interchangeable value partitions; rules forbid
pairs of partitions that cannot be combined; the generators produce either a
pairwise covering table or every compatible combination.

WHAT'S INCLUDED
---------------
• naming.h              — Key format, name validation, string helpers
• enum_utils.h          — PAIRGEN_DECLARE_ENUM_WITH_COUNT and helpers
• value.h               — Type-erased Value, DataStore
• logging.h             — Process-wide leveled logger
• partition.h           — Constant, computed and cycling partitions
• rule.h                — Compatibility rules
• parameter.h           — Parameter, ParameterSet, areCompatible()
• predicates.h          — Predicate helpers, where(), rules::implies/excludes
• combination.h         — Slot vector of partitions
• combination_table.h   — Deduplicated result table
• rule_propagator.h     — Rule propagation pass
• callbacks.h           — GenerationCallback, Progress
• pair_coverage.h       — Candidate pairs and coverage state
• generation_algorithm.h— Base class of the generators
• pairwise.h            — Seed-and-complete pairwise builder
• legacy_pairwise.h     — Merge-based pairwise builder
• combinatorial.h       — Exhaustive backtracking generator
• diagnostics.h         — Statistics, coverage and conflict reports
• generator.h           — TestGenerator, facade functions, builder()

QUICK START
-----------
    #include <pairgen/pairgen.h>

    int main() {
        using namespace pairgen;

        ParameterSet params;
        params.add("Browser", { constant("Chrome"), constant("Firefox"), constant("Safari") },
                   { rules::implies("Safari only with macOS",
                                    predicates::nameIs("Safari"),
                                    predicates::parameterNameIs("OS"),
                                    predicates::nameIs("macOS")) });
        params.add("OS", { constant("Windows"), constant("macOS"), constant("Linux") });

        CombinationTable table = generatePairwise(params);
        for (const auto& row : table)
            std::cout << row.description() << '\n';
        std::cout << tableSummary(params, table) << '\n';
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 10+, Clang 12+, MSVC 19.29+)
• Standard library only at runtime; Catch2 v3 for the tests

NAMESPACE
---------
Everything lives in `pairgen::`. Predicate helpers are in
`pairgen::predicates`, rule factories in `pairgen::rules`, string helpers in
`pairgen::naming`.

CONFIGURATION
-------------
• PAIRGEN_DEBUG or _DEBUG: default log threshold Debug (otherwise Warn)

===============================================================================
*/

// ============================================================================
// CORE COMPONENTS (order matters for dependencies)
// ============================================================================

// Naming and enum utilities (no dependencies)
#include "naming.h"
#include "enum_utils.h"

// Value storage (depends on naming)
#include "value.h"

// Logging (depends on enum_utils, naming)
#include "logging.h"

// Data model
#include "partition.h"
#include "rule.h"
#include "parameter.h"
#include "predicates.h"
#include "combination.h"
#include "combination_table.h"

// ============================================================================
// GENERATION
// ============================================================================

#include "rule_propagator.h"
#include "callbacks.h"
#include "pair_coverage.h"
#include "generation_algorithm.h"
#include "pairwise.h"
#include "legacy_pairwise.h"
#include "combinatorial.h"

// ============================================================================
// HIGH-LEVEL COMPONENTS
// ============================================================================

#include "diagnostics.h"
#include "generator.h"
