/*
===============================================================================
TEST RULE PROPAGATOR — Tests for rule_propagator.h
===============================================================================

OVERVIEW
--------
Validates rule propagation: a rule declared on one Parameter is attached to
every other Parameter it examines, on a copy of the input. Detection uses the
rule's declared scope when present and probes the partitions otherwise.

TEST ORGANIZATION
-----------------
• Section A: Detection (examines)
• Section B: Propagation by probing
• Section C: Propagation by declared scope
• Section D: Input left untouched, report contents

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• rule_propagator.h - System under test
• predicates.h - Rule factories

===============================================================================
*/

#include <catch2/catch.hpp>
#include <pairgen/predicates.h>
#include <pairgen/rule_propagator.h>

#include <string>

using namespace pairgen;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

Rule safariOnlyWithMac()
{
    return rules::implies("Safari only with macOS",
                          predicates::nameIs("Safari"),
                          predicates::parameterNameIs("OS"),
                          predicates::nameIs("macOS"));
}

ParameterSet browserOsDevice(const Rule& rule)
{
    ParameterSet params;
    params.add("Browser", { constant("Chrome"), constant("Safari") }, { rule });
    params.add("OS", { constant("Windows"), constant("macOS") });
    params.add("Device", { constant("Phone"), constant("Desktop") });
    return params;
}

} // namespace

// ============================================================================
// SECTION A: DETECTION
// ============================================================================

/**
 * @test Examines::ByProbing
 * @brief Verifies a rule examines a Parameter if it rejects one of its pairs
 */
TEST_CASE("A1: Examines::ByProbing", "[propagator][detect]")
{
    Rule rule = safariOnlyWithMac();
    ParameterSet params = browserOsDevice(rule);

    REQUIRE(RulePropagator::examines(rule, params[0], params[1]));
    REQUIRE_FALSE(RulePropagator::examines(rule, params[0], params[2]));
    REQUIRE_FALSE(RulePropagator::examines(rule, params[0], params[0]));
}

/**
 * @test Examines::ByScope
 * @brief Verifies a declared scope is used instead of probing
 */
TEST_CASE("A2: Examines::ByScope", "[propagator][detect]")
{
    Rule permissive("watches Device",
                    [](const ValuePartition&, const ValuePartition&) { return true; },
                    { "Device" });
    ParameterSet params = browserOsDevice(permissive);

    REQUIRE(RulePropagator::examines(permissive, params[0], params[2]));
    REQUIRE_FALSE(RulePropagator::examines(permissive, params[0], params[1]));
}

// ============================================================================
// SECTION B: PROPAGATION BY PROBING
// ============================================================================

/**
 * @test Propagate::ReachesExaminedParameterOnly
 * @brief Verifies OS gains the Browser rule and Device gains nothing
 */
TEST_CASE("B1: Propagate::ReachesExaminedParameterOnly", "[propagator][propagate]")
{
    Rule rule = safariOnlyWithMac();
    ParameterSet params = browserOsDevice(rule);

    ParameterSet propagated = RulePropagator::propagate(params);

    REQUIRE(propagated.size() == 3);
    REQUIRE(propagated[0].hasRule(rule));
    REQUIRE(propagated[1].hasRule(rule));
    REQUIRE(propagated[1].rules().size() == 1);
    REQUIRE(propagated[2].rules().empty());
}

/**
 * @test Propagate::DeclaredSetIsKept
 * @brief Verifies every declared rule is still present after propagation
 */
TEST_CASE("B2: Propagate::DeclaredSetIsKept", "[propagator][propagate][property]")
{
    Rule first = safariOnlyWithMac();
    Rule second = rules::excludes("no Safari on desktop",
                                  predicates::nameIs("Safari"),
                                  predicates::nameIs("Desktop"));
    ParameterSet params;
    params.add("Browser", { constant("Chrome"), constant("Safari") }, { first });
    params.add("OS", { constant("Windows"), constant("macOS") });
    params.add("Device", { constant("Phone"), constant("Desktop") }, { second });

    ParameterSet propagated = RulePropagator::propagate(params);

    for (std::size_t i = 0; i < params.size(); ++i) {
        for (const auto& r : params[i].rules())
            REQUIRE(propagated[i].hasRule(r));
    }
    REQUIRE(propagated[0].hasRule(second));
    REQUIRE(propagated[2].hasRule(second));
    REQUIRE_FALSE(propagated[2].hasRule(first));
    REQUIRE_FALSE(propagated[1].hasRule(second));
}

/**
 * @test Propagate::NoDuplicates
 * @brief Verifies a rule already carried by the target is not added again
 */
TEST_CASE("B3: Propagate::NoDuplicates", "[propagator][propagate]")
{
    Rule rule = safariOnlyWithMac();
    ParameterSet params;
    params.add("Browser", { constant("Safari") }, { rule });
    params.add("OS", { constant("Windows"), constant("macOS") }, { rule });

    PropagationReport report;
    ParameterSet propagated = RulePropagator::propagate(params, &report);

    REQUIRE(report.count() == 0);
    REQUIRE(propagated[1].rules().size() == 1);
}

// ============================================================================
// SECTION C: PROPAGATION BY SCOPE
// ============================================================================

/**
 * @test Propagate::ScopedRule
 * @brief Verifies a scoped rule reaches exactly the named Parameters
 */
TEST_CASE("C1: Propagate::ScopedRule", "[propagator][scope]")
{
    Rule scoped("Browser and Device only",
                [](const ValuePartition&, const ValuePartition&) { return true; },
                { "Device" });
    ParameterSet params = browserOsDevice(scoped);

    ParameterSet propagated = RulePropagator::propagate(params);
    REQUIRE(propagated[2].hasRule(scoped));
    REQUIRE_FALSE(propagated[1].hasRule(scoped));
}

// ============================================================================
// SECTION D: INPUT AND REPORT
// ============================================================================

/**
 * @test Propagate::InputUntouched
 * @brief Verifies the input keeps its rules while the result shares its partitions
 */
TEST_CASE("D1: Propagate::InputUntouched", "[propagator][copy]")
{
    Rule rule = safariOnlyWithMac();
    ParameterSet params = browserOsDevice(rule);

    ParameterSet propagated = RulePropagator::propagate(params);

    REQUIRE(params[1].rules().empty());
    REQUIRE(propagated[1].hasRule(rule));
    REQUIRE(&propagated[0].partition(0) == &params[0].partition(0));
    REQUIRE(propagated[0].partition(0).parent() == &params[0]);
    REQUIRE(propagated[1].owns(params[1].partition(0)));
}

/**
 * @test Propagate::Report
 * @brief Verifies the report lists rule, source and target of each addition
 */
TEST_CASE("D2: Propagate::Report", "[propagator][report]")
{
    Rule rule = safariOnlyWithMac();
    ParameterSet params = browserOsDevice(rule);

    PropagationReport report;
    (void)RulePropagator::propagate(params, &report);

    REQUIRE(report.count() == 1);
    REQUIRE(report.additions[0].rule == "Safari only with macOS");
    REQUIRE(report.additions[0].from == "Browser");
    REQUIRE(report.additions[0].to == "OS");
}
