/*
===============================================================================
TEST COMBINATION TABLE — Tests for combination_table.h
===============================================================================

OVERVIEW
--------
Validates the deduplicated result table: insertion rules, lookup, export to
test-runner rows and row maps, metrics, and lifetime of the parameter set it
refers to.

TEST ORGANIZATION
-----------------
• Section A: Insertion and deduplication
• Section B: Export
• Section C: Metrics and rendering
• Section D: Lifetime

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• combination_table.h - System under test

===============================================================================
*/

#include <catch2/catch.hpp>
#include <pairgen/combination_table.h>

#include <memory>
#include <stdexcept>
#include <string>

using namespace pairgen;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

std::shared_ptr<const ParameterSet> makeParams()
{
    ParameterSet params;
    params.add("Browser", { constant("Chrome"), constant("Safari") });
    params.add("OS", { constant("Windows"), constant("macOS") });
    return std::make_shared<const ParameterSet>(std::move(params));
}

Combination row(const ParameterSet& params, std::size_t browser, std::size_t os)
{
    Combination c(params);
    c.setValue(0, params[0].partition(browser));
    c.setValue(1, params[1].partition(os));
    return c;
}

} // namespace

// ============================================================================
// SECTION A: INSERTION
// ============================================================================

/**
 * @test Table::AddAndDeduplicate
 * @brief Verifies add() appends new keys and reports duplicates
 */
TEST_CASE("A1: Table::AddAndDeduplicate", "[table][insert]")
{
    auto params = makeParams();
    CombinationTable table(params);
    REQUIRE(table.empty());

    REQUIRE(table.add(row(*params, 0, 0)));
    REQUIRE(table.add(row(*params, 1, 1)));
    REQUIRE_FALSE(table.add(row(*params, 0, 0)));

    REQUIRE(table.size() == 2);
    REQUIRE(table.contains("Chrome|Windows"));
    REQUIRE_FALSE(table.contains("Chrome|macOS"));
    REQUIRE(table[1].key() == "Safari|macOS");
    REQUIRE(table.at(0).key() == "Chrome|Windows");
    REQUIRE_THROWS_AS(table.at(2), std::out_of_range);

    std::size_t visited = 0;
    for (const auto& c : table) {
        REQUIRE(c.isFilled());
        ++visited;
    }
    REQUIRE(visited == table.combinations().size());
}

/**
 * @test Table::RejectsInvalidRows
 * @brief Verifies unfilled or wrongly sized combinations are rejected
 */
TEST_CASE("A2: Table::RejectsInvalidRows", "[table][insert][errors]")
{
    auto params = makeParams();
    CombinationTable table(params);

    Combination partial(*params);
    partial.setValue(0, params->at(0).partition(0));
    REQUIRE_THROWS_AS(table.add(partial), std::invalid_argument);
    REQUIRE_THROWS_AS(table.add(Combination(std::size_t{ 3 })), std::invalid_argument);
    REQUIRE(table.empty());

    REQUIRE_THROWS_AS(CombinationTable(nullptr), std::invalid_argument);
}

// ============================================================================
// SECTION B: EXPORT
// ============================================================================

/**
 * @test Export::Rows
 * @brief Verifies asRows() yields [description, values...] per combination
 */
TEST_CASE("B1: Export::Rows", "[table][export]")
{
    auto params = makeParams();
    CombinationTable table(params);
    table.add(row(*params, 1, 1));

    auto rows = table.asRows();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].size() == 3);
    REQUIRE(rows[0][0].toString() == "Combination{[Browser:Safari, OS:macOS]}");
    REQUIRE(rows[0][1].get<std::string>() == "Safari");
    REQUIRE(rows[0][2].get<std::string>() == "macOS");
}

/**
 * @test Export::RowMaps
 * @brief Verifies asRowMaps() keys values by parameter name
 */
TEST_CASE("B2: Export::RowMaps", "[table][export]")
{
    auto params = makeParams();
    CombinationTable table(params);
    table.add(row(*params, 0, 1));

    auto maps = table.asRowMaps();
    REQUIRE(maps.size() == 1);
    REQUIRE(maps[0].size() == 3);
    REQUIRE(maps[0].at("Browser").get<std::string>() == "Chrome");
    REQUIRE(maps[0].at("OS").get<std::string>() == "macOS");
    REQUIRE(maps[0].at(CombinationTable::DESCRIPTION_KEY).toString() == "Combination{[Browser:Chrome, OS:macOS]}");
}

// ============================================================================
// SECTION C: METRICS
// ============================================================================

/**
 * @test Metrics::BreadthAndSpan
 * @brief Verifies breadth() and the count of distinct covered pairs
 */
TEST_CASE("C1: Metrics::BreadthAndSpan", "[table][metrics]")
{
    auto params = makeParams();
    CombinationTable table(params);
    REQUIRE(table.breadth() == 0);
    REQUIRE(table.span() == 0);

    table.add(row(*params, 0, 0));
    table.add(row(*params, 0, 1));
    table.add(row(*params, 1, 1));
    REQUIRE(table.breadth() == 2);
    REQUIRE(table.span() == 3);
}

/**
 * @test Metrics::ToString
 * @brief Verifies the summary string with and without rows
 */
TEST_CASE("C2: Metrics::ToString", "[table][render]")
{
    auto params = makeParams();
    CombinationTable table(params);
    REQUIRE(table.toString() == "CombinationTable{0 combinations.}");

    table.add(row(*params, 0, 0));
    REQUIRE(table.toString() == "CombinationTable{1 combinations. First is: Combination{[Browser:Chrome, OS:Windows]}}");
}

// ============================================================================
// SECTION D: LIFETIME
// ============================================================================

/**
 * @test Lifetime::TableKeepsParametersAlive
 * @brief Verifies rows stay readable after the caller drops its reference
 */
TEST_CASE("D1: Lifetime::TableKeepsParametersAlive", "[table][lifetime]")
{
    auto params = makeParams();
    CombinationTable table(params);
    table.add(row(*params, 1, 0));

    std::weak_ptr<const ParameterSet> watch = params;
    params.reset();

    REQUIRE_FALSE(watch.expired());
    REQUIRE(&table.parameters() == table.sharedParameters().get());
    REQUIRE(table[0].value(0)->label() == "Browser:Safari");
}
