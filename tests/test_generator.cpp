/*
===============================================================================
TEST GENERATOR — Tests for generator.h
===============================================================================

OVERVIEW
--------
Validates the TestGenerator orchestration (template-method hooks, options,
presets, rule propagation, result bookkeeping) and the facade entry points
generatePairwise / generateLegacyPairwise / generateCombinatorial / builder().

TEST ORGANIZATION
-----------------
• Section A: Hook sequence and initialization
• Section B: Options and presets
• Section C: Propagation and results
• Section D: Facade functions, result lifetime and shared partitions
• Section E: InputBuilder

TEST STRATEGY
-------------
• Derived generators record hook calls in a vector
• Scenario checks go through the facade, as users would call it
• Rules are declared on one Parameter only, so the facade must propagate

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• generator.h - System under test
• diagnostics.h, predicates.h - Coverage checks and rule factories

===============================================================================
*/

#include <catch2/catch.hpp>
#include <pairgen/diagnostics.h>
#include <pairgen/generator.h>
#include <pairgen/predicates.h>

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

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

/// Rule declared on Browser only
ParameterSet browserOs()
{
    ParameterSet params;
    params.add("Browser", { constant("Chrome"), constant("Firefox"), constant("Safari") }, { safariOnlyWithMac() });
    params.add("OS", { constant("Windows"), constant("macOS"), constant("Linux") });
    return params;
}

ParameterSet browserOsResolution()
{
    ParameterSet params = browserOs();
    params.add("Resolution", { constant("1024x768"), constant("1920x1080") });
    return params;
}

} // namespace

/**
 * @brief Generator declaring its parameters in addParameters()
 */
class MatrixGenerator : public TestGenerator {
public:
    std::vector<std::string> calls;
    std::size_t preparedRules = 0;

    void addParameters() override {
        calls.push_back("addParameters");
        parameter("Browser", { constant("Chrome"), constant("Safari") }, { safariOnlyWithMac() });
        parameter("OS", { constant("Windows"), constant("macOS") });
    }

    void beforeGenerate(const ParameterSet& prepared) override {
        calls.push_back("beforeGenerate");
        preparedRules = prepared[1].rules().size();
    }

    void afterGenerate(const CombinationTable& table) override {
        calls.push_back("afterGenerate");
        store_["custom:Rows"] = table.size();
    }
};

// ============================================================================
// SECTION A: HOOKS
// ============================================================================

/**
 * @test TestGenerator::HookSequence
 * @brief Verifies addParameters -> beforeGenerate -> afterGenerate
 */
TEST_CASE("A1: TestGenerator::HookSequence", "[generator][hooks]")
{
    MatrixGenerator gen;
    gen.quiet();
    const CombinationTable& table = gen.generatePairwise();

    REQUIRE(gen.calls == std::vector<std::string>{ "addParameters", "beforeGenerate", "afterGenerate" });
    REQUIRE(gen.preparedRules == 1);
    REQUIRE(gen.store().at("custom:Rows").get<std::size_t>() == table.size());
    REQUIRE(&gen.result() == &table);
}

/**
 * @test TestGenerator::InitializeOnce
 * @brief Verifies addParameters() runs once across accessors and runs
 */
TEST_CASE("A2: TestGenerator::InitializeOnce", "[generator][hooks]")
{
    MatrixGenerator gen;
    gen.quiet();
    REQUIRE(gen.span() == 4);
    REQUIRE(gen.parameters().size() == 2);
    gen.generatePairwise();
    gen.generateCombinatorial();

    std::size_t adds = 0;
    for (const auto& c : gen.calls)
        adds += (c == "addParameters") ? 1 : 0;
    REQUIRE(adds == 1);
}

/**
 * @test TestGenerator::NoResultYet
 * @brief Verifies result() before a run and an empty generator fail
 */
TEST_CASE("A3: TestGenerator::NoResultYet", "[generator][errors]")
{
    TestGenerator gen;
    REQUIRE_FALSE(gen.hasResult());
    REQUIRE_THROWS_AS(gen.result(), std::logic_error);
    REQUIRE_THROWS_AS(gen.generatePairwise(), std::invalid_argument);
}

// ============================================================================
// SECTION B: OPTIONS
// ============================================================================

/**
 * @test Options::StoredAndValidated
 * @brief Verifies option setters validate and record under param:<Name>
 */
TEST_CASE("B1: Options::StoredAndValidated", "[generator][options]")
{
    TestGenerator gen(browserOs());

    gen.jump(4);
    gen.seed(7);
    gen.limit(10);
    gen.completionAttempts(2);
    gen.propagateRules(false);
    gen.logLevel(LogLevel::Info);

    REQUIRE(gen.jumpSetting() == 4);
    REQUIRE(gen.seedSetting() == std::uint64_t{ 7 });
    REQUIRE(gen.limitSetting() == 10LL);
    REQUIRE(gen.completionAttemptsSetting() == 2);
    REQUIRE_FALSE(gen.propagatesRules());

    const DataStore& store = gen.store();
    REQUIRE(store.at("param:Jump").get<int>() == 4);
    REQUIRE(store.at("param:Seed").get<std::uint64_t>() == 7);
    REQUIRE(store.at("param:Limit").get<long long>() == 10);
    REQUIRE(store.at("param:CompletionAttempts").get<int>() == 2);
    REQUIRE(store.at("param:PropagateRules").get<bool>() == false);
    REQUIRE(store.at("param:LogLevel").get<std::string>() == "Info");

    REQUIRE_THROWS_AS(gen.jump(0), std::invalid_argument);
    REQUIRE_THROWS_AS(gen.limit(0), std::invalid_argument);
    REQUIRE_THROWS_AS(gen.completionAttempts(0), std::invalid_argument);
    REQUIRE(gen.jumpSetting() == 4);
}

/**
 * @test Options::Defaults
 * @brief Verifies default option values
 */
TEST_CASE("B2: Options::Defaults", "[generator][options]")
{
    TestGenerator gen(browserOs());
    REQUIRE(gen.jumpSetting() == 3);
    REQUIRE(gen.completionAttemptsSetting() == 3);
    REQUIRE_FALSE(gen.limitSetting().has_value());
    REQUIRE_FALSE(gen.seedSetting().has_value());
    REQUIRE(gen.propagatesRules());
    REQUIRE(gen.store().empty());
}

/**
 * @test Presets::Apply
 * @brief Verifies each preset's settings and the recorded preset name
 */
TEST_CASE("B3: Presets::Apply", "[generator][presets]")
{
    SECTION("Fast")
    {
        TestGenerator gen(browserOs());
        gen.applyPreset(TestGenerator::Preset::Fast);
        REQUIRE(gen.jumpSetting() == 5);
        REQUIRE(gen.completionAttemptsSetting() == 1);
        REQUIRE(gen.store().at("param:Preset").get<std::string>() == "Fast");
    }

    SECTION("Thorough")
    {
        TestGenerator gen(browserOs());
        gen.applyPreset(TestGenerator::Preset::Thorough);
        REQUIRE(gen.jumpSetting() == 1);
        REQUIRE(gen.completionAttemptsSetting() == 8);
    }

    SECTION("Deterministic")
    {
        TestGenerator gen(browserOs());
        gen.applyPreset(TestGenerator::Preset::Deterministic);
        REQUIRE(gen.seedSetting() == std::uint64_t{ 0 });
    }

    SECTION("Quiet and Debug")
    {
        TestGenerator gen(browserOs());
        gen.applyPreset(TestGenerator::Preset::Quiet);
        REQUIRE(gen.store().at("param:LogLevel").get<std::string>() == "Error");
        gen.applyPreset(TestGenerator::Preset::Debug);
        REQUIRE(gen.store().at("param:LogLevel").get<std::string>() == "Debug");
        REQUIRE(gen.store().at("param:Preset").get<std::string>() == "Debug");
    }
}

/**
 * @test Options::LogLevelIsScopedToRun
 * @brief Verifies the run threshold is restored afterwards
 */
TEST_CASE("B4: Options::LogLevelIsScopedToRun", "[generator][options][logging]")
{
    ScopedLogLevel outer(LogLevel::Warn);
    TestGenerator gen(browserOs());
    gen.quiet();
    gen.generatePairwise();
    REQUIRE(logger().level() == LogLevel::Warn);
}

// ============================================================================
// SECTION C: PROPAGATION AND RESULTS
// ============================================================================

/**
 * @test Propagation::AppliedBeforeRun
 * @brief Verifies propagation lets a one-sided rule constrain the result
 */
TEST_CASE("C1: Propagation::AppliedBeforeRun", "[generator][propagation]")
{
    TestGenerator gen(browserOs());
    gen.quiet();
    const CombinationTable& table = gen.generateCombinatorial();

    REQUIRE(table.size() == 7);
    REQUIRE(gen.propagation().count() == 1);
    REQUIRE(gen.propagation().additions[0].to == "OS");
    REQUIRE(gen.parameters()[1].rules().empty());
    REQUIRE(table.parameters()[1].rules().size() == 1);
}

/**
 * @test Propagation::Disabled
 * @brief Verifies propagateRules(false) runs on a plain copy
 */
TEST_CASE("C2: Propagation::Disabled", "[generator][propagation]")
{
    TestGenerator gen(browserOs());
    gen.quiet();
    gen.propagateRules(false);
    const CombinationTable& table = gen.generateCombinatorial();

    REQUIRE(gen.propagation().count() == 0);
    REQUIRE(table.parameters()[1].rules().empty());
    REQUIRE(table.size() == 7);
}

/**
 * @test Results::StoreMetadata
 * @brief Verifies result:<Name> entries after a run
 */
TEST_CASE("C3: Results::StoreMetadata", "[generator][results]")
{
    TestGenerator gen(browserOsResolution());
    gen.quiet();
    gen.seed(3);
    const CombinationTable& table = gen.generate(AlgorithmKind::Pairwise);

    const DataStore& store = gen.store();
    REQUIRE(store.at("result:Algorithm").get<std::string>() == "pairwise");
    REQUIRE(store.at("result:Combinations").get<std::size_t>() == table.size());
    REQUIRE(store.at("result:PropagatedRules").get<std::size_t>() == 1);
    REQUIRE(store.at("result:DegradedSeeds").get<std::size_t>() == 0);
    REQUIRE(store.at("result:Runtime").get<double>() >= 0.0);
    REQUIRE(gen.hasResult());
}

/**
 * @test Results::AlgorithmKinds
 * @brief Verifies generate(AlgorithmKind) dispatches to each algorithm
 */
TEST_CASE("C4: Results::AlgorithmKinds", "[generator][results]")
{
    TestGenerator gen(browserOsResolution());
    gen.quiet();

    gen.generate(AlgorithmKind::LegacyPairwise);
    REQUIRE(gen.store().at("result:Algorithm").get<std::string>() == "legacy-pairwise");
    REQUIRE(computeCoverage(gen.result()).complete());

    gen.generate(AlgorithmKind::Combinatorial);
    REQUIRE(gen.store().at("result:Algorithm").get<std::string>() == "combinatorial");
    REQUIRE(gen.result().size() == 14);

    REQUIRE_THROWS_AS(gen.generate(AlgorithmKind::COUNT), std::invalid_argument);
}

// ============================================================================
// SECTION D: FACADE
// ============================================================================

/**
 * @test Facade::PairwiseScenario
 * @brief Verifies the browser/OS scenario through generatePairwise()
 */
TEST_CASE("D1: Facade::PairwiseScenario", "[generator][facade][scenario]")
{
    ScopedLogLevel level(LogLevel::Error);
    ParameterSet params = browserOs();
    CombinationTable table = generatePairwise(params);

    for (const auto& row : table) {
        if (row.value(0)->name() == "Safari")
            REQUIRE(row.value(1)->name() == "macOS");
    }
    for (const char* browser : { "Chrome", "Firefox" })
        for (const char* os : { "Windows", "macOS", "Linux" })
            REQUIRE(table.contains(std::string(browser) + "|" + os));

    REQUIRE(findConflicts(table).empty());
    REQUIRE(params[1].rules().empty());
}

/**
 * @test Facade::CombinatorialScenarios
 * @brief Verifies the 2x2 grid and the limit-5 draw through the facade
 */
TEST_CASE("D2: Facade::CombinatorialScenarios", "[generator][facade][scenario]")
{
    ScopedLogLevel level(LogLevel::Error);

    SECTION("2x2 grid with the default limit")
    {
        ParameterSet params;
        params.add("X", { constant("x1"), constant("x2") });
        params.add("Y", { constant("y1"), constant("y2") });
        REQUIRE(generateCombinatorial(params).size() == 4);
        REQUIRE(generateCombinatorial(params, 99).size() == 4);
    }

    SECTION("Limit 5 out of 14")
    {
        ParameterSet params = browserOsResolution();
        std::set<std::string> valid;
        for (const auto& row : generateCombinatorial(params, 1000))
            valid.insert(row.key());
        REQUIRE(valid.size() == 14);

        CombinationTable limited = generateCombinatorial(params, 5);
        REQUIRE(limited.size() == 5);
        for (const auto& row : limited)
            REQUIRE(valid.count(row.key()) == 1);
    }
}

/**
 * @test Facade::LegacyPairwise
 * @brief Verifies generateLegacyPairwise() with a custom jump
 */
TEST_CASE("D3: Facade::LegacyPairwise", "[generator][facade]")
{
    ScopedLogLevel level(LogLevel::Error);
    ParameterSet params = browserOsResolution();
    CombinationTable table = generateLegacyPairwise(params, 2);
    REQUIRE(computeCoverage(params, table).complete());
    REQUIRE(findConflicts(table).empty());
}

/**
 * @test Facade::InvalidArguments
 * @brief Verifies limit and empty-input validation at the boundary
 */
TEST_CASE("D4: Facade::InvalidArguments", "[generator][facade][errors]")
{
    ParameterSet params = browserOs();
    REQUIRE_THROWS_AS(generateCombinatorial(params, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(generateCombinatorial(params, -1), std::invalid_argument);
    REQUIRE_THROWS_AS(generateLegacyPairwise(params, 0), std::invalid_argument);

    ParameterSet empty;
    REQUIRE_THROWS_AS(generatePairwise(empty), std::invalid_argument);
    REQUIRE_THROWS_AS(generateCombinatorial(empty, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(generateCombinatorial(empty, 5), std::invalid_argument);
}

/**
 * @test Facade::TableOutlivesInput
 * @brief Verifies a facade result stays valid after the input is destroyed
 */
TEST_CASE("D5: Facade::TableOutlivesInput", "[generator][facade][lifetime]")
{
    ScopedLogLevel level(LogLevel::Error);
    CombinationTable table = [] {
        ParameterSet params = browserOs();
        return generatePairwise(params);
    }();

    REQUIRE_FALSE(table.empty());
    REQUIRE(table.parameters()[0].name() == "Browser");
    REQUIRE(table[0].description().rfind("Combination{[Browser:", 0) == 0);
    REQUIRE(table.asRows().size() == table.size());
}

/**
 * @test Facade::IdentityRulesHold
 * @brief Verifies a rule comparing partition objects of the caller's set is
 *        honoured by every facade function
 */
TEST_CASE("D6: Facade::IdentityRulesHold", "[generator][facade][identity]")
{
    ScopedLogLevel level(LogLevel::Error);
    PartitionPtr safari = constant("Safari");
    PartitionPtr windows = constant("Windows");
    const ValuePartition* safariRaw = safari.get();
    const ValuePartition* windowsRaw = windows.get();

    Rule notThisPair("Safari object never with Windows object",
                     [safariRaw, windowsRaw](const ValuePartition& a, const ValuePartition& b) {
                         return !((&a == safariRaw && &b == windowsRaw) || (&a == windowsRaw && &b == safariRaw));
                     });

    ParameterSet params;
    params.add("Browser", { constant("Chrome"), safari }, { notThisPair });
    params.add("OS", { windows, constant("macOS") });

    CombinationTable all = generateCombinatorial(params, 99);
    REQUIRE(all.size() == 3);
    REQUIRE_FALSE(all.contains("Safari|Windows"));

    CombinationTable pairwise = generatePairwise(params);
    REQUIRE_FALSE(pairwise.contains("Safari|Windows"));
    REQUIRE(computeCoverage(params, pairwise).complete());

    CombinationTable legacy = generateLegacyPairwise(params);
    REQUIRE_FALSE(legacy.contains("Safari|Windows"));
    REQUIRE(computeCoverage(params, legacy).complete());

    for (const CombinationTable* table : { &all, &pairwise, &legacy }) {
        REQUIRE(findConflicts(*table).empty());
        for (const auto& row : *table) {
            REQUIRE(params[0].owns(*row.value(0)));
            REQUIRE(params[1].owns(*row.value(1)));
        }
    }
    REQUIRE(params[1].rules().empty());
}

// ============================================================================
// SECTION E: INPUT BUILDER
// ============================================================================

/**
 * @test InputBuilder::FluentRun
 * @brief Verifies builder().parameter(...).rule(...).generatePairwise()
 */
TEST_CASE("E1: InputBuilder::FluentRun", "[generator][builder]")
{
    ScopedLogLevel level(LogLevel::Error);
    CombinationTable table = builder()
        .parameter("Browser", { constant("Chrome"), constant("Safari") })
        .parameter("OS", { constant("Windows"), constant("macOS") })
        .rule("Browser", safariOnlyWithMac())
        .seed(5)
        .jump(2)
        .generatePairwise();

    REQUIRE(table.size() == 3);
    REQUIRE_FALSE(table.contains("Safari|Windows"));
}

/**
 * @test InputBuilder::CombinatorialAndBuild
 * @brief Verifies generateCombinatorial(limit) and build()
 */
TEST_CASE("E2: InputBuilder::CombinatorialAndBuild", "[generator][builder]")
{
    ScopedLogLevel level(LogLevel::Error);
    InputBuilder b;
    b.parameter("X", { constant("x1"), constant("x2") })
     .parameter("Y", { constant("y1"), constant("y2") });

    REQUIRE(b.generateCombinatorial().size() == 4);
    REQUIRE(b.generateCombinatorial(2).size() == 2);
    REQUIRE(b.generateLegacyPairwise().size() == 4);

    ParameterSet built = b.build();
    REQUIRE(built.size() == 2);
    REQUIRE_THROWS_AS(b.generatePairwise(), std::invalid_argument);
}

/**
 * @test InputBuilder::UnknownParameter
 * @brief Verifies rule() on an unknown name is rejected
 */
TEST_CASE("E3: InputBuilder::UnknownParameter", "[generator][builder][errors]")
{
    InputBuilder b;
    b.parameter("OS", { constant("Linux") });
    REQUIRE_THROWS_AS(b.rule("Browser", safariOnlyWithMac()), std::invalid_argument);
}
