#pragma once
/*
===============================================================================
GENERATOR — Orchestration of generation runs and the convenience facade
===============================================================================

Overview
--------
TestGenerator is the high-level entry point. It owns the parameter set,
tracks run options, applies rule propagation and hands a prepared copy of the
input to one of the generation algorithms.

It implements the "template method" pattern:

    initialize()                 (runs addParameters() once)
    generate(algorithm) {
        propagate rules          (unless propagateRules(false))
        beforeGenerate();
        algorithm.generate(prepared input);
        afterGenerate();
    }

Derived generators override the hooks; simple uses need no subclass at all.

Key Features
------------
1. Lazy initialization:
       - The constructor performs no work; addParameters() runs on first use.

2. Options tracked in store():
       - jump(), seed(), limit(), completionAttempts(), propagateRules(),
         quiet(), verbose(), logLevel()
       - store()["param:Jump"], store()["param:Seed"], ...
       - Presets: applyPreset(Preset::Fast), Preset::Thorough, ...

3. Results:
       - result() holds the last table; store()["result:*"] holds its metrics
       - propagation() reports which rules were copied to which parameters

4. Facade:
       - generatePairwise(params), generateLegacyPairwise(params, jump),
         generateCombinatorial(params, limit)
       - builder().parameter(...).parameter(...).generatePairwise()

Typical Usage
-------------
    class BrowserMatrix : public pairgen::TestGenerator {
        void addParameters() override {
            parameter("Browser", { constant("Chrome"), constant("Safari") }, { safariOnMac });
            parameter("OS", { constant("Windows"), constant("macOS") });
        }
    };

    BrowserMatrix gen;
    gen.seed(1);
    const auto& table = gen.generatePairwise();

    // or, without a subclass
    auto table = pairgen::builder()
                     .parameter("Browser", { constant("Chrome"), constant("Safari") })
                     .parameter("OS", { constant("Windows"), constant("macOS") })
                     .generateCombinatorial();

Design Notes
------------
* The caller's ParameterSet is never modified; runs use a propagated copy
  made by ParameterSet::derive(), which the result table keeps alive. The
  copy shares the caller's partition objects, so rules that compare
  partition identity hold inside generation too.
* The logger threshold set through quiet()/verbose()/logLevel() applies for
  the duration of a run only.

===============================================================================
*/

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "callbacks.h"
#include "combination_table.h"
#include "combinatorial.h"
#include "enum_utils.h"
#include "generation_algorithm.h"
#include "legacy_pairwise.h"
#include "logging.h"
#include "naming.h"
#include "pairwise.h"
#include "parameter.h"
#include "rule_propagator.h"
#include "value.h"

namespace pairgen {

    PAIRGEN_DECLARE_ENUM_WITH_COUNT(AlgorithmKind, Pairwise, LegacyPairwise, Combinatorial)

    /// Limit used by the facade when none is given
    inline constexpr long long DEFAULT_COMBINATORIAL_LIMIT = 99;

    /*
    ===============================================================================
    TEST GENERATOR
    ===============================================================================
    */
    class TestGenerator {
    private:
        ParameterSet params_;
        bool initialized_ = false;

        std::optional<CombinationTable> result_;
        PropagationReport propagation_;
        GenerationCallback* callback_ = nullptr;

        int jump_ = PairwiseAlgorithm::DEFAULT_JUMP;
        int attempts_ = PairwiseAlgorithm::DEFAULT_ATTEMPTS;
        long long limit_ = 0;   // 0: unlimited
        bool propagate_ = true;
        std::optional<std::uint64_t> seed_;
        std::optional<LogLevel> logLevel_;

    protected:
        // Arbitrary key-value store for options and run metadata
        DataStore store_;

    public:
        // -------------------------------------------------------------------------
        // Constructors
        // -------------------------------------------------------------------------

        /// @brief Empty generator; parameters come from addParameters() or parameter()
        TestGenerator() = default;

        /// @brief Generator over an existing parameter set
        explicit TestGenerator(ParameterSet params)
            : params_(std::move(params))
        {
        }

        virtual ~TestGenerator() = default;

        TestGenerator(const TestGenerator&) = delete;
        TestGenerator& operator=(const TestGenerator&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------

        /// @brief Run addParameters() once; later calls do nothing
        void initialize()
        {
            if (initialized_)
                return;
            initialized_ = true;
            addParameters();
        }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------

        /// @brief Parameter set, auto-initializing
        ParameterSet& parameters()
        {
            initialize();
            return params_;
        }

        const ParameterSet& parameters() const noexcept { return params_; }

        /// @brief Append a parameter (see ParameterSet::add)
        Parameter& parameter(std::string name, std::vector<PartitionPtr> partitions, std::vector<Rule> rules = {})
        {
            return params_.add(std::move(name), std::move(partitions), std::move(rules));
        }

        /// @brief Unconstrained combination count of the input (saturating)
        std::size_t span() { return parameters().span(); }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        void setCallback(GenerationCallback* callback) noexcept { callback_ = callback; }
        GenerationCallback* callback() const noexcept { return callback_; }

        bool hasResult() const noexcept { return result_.has_value(); }

        /// @throws std::logic_error if nothing has been generated yet
        const CombinationTable& result() const
        {
            if (!result_)
                throw std::logic_error("TestGenerator::result: no generation has run yet");
            return *result_;
        }

        /// @brief Rule additions made by the last run's propagation step
        const PropagationReport& propagation() const noexcept { return propagation_; }

        // -------------------------------------------------------------------------
        // Options
        // -------------------------------------------------------------------------

        /**
         * @brief Step between visited queue positions in the pairwise builders
         * @throws std::invalid_argument if value < 1
         * @note Tracked in store()["param:Jump"]
         */
        void jump(int value)
        {
            if (value < 1)
                throw std::invalid_argument(naming::concat("jump must be >= 1, got ", value));
            jump_ = value;
            store_["param:Jump"] = value;
        }

        /**
         * @brief Fix the random seed so that runs are reproducible
         * @note Tracked in store()["param:Seed"]
         */
        void seed(std::uint64_t value)
        {
            seed_ = value;
            store_["param:Seed"] = value;
        }

        /**
         * @brief Cap on the combinatorial result size
         * @throws std::invalid_argument if value < 1
         * @note Tracked in store()["param:Limit"]
         */
        void limit(long long value)
        {
            if (value < 1)
                throw std::invalid_argument(naming::concat("limit must be >= 1, got ", value));
            limit_ = value;
            store_["param:Limit"] = value;
        }

        /**
         * @brief Reshuffled completion retries per pairwise seed
         * @throws std::invalid_argument if value < 1
         * @note Tracked in store()["param:CompletionAttempts"]
         */
        void completionAttempts(int value)
        {
            if (value < 1)
                throw std::invalid_argument(naming::concat("completion attempts must be >= 1, got ", value));
            attempts_ = value;
            store_["param:CompletionAttempts"] = value;
        }

        /// @note Tracked in store()["param:PropagateRules"]
        void propagateRules(bool enabled)
        {
            propagate_ = enabled;
            store_["param:PropagateRules"] = enabled;
        }

        /// @brief Logger threshold applied while a run executes
        /// @note Tracked in store()["param:LogLevel"]
        void logLevel(LogLevel level)
        {
            logLevel_ = level;
            store_["param:LogLevel"] = std::string(enum_name(level));
        }

        /// @brief Only errors during runs
        void quiet() { logLevel(LogLevel::Error); }

        /// @brief Debug output during runs
        void verbose() { logLevel(LogLevel::Debug); }

        // -------------------------------------------------------------------------
        // Presets
        // -------------------------------------------------------------------------

        /// @brief Predefined option sets
        enum class Preset {
            Fast,           ///< jump 5, single completion attempt
            Thorough,       ///< jump 1, 8 completion attempts
            Deterministic,  ///< seed 0
            Quiet,          ///< errors only
            Debug           ///< debug output
        };

        /**
         * @brief Apply a predefined option set
         * @note Preset name is tracked in store()["param:Preset"]
         */
        void applyPreset(Preset p)
        {
            switch (p) {
                case Preset::Fast:
                    jump(5);
                    completionAttempts(1);
                    store_["param:Preset"] = std::string("Fast");
                    break;

                case Preset::Thorough:
                    jump(1);
                    completionAttempts(8);
                    store_["param:Preset"] = std::string("Thorough");
                    break;

                case Preset::Deterministic:
                    seed(0);
                    store_["param:Preset"] = std::string("Deterministic");
                    break;

                case Preset::Quiet:
                    quiet();
                    store_["param:Preset"] = std::string("Quiet");
                    break;

                case Preset::Debug:
                    verbose();
                    store_["param:Preset"] = std::string("Debug");
                    break;
            }
        }

        int jumpSetting() const noexcept { return jump_; }
        int completionAttemptsSetting() const noexcept { return attempts_; }
        std::optional<long long> limitSetting() const noexcept
        {
            return limit_ > 0 ? std::optional<long long>(limit_) : std::nullopt;
        }
        std::optional<std::uint64_t> seedSetting() const noexcept { return seed_; }
        bool propagatesRules() const noexcept { return propagate_; }

        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Declare parameters (called once, from initialize())
        virtual void addParameters() {}

        /// @brief Called after propagation, before the algorithm runs
        virtual void beforeGenerate(const ParameterSet& prepared) { (void)prepared; }

        /// @brief Called with the finished table
        virtual void afterGenerate(const CombinationTable& table) { (void)table; }

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        const CombinationTable& generatePairwise()
        {
            PairwiseAlgorithm algo(jump_, attempts_);
            return generate(algo);
        }

        const CombinationTable& generateLegacyPairwise()
        {
            LegacyPairwiseAlgorithm algo(jump_);
            return generate(algo);
        }

        const CombinationTable& generateCombinatorial()
        {
            if (limit_ > 0) {
                CombinatorialAlgorithm algo(limit_);
                return generate(algo);
            }
            CombinatorialAlgorithm algo;
            return generate(algo);
        }

        const CombinationTable& generate(AlgorithmKind kind)
        {
            switch (kind) {
                case AlgorithmKind::Pairwise:
                    return generatePairwise();
                case AlgorithmKind::LegacyPairwise:
                    return generateLegacyPairwise();
                case AlgorithmKind::Combinatorial:
                    return generateCombinatorial();
                case AlgorithmKind::COUNT:
                    break;
            }
            throw std::invalid_argument("TestGenerator::generate: unknown algorithm kind");
        }

        /**
         * @brief Run `algorithm` on a prepared, derived copy of the parameters
         *
         * Steps:
         *     1. initialize()              (if not already)
         *     2. propagate rules / derive  (input rules left untouched)
         *     3. beforeGenerate()
         *     4. algorithm.generate()
         *     5. afterGenerate()
         *
         * @throws std::invalid_argument if there are no parameters
         */
        const CombinationTable& generate(GenerationAlgorithm& algorithm)
        {
            initialize();
            if (params_.empty())
                throw std::invalid_argument("TestGenerator: no parameters to generate from");

            std::optional<ScopedLogLevel> scopedLevel;
            if (logLevel_)
                scopedLevel.emplace(*logLevel_);

            propagation_ = PropagationReport{};
            auto prepared = std::make_shared<const ParameterSet>(
                propagate_ ? RulePropagator::propagate(params_, &propagation_) : params_.derive());

            beforeGenerate(*prepared);

            if (seed_)
                algorithm.seed(*seed_);
            algorithm.setCallback(callback_);
            result_.emplace(algorithm.generate(prepared));

            const Progress& progress = algorithm.progress();
            store_["result:Algorithm"] = algorithm.name();
            store_["result:Combinations"] = result_->size();
            store_["result:PropagatedRules"] = propagation_.count();
            store_["result:DegradedSeeds"] = progress.degradedSeeds;
            store_["result:Runtime"] = progress.runtime;

            afterGenerate(*result_);
            return *result_;
        }
    };

    // ========================================================================
    // FACADE
    // ========================================================================

    /**
     * @brief Pairwise table for `params` (rules propagated on a derived copy)
     * @throws std::invalid_argument if params is empty
     */
    inline CombinationTable generatePairwise(const ParameterSet& params)
    {
        TestGenerator gen(params.derive());
        return gen.generatePairwise();
    }

    /// @throws std::invalid_argument if params is empty or jump < 1
    inline CombinationTable generateLegacyPairwise(const ParameterSet& params,
                                                   int jump = LegacyPairwiseAlgorithm::DEFAULT_JUMP)
    {
        TestGenerator gen(params.derive());
        gen.jump(jump);
        return gen.generateLegacyPairwise();
    }

    /**
     * @brief All compatible combinations, at most `limit` of them
     * @throws std::invalid_argument if limit < 1 (checked first) or params is empty
     */
    inline CombinationTable generateCombinatorial(const ParameterSet& params,
                                                  long long limit = DEFAULT_COMBINATORIAL_LIMIT)
    {
        if (limit < 1)
            throw std::invalid_argument(naming::concat("limit must be >= 1, got ", limit));
        TestGenerator gen(params.derive());
        gen.limit(limit);
        return gen.generateCombinatorial();
    }

    /**
     * @class InputBuilder
     * @brief Fluent construction of a parameter set followed by a run
     */
    class InputBuilder {
    public:
        InputBuilder& parameter(std::string name, std::vector<PartitionPtr> partitions, std::vector<Rule> rules = {})
        {
            params_.add(std::move(name), std::move(partitions), std::move(rules));
            return *this;
        }

        /// @throws std::invalid_argument if no parameter has that name
        InputBuilder& rule(const std::string& parameterName, Rule rule)
        {
            Parameter* p = params_.find(parameterName);
            if (p == nullptr)
                throw std::invalid_argument(naming::concat("Unknown parameter '", parameterName, "'"));
            p->addRule(std::move(rule));
            return *this;
        }

        InputBuilder& seed(std::uint64_t value) { seed_ = value; return *this; }
        InputBuilder& jump(int value) { jump_ = value; return *this; }

        /// @brief Move the assembled set out; the builder is left empty
        ParameterSet build() { return std::exchange(params_, ParameterSet{}); }

        CombinationTable generatePairwise()
        {
            TestGenerator gen(params_.derive());
            configure(gen);
            return gen.generatePairwise();
        }

        CombinationTable generateLegacyPairwise()
        {
            TestGenerator gen(params_.derive());
            configure(gen);
            return gen.generateLegacyPairwise();
        }

        CombinationTable generateCombinatorial(long long limit = DEFAULT_COMBINATORIAL_LIMIT)
        {
            TestGenerator gen(params_.derive());
            configure(gen);
            gen.limit(limit);
            return gen.generateCombinatorial();
        }

    private:
        void configure(TestGenerator& gen) const
        {
            if (seed_)
                gen.seed(*seed_);
            if (jump_)
                gen.jump(*jump_);
        }

        ParameterSet params_;
        std::optional<std::uint64_t> seed_;
        std::optional<int> jump_;
    };

    inline InputBuilder builder() { return InputBuilder{}; }

} // namespace pairgen
