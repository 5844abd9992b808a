#pragma once
/*
===============================================================================
RULE — Compatibility predicates over pairs of value partitions
===============================================================================

OVERVIEW
--------
A Rule decides whether two partitions of different parameters may appear in
the same combination. Rules are stored on Parameters; a Parameter applies
each of its rules with its own partition as the first argument. A rule is
expected to give the same answer for (a, b) and (b, a), and the generator
only ever relies on the AND of both directions.

KEY COMPONENTS
--------------
• RuleFunction: std::function<bool(const ValuePartition&, const ValuePartition&)>
• Rule: immutable, cheaply copyable handle (label, predicate, optional scope)

DESIGN PHILOSOPHY
-----------------
• Copies of a Rule share one predicate and compare equal; propagation can
  attach the same rule to several Parameters without duplicating it
• A predicate that throws answers "incompatible" instead of aborting a run
• The optional scope names the Parameters the rule examines; without one the
  rule propagator probes for them

USAGE EXAMPLES
--------------
    pairgen::Rule safariOnMac("Safari only with macOS",
        [](const ValuePartition& a, const ValuePartition& b) {
            auto violates = [](const ValuePartition& x, const ValuePartition& y) {
                return x.name() == "Safari" && y.parameterName() == "OS" && y.name() != "macOS";
            };
            return !violates(a, b) && !violates(b, a);
        },
        {"Browser", "OS"});

THREAD SAFETY
-------------
• Rule is immutable; evaluate() is as thread-safe as the wrapped predicate

EXCEPTION SAFETY
----------------
• Construction with an empty predicate throws std::invalid_argument
• evaluate() is noexcept for predicates throwing std::exception

===============================================================================
*/

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "logging.h"
#include "partition.h"

namespace pairgen {

    using RuleFunction = std::function<bool(const ValuePartition&, const ValuePartition&)>;

    /**
     * @class Rule
     * @brief Shared handle to a labelled compatibility predicate
     */
    class Rule
    {
    public:
        /**
         * @brief Unlabelled rule from any callable (lambda, function pointer)
         * @throws std::invalid_argument if the callable is empty
         */
        template <typename F,
                  typename = std::enable_if_t<
                      !std::is_same_v<std::decay_t<F>, Rule> &&
                      std::is_invocable_r_v<bool, F&, const ValuePartition&, const ValuePartition&>>>
        Rule(F&& fn)
            : Rule(std::string{}, RuleFunction(std::forward<F>(fn)), {})
        {
        }

        /**
         * @param label Human-readable description used in logs and reports
         * @param fn    Predicate; must not be empty
         * @param scope Names of the Parameters the predicate examines (optional)
         *
         * @throws std::invalid_argument if fn is empty or a scope name is invalid
         */
        Rule(std::string label, RuleFunction fn, std::vector<std::string> scope = {})
        {
            if (!fn) {
                throw std::invalid_argument(naming::concat(
                    "Rule '", label, "' requires a predicate"));
            }
            for (const auto& name : scope)
                naming::validate_parameter_name(name);
            impl_ = std::make_shared<const Impl>(Impl{ std::move(label), std::move(fn), std::move(scope) });
        }

        /// @brief Label, or "<unlabelled rule>" when none was given
        std::string description() const
        {
            return impl_->label.empty() ? std::string("<unlabelled rule>") : impl_->label;
        }

        const std::string& label() const noexcept { return impl_->label; }

        const std::vector<std::string>& scope() const noexcept { return impl_->scope; }

        bool hasScope() const noexcept { return !impl_->scope.empty(); }

        /// @brief True if the declared scope names the given Parameter
        bool inScope(std::string_view parameterName) const noexcept
        {
            return std::find(impl_->scope.begin(), impl_->scope.end(), parameterName) != impl_->scope.end();
        }

        /**
         * @brief Apply the predicate
         * @return false if the predicate rejects the pair or throws
         */
        bool evaluate(const ValuePartition& a, const ValuePartition& b) const noexcept
        {
            try {
                return impl_->fn(a, b);
            } catch (const std::exception& e) {
                if (logger().enabled(LogLevel::Debug)) {
                    logger().debug(naming::concat("Rule '", description(), "' threw on (",
                                                  a.name(), ", ", b.name(), "): ", e.what(),
                                                  "; treating as incompatible"));
                }
                return false;
            }
        }

        bool operator()(const ValuePartition& a, const ValuePartition& b) const noexcept
        {
            return evaluate(a, b);
        }

        /// @brief Identity comparison: copies of one rule are equal
        bool operator==(const Rule& other) const noexcept { return impl_ == other.impl_; }

    private:
        struct Impl
        {
            std::string label;
            RuleFunction fn;
            std::vector<std::string> scope;
        };

        std::shared_ptr<const Impl> impl_;
    };

} // namespace pairgen
