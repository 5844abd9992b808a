#pragma once
/*
===============================================================================
RULE PROPAGATOR — Make every rule visible from every parameter it examines
===============================================================================

OVERVIEW
--------
Rules are declared on one Parameter but usually constrain two. Compatibility
queries consult the rule sets of both owners, so a rule declared on
"Browser" that forbids Safari with Linux must also be carried by "OS".
propagate() returns a derived parameter set (ParameterSet::derive(): the same
partition objects, separate rule lists) in which every rule is attached to
each Parameter it examines; Parameters a rule never examines are left
untouched.

DETECTION
---------
A rule with an explicit scope is attached to exactly the Parameters named in
it. A rule without a scope is probed: for its declaring Parameter S and every
other Parameter T, the rule examines T if some pair (s, t) with s in S and
t in T is rejected in either argument order. A probe that throws counts as a
rejection.

KEY COMPONENTS
--------------
• RulePropagator::propagate(): augmented derived copy of a ParameterSet
• RulePropagator::examines(): the detection predicate
• PropagationReport: which rule was copied from where to where

USAGE EXAMPLES
--------------
    PropagationReport report;
    ParameterSet ready = RulePropagator::propagate(params, &report);
    for (const auto& a : report.additions)
        std::cout << a.rule << ": " << a.from << " -> " << a.to << '\n';

THREAD SAFETY
-------------
• Stateless; the input set is only read (value-based rules may advance
  cycling cursors of the input while probing)

EXCEPTION SAFETY
----------------
• Strong guarantee: the input set is never modified

===============================================================================
*/

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "logging.h"
#include "naming.h"
#include "parameter.h"
#include "rule.h"

namespace pairgen {

    struct PropagationReport
    {
        struct Addition
        {
            std::string rule;   ///< Rule description
            std::string from;   ///< Declaring Parameter
            std::string to;     ///< Parameter that received the rule
        };

        std::vector<Addition> additions;

        std::size_t count() const noexcept { return additions.size(); }
    };

    class RulePropagator
    {
    public:
        /**
         * @brief True if `rule`, declared on `source`, examines `target`
         */
        static bool examines(const Rule& rule, const Parameter& source, const Parameter& target)
        {
            if (&source == &target)
                return false;
            if (rule.hasScope())
                return rule.inScope(target.name());
            for (const auto& s : source.partitions()) {
                for (const auto& t : target.partitions()) {
                    if (!rule.evaluate(*s, *t) || !rule.evaluate(*t, *s))
                        return true;
                }
            }
            return false;
        }

        /**
         * @brief Copy of `params` with every rule attached to every Parameter
         *        it examines
         *
         * @param params Input set (unchanged)
         * @param report Optional sink for the list of additions
         *
         * @details Detection runs against the declared rules of the input
         *          only, so the outcome does not depend on Parameter order.
         */
        static ParameterSet propagate(const ParameterSet& params, PropagationReport* report = nullptr)
        {
            struct Pending
            {
                Rule rule;
                std::size_t from;
                std::size_t to;
            };
            std::vector<Pending> pending;

            for (std::size_t si = 0; si < params.size(); ++si) {
                const Parameter& source = params[si];
                for (const auto& rule : source.rules()) {
                    for (std::size_t ti = 0; ti < params.size(); ++ti) {
                        const Parameter& target = params[ti];
                        if (ti == si || target.hasRule(rule))
                            continue;
                        if (examines(rule, source, target))
                            pending.push_back(Pending{ rule, si, ti });
                    }
                }
            }

            ParameterSet result = params.derive();
            std::size_t added = 0;
            for (auto& p : pending) {
                if (!result[p.to].addRule(p.rule))
                    continue;
                ++added;
                if (logger().enabled(LogLevel::Trace)) {
                    logger().log(LogLevel::Trace, naming::concat(
                        "Propagated rule '", p.rule.description(), "' from ",
                        params[p.from].name(), " to ", params[p.to].name()));
                }
                if (report != nullptr) {
                    report->additions.push_back(PropagationReport::Addition{
                        p.rule.description(), params[p.from].name(), params[p.to].name() });
                }
            }

            if (logger().enabled(LogLevel::Debug)) {
                logger().debug(naming::concat("Rule propagation: ", added, " rule attachment(s) added across ",
                                              params.size(), " parameter(s)"));
            }
            return result;
        }
    };

} // namespace pairgen
