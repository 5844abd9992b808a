#pragma once
/*
===============================================================================
PREDICATES — Building blocks for compatibility rules
===============================================================================

OVERVIEW
--------
Most rules have the shape "if one side is X and the other side belongs to Y,
the other side must be Z" or "X and Y never go together". This header
provides unary partition predicates, a fluent condition builder and two rule
factories that are symmetric by construction.

KEY COMPONENTS
--------------
• PartitionPredicate: std::function<bool(const ValuePartition&)>
• predicates::nameIs / nameIn / nameStartsWith / parameterNameIs /
  valueIs / valueContains / allOf / anyOf / negate / always
• Condition + where(): AND-chained predicate builder
• rules::implies(), rules::excludes()

USAGE EXAMPLES
--------------
    using namespace pairgen;

    Rule safariOnMac = rules::implies("Safari only with macOS",
        predicates::nameIs("Safari"),
        predicates::parameterNameIs("OS"),
        predicates::nameIs("macOS"));

    Rule noIeOnLinux = rules::excludes("IE not on Linux",
        where().parameterNameIs("Browser").nameIs("IE"),
        where().parameterNameIs("OS").nameIs("Linux"));

THREAD SAFETY
-------------
• Predicates are immutable. Value-based predicates read the partition, which
  advances cycling cursors.

===============================================================================
*/

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parameter.h"
#include "partition.h"
#include "rule.h"

namespace pairgen {

    using PartitionPredicate = std::function<bool(const ValuePartition&)>;

    namespace predicates {

        inline PartitionPredicate always()
        {
            return [](const ValuePartition&) { return true; };
        }

        inline PartitionPredicate nameIs(std::string name)
        {
            return [name = std::move(name)](const ValuePartition& p) { return p.name() == name; };
        }

        inline PartitionPredicate nameIn(std::vector<std::string> names)
        {
            return [names = std::move(names)](const ValuePartition& p) {
                for (const auto& n : names) {
                    if (p.name() == n)
                        return true;
                }
                return false;
            };
        }

        inline PartitionPredicate nameStartsWith(std::string prefix)
        {
            return [prefix = std::move(prefix)](const ValuePartition& p) {
                return std::string_view(p.name()).substr(0, prefix.size()) == prefix;
            };
        }

        /// @brief Matches partitions owned by the named Parameter (never orphans)
        inline PartitionPredicate parameterNameIs(std::string parameterName)
        {
            return [parameterName = std::move(parameterName)](const ValuePartition& p) {
                return p.parent() != nullptr && p.parent()->name() == parameterName;
            };
        }

        /**
         * @brief Matches partitions whose next read equals `expected`
         * @note Uses Value::equals: the stored type must match exactly
         */
        template <typename T>
        PartitionPredicate valueIs(T expected)
        {
            return [expected = std::move(expected)](const ValuePartition& p) {
                return p.value().equals(expected);
            };
        }

        /// @brief Matches partitions whose rendered value contains `fragment`
        inline PartitionPredicate valueContains(std::string fragment)
        {
            return [fragment = std::move(fragment)](const ValuePartition& p) {
                const Value v = p.value();
                return v.has_value() && v.toString().find(fragment) != std::string::npos;
            };
        }

        inline PartitionPredicate allOf(std::vector<PartitionPredicate> preds)
        {
            return [preds = std::move(preds)](const ValuePartition& p) {
                for (const auto& pred : preds) {
                    if (!pred(p))
                        return false;
                }
                return true;
            };
        }

        inline PartitionPredicate anyOf(std::vector<PartitionPredicate> preds)
        {
            return [preds = std::move(preds)](const ValuePartition& p) {
                for (const auto& pred : preds) {
                    if (pred(p))
                        return true;
                }
                return false;
            };
        }

        inline PartitionPredicate negate(PartitionPredicate pred)
        {
            return [pred = std::move(pred)](const ValuePartition& p) { return !pred(p); };
        }

    } // namespace predicates

    // ========================================================================
    // CONDITION BUILDER
    // ========================================================================

    /**
     * @class Condition
     * @brief Fluent AND-chain of partition predicates
     *
     * @details An empty condition matches every partition.
     */
    class Condition
    {
    public:
        Condition& nameIs(std::string name) { return matches(predicates::nameIs(std::move(name))); }
        Condition& nameIn(std::vector<std::string> names) { return matches(predicates::nameIn(std::move(names))); }
        Condition& nameStartsWith(std::string prefix) { return matches(predicates::nameStartsWith(std::move(prefix))); }
        Condition& parameterNameIs(std::string name) { return matches(predicates::parameterNameIs(std::move(name))); }
        Condition& valueContains(std::string fragment) { return matches(predicates::valueContains(std::move(fragment))); }

        template <typename T>
        Condition& valueIs(T expected) { return matches(predicates::valueIs(std::move(expected))); }

        Condition& anyOf(std::vector<PartitionPredicate> preds) { return matches(predicates::anyOf(std::move(preds))); }
        Condition& allOf(std::vector<PartitionPredicate> preds) { return matches(predicates::allOf(std::move(preds))); }
        Condition& negate(PartitionPredicate pred) { return matches(predicates::negate(std::move(pred))); }

        /// @brief Append a custom predicate; empty functions are ignored
        Condition& matches(PartitionPredicate pred)
        {
            if (pred)
                terms_.push_back(std::move(pred));
            return *this;
        }

        PartitionPredicate build() const { return predicates::allOf(terms_); }

        /// @note Callable, so a Condition converts to PartitionPredicate directly
        bool operator()(const ValuePartition& p) const
        {
            for (const auto& t : terms_) {
                if (!t(p))
                    return false;
            }
            return true;
        }

    private:
        std::vector<PartitionPredicate> terms_;
    };

    inline Condition where() { return Condition{}; }

    // ========================================================================
    // RULE FACTORIES
    // ========================================================================

    namespace rules {

        /**
         * @brief "If one side matches `when` and the other side matches `scope`,
         *        the other side must satisfy `then`"
         *
         * @details Checked in both argument orders, so the resulting rule is
         *          symmetric regardless of which Parameter carries it.
         *
         * @example
         *     rules::implies("Safari only with macOS",
         *                    predicates::nameIs("Safari"),
         *                    predicates::parameterNameIs("OS"),
         *                    predicates::nameIs("macOS"));
         */
        inline Rule implies(std::string label, PartitionPredicate when,
                            PartitionPredicate scope, PartitionPredicate then)
        {
            if (!when || !scope || !then) {
                throw std::invalid_argument(naming::concat(
                    "rules::implies '", label, "' requires three predicates"));
            }
            auto violates = [when = std::move(when), scope = std::move(scope), then = std::move(then)](
                                const ValuePartition& x, const ValuePartition& y) {
                return when(x) && scope(y) && !then(y);
            };
            return Rule(std::move(label),
                        [violates](const ValuePartition& a, const ValuePartition& b) {
                            return !violates(a, b) && !violates(b, a);
                        });
        }

        /// @brief `left` and `right` never appear in the same combination (symmetric)
        inline Rule excludes(std::string label, PartitionPredicate left, PartitionPredicate right)
        {
            if (!left || !right) {
                throw std::invalid_argument(naming::concat(
                    "rules::excludes '", label, "' requires two predicates"));
            }
            return Rule(std::move(label),
                        [left = std::move(left), right = std::move(right)](const ValuePartition& a,
                                                                           const ValuePartition& b) {
                            return !(left(a) && right(b)) && !(left(b) && right(a));
                        });
        }

    } // namespace rules

} // namespace pairgen
