#pragma once
/*
===============================================================================
PARAMETER — Test parameters, parameter sets and pairwise compatibility
===============================================================================

OVERVIEW
--------
A Parameter is a named, ordered group of value partitions together with the
rules ("dependencies") that constrain which partitions of other parameters
they may be combined with. A ParameterSet is the ordered input of every
generation algorithm: slot i of a combination always belongs to parameter i.

KEY COMPONENTS
--------------
• Parameter: name, adopted partitions, rule list, accepts()
• ParameterSet: ordered ownership of Parameters, partition ids, clone(), derive()
• areCompatible(): symmetric compatibility of two partitions, by owner or by slot

DESIGN PHILOSOPHY
-----------------
• Ownership flows downward: set -> parameter -> partitions. The partition's
  pointer back to its Parameter is non-owning and assigned once.
• Compatibility is the AND of both owners' rule sets, so the answer never
  depends on argument order.
• Partition ids are assigned by the set in registration order; nothing in
  the library uses process-wide counters.

USAGE EXAMPLES
--------------
    pairgen::ParameterSet params;
    params.add("Browser", { constant("Chrome"), constant("Firefox"), constant("Safari") },
               { safariOnMac });
    params.add("OS", { constant("Windows"), constant("macOS"), constant("Linux") });

    const auto& safari = params.at(0).partition(2);
    const auto& linux  = params.at(1).partition(2);
    pairgen::areCompatible(safari, linux);   // false

DEPENDENCIES
------------
• partition.h, rule.h, naming.h

THREAD SAFETY
-------------
• Read-only access is safe; addRule() and ParameterSet::add() are not
  synchronized

EXCEPTION SAFETY
----------------
• Constructors validate every argument before adopting any partition
  (strong guarantee)
• std::invalid_argument for invalid/duplicate names and null partitions
• std::logic_error for partitions or Parameters that already have an owner
• std::out_of_range for bad indices

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "naming.h"
#include "partition.h"
#include "rule.h"

namespace pairgen {

    // ========================================================================
    // PARAMETER
    // ========================================================================

    /**
     * @class Parameter
     * @brief Named group of value partitions plus its compatibility rules
     *
     * @note Neither copyable nor movable: partitions point back at it.
     */
    class Parameter
    {
        // Restricts the sharing constructor to ParameterSet::derive()
        struct SharedPartitions
        {
            explicit SharedPartitions() = default;
        };

    public:
        /**
         * @param name       Non-empty, unique within the owning set
         * @param partitions Partition list (may be empty); entries must be non-null
         *                   and not owned by another Parameter
         * @param rules      Initial rules (default: none)
         *
         * @throws std::invalid_argument on invalid names, null or duplicate partitions
         * @throws std::logic_error if a partition already has an owner
         */
        Parameter(std::string name, std::vector<PartitionPtr> partitions, std::vector<Rule> rules = {})
            : name_(std::move(name))
            , partitions_(std::move(partitions))
            , rules_(std::move(rules))
        {
            naming::validate_parameter_name(name_);

            std::unordered_set<std::string_view> seen;
            for (std::size_t i = 0; i < partitions_.size(); ++i) {
                const auto& p = partitions_[i];
                if (!p) {
                    throw std::invalid_argument(naming::concat(
                        "Parameter '", name_, "': partition ", i, " is null"));
                }
                naming::validate_partition_name(name_, p->name());
                if (!seen.insert(p->name()).second) {
                    throw std::invalid_argument(naming::concat(
                        "Parameter '", name_, "': duplicate partition name '", p->name(), "'"));
                }
                if (p->adopted_) {
                    throw std::logic_error(naming::concat(
                        "Parameter '", name_, "': partition '", p->name(),
                        "' already belongs to a parameter"));
                }
            }
            for (auto& p : partitions_)
                p->attach(*this);
        }

        /**
         * @brief View over another Parameter's partitions with a copy of its rules
         * @note The partitions keep their original owner; use owns() for membership.
         */
        Parameter(SharedPartitions, const Parameter& source)
            : name_(source.name_)
            , partitions_(source.partitions_)
            , rules_(source.rules_)
        {
        }

        ~Parameter()
        {
            for (auto& p : partitions_)
                p->detach(*this);
        }

        Parameter(const Parameter&) = delete;
        Parameter& operator=(const Parameter&) = delete;
        Parameter(Parameter&&) = delete;
        Parameter& operator=(Parameter&&) = delete;

        const std::string& name() const noexcept { return name_; }

        // ====================================================================
        // PARTITIONS
        // ====================================================================

        const std::vector<PartitionPtr>& partitions() const noexcept { return partitions_; }

        std::size_t size() const noexcept { return partitions_.size(); }
        bool empty() const noexcept { return partitions_.empty(); }

        /// @throws std::out_of_range if i >= size()
        const ValuePartition& partition(std::size_t i) const
        {
            if (i >= partitions_.size()) {
                throw std::out_of_range(naming::concat(
                    "Parameter '", name_, "': partition index ", i,
                    " out of range (size ", partitions_.size(), ")"));
            }
            return *partitions_[i];
        }

        /// @brief True if the partition object is one of this Parameter's entries
        bool owns(const ValuePartition& partition) const noexcept
        {
            for (const auto& p : partitions_) {
                if (p.get() == &partition)
                    return true;
            }
            return false;
        }

        /// @brief Partition with the given name, nullptr if absent
        const ValuePartition* find(std::string_view partitionName) const noexcept
        {
            for (const auto& p : partitions_) {
                if (p->name() == partitionName)
                    return p.get();
            }
            return nullptr;
        }

        // ====================================================================
        // RULES
        // ====================================================================

        const std::vector<Rule>& rules() const noexcept { return rules_; }

        bool hasRule(const Rule& rule) const noexcept
        {
            for (const auto& r : rules_) {
                if (r == rule)
                    return true;
            }
            return false;
        }

        /// @return false if the rule was already present
        bool addRule(Rule rule)
        {
            if (hasRule(rule))
                return false;
            rules_.push_back(std::move(rule));
            return true;
        }

        /**
         * @brief True if every rule of this Parameter accepts (own, other)
         * @param own   A partition of this Parameter
         * @param other A partition of another Parameter
         */
        bool accepts(const ValuePartition& own, const ValuePartition& other) const noexcept
        {
            for (const auto& r : rules_) {
                if (!r.evaluate(own, other))
                    return false;
            }
            return true;
        }

        /// @brief Slot index in the owning ParameterSet, -1 if not in a set
        int position() const noexcept { return position_; }

    private:
        friend class ParameterSet;

        std::string name_;
        std::vector<PartitionPtr> partitions_;
        std::vector<Rule> rules_;
        int position_ = -1;
    };

    // ========================================================================
    // COMPATIBILITY
    // ========================================================================

    /**
     * @brief Symmetric compatibility of two partitions
     *
     * @details Both owning Parameters must accept the pair. A partition
     *          without an owner is compatible with everything.
     *
     * @complexity O(|rules(a.parent)| + |rules(b.parent)|)
     */
    inline bool areCompatible(const ValuePartition& a, const ValuePartition& b) noexcept
    {
        const Parameter* pa = a.parent();
        const Parameter* pb = b.parent();
        if (pa == nullptr || pb == nullptr)
            return true;
        return pa->accepts(a, b) && pb->accepts(b, a);
    }

    /**
     * @brief Compatibility of two partitions placed in the given Parameters' slots
     *
     * @details Used wherever the slot is known, so that a derived set's rules
     *          apply to partitions it shares with the set it came from.
     */
    inline bool areCompatible(const Parameter& pa, const ValuePartition& a,
                              const Parameter& pb, const ValuePartition& b) noexcept
    {
        return pa.accepts(a, b) && pb.accepts(b, a);
    }

    inline bool ValuePartition::isCompatibleWith(const ValuePartition& other) const
    {
        return areCompatible(*this, other);
    }

    inline std::string ValuePartition::parameterName() const
    {
        return parent_ ? parent_->name() : std::string{};
    }

    inline std::string ValuePartition::label() const
    {
        return naming::slot_label(parent_ ? std::string_view(parent_->name()) : std::string_view{}, name_);
    }

    // ========================================================================
    // PARAMETER SET
    // ========================================================================

    /**
     * @class ParameterSet
     * @brief Ordered collection of Parameters; slot i of a combination is parameter i
     *
     * @example
     *     ParameterSet params;
     *     params.add("Browser", { constant("Chrome"), constant("Safari") });
     *     params.add("OS", { constant("macOS") });
     *     params.span();   // 2
     */
    class ParameterSet
    {
    public:
        ParameterSet() = default;
        ParameterSet(ParameterSet&&) noexcept = default;
        ParameterSet& operator=(ParameterSet&&) noexcept = default;
        ParameterSet(const ParameterSet&) = delete;
        ParameterSet& operator=(const ParameterSet&) = delete;

        /**
         * @brief Construct and append a Parameter
         * @return Reference to the stored Parameter (stable for the set's lifetime)
         * @throws std::invalid_argument if the name is already used
         */
        Parameter& add(std::string name, std::vector<PartitionPtr> partitions, std::vector<Rule> rules = {})
        {
            if (contains(name)) {
                throw std::invalid_argument(naming::concat("Duplicate parameter name '", name, "'"));
            }
            return add(std::make_unique<Parameter>(std::move(name), std::move(partitions), std::move(rules)));
        }

        /**
         * @brief Append an existing Parameter
         * @throws std::invalid_argument if null or the name is already used
         * @throws std::logic_error if the Parameter already belongs to a set
         */
        Parameter& add(std::unique_ptr<Parameter> parameter)
        {
            if (!parameter)
                throw std::invalid_argument("Cannot add a null parameter");
            if (parameter->position_ >= 0) {
                throw std::logic_error(naming::concat(
                    "Parameter '", parameter->name(), "' already belongs to a parameter set"));
            }
            if (contains(parameter->name())) {
                throw std::invalid_argument(naming::concat(
                    "Duplicate parameter name '", parameter->name(), "'"));
            }
            parameter->position_ = static_cast<int>(parameters_.size());
            for (auto& p : parameter->partitions_) {
                // Shared partitions keep the id their owning set gave them
                if (p->parent() == parameter.get())
                    p->assignId(nextId_);
                ++nextId_;
            }
            parameters_.push_back(std::move(parameter));
            return *parameters_.back();
        }

        std::size_t size() const noexcept { return parameters_.size(); }
        bool empty() const noexcept { return parameters_.empty(); }

        /// @throws std::out_of_range if i >= size()
        const Parameter& at(std::size_t i) const
        {
            if (i >= parameters_.size()) {
                throw std::out_of_range(naming::concat(
                    "Parameter index ", i, " out of range (size ", parameters_.size(), ")"));
            }
            return *parameters_[i];
        }

        Parameter& at(std::size_t i)
        {
            return const_cast<Parameter&>(std::as_const(*this).at(i));
        }

        const Parameter& operator[](std::size_t i) const { return *parameters_[i]; }
        Parameter& operator[](std::size_t i) { return *parameters_[i]; }

        const Parameter* find(std::string_view name) const noexcept
        {
            for (const auto& p : parameters_) {
                if (p->name() == name)
                    return p.get();
            }
            return nullptr;
        }

        Parameter* find(std::string_view name) noexcept
        {
            return const_cast<Parameter*>(std::as_const(*this).find(name));
        }

        bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

        std::optional<std::size_t> indexOf(std::string_view name) const noexcept
        {
            for (std::size_t i = 0; i < parameters_.size(); ++i) {
                if (parameters_[i]->name() == name)
                    return i;
            }
            return std::nullopt;
        }

        /// @brief Visit every Parameter with its slot index
        template <typename Fn>
        void forEach(Fn&& fn) const
        {
            for (std::size_t i = 0; i < parameters_.size(); ++i)
                fn(i, static_cast<const Parameter&>(*parameters_[i]));
        }

        /// @brief Total number of partitions registered (= next id)
        std::size_t partitionCount() const noexcept { return static_cast<std::size_t>(nextId_); }

        /**
         * @brief Product of the partition counts, ignoring rules
         * @note Saturates at std::numeric_limits<std::size_t>::max()
         */
        std::size_t span() const noexcept
        {
            if (parameters_.empty())
                return 0;
            constexpr std::size_t maxSpan = std::numeric_limits<std::size_t>::max();
            std::size_t total = 1;
            for (const auto& p : parameters_) {
                const std::size_t n = p->size();
                if (n == 0)
                    return 0;
                if (total > maxSpan / n)
                    return maxSpan;
                total *= n;
            }
            return total;
        }

        /**
         * @brief Deep copy: partitions are cloned, rules are shared
         * @note Cycling cursors of the copy start at the default value
         */
        ParameterSet clone() const
        {
            ParameterSet copy;
            for (const auto& param : parameters_) {
                std::vector<PartitionPtr> parts;
                parts.reserve(param->size());
                for (const auto& p : param->partitions())
                    parts.push_back(PartitionPtr(p->clone()));
                copy.add(param->name(), std::move(parts), param->rules());
            }
            return copy;
        }

        /**
         * @brief Shallow copy: same partition objects, independent rule lists
         *
         * @details Rules added to the result never reach this set. The result
         *          must not outlive the partitions' owners when rules look at
         *          ValuePartition::parent().
         */
        ParameterSet derive() const
        {
            ParameterSet copy;
            for (const auto& param : parameters_)
                copy.add(std::make_unique<Parameter>(Parameter::SharedPartitions{}, *param));
            return copy;
        }

        auto begin() const noexcept { return parameters_.begin(); }
        auto end() const noexcept { return parameters_.end(); }

    private:
        std::vector<std::unique_ptr<Parameter>> parameters_;
        int nextId_ = 0;
    };

} // namespace pairgen
