#pragma once
/*
===============================================================================
COMBINATION — Slot vector of value partitions, one slot per parameter
===============================================================================

OVERVIEW
--------
A Combination is one (possibly partial) test case: slot i holds either
nothing or a partition of parameter i. Generation algorithms build
combinations slot by slot; once filled and placed into a CombinationTable a
combination is only read.

KEY COMPONENTS
--------------
• setValue / clearValue / value: checked slot access
• key(): canonical "Chrome|_|1024x768" identity of the assignment
• merge() / diff(): slot-wise algebra used by the legacy pairwise builder
• checkNoConflicts() / fitsWith(): compatibility of assigned slots
• description() / asRow(): rendering for reports and test-runner rows

DESIGN PHILOSOPHY
-----------------
• Slots hold non-owning pointers; the ParameterSet owns the partitions and
  must outlive every combination built from it
• A slot only accepts a partition of the Parameter at the same position
  when the combination is bound to a ParameterSet
• Keys are built from partition names, never from produced values

USAGE EXAMPLES
--------------
    Combination c(params);
    c.setValue(0, params.at(0).partition(1));   // Browser = Firefox
    c.key();                                    // "Firefox|_"
    c.isFilled();                               // false
    c.description();                            // "Combination{[Browser:Firefox, OS:null]}"

THREAD SAFETY
-------------
• Not synchronized; concurrent reads of an unchanging combination are safe

EXCEPTION SAFETY
----------------
• setValue(): std::invalid_argument for null or foreign partitions,
  std::out_of_range for bad indices; the slot is left unchanged
• merge()/diff(): std::invalid_argument on size mismatch
• asRow(): std::runtime_error if the combination is not filled

===============================================================================
*/

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "naming.h"
#include "parameter.h"
#include "partition.h"
#include "value.h"

namespace pairgen {

    class Combination
    {
    public:
        /**
         * @brief Empty combination bound to a parameter set
         * @throws std::invalid_argument if the set is empty
         */
        explicit Combination(const ParameterSet& params)
            : params_(&params)
            , slots_(params.size(), nullptr)
        {
            if (params.empty())
                throw std::invalid_argument("Combination requires at least one parameter");
        }

        /**
         * @brief Unbound combination of the given width (no ownership checks)
         * @throws std::invalid_argument if size == 0
         */
        explicit Combination(std::size_t size)
            : slots_(size, nullptr)
        {
            if (size == 0)
                throw std::invalid_argument("Combination size must be positive");
        }

        std::size_t size() const noexcept { return slots_.size(); }

        /// @brief Bound parameter set, nullptr for unbound combinations
        const ParameterSet* parameters() const noexcept { return params_; }

        // ====================================================================
        // SLOT ACCESS
        // ====================================================================

        /**
         * @brief Assign slot i
         *
         * @throws std::out_of_range     if i >= size()
         * @throws std::invalid_argument if partition is null, or (bound
         *         combinations only) is not owned by parameter i
         */
        void setValue(std::size_t i, const ValuePartition* partition)
        {
            checkIndex(i);
            if (partition == nullptr) {
                throw std::invalid_argument(naming::concat(
                    "Combination::setValue: null partition for slot ", i,
                    "; use clearValue() to unset a slot"));
            }
            if (params_ != nullptr && !(*params_)[i].owns(*partition)) {
                throw std::invalid_argument(naming::concat(
                    "Combination::setValue: partition '", partition->label(),
                    "' does not belong to parameter '", (*params_)[i].name(), "' at slot ", i));
            }
            slots_[i] = partition;
        }

        void setValue(std::size_t i, const ValuePartition& partition) { setValue(i, &partition); }

        /// @throws std::out_of_range if i >= size()
        void clearValue(std::size_t i)
        {
            checkIndex(i);
            slots_[i] = nullptr;
        }

        /// @brief Slot content, nullptr when unassigned
        /// @throws std::out_of_range if i >= size()
        const ValuePartition* value(std::size_t i) const
        {
            checkIndex(i);
            return slots_[i];
        }

        bool isSet(std::size_t i) const { return value(i) != nullptr; }

        std::size_t setCount() const noexcept
        {
            std::size_t n = 0;
            for (const auto* s : slots_) {
                if (s != nullptr)
                    ++n;
            }
            return n;
        }

        bool isFilled() const noexcept { return setCount() == slots_.size(); }

        bool isEmpty() const noexcept { return setCount() == 0; }

        // ====================================================================
        // IDENTITY
        // ====================================================================

        /// @brief Canonical key: partition names joined with '|', '_' for empty slots
        std::string key() const
        {
            std::vector<std::optional<std::string_view>> names;
            names.reserve(slots_.size());
            for (const auto* s : slots_) {
                if (s != nullptr)
                    names.emplace_back(s->name());
                else
                    names.emplace_back(std::nullopt);
            }
            return naming::slot_key(names);
        }

        /// @brief Same slot assignments (pointer identity per slot)
        bool operator==(const Combination& other) const noexcept { return slots_ == other.slots_; }
        bool operator!=(const Combination& other) const noexcept { return !(*this == other); }

        // ====================================================================
        // ALGEBRA
        // ====================================================================

        /**
         * @brief Slot-wise union
         * @return std::nullopt if any slot is assigned differently in the two
         * @throws std::invalid_argument if sizes differ
         *
         * @note Compatibility of the merged slots is not checked here; call
         *       checkNoConflicts() on the result.
         */
        std::optional<Combination> merge(const Combination& other) const
        {
            checkSameSize(other, "merge");
            Combination result = *this;
            if (result.params_ == nullptr)
                result.params_ = other.params_;
            for (std::size_t i = 0; i < slots_.size(); ++i) {
                const auto* theirs = other.slots_[i];
                if (theirs == nullptr)
                    continue;
                if (slots_[i] == nullptr)
                    result.slots_[i] = theirs;
                else if (slots_[i] != theirs)
                    return std::nullopt;
            }
            return result;
        }

        /**
         * @brief Slot-wise symmetric difference
         *
         * @details Slots assigned in exactly one operand keep that partition,
         *          slots assigned identically in both become empty.
         *
         * @return std::nullopt if any slot is assigned differently in the two
         * @throws std::invalid_argument if sizes differ
         */
        std::optional<Combination> diff(const Combination& other) const
        {
            checkSameSize(other, "diff");
            Combination result = *this;
            if (result.params_ == nullptr)
                result.params_ = other.params_;
            for (std::size_t i = 0; i < slots_.size(); ++i) {
                const auto* theirs = other.slots_[i];
                if (theirs == nullptr)
                    continue;
                if (slots_[i] == nullptr)
                    result.slots_[i] = theirs;
                else if (slots_[i] == theirs)
                    result.slots_[i] = nullptr;
                else
                    return std::nullopt;
            }
            return result;
        }

        // ====================================================================
        // COMPATIBILITY
        // ====================================================================

        /// @brief True if every pair of assigned slots is mutually compatible
        bool checkNoConflicts() const noexcept
        {
            for (std::size_t i = 0; i < slots_.size(); ++i) {
                if (slots_[i] == nullptr)
                    continue;
                for (std::size_t j = i + 1; j < slots_.size(); ++j) {
                    if (slots_[j] != nullptr && !compatible(i, *slots_[i], j, *slots_[j]))
                        return false;
                }
            }
            return true;
        }

        /**
         * @brief True if `candidate` is compatible with every assigned slot
         *        other than `skip`
         */
        bool fitsWith(const ValuePartition& candidate, std::size_t skip) const noexcept
        {
            for (std::size_t i = 0; i < slots_.size(); ++i) {
                if (i == skip || slots_[i] == nullptr)
                    continue;
                if (!compatible(skip, candidate, i, *slots_[i]))
                    return false;
            }
            return true;
        }

        // ====================================================================
        // RENDERING
        // ====================================================================

        /// @brief "Combination{[Browser:Chrome, OS:null]}"
        std::string description() const
        {
            std::string out = "Combination{[";
            for (std::size_t i = 0; i < slots_.size(); ++i) {
                if (i > 0)
                    out += ", ";
                const std::string_view owner =
                    params_ != nullptr ? std::string_view((*params_)[i].name()) : std::string_view{};
                out += naming::slot_label(owner, slots_[i] != nullptr ? std::string_view(slots_[i]->name())
                                                                      : std::string_view("null"));
            }
            out += "]}";
            return out;
        }

        /**
         * @brief Test-runner row: [description, value_0, ..., value_n-1]
         *
         * @note Values are read at call time; cycling partitions advance.
         * @throws std::runtime_error if the combination is not filled
         */
        std::vector<Value> asRow() const
        {
            if (!isFilled()) {
                throw std::runtime_error(naming::concat(
                    "Cannot export unfilled combination ", description()));
            }
            std::vector<Value> row;
            row.reserve(slots_.size() + 1);
            row.emplace_back(description());
            for (const auto* s : slots_)
                row.push_back(s->value());
            return row;
        }

    private:
        // Bound combinations judge by slot; unbound ones fall back to the owners
        bool compatible(std::size_t i, const ValuePartition& a,
                        std::size_t j, const ValuePartition& b) const noexcept
        {
            if (params_ != nullptr)
                return areCompatible((*params_)[i], a, (*params_)[j], b);
            return areCompatible(a, b);
        }

        void checkIndex(std::size_t i) const
        {
            if (i >= slots_.size()) {
                throw std::out_of_range(naming::concat(
                    "Combination slot ", i, " out of range (size ", slots_.size(), ")"));
            }
        }

        void checkSameSize(const Combination& other, const char* op) const
        {
            if (other.size() != size()) {
                throw std::invalid_argument(naming::concat(
                    "Combination::", op, ": size mismatch (", size(), " vs ", other.size(), ")"));
            }
        }

        const ParameterSet* params_ = nullptr;
        std::vector<const ValuePartition*> slots_;
    };

} // namespace pairgen
