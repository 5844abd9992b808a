#pragma once
/*
===============================================================================
PARTITION — Value partitions: named producers of concrete test values
===============================================================================

OVERVIEW
--------
A value partition is one equivalence class of a test parameter ("Chrome",
"Windows", "1024x768"). Generation algorithms only ever handle partitions;
concrete values are produced when a generated row is read. Three producers
are provided:

    • ConstantPartition   always yields the same value
    • ComputedPartition   invokes a producer function on every read
    • CyclingPartition    yields default, v1, v2, ..., default, v1, ... in turn

KEY COMPONENTS
--------------
• ValuePartition: abstract base (name, owning parameter, set-local id)
• ConstantPartition / ComputedPartition / CyclingPartition
• Factories: constant(), computed(), cycling()

DESIGN PHILOSOPHY
-----------------
• Identity is the partition object, never the value it produced. Two reads of
  a cycling partition may differ, yet it is the same slot assignment.
• The owning Parameter is recorded once when the Parameter adopts the
  partition and is never replaced (a non-owning back-pointer).
• Ids are handed out by the ParameterSet, not by a process-wide counter.

USAGE EXAMPLES
--------------
    auto chrome  = pairgen::constant("Chrome");              // name "Chrome"
    auto retries = pairgen::constant("three", 3);
    auto stamp   = pairgen::computed("now", [] { return std::time(nullptr); });
    auto version = pairgen::cycling("Chrome", "116.0",
                                    {"116.0", "116.1", "116.2"});

    version->value().get<std::string>();   // "116.0"
    version->value().get<std::string>();   // "116.1"

DEPENDENCIES
------------
• value.h  - Value
• naming.h - name validation, labels

THREAD SAFETY
-------------
• name(), parent(), id() are immutable after the partition joins a set
• CyclingPartition::value() is safe to call concurrently; the cursor advances
  with a single atomic compare-and-swap, so one full cycle hands out each
  position exactly once
• ComputedPartition::value() is as thread-safe as the supplied producer

EXCEPTION SAFETY
----------------
• Constructors throw std::invalid_argument on invalid names or null producers
• Attaching a partition to a second Parameter throws std::logic_error

===============================================================================
*/

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "naming.h"
#include "value.h"

namespace pairgen {

    class Parameter;
    class ParameterSet;

    // ========================================================================
    // VALUE PARTITION (abstract)
    // ========================================================================

    /**
     * @class ValuePartition
     * @brief Named producer of one concrete value per read
     *
     * @details Derived classes implement value() and clone(). Compatibility
     *          queries are answered through the owning Parameter's rules; see
     *          areCompatible() in parameter.h.
     */
    class ValuePartition
    {
    public:
        /**
         * @param name Partition name, unique within its Parameter
         * @throws std::invalid_argument if the name is empty, "_" or contains '|'
         */
        explicit ValuePartition(std::string name)
            : name_(std::move(name))
        {
            naming::validate_partition_name({}, name_);
        }

        virtual ~ValuePartition() = default;

        ValuePartition(const ValuePartition&) = delete;
        ValuePartition& operator=(const ValuePartition&) = delete;

        const std::string& name() const noexcept { return name_; }

        /// @brief Owning Parameter, nullptr until adopted
        const Parameter* parent() const noexcept { return parent_; }

        /// @brief Id local to the owning ParameterSet, -1 until registered
        int id() const noexcept { return id_; }

        /// @brief Produce a value; may differ between reads for non-constant kinds
        virtual Value value() const = 0;

        /// @brief Fresh, unattached copy (cycling cursors restart at the default)
        virtual std::unique_ptr<ValuePartition> clone() const = 0;

        /// @brief Owning Parameter's name, "" for an orphan (defined in parameter.h)
        std::string parameterName() const;

        /// @brief "Parameter:name" (defined in parameter.h)
        std::string label() const;

        /**
         * @brief Symmetric compatibility with another partition
         * @note Defined in parameter.h; equivalent to areCompatible(*this, other)
         */
        bool isCompatibleWith(const ValuePartition& other) const;

    private:
        friend class Parameter;
        friend class ParameterSet;

        void attach(const Parameter& owner)
        {
            if (adopted_) {
                throw std::logic_error(naming::concat(
                    "Partition '", name_, "' already belongs to a parameter"));
            }
            parent_ = &owner;
            adopted_ = true;
        }

        void detach(const Parameter& owner) noexcept
        {
            if (parent_ == &owner)
                parent_ = nullptr;
        }

        void assignId(int id) noexcept { id_ = id; }

        std::string name_;
        const Parameter* parent_ = nullptr;
        bool adopted_ = false;
        int id_ = -1;
    };

    using PartitionPtr = std::shared_ptr<ValuePartition>;

    // ========================================================================
    // CONSTANT
    // ========================================================================

    class ConstantPartition : public ValuePartition
    {
    public:
        ConstantPartition(std::string name, Value value)
            : ValuePartition(std::move(name))
            , value_(std::move(value))
        {
        }

        Value value() const override { return value_; }

        std::unique_ptr<ValuePartition> clone() const override
        {
            return std::make_unique<ConstantPartition>(name(), value_);
        }

    private:
        Value value_;
    };

    // ========================================================================
    // COMPUTED
    // ========================================================================

    /// Zero-argument producer evaluated on every read
    using ValueProducer = std::function<Value()>;

    class ComputedPartition : public ValuePartition
    {
    public:
        /// @throws std::invalid_argument if producer is empty
        ComputedPartition(std::string name, ValueProducer producer)
            : ValuePartition(std::move(name))
            , producer_(std::move(producer))
        {
            if (!producer_) {
                throw std::invalid_argument(naming::concat(
                    "Computed partition '", this->name(), "' requires a producer"));
            }
        }

        /// @note No caching; exceptions from the producer propagate
        Value value() const override { return producer_(); }

        std::unique_ptr<ValuePartition> clone() const override
        {
            return std::make_unique<ComputedPartition>(name(), producer_);
        }

    private:
        ValueProducer producer_;
    };

    // ========================================================================
    // CYCLING
    // ========================================================================

    /**
     * @class CyclingPartition
     * @brief Yields the default value, then each listed value, then wraps
     *
     * @details The cycle is built as [default, values...] with the first
     *          listed value equal to the default removed, so
     *          cycling("Chrome", "116.0", {"116.0", "116.1", "116.2"}) reads
     *          116.0, 116.1, 116.2, 116.0, ...
     */
    class CyclingPartition : public ValuePartition
    {
        // Restricts the pre-normalized constructor to clone()
        struct NormalizedCycle
        {
            explicit NormalizedCycle() = default;
        };

    public:
        CyclingPartition(std::string name, Value defaultValue, const std::vector<Value>& values)
            : ValuePartition(std::move(name))
        {
            if (!defaultValue.has_value()) {
                throw std::invalid_argument(naming::concat(
                    "Cycling partition '", this->name(), "' requires a default value"));
            }
            cycle_.push_back(defaultValue);
            bool skipped = false;
            for (const auto& v : values) {
                if (!skipped && sameValue(v, defaultValue)) {
                    skipped = true;
                    continue;
                }
                cycle_.push_back(v);
            }
        }

        /// @brief Clone path: the cycle is already normalized
        CyclingPartition(NormalizedCycle, std::string name, std::vector<Value> cycle)
            : ValuePartition(std::move(name))
            , cycle_(std::move(cycle))
        {
        }

        /// @brief Returns the value at the cursor and advances it atomically
        Value value() const override
        {
            const std::size_t n = cycle_.size();
            std::size_t current = cursor_.load(std::memory_order_relaxed);
            while (!cursor_.compare_exchange_weak(current, (current + 1) % n,
                                                  std::memory_order_acq_rel,
                                                  std::memory_order_relaxed)) {
            }
            return cycle_[current];
        }

        std::unique_ptr<ValuePartition> clone() const override
        {
            return std::make_unique<CyclingPartition>(NormalizedCycle{}, name(), cycle_);
        }

        /// @brief Number of distinct positions in one full cycle
        std::size_t cycleLength() const noexcept { return cycle_.size(); }

        /// @brief Position the next read will return
        std::size_t position() const noexcept { return cursor_.load(std::memory_order_relaxed); }

    private:
        static bool sameValue(const Value& a, const Value& b)
        {
            return a.type() == b.type() && a.toString() == b.toString();
        }

        std::vector<Value> cycle_;
        mutable std::atomic<std::size_t> cursor_{ 0 };
    };

    // ========================================================================
    // FACTORIES
    // ========================================================================

    /**
     * @brief Constant partition named after its value's string form
     * @example constant("Chrome"), constant(1024)
     */
    inline PartitionPtr constant(Value value)
    {
        std::string name = value.toString();
        return std::make_shared<ConstantPartition>(std::move(name), std::move(value));
    }

    inline PartitionPtr constant(std::string name, Value value)
    {
        return std::make_shared<ConstantPartition>(std::move(name), std::move(value));
    }

    inline PartitionPtr computed(std::string name, ValueProducer producer)
    {
        return std::make_shared<ComputedPartition>(std::move(name), std::move(producer));
    }

    inline PartitionPtr cycling(std::string name, Value defaultValue, const std::vector<Value>& values)
    {
        return std::make_shared<CyclingPartition>(std::move(name), std::move(defaultValue), values);
    }

    /// @brief Cycling partition whose default is the first listed value
    /// @throws std::invalid_argument if values is empty
    inline PartitionPtr cycling(std::string name, const std::vector<Value>& values)
    {
        if (values.empty()) {
            throw std::invalid_argument(naming::concat(
                "Cycling partition '", name, "' requires at least one value"));
        }
        return cycling(std::move(name), values.front(), values);
    }

} // namespace pairgen
