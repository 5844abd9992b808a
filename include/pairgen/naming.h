#pragma once
/*
===============================================================================
NAMING — Canonical names and keys for parameters, partitions and combinations
===============================================================================

OVERVIEW
--------
Every bookkeeping structure in the generator is keyed by strings built from
partition names: the pairwise coverage map, the deduplicating combination
table and the exported row descriptions. This header owns the exact format of
those strings and the validation that keeps them canonical.

KEY COMPONENTS
--------------
• KEY_SEPARATOR / EMPTY_SLOT: key format constants ("Chrome|_|1024x768")
• naming::validate_parameter_name / validate_partition_name
• naming::slot_key(): canonical key from per-slot names
• naming::slot_label(): "Parameter:partition" rendering
• naming::concat(), naming::join(), naming::toString(): streaming helpers
• debug_enabled(): build-configuration switch (PAIRGEN_DEBUG or _DEBUG)

DESIGN PHILOSOPHY
-----------------
• A key identifies a slot assignment, never a produced value
• Names that could make two different assignments render to the same key are
  rejected at construction time, not discovered during generation
• Compile-time checking of streamable arguments via C++20 concepts

USAGE EXAMPLES
--------------
    naming::validate_partition_name("Browser", "Chrome");     // ok
    naming::validate_partition_name("Browser", "_");          // throws

    std::vector<std::optional<std::string_view>> slots{"Chrome", std::nullopt, "1024x768"};
    std::string key = naming::slot_key(slots);                 // "Chrome|_|1024x768"

    std::string msg = naming::concat("queue=", 12, " jump=", 3);

THREAD SAFETY
-------------
• All functions are stateless and safe for concurrent calls

EXCEPTION SAFETY
----------------
• Validation functions throw std::invalid_argument with a descriptive message
• Everything else offers the strong guarantee (may throw std::bad_alloc)

===============================================================================
*/

#include <concepts>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

// ============================================================================
// BUILD CONFIGURATION
// ============================================================================
#if defined(PAIRGEN_DEBUG) || defined(_DEBUG)
inline constexpr bool PAIRGEN_DEBUG_BUILD = true;
#else
inline constexpr bool PAIRGEN_DEBUG_BUILD = false;
#endif

namespace pairgen {

    /**
     * @brief Returns true in debug builds (PAIRGEN_DEBUG or _DEBUG defined)
     *
     * @note Controls the default logging threshold (see logging.h)
     */
    [[nodiscard]] constexpr bool debug_enabled() noexcept {
        return PAIRGEN_DEBUG_BUILD;
    }

    namespace naming {

        /// Separator between slot names in a combination key
        inline constexpr std::string_view KEY_SEPARATOR = "|";

        /// Placeholder rendered for an unassigned slot
        inline constexpr std::string_view EMPTY_SLOT = "_";

        /// Separator between parameter name and partition name in labels
        inline constexpr std::string_view LABEL_SEPARATOR = ":";

        // ====================================================================
        // CONCEPTS
        // ====================================================================

        /**
         * @concept Streamable
         * @brief True if T can be written to std::ostream via operator<<
         */
        template<typename T>
        concept Streamable = requires(std::ostream & os, const T & value) {
            { os << value } -> std::same_as<std::ostream&>;
        };

        /**
         * @concept StringLike
         * @brief Types convertible to std::string_view
         */
        template<typename T>
        concept StringLike = std::convertible_to<const T&, std::string_view>;

        // ====================================================================
        // STREAMING HELPERS
        // ====================================================================

        /**
         * @brief Concatenate streamable arguments
         *
         * @example
         *     concat("pairs=", 12, " covered=", 0.5)  // "pairs=12 covered=0.5"
         */
        template<typename... Args>
        [[nodiscard]] inline std::string concat(Args&&... parts) {
            static_assert((Streamable<std::remove_cvref_t<Args>> && ...),
                "naming::concat: all arguments must be streamable via operator<<");
            std::ostringstream oss;
            ((oss << std::forward<Args>(parts)), ...);
            return oss.str();
        }

        /// @brief Render a single streamable value
        template<Streamable T>
        [[nodiscard]] inline std::string toString(const T& value) {
            if constexpr (StringLike<T>) {
                return std::string(std::string_view(value));
            } else {
                std::ostringstream oss;
                oss << std::boolalpha << value;
                return oss.str();
            }
        }

        /// @brief Join string-like parts with a separator
        template<typename Range>
        [[nodiscard]] inline std::string join(const Range& parts, std::string_view sep) {
            std::string result;
            bool first = true;
            for (const auto& part : parts) {
                if (!first)
                    result.append(sep);
                first = false;
                result.append(std::string_view(part));
            }
            return result;
        }

        // ====================================================================
        // VALIDATION
        // ====================================================================

        /**
         * @brief Validate a parameter name
         * @throws std::invalid_argument if empty or containing KEY_SEPARATOR
         */
        inline void validate_parameter_name(std::string_view name) {
            if (name.empty()) {
                throw std::invalid_argument("Parameter name must not be empty");
            }
            if (name.find(KEY_SEPARATOR) != std::string_view::npos) {
                throw std::invalid_argument(
                    concat("Parameter name '", name, "' must not contain '", KEY_SEPARATOR, "'"));
            }
        }

        /**
         * @brief Validate a partition name within its parameter
         *
         * @param owner Parameter name used for the error message (may be empty)
         * @param name  Partition name
         *
         * @throws std::invalid_argument if the name is empty, equals EMPTY_SLOT
         *         or contains KEY_SEPARATOR
         */
        inline void validate_partition_name(std::string_view owner, std::string_view name) {
            const std::string where = owner.empty()
                ? std::string("partition")
                : concat("partition of parameter '", owner, "'");
            if (name.empty()) {
                throw std::invalid_argument("Name of " + where + " must not be empty");
            }
            if (name == EMPTY_SLOT) {
                throw std::invalid_argument(
                    concat("Name of ", where, " must not be '", EMPTY_SLOT, "'"));
            }
            if (name.find(KEY_SEPARATOR) != std::string_view::npos) {
                throw std::invalid_argument(
                    concat("Name '", name, "' of ", where, " must not contain '", KEY_SEPARATOR, "'"));
            }
        }

        // ====================================================================
        // KEYS AND LABELS
        // ====================================================================

        /**
         * @brief Build the canonical key of a slot assignment
         *
         * @param slots One entry per slot; std::nullopt for an unassigned slot
         * @return Names joined with KEY_SEPARATOR, EMPTY_SLOT for gaps
         *
         * @complexity O(total characters)
         */
        [[nodiscard]] inline std::string slot_key(
            const std::vector<std::optional<std::string_view>>& slots)
        {
            std::string key;
            for (std::size_t i = 0; i < slots.size(); ++i) {
                if (i > 0)
                    key.append(KEY_SEPARATOR);
                key.append(slots[i] ? *slots[i] : EMPTY_SLOT);
            }
            return key;
        }

        /// @brief "Parameter:partition", or "partition" when the owner is unknown
        [[nodiscard]] inline std::string slot_label(std::string_view parameter,
                                                    std::string_view partition) {
            if (parameter.empty())
                return std::string(partition);
            std::string label;
            label.reserve(parameter.size() + partition.size() + 1);
            label.append(parameter).append(LABEL_SEPARATOR).append(partition);
            return label;
        }

    } // namespace naming

} // namespace pairgen
