#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration utilities for pairgen
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations that carry their own size and the names
of their enumerators. The macro generates an enum class with a COUNT sentinel,
a matching size constant and an ADL-visible name table, so log levels,
presets and algorithm kinds can be printed and iterated without hand-written
switch statements.

KEY COMPONENTS
--------------
• PAIRGEN_DECLARE_ENUM_WITH_COUNT: enum class + COUNT + <Name>_COUNT + names
• enum_size<E>: uniform size trait
• is_valid_enum_value(): bounds check against the COUNT sentinel
• enum_from_value<E>(): checked integral -> enum conversion
• enum_name(): enumerator name lookup

USAGE EXAMPLES
--------------
    PAIRGEN_DECLARE_ENUM_WITH_COUNT(Color, Red, Green, Blue);

    std::array<double, Color_COUNT> weights{};
    std::string_view n = pairgen::enum_name(Color::Green);   // "Green"
    Color c = pairgen::enum_from_value<Color>(2);             // Color::Blue

DEPENDENCIES
------------
• <cstddef>, <string_view>, <stdexcept>, <string>

THREAD SAFETY
-------------
• Everything is constexpr or stateless

EXCEPTION SAFETY
----------------
• enum_from_value() throws std::out_of_range for values >= COUNT
• enum_name() is noexcept and returns "COUNT" for the sentinel

===============================================================================
*/

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @macro PAIRGEN_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel and a name table
 *
 * @param Name The name of the enumeration type
 * @param ...  Comma-separated list of enumerator identifiers (at least one)
 *
 * @details
 * Expands to:
 * 1. `enum class Name { ..., COUNT };`
 * 2. `static constexpr std::size_t Name_COUNT`
 * 3. `constexpr std::string_view pairgen_enum_names(Name)` returning the
 *    stringified enumerator list; found by ADL from enum_name().
 *
 * @warning Must be used at namespace scope. Enumerators must not carry
 *          explicit initializers; values are sequential from 0.
 */
#define PAIRGEN_DECLARE_ENUM_WITH_COUNT(Name, ...)                         \
    enum class Name { __VA_ARGS__, COUNT };                                \
    static constexpr std::size_t Name##_COUNT =                            \
        static_cast<std::size_t>(Name::COUNT);                             \
    [[maybe_unused]] constexpr std::string_view pairgen_enum_names(Name) { \
        return #__VA_ARGS__;                                               \
    }

namespace pairgen {

    /**
     * @brief Compile-time enumeration size trait
     *
     * @details Primary template assumes the COUNT sentinel convention.
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief True if value names a user enumerator (not COUNT, not out of range)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return static_cast<std::size_t>(value) < enum_size<Enum>::value;
    }

    /**
     * @brief Checked conversion from an integral value
     * @throws std::out_of_range if value >= enum_size<Enum>::value
     */
    template<typename Enum>
    constexpr Enum enum_from_value(std::size_t value) {
        if (value >= enum_size<Enum>::value) {
            throw std::out_of_range(
                "enum_from_value: " + std::to_string(value) +
                " is not below COUNT (" + std::to_string(enum_size<Enum>::value) + ")");
        }
        return static_cast<Enum>(value);
    }

    namespace enum_detail {

        constexpr std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\n' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\n' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }

        // n-th entry of a "A, B, C" list; empty if out of range
        constexpr std::string_view nth_name(std::string_view list, std::size_t n) noexcept {
            std::size_t index = 0;
            while (true) {
                const auto comma = list.find(',');
                const auto head = (comma == std::string_view::npos) ? list : list.substr(0, comma);
                if (index == n)
                    return trim(head);
                if (comma == std::string_view::npos)
                    return {};
                list.remove_prefix(comma + 1);
                ++index;
            }
        }

    } // namespace enum_detail

    /**
     * @brief Name of an enumerator declared with PAIRGEN_DECLARE_ENUM_WITH_COUNT
     *
     * @return The identifier as written in the declaration, "COUNT" for the
     *         sentinel, or an empty view for out-of-range values.
     */
    template<typename Enum>
    constexpr std::string_view enum_name(Enum value) noexcept {
        const auto index = static_cast<std::size_t>(value);
        if (index == enum_size<Enum>::value)
            return "COUNT";
        if (index > enum_size<Enum>::value)
            return {};
        return enum_detail::nth_name(pairgen_enum_names(value), index);
    }

} // namespace pairgen
