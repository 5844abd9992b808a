#pragma once
/*
===============================================================================
VALUE — Type-erased concrete values produced by partitions
===============================================================================

OVERVIEW
--------
A partition stands for an equivalence class; reading it yields one concrete
value of whatever type the test author chose (a string, a version number, a
struct). Value is the type-erased holder for such a read, and DataStore is a
string-keyed map of Values used for generator configuration.

KEY COMPONENTS
--------------
• Value: std::any wrapper with safe access and a captured string renderer
• DataStore: std::unordered_map<std::string, Value>
• Access patterns: try_get(), get(), get_or(), equals(), toString()

DESIGN PHILOSOPHY
-----------------
• Type-safe with clear failure modes (exceptions vs. nullopt vs. default)
• String literals decay to std::string so that "Chrome" and
  std::string("Chrome") compare equal
• Rendering is captured at construction time, so exported rows can print any
  streamable type without knowing it

USAGE EXAMPLES
--------------
    Value v = "116.0";                    // stored as std::string
    v.is<std::string>();                  // true
    v.equals(std::string("116.0"));       // true
    v.toString();                         // "116.0"

    DataStore options;
    options["param:Jump"] = 3;
    int jump = options["param:Jump"].get_or<int>(1);

THREAD SAFETY
-------------
• Concurrent const access is safe; modification requires external locking

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_any_cast on type mismatch
• try_get<T>(), get_or<T>(), equals<T>(), is<T>() never throw on mismatch

===============================================================================
*/

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "naming.h"

namespace pairgen {

    namespace value_detail {

        // const char*, char arrays and string_views are stored as std::string
        template<typename T>
        using stored_t = std::conditional_t<
            std::is_convertible_v<T, std::string_view> && !std::is_same_v<std::decay_t<T>, std::string>,
            std::string,
            std::decay_t<T>>;

        template<typename T>
        std::string render(const std::any& a) {
            if constexpr (naming::Streamable<T>) {
                return naming::toString(std::any_cast<const T&>(a));
            } else {
                return "<unprintable>";
            }
        }

    } // namespace value_detail

    /**
     * @class Value
     * @brief Type-erased holder for a partition's concrete value
     *
     * @details Wraps std::any. The renderer for the stored type is captured
     *          when the value is assigned, so toString() works for every
     *          streamable type without a registry.
     *
     * @example
     *     Value v = 42;
     *     v.get<int>();          // 42
     *     v.get_or<double>(0.0); // 0.0 (type mismatch)
     *     v.toString();          // "42"
     */
    class Value
    {
        std::any storage_;
        std::string (*render_)(const std::any&) = nullptr;

    public:
        // ====================================================================
        // CONSTRUCTORS AND ASSIGNMENT
        // ====================================================================

        /// @brief Empty value; has_value() == false
        Value() = default;

        /**
         * @brief Store any copyable value
         * @note String literals and string views are stored as std::string
         */
        template <typename T,
                  typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value>>>
        Value(T&& v)
            : storage_(value_detail::stored_t<T>(std::forward<T>(v)))
            , render_(&value_detail::render<value_detail::stored_t<T>>)
        {
        }

        template <typename T,
                  typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value>>>
        Value& operator=(T&& v)
        {
            storage_ = value_detail::stored_t<T>(std::forward<T>(v));
            render_ = &value_detail::render<value_detail::stored_t<T>>;
            return *this;
        }

        // ====================================================================
        // INTROSPECTION
        // ====================================================================

        bool has_value() const noexcept { return storage_.has_value(); }

        /// @brief typeid of the stored value, typeid(void) when empty
        const std::type_info& type() const noexcept { return storage_.type(); }

        /// @brief Exact type match; no conversions considered
        template <typename T>
        bool is() const noexcept
        {
            return storage_.type() == typeid(T);
        }

        // ====================================================================
        // ACCESS
        // ====================================================================

        /**
         * @brief Optional reference access
         * @return reference wrapper if the stored type is T, std::nullopt otherwise
         */
        template <typename T>
        std::optional<std::reference_wrapper<const T>> try_get() const noexcept
        {
            if (!is<T>())
                return std::nullopt;
            return std::cref(*std::any_cast<T>(&storage_));
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        const T& get() const
        {
            return std::any_cast<const T&>(storage_);
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        T& get()
        {
            return std::any_cast<T&>(storage_);
        }

        /// @brief Stored value if the type matches, default_value otherwise
        template <typename T>
        T get_or(const T& default_value) const
        {
            if (is<T>())
                return get<T>();
            return default_value;
        }

        /**
         * @brief True if the stored value has the stored type of `other` and
         *        compares equal to it
         *
         * @example
         *     Value("Safari").equals("Safari");   // true, both std::string
         *     Value(3).equals(3.0);               // false, int vs double
         */
        template <typename T>
        bool equals(const T& other) const
        {
            using S = value_detail::stored_t<const T&>;
            if (!is<S>())
                return false;
            return get<S>() == S(other);
        }

        /// @brief Human-readable rendering; "" when empty
        std::string toString() const
        {
            if (!has_value() || render_ == nullptr)
                return {};
            return render_(storage_);
        }

        void reset() noexcept
        {
            storage_.reset();
            render_ = nullptr;
        }

        // Hidden friend: only found through ADL on Value itself
        friend std::ostream& operator<<(std::ostream& os, const Value& v)
        {
            return os << v.toString();
        }
    };

    /**
     * @typedef DataStore
     * @brief String-keyed map of Values for configuration and metadata
     *
     * @note Not thread-safe; keys are case-sensitive
     */
    using DataStore = std::unordered_map<std::string, Value>;

} // namespace pairgen
