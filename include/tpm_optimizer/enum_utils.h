#pragma once
/*
===============================================================================
ENUM UTILS — Named enumerations with COUNT sentinel for the TPM optimizer
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations that carry their own size and the
spelling of their enumerators. The optimizer uses them for every closed set it
iterates or prints: Pareto metrics, objective kinds, strategy kinds.

KEY COMPONENTS
--------------
• TPMOPT_DECLARE_ENUM_WITH_COUNT: enum class + COUNT sentinel + <Name>_COUNT
  + enumerator spelling reachable through ADL
• EnumArray<Enum, T>: std::array sized by the enumeration
• enumName(value): "OverloadedTpms", "Capacity", ...
• enumFromName<Enum>(text): case-insensitive reverse lookup
• forEachEnum<Enum>(fn): ordered iteration over the enumerators

USAGE EXAMPLES
--------------
    TPMOPT_DECLARE_ENUM_WITH_COUNT(Metric, UnusedTpms, OverloadedTpms);

    EnumArray<Metric, int> counts{};
    counts[index(Metric::OverloadedTpms)] = 2;

    forEachEnum<Metric>([&](Metric m) {
        std::cout << enumName(m) << " = " << counts[index(m)] << "\n";
    });

    auto m = enumFromName<Metric>("unusedtpms");   // Metric::UnusedTpms

DESIGN NOTES
------------
• The spelling table is the stringized enumerator list; it is split lazily on
  each enumName() call, which only happens on logging paths.
• Enumerators must not carry explicit values: the sequential 0..COUNT-1
  layout is what makes EnumArray indexing valid.

===============================================================================
*/

#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/**
 * @macro TPMOPT_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a COUNT sentinel and its spelling table
 *
 * @param Name The name of the enumeration type
 * @param ...  Comma-separated enumerator identifiers (at least one, no values)
 *
 * Expands to:
 *   enum class Name { ..., COUNT };
 *   static constexpr std::size_t Name_COUNT;
 *   constexpr std::string_view enumSpelling(Name);   // found through ADL
 */
#define TPMOPT_DECLARE_ENUM_WITH_COUNT(Name, ...)                          \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT);                            \
    [[maybe_unused]] constexpr std::string_view enumSpelling(Name) noexcept \
    {                                                                     \
        return #__VA_ARGS__;                                              \
    }

namespace tpmopt {

    /// @brief Number of enumerators declared before COUNT
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief Fixed-size array with one slot per enumerator
    template<typename Enum, typename T>
    using EnumArray = std::array<T, enum_size<Enum>::value>;

    /// @brief Position of an enumerator (for EnumArray indexing)
    template<typename Enum>
    constexpr std::size_t index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return index(value) < enum_size<Enum>::value;
    }

    /**
     * @brief Invoke fn(e) for every enumerator in declaration order
     */
    template<typename Enum, typename Fn>
    constexpr void forEachEnum(Fn&& fn) {
        for (std::size_t i = 0; i < enum_size<Enum>::value; ++i) {
            fn(static_cast<Enum>(i));
        }
    }

    namespace enum_detail {

        inline std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
                s.remove_prefix(1);
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
                s.remove_suffix(1);
            return s;
        }

        /// @brief n-th comma-separated token of a stringized enumerator list
        inline std::string_view nthToken(std::string_view list, std::size_t n) noexcept {
            std::size_t start = 0;
            for (std::size_t i = 0; i < n; ++i) {
                std::size_t comma = list.find(',', start);
                if (comma == std::string_view::npos)
                    return {};
                start = comma + 1;
            }
            std::size_t end = list.find(',', start);
            return trim(list.substr(start, end == std::string_view::npos
                                               ? std::string_view::npos
                                               : end - start));
        }

        inline bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size())
                return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i])))
                    return false;
            }
            return true;
        }

    } // namespace enum_detail

    /**
     * @brief Spelling of an enumerator as written in its declaration
     * @return Enumerator name, or "COUNT" for the sentinel
     */
    template<typename Enum>
    std::string_view enumName(Enum value) noexcept {
        if (!is_valid_enum_value(value))
            return "COUNT";
        return enum_detail::nthToken(enumSpelling(value), index(value));
    }

    /**
     * @brief Case-insensitive lookup of an enumerator by spelling
     * @return The enumerator, or std::nullopt if no enumerator matches
     */
    template<typename Enum>
    std::optional<Enum> enumFromName(std::string_view text) noexcept {
        const std::string_view needle = enum_detail::trim(text);
        for (std::size_t i = 0; i < enum_size<Enum>::value; ++i) {
            const auto candidate = static_cast<Enum>(i);
            if (enum_detail::equalsIgnoreCase(enumName(candidate), needle))
                return candidate;
        }
        return std::nullopt;
    }

} // namespace tpmopt
