#pragma once

#include "./error.hpp"

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace debate {

/// Convert an enumerator identifier to its command-line spelling ("dry_run" -> "dry-run")
inline std::string enum_spelling(std::string_view ident) {
    std::string ret{ident};
    std::ranges::replace(ret, '_', '-');
    return ret;
}

/**
 * @brief Parse an enumerator from its command-line spelling. Throws invalid_arguments if no
 * enumerator matches.
 */
template <typename E>
E parse_enum_arg(std::string_view given, std::string_view spelling) {
    for (auto& [value, ident] : magic_enum::enum_entries<E>()) {
        if (enum_spelling(ident) == given) {
            return value;
        }
    }
    BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Invalid value given for argument"),
                               e_invalid_arg_value{std::string(given)},
                               e_arg_spelling{std::string(spelling)});
}

template <typename T>
void put_arg_value(T& dest, std::string_view given, std::string_view spelling) {
    if constexpr (std::is_enum_v<T>) {
        dest = parse_enum_arg<T>(given, spelling);
    } else {
        dest = T(given);
    }
}

template <typename T>
void put_arg_value(std::optional<T>& dest, std::string_view given, std::string_view spelling) {
    T tmp{};
    put_arg_value(tmp, given, spelling);
    dest = std::move(tmp);
}

/// An action that stores the given value in `dest`, converting to the type of `dest`
constexpr inline auto put_into = [](auto& dest) {
    return [&dest](std::string_view given, std::string_view spelling) {
        put_arg_value(dest, given, spelling);
    };
};

/// An action for a switch that stores a fixed value in `dest`
constexpr inline auto store_value = [](auto& dest, auto val) {
    return [&dest, val](std::string_view = {}, std::string_view = {}) { dest = val; };
};

constexpr inline auto store_true  = [](auto& dest) { return store_value(dest, true); };
constexpr inline auto store_false = [](auto& dest) { return store_value(dest, false); };

constexpr inline auto push_back_onto = [](auto& dest) {
    return [&dest](std::string_view value, std::string_view = {}) { dest.emplace_back(value); };
};

/**
 * @brief A single command-line argument.
 *
 * An argument with no spellings is positional. `nargs` is either 0 (a switch) or 1 (takes one
 * value). The action receives the value (empty for a switch) and the spelling that was used.
 */
struct argument {
    std::vector<std::string> long_spellings{};
    std::vector<std::string> short_spellings{};

    std::string help{};
    std::string valname{};

    bool required   = false;
    int  nargs      = 1;
    bool can_repeat = false;

    std::function<void(std::string_view, std::string_view)> action;

    bool is_positional() const noexcept {
        return long_spellings.empty() && short_spellings.empty();
    }

    std::string_view try_match_long(std::string_view tail) const noexcept;
    std::string_view try_match_short(std::string_view tail) const noexcept;

    std::string preferred_spelling() const noexcept;
    std::string syntax_string() const noexcept;
    std::string help_string() const noexcept;
};

}  // namespace debate
