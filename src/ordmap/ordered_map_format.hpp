#pragma once

#include "ordmap/ordered_map.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <type_traits>

namespace ordmap {

template <typename T>
std::string
repr_debug(const T& value);

template <typename K, typename V>
std::string
repr(const OrderedMap<K, V>& map) {
    std::string s = "[";
    bool first = true;
    for (const auto& [key, value] : map) {
        if (!first) {
            s += ", ";
        }
        s += fmt::format("Entry {{ key: {}, val: {} }}", repr_debug(key), repr_debug(value));
        first = false;
    }
    return s + "]";
}

namespace internal {
template <typename T>
struct is_ordered_map : std::false_type {};

template <typename K, typename V>
struct is_ordered_map<OrderedMap<K, V>> : std::true_type {};
}  // namespace internal

// Debug rendering of a single key or value. Text is quoted and escaped.
template <typename T>
std::string
repr_debug(const T& value) {
    if constexpr (internal::is_ordered_map<T>::value) {
        return repr(value);
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return fmt::format("{:?}", std::string_view{value});
    } else if constexpr (std::is_same_v<T, char>) {
        return fmt::format("{:?}", value);
    } else {
        return fmt::format("{}", value);
    }
}

}  // namespace ordmap

template <typename K, typename V>
struct fmt::formatter<ordmap::OrderedMap<K, V>> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto
    format(const ordmap::OrderedMap<K, V>& map, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(ordmap::repr(map), ctx);
    }
};
