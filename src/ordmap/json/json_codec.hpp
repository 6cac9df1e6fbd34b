#pragma once

//
//  Conversion between typed C++ values and the JSON `Value` tree.
//
//  `JsonCodec<T>` turns a T into a Value and back. Maps are written as
//  objects with their members in insertion order, and read back by inserting
//  the members in the order they appear in the text. Map keys go through
//  `JsonKeyCodec<K>`, since object member names are always strings.
//

#include "ordmap/json/json_parser.hpp"
#include "ordmap/json/json_serializer.hpp"
#include "ordmap/ordered_map.hpp"

#include <fmt/format.h>

#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace ordmap {

namespace internal {
// Integral types that go through Value::Int. bool and the character types
// have codecs of their own.
template <typename T>
inline constexpr bool is_json_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
    !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> &&
    !std::is_same_v<T, char32_t>;
}  // namespace internal

template <typename T, typename Enable = void>
struct JsonCodec;

template <typename K, typename Enable = void>
struct JsonKeyCodec;

//
// Values
//

template <>
struct JsonCodec<Value> {
    static Value
    encode(const Value& value) {
        return value;
    }

    static bool
    decode(const Value& value, Value& out, std::string& /*error*/) {
        out = value;
        return true;
    }
};

template <>
struct JsonCodec<std::string> {
    static Value
    encode(const std::string& value) {
        return Value{Value::String{value}};
    }

    static bool
    decode(const Value& value, std::string& out, std::string& error) {
        if (!value.is_string()) {
            error = fmt::format("expected string, found {}", repr(value));
            return false;
        }
        out = value.as_string();
        return true;
    }
};

template <>
struct JsonCodec<bool> {
    static Value
    encode(const bool& value) {
        return Value{Value::Bool{value}};
    }

    static bool
    decode(const Value& value, bool& out, std::string& error) {
        if (!value.is_bool()) {
            error = fmt::format("expected boolean, found {}", repr(value));
            return false;
        }
        out = value.as_bool();
        return true;
    }
};

template <>
struct JsonCodec<char> {
    static Value
    encode(const char& value) {
        return Value{Value::String(1, value)};
    }

    static bool
    decode(const Value& value, char& out, std::string& error) {
        if (!value.is_string() || value.as_string().size() != 1) {
            error = fmt::format("expected single character string, found {}", repr(value));
            return false;
        }
        out = value.as_string()[0];
        return true;
    }
};

// Integers above INT64_MAX are stored as Value::UInt, everything else as
// Value::Int.
template <typename T>
struct JsonCodec<T, std::enable_if_t<internal::is_json_integer_v<T>>> {
    static Value
    encode(const T& value) {
        if constexpr (std::is_unsigned_v<T>) {
            if (!std::in_range<Value::Int>(value)) {
                return Value{Value::UInt{value}};
            }
        }
        return Value{Value::Int{static_cast<Value::Int>(value)}};
    }

    static bool
    decode(const Value& value, T& out, std::string& error) {
        if (value.is_uint()) {
            auto u = value.as_uint();
            if (!std::in_range<T>(u)) {
                error = fmt::format("integer {} out of range", u);
                return false;
            }
            out = static_cast<T>(u);
            return true;
        }
        if (!value.is_int()) {
            error = fmt::format("expected integer, found {}", repr(value));
            return false;
        }
        auto i = value.as_int();
        if (!std::in_range<T>(i)) {
            error = fmt::format("integer {} out of range", i);
            return false;
        }
        out = static_cast<T>(i);
        return true;
    }
};

template <typename T>
struct JsonCodec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static Value
    encode(const T& value) {
        return Value{Value::Float{static_cast<Value::Float>(value)}};
    }

    static bool
    decode(const Value& value, T& out, std::string& error) {
        if (value.is_float()) {
            out = static_cast<T>(value.as_float());
            return true;
        }
        if (value.is_int()) {
            out = static_cast<T>(value.as_int());
            return true;
        }
        if (value.is_uint()) {
            out = static_cast<T>(value.as_uint());
            return true;
        }
        error = fmt::format("expected number, found {}", repr(value));
        return false;
    }
};

template <typename T>
struct JsonCodec<std::optional<T>> {
    static Value
    encode(const std::optional<T>& value) {
        if (!value) {
            return Value{};
        }
        return JsonCodec<T>::encode(*value);
    }

    static bool
    decode(const Value& value, std::optional<T>& out, std::string& error) {
        if (value.is_null()) {
            out = std::nullopt;
            return true;
        }
        T decoded{};
        if (!JsonCodec<T>::decode(value, decoded, error)) {
            return false;
        }
        out = std::move(decoded);
        return true;
    }
};

template <typename T>
struct JsonCodec<std::vector<T>> {
    static Value
    encode(const std::vector<T>& values) {
        Value::Array array;
        array.reserve(values.size());
        for (const auto& v : values) {
            array.push_back(JsonCodec<T>::encode(v));
        }
        return Value{std::move(array)};
    }

    static bool
    decode(const Value& value, std::vector<T>& out, std::string& error) {
        if (!value.is_array()) {
            error = fmt::format("expected array, found {}", repr(value));
            return false;
        }
        std::vector<T> decoded;
        decoded.reserve(value.as_array().size());
        std::size_t index = 0;
        for (const auto& element : value.as_array()) {
            T item{};
            std::string element_error;
            if (!JsonCodec<T>::decode(element, item, element_error)) {
                error = fmt::format("at [{}]: {}", index, element_error);
                return false;
            }
            decoded.push_back(std::move(item));
            index++;
        }
        out = std::move(decoded);
        return true;
    }
};

template <typename K, typename V>
struct JsonCodec<OrderedMap<K, V>> {
    static Value
    encode(const OrderedMap<K, V>& map) {
        auto table = Value::Table::with_capacity(map.size());
        for (const auto& [key, value] : map) {
            table.insert(JsonKeyCodec<K>::encode(key), JsonCodec<V>::encode(value));
        }
        return Value{std::move(table)};
    }

    // Members are inserted in text order, so a duplicate member keeps the
    // position of its first occurrence and the value of its last.
    static bool
    decode(const Value& value, OrderedMap<K, V>& out, std::string& error) {
        if (!value.is_table()) {
            error = fmt::format("expected object, found {}", repr(value));
            return false;
        }
        const auto& table = value.as_table();
        auto decoded = OrderedMap<K, V>::with_capacity(table.size());
        for (const auto& [name, member] : table) {
            K key{};
            V item{};
            std::string member_error;
            if (!JsonKeyCodec<K>::decode(name, key, member_error) ||
                !JsonCodec<V>::decode(member, item, member_error)) {
                error = fmt::format("at {}: {}", json_quote(name), member_error);
                return false;
            }
            decoded.insert(std::move(key), std::move(item));
        }
        out = std::move(decoded);
        return true;
    }
};

//
// Keys
//

template <>
struct JsonKeyCodec<std::string> {
    static std::string
    encode(const std::string& key) {
        return key;
    }

    static bool
    decode(const std::string& name, std::string& out, std::string& /*error*/) {
        out = name;
        return true;
    }
};

template <>
struct JsonKeyCodec<char> {
    static std::string
    encode(const char& key) {
        return std::string(1, key);
    }

    static bool
    decode(const std::string& name, char& out, std::string& error) {
        if (name.size() != 1) {
            error = fmt::format("expected single character key, found {}", json_quote(name));
            return false;
        }
        out = name[0];
        return true;
    }
};

// Integer keys are written as their decimal text, e.g. {"42": ...}
template <typename K>
struct JsonKeyCodec<K, std::enable_if_t<internal::is_json_integer_v<K>>> {
    static std::string
    encode(const K& key) {
        return fmt::format("{}", key);
    }

    static bool
    decode(const std::string& name, K& out, std::string& error) {
        K parsed{};
        auto last = name.data() + name.size();
        auto [ptr, ec] = std::from_chars(name.data(), last, parsed);
        if (ec != std::errc{} || ptr != last || name.empty()) {
            error = fmt::format("invalid integer key {}", json_quote(name));
            return false;
        }
        out = parsed;
        return true;
    }
};

//
// Entry points
//

template <typename T>
Value
json_encode(const T& value) {
    return JsonCodec<T>::encode(value);
}

// Decode `value` into `out`. On failure `out` is left untouched.
template <typename T>
bool
json_decode(const Value& value, T& out, ParseResult& result) {
    T decoded{};
    std::string error;
    if (!JsonCodec<T>::decode(value, decoded, error)) {
        result.kind = ParseErrorKind::Decode;
        result.error = error;
        return false;
    }
    out = std::move(decoded);
    result.kind = ParseErrorKind::None;
    result.error.clear();
    return true;
}

template <typename K, typename V>
std::string
to_json(const OrderedMap<K, V>& map, const SerializeOptions& options = {}) {
    return json_serialize(json_encode(map), options);
}

template <typename K, typename V>
bool
from_json(const std::string& text, ParseResult& result, OrderedMap<K, V>& out) {
    Value tree;
    if (!json_parse_value_tree(text, result, tree)) {
        return false;
    }
    return json_decode(tree, out, result);
}

}  // namespace ordmap
