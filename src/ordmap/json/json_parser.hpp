#pragma once

#include "ordmap/json/json_tokenizer.hpp"
#include "ordmap/ordered_map.hpp"

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace ordmap {

/**

 JSON parser

 The parser works in two passes over the input:

    Given the input

        {"name": "ordmap", "tags": [1, 2]}

    We first tokenize the input text into these tokens:
        {, "name", :, "ordmap", ",", "tags", :, [, 1, ",", 2, ], }

    Whitespace is dropped and strings/numbers are decoded and type-tagged.

    We then run a state machine over the tokens and emit a linear set of
    instructions that describe the document:

        OBJECT_START
            KEY 'name'
            VALUE 'ordmap'
            KEY 'tags'
            ARRAY_START
                VALUE 1
                VALUE 2
            ARRAY_END
        OBJECT_END

    The instructions can be consumed directly, or turned into a `Value` tree.
    Object members are emitted in the order they appear in the text.
*/

// Instruction value type
enum class InsValueType {
    None,
    Null,
    Int,
    UInt,
    Float,
    Bool,
    String,
};

// Instruction operator
enum class InsOperator {
    Key,
    Value,
    ArrayStart,
    ArrayEnd,
    ObjectStart,
    ObjectEnd,
};

struct Instruction {
    static Instruction
    ArrayStart() {
        Instruction ins;
        ins.op = InsOperator::ArrayStart;
        return ins;
    }

    static Instruction
    ArrayEnd() {
        Instruction ins;
        ins.op = InsOperator::ArrayEnd;
        return ins;
    }

    static Instruction
    ObjectStart() {
        Instruction ins;
        ins.op = InsOperator::ObjectStart;
        return ins;
    }

    static Instruction
    ObjectEnd() {
        Instruction ins;
        ins.op = InsOperator::ObjectEnd;
        return ins;
    }

    static Instruction
    Key(const std::string& key) {
        Instruction ins;
        ins.op = InsOperator::Key;
        ins.oparg_string = key;
        return ins;
    }

    static Instruction
    Null() {
        Instruction ins;
        ins.op = InsOperator::Value;
        ins.oparg_type = InsValueType::Null;
        return ins;
    }

    static Instruction
    Value(const char* value) {
        Instruction ins;
        ins.op = InsOperator::Value;
        ins.oparg_type = InsValueType::String;
        ins.oparg_string = value;
        return ins;
    }

    static Instruction
    Value(const std::string& value) {
        Instruction ins;
        ins.op = InsOperator::Value;
        ins.oparg_type = InsValueType::String;
        ins.oparg_string = value;
        return ins;
    }

    static Instruction
    Value(const std::int64_t value) {
        Instruction ins;
        ins.op = InsOperator::Value;
        ins.oparg_type = InsValueType::Int;
        ins.oparg_int = value;
        return ins;
    }

    static Instruction
    Value(const int value) {
        return Value(static_cast<std::int64_t>(value));
    }

    // Only used for integers above INT64_MAX
    static Instruction
    Value(const std::uint64_t value) {
        Instruction ins;
        ins.op = InsOperator::Value;
        ins.oparg_type = InsValueType::UInt;
        ins.oparg_uint = value;
        return ins;
    }

    static Instruction
    Value(const bool value) {
        Instruction ins;
        ins.op = InsOperator::Value;
        ins.oparg_type = InsValueType::Bool;
        ins.oparg_bool = value;
        return ins;
    }

    static Instruction
    Value(const double value) {
        Instruction ins;
        ins.op = InsOperator::Value;
        ins.oparg_type = InsValueType::Float;
        ins.oparg_float = value;
        return ins;
    }

    InsOperator op = InsOperator::Value;
    InsValueType oparg_type = InsValueType::None;
    std::string oparg_string;
    std::int64_t oparg_int = 0;
    std::uint64_t oparg_uint = 0;
    bool oparg_bool = false;
    double oparg_float = 0.0;

    bool
    operator==(const Instruction& other) const {
        if (op != other.op || oparg_type != other.oparg_type) {
            return false;
        }
        if (op == InsOperator::Key) {
            return oparg_string == other.oparg_string;
        }
        switch (oparg_type) {
            case InsValueType::String:
                return oparg_string == other.oparg_string;
            case InsValueType::Int:
                return oparg_int == other.oparg_int;
            case InsValueType::UInt:
                return oparg_uint == other.oparg_uint;
            case InsValueType::Float:
                return std::abs(oparg_float - other.oparg_float) < 0.0000001;
            case InsValueType::Bool:
                return oparg_bool == other.oparg_bool;
            default:
                return true;
        }
    }
};

// ---

struct Value {
    using Table = OrderedMap<std::string, Value>;
    using Array = std::vector<Value>;
    using Int = std::int64_t;
    using UInt = std::uint64_t;  // Integers above INT64_MAX. Everything else is Int.
    using Float = double;
    using Bool = bool;
    using String = std::string;
    using Null = std::nullptr_t;

    std::variant<Null, Table, Array, Int, UInt, Float, Bool, String> v;

    // Table access. Missing keys are appended as null.
    Value&
    operator[](const std::string& key) {
        assert(is_table());
        auto& table = as_table();
        if (!table.contains(key)) {
            table.insert(key, Value{});
        }
        return table.get(key)->get();
    }

    Value&
    operator[](std::size_t index) {
        assert(is_array());
        return as_array()[index];
    }

    bool
    contains(const std::string& key) const {
        if (is_table()) {
            return as_table().contains(key);
        }
        return false;
    }

    bool
    operator==(const Value& other) const {
        return v == other.v;
    }

    // clang-format off
    bool is_null() const { return std::holds_alternative<Value::Null>(v); }
    bool is_array() const { return std::holds_alternative<Value::Array>(v); }
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_uint() const { return std::holds_alternative<Value::UInt>(v); }
    bool is_float() const { return std::holds_alternative<Value::Float>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Array& as_array() { return std::get<Value::Array>(v); }
    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    UInt& as_uint() { return std::get<Value::UInt>(v); }
    Float& as_float() { return std::get<Value::Float>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }

    const Array& as_array() const { return std::get<Value::Array>(v); }
    const Table& as_table() const { return std::get<Value::Table>(v); }
    const Int& as_int() const { return std::get<Value::Int>(v); }
    const UInt& as_uint() const { return std::get<Value::UInt>(v); }
    const Float& as_float() const { return std::get<Value::Float>(v); }
    const Bool& as_bool() const { return std::get<Value::Bool>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(const Value& v);

// clang-format off
enum class ParseErrorKind {
    None         = 1 << 0,
    Tokenization = 1 << 1,
    Parsing      = 1 << 2,
    Decode       = 1 << 3, // Valid JSON, but not the shape the caller asked for
    Other        = 1 << 4,
};
// clang-format on

// Objects and arrays nested deeper than this are rejected by the parser.
const std::size_t kMaxNestingDepth = 128;

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(const json_tokenizer::Token& token, std::string error_message);
};

bool
json_parse(const std::string& input_data, ParseResult& result, std::function<void(Instruction)> emit_cb);

bool
json_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj);

bool
json_parse_collect(const std::string& input_data, ParseResult& result, std::vector<Instruction>& instructions);

std::string
repr(InsOperator s);

std::string
repr(InsValueType vt);

std::string
repr(ParseErrorKind kind);

}  // namespace ordmap
