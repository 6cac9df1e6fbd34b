#include "ordmap/json/json_parser.hpp"

#include "ordmap/json/json_tokenizer.hpp"

#include <fmt/format.h>

#include <cassert>
#include <functional>
#include <stack>
#include <tuple>
#include <variant>
#include <vector>

#ifndef ORDMAP_JSON_TRACE
#define ORDMAP_JSON_TRACE 0
#endif

#define TRACE(...)               \
    if (ORDMAP_JSON_TRACE) {     \
        fmt::print(__VA_ARGS__); \
    }

using namespace ordmap;
using namespace json_tokenizer;

namespace internal {
bool
tokenize(const std::string& input_data, std::vector<json_tokenizer::Token>& tokens, ordmap::ParseResult& result) {
    json_tokenizer::ParseOptions tokenizer_options;
    tokenizer_options.strip_whitespace = true;
    tokenizer_options.append_terminator = true;  // Append termination token to avoid some bounds checking

    json_tokenizer::ParseResult tokenizer_result;
    if (!json_tokenizer::tokenize(input_data, tokenizer_options, tokenizer_result)) {
        result.kind = ParseErrorKind::Tokenization;
        result.error = tokenizer_result.error;
        return false;
    }

    if (ORDMAP_JSON_TRACE) {
        json_tokenizer::token_dump(tokenizer_result.tokens, input_data);
    }

    // All good!
    tokens = std::move(tokenizer_result.tokens);
    result.kind = ParseErrorKind::None;
    result.error.clear();
    return true;
}
}  // namespace internal

// Our state machine states.
//
// Every value, at the root or nested, starts at `ParseValue`. After a complete
// value we go to `AfterValue`, which looks at the enclosing scope to decide
// whether a separator, a closing token or the end of input comes next.
//
// Set `ORDMAP_JSON_TRACE` to dump the parser states to stdout.
//
enum class State {
    ParseValue,
    ParseScalar,

    ParseObjectStart,
    ParseMember,
    ParseObjectEnd,

    ParseArrayStart,
    ParseArrayEnd,

    AfterValue,

    Finish,
};

std::string
repr(State s);

enum class Scope {
    Object,
    Array,
};

std::string
repr(Scope s);

void
ordmap::ParseResult::set_error(const json_tokenizer::Token& token, std::string error_message) {
    this->kind = ParseErrorKind::Parsing;
    this->error = fmt::format("{} at line {} column {}", error_message, token.line, token.column);
}

bool
ordmap::json_parse(const std::string& input_data, ordmap::ParseResult& result, std::function<void(Instruction)> emit_cb) {
    std::vector<json_tokenizer::Token> input_tokens;
    if (!internal::tokenize(input_data, input_tokens, result)) {
        return false;
    }

    //
    // State machine "DSL"
    //
    // Internal state:
    //  input_tokens | vector of all tokens, always ends with a terminator
    //        cursor | current index into `input_tokens`
    //         state | current parsing state
    //   scope_stack | stack of scopes to handle nested values
    //
    // Each pass through the loop looks at `input_tokens[cursor]`. A state never
    // moves past the terminator, so `cursor` stays in bounds.
    //

    std::size_t cursor = 0;

    // clang-format off
    #define PARSER_NEXT_STATE() {                   \
        continue;                                   \
    }

    #define PARSER_FAIL(message) {                                            \
        result.set_error(token, fmt::format("{}, found {}",                   \
            message, describe(token)));                                       \
        return false;                                                         \
    }

    #define PARSER_EXPECT(expected_id, message) {    \
        if (!((expected_id) & token.id)) {           \
            PARSER_FAIL(message);                    \
        }                                            \
    }

    #define PARSER_JUMP(next_state) { \
        state = next_state;           \
        PARSER_NEXT_STATE();          \
    }

    #define PARSER_ADVANCE_AND_JUMP(next_state) { \
        cursor++;                                 \
        PARSER_JUMP(next_state);                  \
    }

    #define PARSER_TRANSITION_TO(token_id, next_state) { \
        if (token.id & (token_id)) {                     \
            PARSER_JUMP(next_state);                     \
        }                                                \
    }
    // clang-format on

    auto describe = [&input_data](const Token& token) -> std::string {
        if (token.id & TokenId_Terminator) {
            return "end of input";
        }
        return fmt::format("'{}'", token.str_display_from(input_data));
    };

    int emitted = 0;
    auto emit_ins = [&](Instruction ins) {
        emitted++;
        TRACE("* Emit[{}] {} {}\n", emitted, repr(ins.op), ins.oparg_string);
        emit_cb(std::move(ins));
    };

    // Scope stack
    std::stack<Scope> scope_stack;

    // Current state
    State state = State::ParseValue;

    bool done = false;
    while (!done) {
        const Token& token = input_tokens[cursor];

        TRACE("({:3}:[#{}]:{:16}) Token {} '{}'\n", cursor, scope_stack.size(), repr(state),
              json_tokenizer::repr(token.id), token.str_display_from(input_data));

        switch (state) {
            case State::ParseValue: {
                PARSER_TRANSITION_TO(TokenId_OpenCurly, State::ParseObjectStart);
                PARSER_TRANSITION_TO(TokenId_OpenBracket, State::ParseArrayStart);
                PARSER_TRANSITION_TO(TokenId_MetaScalar, State::ParseScalar);

                PARSER_FAIL("Expected a value");
            } break;
            case State::ParseScalar: {
                PARSER_EXPECT(TokenId_MetaScalar, "Expected a value");

                if (token.id & TokenId_String) {
                    emit_ins(Instruction::Value(token.token_string_arg));
                } else if (token.id & TokenId_Integer) {
                    emit_ins(Instruction::Value(token.token_int_arg));
                } else if (token.id & TokenId_Unsigned) {
                    emit_ins(Instruction::Value(token.token_uint_arg));
                } else if (token.id & TokenId_Float) {
                    emit_ins(Instruction::Value(token.token_float_arg));
                } else if (token.id & TokenId_Boolean) {
                    emit_ins(Instruction::Value(token.token_boolean_arg));
                } else {
                    emit_ins(Instruction::Null());
                }

                PARSER_ADVANCE_AND_JUMP(State::AfterValue);
            } break;
            case State::ParseObjectStart: {
                PARSER_EXPECT(TokenId_OpenCurly, "Expected '{'");
                if (scope_stack.size() >= kMaxNestingDepth) {
                    PARSER_FAIL(fmt::format("Exceeded maximum nesting depth of {}", kMaxNestingDepth));
                }

                scope_stack.push(Scope::Object);
                TRACE("* Pushing stack {}\n", repr(scope_stack.top()));
                emit_ins(Instruction::ObjectStart());

                cursor++;
                const Token& next = input_tokens[cursor];
                if (next.id & TokenId_CloseCurly) {
                    PARSER_JUMP(State::ParseObjectEnd);
                }
                PARSER_JUMP(State::ParseMember);
            } break;
            case State::ParseMember: {
                // Consume ´"key"´ in ´"key": ...´
                PARSER_EXPECT(TokenId_String, "Expected a string key");
                emit_ins(Instruction::Key(token.token_string_arg));

                cursor++;
                const Token& separator = input_tokens[cursor];
                if (!(separator.id & TokenId_Colon)) {
                    result.set_error(separator, fmt::format("Expected ':', found {}", describe(separator)));
                    return false;
                }

                PARSER_ADVANCE_AND_JUMP(State::ParseValue);
            } break;
            case State::ParseObjectEnd: {
                PARSER_EXPECT(TokenId_CloseCurly, "Expected '}'");

                TRACE("* Popping stack {}\n", repr(scope_stack.top()));
                scope_stack.pop();
                emit_ins(Instruction::ObjectEnd());

                PARSER_ADVANCE_AND_JUMP(State::AfterValue);
            } break;
            case State::ParseArrayStart: {
                PARSER_EXPECT(TokenId_OpenBracket, "Expected '['");
                if (scope_stack.size() >= kMaxNestingDepth) {
                    PARSER_FAIL(fmt::format("Exceeded maximum nesting depth of {}", kMaxNestingDepth));
                }

                scope_stack.push(Scope::Array);
                TRACE("* Pushing stack {}\n", repr(scope_stack.top()));
                emit_ins(Instruction::ArrayStart());

                cursor++;
                const Token& next = input_tokens[cursor];
                if (next.id & TokenId_CloseBracket) {
                    PARSER_JUMP(State::ParseArrayEnd);
                }
                PARSER_JUMP(State::ParseValue);
            } break;
            case State::ParseArrayEnd: {
                PARSER_EXPECT(TokenId_CloseBracket, "Expected ']'");

                TRACE("* Popping stack {}\n", repr(scope_stack.top()));
                scope_stack.pop();
                emit_ins(Instruction::ArrayEnd());

                PARSER_ADVANCE_AND_JUMP(State::AfterValue);
            } break;
            case State::AfterValue: {
                if (scope_stack.empty()) {
                    // Exactly one root value
                    PARSER_EXPECT(TokenId_Terminator, "Expected end of input");
                    PARSER_JUMP(State::Finish);
                }

                switch (scope_stack.top()) {
                    case Scope::Object: {
                        PARSER_TRANSITION_TO(TokenId_CloseCurly, State::ParseObjectEnd);
                        PARSER_EXPECT(TokenId_Comma, "Expected ',' or '}'");

                        // No trailing comma, another member must follow
                        cursor++;
                        PARSER_JUMP(State::ParseMember);
                    } break;
                    case Scope::Array: {
                        PARSER_TRANSITION_TO(TokenId_CloseBracket, State::ParseArrayEnd);
                        PARSER_EXPECT(TokenId_Comma, "Expected ',' or ']'");

                        PARSER_ADVANCE_AND_JUMP(State::ParseValue);
                    } break;
                };
            } break;
            case State::Finish: {
                assert(scope_stack.empty());
                done = true;
            } break;
        }
    }

    #undef PARSER_NEXT_STATE
    #undef PARSER_FAIL
    #undef PARSER_EXPECT
    #undef PARSER_JUMP
    #undef PARSER_ADVANCE_AND_JUMP
    #undef PARSER_TRANSITION_TO

    return true;
}

bool
ordmap::json_parse_value_tree(const std::string& input_data, ordmap::ParseResult& result, Value& result_obj) {
    Value root;
    bool has_root = false;

    // Open containers, innermost last. Only the innermost container grows
    // while it is open, so the pointers to its ancestors stay valid.
    std::vector<Value*> value_stack;
    std::string last_key;

    // Attach a value to the innermost container (or make it the root) and
    // return where it ended up.
    auto place_value = [&](Value value) -> Value* {
        if (value_stack.empty()) {
            assert(!has_root && "multiple root values");
            root = std::move(value);
            has_root = true;
            return &root;
        }

        auto& top_value = *value_stack.back();
        if (top_value.is_array()) {
            auto& array = top_value.as_array();
            array.push_back(std::move(value));
            return &array.back();
        }

        assert(top_value.is_table());
        auto& table = top_value.as_table();
        table.insert(last_key, std::move(value));
        return &table.get(last_key)->get();
    };

    auto update_tree = [&](Instruction ins) {
        switch (ins.op) {
            case InsOperator::ObjectStart: {
                value_stack.push_back(place_value(Value{Value::Table{}}));
            } break;
            case InsOperator::ArrayStart: {
                value_stack.push_back(place_value(Value{Value::Array{}}));
            } break;
            case InsOperator::ObjectEnd:
                // fall-through
            case InsOperator::ArrayEnd: {
                if (!value_stack.empty()) {
                    value_stack.pop_back();
                }
            } break;
            case InsOperator::Key: {
                last_key = ins.oparg_string;
            } break;
            case InsOperator::Value: {
                switch (ins.oparg_type) {
                    case InsValueType::Int: {
                        place_value(Value{Value::Int{ins.oparg_int}});
                    } break;
                    case InsValueType::UInt: {
                        place_value(Value{Value::UInt{ins.oparg_uint}});
                    } break;
                    case InsValueType::Float: {
                        place_value(Value{Value::Float{ins.oparg_float}});
                    } break;
                    case InsValueType::Bool: {
                        place_value(Value{Value::Bool{ins.oparg_bool}});
                    } break;
                    case InsValueType::String: {
                        place_value(Value{Value::String{ins.oparg_string}});
                    } break;
                    default: {
                        place_value(Value{});
                    } break;
                }
            } break;
        }
    };

    if (!json_parse(input_data, result, update_tree)) {
        return false;
    }

    result_obj = std::move(root);
    return true;
}

bool
ordmap::json_parse_collect(const std::string& input_data,
                           ordmap::ParseResult& result,
                           std::vector<Instruction>& instructions) {
    return json_parse(input_data, result, [&](auto x) { instructions.push_back(x); });
}

std::string
repr(State s) {
    std::vector<std::tuple<State, std::string>> lut = {{State::ParseValue, "ParseValue"},
                                                       {State::ParseScalar, "ParseScalar"},
                                                       {State::ParseObjectStart, "ParseObjectStart"},
                                                       {State::ParseMember, "ParseMember"},
                                                       {State::ParseObjectEnd, "ParseObjectEnd"},
                                                       {State::ParseArrayStart, "ParseArrayStart"},
                                                       {State::ParseArrayEnd, "ParseArrayEnd"},
                                                       {State::AfterValue, "AfterValue"},
                                                       {State::Finish, "Finish"}};

    for (const auto& [state, value] : lut) {
        if (state == s) {
            return value;
        }
    }

    assert(false && "bad state");
    return "";
}

std::string
repr(Scope s) {
    std::vector<std::tuple<Scope, std::string>> lut = {
        {Scope::Object, "Object"},
        {Scope::Array, "Array"},
    };

    for (const auto& [scope, value] : lut) {
        if (scope == s) {
            return value;
        }
    }

    assert(false && "bad scope");
    return "";
}

std::string
ordmap::repr(const Value& v) {
    if (v.is_table()) {
        return fmt::format("Table<{}>", v.as_table().size());
    } else if (v.is_array()) {
        return fmt::format("Array<{}>", v.as_array().size());
    } else if (v.is_int()) {
        return fmt::format("Integer<{}>", v.as_int());
    } else if (v.is_uint()) {
        return fmt::format("Unsigned<{}>", v.as_uint());
    } else if (v.is_float()) {
        return fmt::format("Float<{}>", v.as_float());
    } else if (v.is_bool()) {
        return fmt::format("Boolean<{}>", v.as_bool());
    } else if (v.is_string()) {
        return fmt::format("String<{:?}>", v.as_string());
    } else {
        return "Null";
    }
}

std::string
ordmap::repr(InsValueType vt) {
    std::vector<std::tuple<InsValueType, std::string>> lut = {
        {InsValueType::None, "None"},  {InsValueType::Null, "Null"}, {InsValueType::Int, "Int"},
        {InsValueType::UInt, "UInt"},
        {InsValueType::Float, "Float"}, {InsValueType::Bool, "Bool"}, {InsValueType::String, "String"},
    };

    for (const auto& [type, value] : lut) {
        if (type == vt) {
            return value;
        }
    }

    assert(false && "unknown value type");
    return "";
}

std::string
ordmap::repr(InsOperator s) {
    std::vector<std::tuple<ordmap::InsOperator, std::string>> lut = {
        {ordmap::InsOperator::Key, "Key"},
        {ordmap::InsOperator::Value, "Value"},
        {ordmap::InsOperator::ArrayStart, "ArrayStart"},
        {ordmap::InsOperator::ArrayEnd, "ArrayEnd"},
        {ordmap::InsOperator::ObjectStart, "ObjectStart"},
        {ordmap::InsOperator::ObjectEnd, "ObjectEnd"},
    };

    for (const auto& [op, value] : lut) {
        if (op == s) {
            return value;
        }
    }

    assert(false && "missing implementation of added enum");
    return "";
}

std::string
ordmap::repr(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::None:
            return "None";
        case ParseErrorKind::Tokenization:
            return "Tokenization";
        case ParseErrorKind::Parsing:
            return "Parsing";
        case ParseErrorKind::Decode:
            return "Decode";
        case ParseErrorKind::Other:
            return "Other";
    }
    return "Unknown";
}
