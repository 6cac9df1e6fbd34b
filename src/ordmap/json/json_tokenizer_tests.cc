#include "ordmap/json/json_tokenizer.hpp"

#include <doctest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace ordmap;
using namespace ordmap::json_tokenizer;

namespace {
std::vector<TokenId>
ids_of(const std::vector<Token>& tokens) {
    std::vector<TokenId> ids;
    for (auto& token : tokens) {
        ids.push_back(token.id);
    }
    return ids;
}

ParseResult
run(const std::string& text, bool strip_whitespace = true) {
    ParseOptions options;
    options.strip_whitespace = strip_whitespace;
    options.append_terminator = true;
    ParseResult result;
    tokenize(text, options, result);
    return result;
}
}  // namespace

TEST_CASE("json_tokenizer") {
    SUBCASE("empty") {
        ParseOptions options;
        ParseResult result;
        REQUIRE(tokenize("", options, result));
        REQUIRE(result.ok);
        REQUIRE(result.tokens.empty());
    }

    SUBCASE("object") {
        std::string text = R"foo({"key2":20,"key1":10})foo";
        auto result = run(text);
        REQUIRE(result.ok);

        // clang-format off
        std::vector<TokenId> expected = {
            TokenId_OpenCurly,
                TokenId_String, TokenId_Colon, TokenId_Integer, TokenId_Comma,
                TokenId_String, TokenId_Colon, TokenId_Integer,
            TokenId_CloseCurly,
            TokenId_Terminator,
        };
        // clang-format on
        REQUIRE(ids_of(result.tokens) == expected);

        REQUIRE(result.tokens[1].token_string_arg == "key2");
        REQUIRE(result.tokens[1].str_from(text) == "key2");
        REQUIRE(result.tokens[3].token_int_arg == 20);
        REQUIRE(result.tokens[5].token_string_arg == "key1");
        REQUIRE(result.tokens[7].token_int_arg == 10);

        for (std::size_t i = 0; i < result.tokens.size(); i++) {
            REQUIRE(result.tokens[i].sequence_index == i);
        }
    }

    SUBCASE("literals and numbers") {
        auto result = run("[true, false, null, -12, 0, 1.5, -2e3, 0.25E-1]");
        REQUIRE(result.ok);

        // clang-format off
        std::vector<TokenId> expected = {
            TokenId_OpenBracket,
            TokenId_Boolean, TokenId_Comma,
            TokenId_Boolean, TokenId_Comma,
            TokenId_Null,    TokenId_Comma,
            TokenId_Integer, TokenId_Comma,
            TokenId_Integer, TokenId_Comma,
            TokenId_Float,   TokenId_Comma,
            TokenId_Float,   TokenId_Comma,
            TokenId_Float,
            TokenId_CloseBracket,
            TokenId_Terminator,
        };
        // clang-format on
        REQUIRE(ids_of(result.tokens) == expected);

        REQUIRE(result.tokens[1].token_boolean_arg == true);
        REQUIRE(result.tokens[3].token_boolean_arg == false);
        REQUIRE(result.tokens[7].token_int_arg == -12);
        REQUIRE(result.tokens[9].token_int_arg == 0);
        REQUIRE(result.tokens[11].token_float_arg == doctest::Approx(1.5));
        REQUIRE(result.tokens[13].token_float_arg == doctest::Approx(-2000.0));
        REQUIRE(result.tokens[15].token_float_arg == doctest::Approx(0.025));
    }

    SUBCASE("integers beyond int64") {
        auto result = run("[9223372036854775807, 9223372036854775808, 18446744073709551615, "
                          "18446744073709551616, -9223372036854775809]");
        REQUIRE(result.ok);
        REQUIRE(result.tokens[1].id == TokenId_Integer);
        REQUIRE(result.tokens[1].token_int_arg == INT64_MAX);
        REQUIRE(result.tokens[3].id == TokenId_Unsigned);
        REQUIRE(result.tokens[3].token_uint_arg == 9223372036854775808ull);
        REQUIRE(result.tokens[5].id == TokenId_Unsigned);
        REQUIRE(result.tokens[5].token_uint_arg == UINT64_MAX);

        // Past every integer type
        REQUIRE(result.tokens[7].id == TokenId_Float);
        REQUIRE(result.tokens[7].token_float_arg == doctest::Approx(18446744073709551616.0));
        REQUIRE(result.tokens[9].id == TokenId_Float);
        REQUIRE(result.tokens[9].token_float_arg == doctest::Approx(-9223372036854775809.0));
    }

    SUBCASE("string escapes") {
        std::string text = R"foo("a\"b\\c\/d\n\t\u00e9\ud83d\ude00")foo";
        auto result = run(text);
        REQUIRE(result.ok);
        REQUIRE(result.tokens.size() == 2);
        REQUIRE(result.tokens[0].id == TokenId_String);
        REQUIRE(result.tokens[0].token_string_arg == "a\"b\\c/d\n\t\xC3\xA9\xF0\x9F\x98\x80");
    }

    SUBCASE("utf-8 passes through") {
        auto result = run("\"\xC3\xB6l och b\xC3\xA5l\"");
        REQUIRE(result.ok);
        REQUIRE(result.tokens[0].token_string_arg == "\xC3\xB6l och b\xC3\xA5l");
    }

    SUBCASE("whitespace and positions") {
        std::string text = "{\n  \"a\" : 1\n}";
        auto stripped = run(text);
        REQUIRE(stripped.ok);
        REQUIRE(stripped.tokens.size() == 6);

        REQUIRE(stripped.tokens[1].line == 2);
        REQUIRE(stripped.tokens[1].column == 3);
        REQUIRE(stripped.tokens[3].line == 2);
        REQUIRE(stripped.tokens[3].column == 9);
        REQUIRE(stripped.tokens[4].line == 3);
        REQUIRE(stripped.tokens[4].column == 1);

        auto kept = run(text, false);
        REQUIRE(kept.ok);
        REQUIRE(kept.tokens[1].id == TokenId_Whitespace);
        REQUIRE(kept.tokens[1].str_from(text) == "\n  ");
        REQUIRE(kept.tokens.size() == 10);
    }

    SUBCASE("errors") {
        struct Case {
            std::string text;
            std::string error;
        };
        // clang-format off
        std::vector<Case> cases = {
            { "\"abc",          "Unterminated string (line 1, col 1)"                 },
            { "\"a\nb\"",       "Control character in string (line 1, col 3)"         },
            { R"("\x")",        "Invalid escape sequence '\\x' (line 1, col 2)"       },
            { R"("\u12")",      "Invalid unicode escape (line 1, col 2)"              },
            { R"("\ud83d")",    "Unpaired surrogate in unicode escape (line 1, col 6)" },
            { "01",             "Invalid number (line 1, col 1)"                      },
            { "-",              "Invalid number (line 1, col 1)"                      },
            { "1.",             "Invalid number (line 1, col 1)"                      },
            { "1e",             "Invalid number (line 1, col 1)"                      },
            { "1e999",          "Number out of range (line 1, col 1)"                 },
            { "[True]",         "Unexpected identifier 'True' (line 1, col 2)"        },
            { "{\n  'a': 1}",   "Unexpected character ''' (line 2, col 3)"            },
            { "\"bad\xff\"",        "Invalid UTF-8 in string (line 1, col 5)"             },
            { "\"\xC0\xAF\"",         "Invalid UTF-8 in string (line 1, col 2)"             },
            { "\"\xED\xA0\x80\"",     "Invalid UTF-8 in string (line 1, col 2)"             },
            { "\"\xE2\x82\"",         "Invalid UTF-8 in string (line 1, col 2)"             },
            { "\"\xF4\x90\x80\x80\"", "Invalid UTF-8 in string (line 1, col 2)"             },
        };
        // clang-format on

        for (auto& c : cases) {
            CAPTURE(c.text);
            auto result = run(c.text);
            REQUIRE_FALSE(result.ok);
            REQUIRE(result.error == c.error);
        }
    }

    SUBCASE("utf-8 sequence length") {
        REQUIRE(utf8_sequence_length("a", 0) == 1);
        REQUIRE(utf8_sequence_length("\xC3\xA5", 0) == 2);
        REQUIRE(utf8_sequence_length("\xE2\x82\xAC", 0) == 3);
        REQUIRE(utf8_sequence_length("\xF0\x9F\x98\x80", 0) == 4);
        REQUIRE(utf8_sequence_length("x\xF0\x9F\x98\x80", 1) == 4);

        REQUIRE(utf8_sequence_length("\xff", 0) == 0);
        REQUIRE(utf8_sequence_length("\x80", 0) == 0);
        REQUIRE(utf8_sequence_length("\xC3", 0) == 0);
    }

    SUBCASE("repr") {
        REQUIRE(repr(TokenId_Unsigned) == "TokenId_Unsigned");
        REQUIRE(repr(TokenId_Colon) == "TokenId_Colon");
        REQUIRE(repr(TokenId_String | TokenId_Integer) == "TokenId_String|TokenId_Integer");
        REQUIRE(repr(0) == "TokenId_None");
    }
}
