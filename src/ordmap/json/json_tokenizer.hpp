#pragma once

/*
    Tokenizer for JSON text. Splits the input into punctuation, strings, numbers
    and literals. String tokens carry their unescaped text and number tokens carry
    their parsed value, so the parser never has to look at the raw text again.
*/

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ordmap {
namespace json_tokenizer {

using TokenId = std::uint32_t;
// clang-format off
const TokenId TokenId_Whitespace   = 1 << 0;
const TokenId TokenId_OpenCurly    = 1 << 1;
const TokenId TokenId_CloseCurly   = 1 << 2;
const TokenId TokenId_OpenBracket  = 1 << 3;
const TokenId TokenId_CloseBracket = 1 << 4;
const TokenId TokenId_Colon        = 1 << 5;
const TokenId TokenId_Comma        = 1 << 6;
const TokenId TokenId_String       = 1 << 7;
const TokenId TokenId_Integer      = 1 << 8;
const TokenId TokenId_Float        = 1 << 9;
const TokenId TokenId_Boolean      = 1 << 10;
const TokenId TokenId_Null         = 1 << 11;
const TokenId TokenId_Terminator   = 1 << 12;
const TokenId TokenId_Unsigned     = 1 << 13;

const TokenId TokenId_MetaScalar = TokenId_String | TokenId_Integer | TokenId_Unsigned | TokenId_Float | TokenId_Boolean | TokenId_Null;
const TokenId TokenId_MetaValue = TokenId_OpenCurly | TokenId_OpenBracket | TokenId_MetaScalar;
// clang-format on

struct Token {
    // Byte range in the input. For strings this excludes the quotes.
    std::string::size_type start = 0;
    std::string::size_type length = 0;

    // 1-based
    std::string::size_type line = 0;
    std::string::size_type column = 0;

    std::size_t sequence_index = 0;

    TokenId id = 0;

    bool token_boolean_arg = false;
    std::int64_t token_int_arg = 0;
    std::uint64_t token_uint_arg = 0;
    double token_float_arg = 0.0;
    std::string token_string_arg;

    const std::string
    str_from(const std::string& text) const {
        return text.substr(this->start, this->length);
    }

    const std::string
    str_display_from(const std::string& text) const;
};

struct ParseOptions {
    bool strip_whitespace = true;
    bool append_terminator = false;
};

struct ParseResult {
    bool ok = false;
    std::vector<Token> tokens;
    std::string error;
};

bool
tokenize(const std::string& text, const ParseOptions& options, ParseResult& result);

void
token_dump(const std::vector<Token>& tokens, const std::string& source_text);

bool
is_whitespace(char c);

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 if the bytes
// there are not one. Overlong forms, surrogates and code points above U+10FFFF
// are rejected.
std::size_t
utf8_sequence_length(std::string_view text, std::size_t pos);

std::string
repr(TokenId id);

}  // namespace json_tokenizer
}  // namespace ordmap
