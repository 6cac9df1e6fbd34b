#include "ordmap/json/json_tokenizer.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

using namespace ordmap;
using namespace ordmap::json_tokenizer;

namespace {

struct TokenDescriptor {
    std::string name;
    TokenId id;
    std::optional<char> character;
};

// clang-format off
const std::vector<TokenDescriptor> kTokens = {{
    // Name           Identifier             Symbol
    { "Whitespace",   TokenId_Whitespace,    std::nullopt },
    { "OpenCurly",    TokenId_OpenCurly,     '{'          },
    { "CloseCurly",   TokenId_CloseCurly,    '}'          },
    { "OpenBracket",  TokenId_OpenBracket,   '['          },
    { "CloseBracket", TokenId_CloseBracket,  ']'          },
    { "Colon",        TokenId_Colon,         ':'          },
    { "Comma",        TokenId_Comma,         ','          },
    // Value tokens are recognized by their content
    { "String",       TokenId_String,        std::nullopt },
    { "Integer",      TokenId_Integer,       std::nullopt },
    { "Float",        TokenId_Float,         std::nullopt },
    { "Boolean",      TokenId_Boolean,       std::nullopt },
    { "Null",         TokenId_Null,          std::nullopt },
    { "Terminator",   TokenId_Terminator,    std::nullopt },
    { "Unsigned",     TokenId_Unsigned,      std::nullopt },
}};

const std::tuple<TokenId, bool, std::string_view> kLiterals[] = {
    { TokenId_Boolean, true,  "true"  },
    { TokenId_Boolean, false, "false" },
    { TokenId_Null,    false, "null"  },
};
// clang-format on

std::optional<TokenId>
find_punctuation(char c) {
    for (const auto& desc : kTokens) {
        if (desc.character && *desc.character == c) {
            return desc.id;
        }
    }
    return std::nullopt;
}

bool
is_digit(char c) {
    return c >= '0' && c <= '9';
}

std::optional<std::uint32_t>
parse_hex4(std::string_view text, std::size_t pos) {
    if (pos + 4 > text.size()) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    auto first = text.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + 4, value, 16);
    if (ec != std::errc{} || ptr != first + 4) {
        return std::nullopt;
    }
    return value;
}

bool
starts_at(std::string_view text, std::size_t pos, std::string_view prefix) {
    return pos + prefix.size() <= text.size() && text.substr(pos, prefix.size()) == prefix;
}

void
append_utf8(std::string& out, std::uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::string
display_char(char c) {
    if (std::isprint(static_cast<unsigned char>(c))) {
        return std::string(1, c);
    }
    return fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
}

}  // namespace

const std::string
Token::str_display_from(const std::string& input_text) const {
    auto original = str_from(input_text);
    std::string sanitized;
    for (auto& c : original) {
        switch (c) {
            case '\"':
                sanitized += "\\\"";
                break;
            case '\\':
                sanitized += "\\\\";
                break;
            case '\n':
                sanitized += "\\n";
                break;
            case '\r':
                sanitized += "\\r";
                break;
            case '\t':
                sanitized += "\\t";
                break;
            default:
                if (std::iscntrl(static_cast<unsigned char>(c))) {
                    sanitized += fmt::format("{:03o}", c);
                } else {
                    sanitized += c;
                }
        }
    }
    return sanitized;
}

bool
ordmap::json_tokenizer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::size_t
ordmap::json_tokenizer::utf8_sequence_length(std::string_view text, std::size_t pos) {
    auto byte_at = [&text](std::size_t i) { return static_cast<unsigned char>(text[i]); };

    const unsigned char lead = byte_at(pos);
    if (lead < 0x80) {
        return 1;
    }

    // Valid range of the second byte depends on the lead byte
    std::size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    // clang-format off
    if (lead >= 0xC2 && lead <= 0xDF)      { length = 2; }
    else if (lead == 0xE0)                 { length = 3; low = 0xA0; }
    else if (lead >= 0xE1 && lead <= 0xEC) { length = 3; }
    else if (lead == 0xED)                 { length = 3; high = 0x9F; }
    else if (lead >= 0xEE && lead <= 0xEF) { length = 3; }
    else if (lead == 0xF0)                 { length = 4; low = 0x90; }
    else if (lead >= 0xF1 && lead <= 0xF3) { length = 4; }
    else if (lead == 0xF4)                 { length = 4; high = 0x8F; }
    else                                   { return 0; }
    // clang-format on

    if (pos + length > text.size()) {
        return 0;
    }
    if (byte_at(pos + 1) < low || byte_at(pos + 1) > high) {
        return 0;
    }
    for (std::size_t i = 2; i < length; i++) {
        if (byte_at(pos + i) < 0x80 || byte_at(pos + i) > 0xBF) {
            return 0;
        }
    }
    return length;
}

std::string
ordmap::json_tokenizer::repr(TokenId id) {
    std::string s;
    for (const auto& token : kTokens) {
        if (id & token.id) {
            s += "TokenId_" + token.name;
            s += "|";
        }
    }
    if (s.empty()) {
        return "TokenId_None";
    }
    return s.substr(0, s.size() - 1);  // drop trailing pipe
}

void
ordmap::json_tokenizer::token_dump(const std::vector<Token>& tokens, const std::string& source_text) {
    fmt::print("input text:\n{}\n---\ntokens:\n", source_text);
    int j = 1;
    for (auto& r : tokens) {
        fmt::print("{:02} [line: {:02}, col: {:02}, off: {:03}, len: {:2}, seq: {:2}]: {:18}    {}\n", j++,
                   r.line, r.column, r.start, r.length, r.sequence_index,
                   "'" + r.str_display_from(source_text) + "'", repr(r.id));
    }
}

bool
ordmap::json_tokenizer::tokenize(const std::string& input_text, const ParseOptions& options, ParseResult& result) {
    result.ok = false;
    result.error = "";
    result.tokens.clear();

    const std::string_view text{input_text};
    std::size_t cursor = 0;

    std::string::size_type current_line_number = 1;
    std::string::size_type last_new_line_offset = 0;

    auto column_of = [&](std::size_t offset) { return offset - last_new_line_offset + 1; };

    auto fail = [&](std::size_t offset, const std::string& message) {
        result.ok = false;
        result.error = fmt::format("{} (line {}, col {})", message, current_line_number, column_of(offset));
        return result.ok;
    };

    auto make_token = [&](std::size_t start, std::size_t length, TokenId id) {
        Token token;
        token.start = start;
        token.length = length;
        token.line = current_line_number;
        token.column = column_of(start);
        token.id = id;
        return token;
    };

    auto push_token = [&](Token token) {
        token.sequence_index = result.tokens.size();
        result.tokens.push_back(std::move(token));
    };

    while (cursor < text.size()) {
        const char c = text[cursor];

        if (is_whitespace(c)) {
            auto token = make_token(cursor, 0, TokenId_Whitespace);
            auto start_idx = cursor;
            while (cursor < text.size() && is_whitespace(text[cursor])) {
                if (text[cursor] == '\n') {
                    current_line_number++;
                    last_new_line_offset = cursor + 1;
                }
                cursor++;
            }
            token.length = cursor - start_idx;
            if (!options.strip_whitespace) {
                push_token(token);
            }
            continue;
        }

        if (auto id = find_punctuation(c); id) {
            push_token(make_token(cursor, 1, *id));
            cursor++;
            continue;
        }

        if (c == '"') {
            auto quote_idx = cursor;
            std::string decoded;
            bool terminated = false;
            cursor++;
            while (cursor < text.size()) {
                const char ch = text[cursor];
                if (ch == '"') {
                    terminated = true;
                    break;
                }
                if (static_cast<unsigned char>(ch) < 0x20) {
                    return fail(cursor, "Control character in string");
                }
                if (static_cast<unsigned char>(ch) >= 0x80) {
                    auto length = utf8_sequence_length(text, cursor);
                    if (length == 0) {
                        return fail(cursor, "Invalid UTF-8 in string");
                    }
                    decoded.append(text.substr(cursor, length));
                    cursor += length;
                    continue;
                }
                if (ch != '\\') {
                    decoded += ch;
                    cursor++;
                    continue;
                }
                if (cursor + 1 >= text.size()) {
                    break;
                }
                const char escaped = text[cursor + 1];
                switch (escaped) {
                    case '"':
                        decoded += '"';
                        break;
                    case '\\':
                        decoded += '\\';
                        break;
                    case '/':
                        decoded += '/';
                        break;
                    case 'b':
                        decoded += '\b';
                        break;
                    case 'f':
                        decoded += '\f';
                        break;
                    case 'n':
                        decoded += '\n';
                        break;
                    case 'r':
                        decoded += '\r';
                        break;
                    case 't':
                        decoded += '\t';
                        break;
                    case 'u': {
                        auto codepoint = parse_hex4(text, cursor + 2);
                        if (!codepoint) {
                            return fail(cursor, "Invalid unicode escape");
                        }
                        cursor += 4;
                        if (*codepoint >= 0xD800 && *codepoint <= 0xDBFF) {
                            // High surrogate, the low half must follow immediately
                            if (!starts_at(text, cursor + 2, "\\u")) {
                                return fail(cursor, "Unpaired surrogate in unicode escape");
                            }
                            auto low = parse_hex4(text, cursor + 4);
                            if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                                return fail(cursor, "Unpaired surrogate in unicode escape");
                            }
                            *codepoint = 0x10000 + ((*codepoint - 0xD800) << 10) + (*low - 0xDC00);
                            cursor += 6;
                        } else if (*codepoint >= 0xDC00 && *codepoint <= 0xDFFF) {
                            return fail(cursor, "Unpaired surrogate in unicode escape");
                        }
                        append_utf8(decoded, *codepoint);
                    } break;
                    default:
                        return fail(cursor, fmt::format("Invalid escape sequence '\\{}'", display_char(escaped)));
                }
                cursor += 2;
            }

            if (!terminated) {
                return fail(quote_idx, "Unterminated string");
            }

            auto token = make_token(quote_idx + 1, cursor - quote_idx - 1, TokenId_String);
            token.column = column_of(quote_idx);
            token.token_string_arg = std::move(decoded);
            push_token(std::move(token));
            cursor++;  // closing quote
            continue;
        }

        if (c == '-' || is_digit(c)) {
            auto start_idx = cursor;
            bool is_float = false;

            if (text[cursor] == '-') {
                cursor++;
            }
            if (cursor >= text.size() || !is_digit(text[cursor])) {
                return fail(start_idx, "Invalid number");
            }
            if (text[cursor] == '0') {
                cursor++;
            } else {
                while (cursor < text.size() && is_digit(text[cursor])) {
                    cursor++;
                }
            }
            if (cursor < text.size() && text[cursor] == '.') {
                is_float = true;
                cursor++;
                if (cursor >= text.size() || !is_digit(text[cursor])) {
                    return fail(start_idx, "Invalid number");
                }
                while (cursor < text.size() && is_digit(text[cursor])) {
                    cursor++;
                }
            }
            if (cursor < text.size() && (text[cursor] == 'e' || text[cursor] == 'E')) {
                is_float = true;
                cursor++;
                if (cursor < text.size() && (text[cursor] == '+' || text[cursor] == '-')) {
                    cursor++;
                }
                if (cursor >= text.size() || !is_digit(text[cursor])) {
                    return fail(start_idx, "Invalid number");
                }
                while (cursor < text.size() && is_digit(text[cursor])) {
                    cursor++;
                }
            }
            // Catches leading zeros ("01") and garbage glued to the number ("1x")
            if (cursor < text.size() && (std::isalnum(static_cast<unsigned char>(text[cursor])) ||
                                         text[cursor] == '.' || text[cursor] == '-' || text[cursor] == '+')) {
                return fail(start_idx, "Invalid number");
            }

            auto literal = text.substr(start_idx, cursor - start_idx);
            auto first = literal.data();
            auto last = literal.data() + literal.size();
            auto token = make_token(start_idx, literal.size(), TokenId_Integer);

            if (!is_float) {
                std::int64_t tmp_int = 0;
                auto [ptr, ec] = std::from_chars(first, last, tmp_int);
                if (ec == std::errc{} && ptr == last) {
                    token.token_int_arg = tmp_int;
                    push_token(std::move(token));
                    continue;
                }
                if (literal[0] != '-') {
                    std::uint64_t tmp_uint = 0;
                    auto [uptr, uec] = std::from_chars(first, last, tmp_uint);
                    if (uec == std::errc{} && uptr == last) {
                        token.id = TokenId_Unsigned;
                        token.token_uint_arg = tmp_uint;
                        push_token(std::move(token));
                        continue;
                    }
                }
                // Too large for any integer, keep it as a float
            }

            double tmp_float = 0.0;
            auto [ptr, ec] = std::from_chars(first, last, tmp_float);
            if (ec == std::errc::result_out_of_range) {
                return fail(start_idx, "Number out of range");
            }
            if (ec != std::errc{} || ptr != last) {
                return fail(start_idx, "Invalid number");
            }
            token.id = TokenId_Float;
            token.token_float_arg = tmp_float;
            push_token(std::move(token));
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c))) {
            auto start_idx = cursor;
            while (cursor < text.size() && std::isalnum(static_cast<unsigned char>(text[cursor]))) {
                cursor++;
            }
            auto word = text.substr(start_idx, cursor - start_idx);

            bool is_literal = false;
            for (const auto& [literal_id, literal_value, literal_text] : kLiterals) {
                if (word == literal_text) {
                    auto token = make_token(start_idx, word.size(), literal_id);
                    token.token_boolean_arg = literal_value;
                    push_token(std::move(token));
                    is_literal = true;
                    break;
                }
            }
            if (!is_literal) {
                return fail(start_idx, fmt::format("Unexpected identifier '{}'", word));
            }
            continue;
        }

        return fail(cursor, fmt::format("Unexpected character '{}'", display_char(c)));
    }

    result.ok = true;
    if (options.append_terminator) {
        push_token(make_token(text.size(), 0, TokenId_Terminator));
    }
    return result.ok;
}
