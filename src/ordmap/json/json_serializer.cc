#include "ordmap/json/json_serializer.hpp"

#include "ordmap/json/json_tokenizer.hpp"

#include <fmt/format.h>

#include <cassert>
#include <cmath>
#include <string>
#include <string_view>

using namespace ordmap;

namespace internal {

static std::string
indent(const SerializeOptions& options, int depth) {
    if (depth < 0) {
        assert(false && "invalid depth!");
        return "";
    }
    return std::string(static_cast<std::size_t>(options.indent * depth), ' ');
}

static std::string
format_float(double value) {
    // JSON has no representation for these
    if (!std::isfinite(value)) {
        return "null";
    }
    auto s = fmt::format("{}", value);
    // Keep floats distinguishable from integers: 1.0 rather than 1
    if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
    }
    return s;
}

void
serialize_obj(const Value& value, const SerializeOptions& options, int depth, std::string& output) {
    const bool pretty = options.indent > 0;
    const std::string newline = pretty ? "\n" : "";

    if (value.is_table()) {
        auto& table = value.as_table();
        if (table.empty()) {
            output += "{}";
            return;
        }
        output += "{" + newline;
        std::size_t row = 0;
        table.for_each([&](const std::string& key, const Value& v) {
            output += indent(options, depth + 1);
            output += json_quote(key);
            output += pretty ? ": " : ":";
            serialize_obj(v, options, depth + 1, output);
            if (++row < table.size()) {
                output += ",";
            }
            output += newline;
        });
        output += indent(options, depth) + "}";
    } else if (value.is_array()) {
        auto& array = value.as_array();
        if (array.empty()) {
            output += "[]";
            return;
        }
        output += "[" + newline;
        std::size_t row = 0;
        for (auto& v : array) {
            output += indent(options, depth + 1);
            serialize_obj(v, options, depth + 1, output);
            if (++row < array.size()) {
                output += ",";
            }
            output += newline;
        }
        output += indent(options, depth) + "]";
    } else if (value.is_int()) {
        output += fmt::format("{}", value.as_int());
    } else if (value.is_uint()) {
        output += fmt::format("{}", value.as_uint());
    } else if (value.is_float()) {
        output += format_float(value.as_float());
    } else if (value.is_bool()) {
        output += fmt::format("{}", value.as_bool());
    } else if (value.is_string()) {
        output += json_quote(value.as_string());
    } else {
        output += "null";
    }
}

}  // namespace internal

std::string
ordmap::json_quote(std::string_view text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '"';
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (static_cast<unsigned char>(c) >= 0x80) {
            auto length = json_tokenizer::utf8_sequence_length(text, pos);
            if (length == 0) {
                // Not UTF-8. Each stray byte becomes U+FFFD so the output stays valid JSON.
                quoted += "\xEF\xBF\xBD";
                pos++;
            } else {
                quoted.append(text.substr(pos, length));
                pos += length;
            }
            continue;
        }
        switch (c) {
            case '"':
                quoted += "\\\"";
                break;
            case '\\':
                quoted += "\\\\";
                break;
            case '\b':
                quoted += "\\b";
                break;
            case '\f':
                quoted += "\\f";
                break;
            case '\n':
                quoted += "\\n";
                break;
            case '\r':
                quoted += "\\r";
                break;
            case '\t':
                quoted += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    quoted += fmt::format("\\u{:04x}", static_cast<unsigned int>(c));
                } else {
                    quoted += c;
                }
        }
        pos++;
    }
    quoted += '"';
    return quoted;
}

std::string
ordmap::json_serialize(const Value& value, const SerializeOptions& options) {
    std::string output;
    internal::serialize_obj(value, options, 0, output);
    return output;
}
