#pragma once

#include "ordmap/json/json_parser.hpp"

#include <string>
#include <string_view>

namespace ordmap {

struct SerializeOptions {
    // Spaces per nesting level. Zero writes everything on one line without
    // any whitespace.
    int indent = 0;
};

// Serialize any value. Table members are written in table order.
std::string
json_serialize(const Value& value, const SerializeOptions& options = {});

// Quote and escape `text` as a JSON string literal. Text is expected to be
// UTF-8; bytes that aren't are written as U+FFFD.
std::string
json_quote(std::string_view text);

}  // namespace ordmap
