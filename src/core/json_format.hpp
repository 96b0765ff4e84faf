#ifndef PACKDOC_CORE_JSON_FORMAT_HPP_
#define PACKDOC_CORE_JSON_FORMAT_HPP_

#include "core/json_dom.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace packdoc::core::json {

namespace detail {

// Quotes, backslashes and control bytes are escaped; UTF-8 passes through.
inline void AppendQuotedString(std::string& out, std::string_view raw) {
  out.push_back('"');
  for (const char ch : raw) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned>(ch));
        out += escaped;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  out.push_back('"');
}

inline void AppendIndent(std::string& out, std::size_t depth, std::size_t indent) {
  out.push_back('\n');
  out.append(depth * indent, ' ');
}

inline void AppendValue(const Value& value, std::size_t depth, std::size_t indent,
                        std::string& out) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    out += value.number_text.empty() ? std::to_string(value.number_value) : value.number_text;
    return;
  case Value::Type::kString:
    AppendQuotedString(out, value.string_value);
    return;
  case Value::Type::kArray:
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i > 0U) {
        out.push_back(',');
      }
      AppendIndent(out, depth + 1U, indent);
      AppendValue(value.array_value[i], depth + 1U, indent, out);
    }
    AppendIndent(out, depth, indent);
    out.push_back(']');
    return;
  case Value::Type::kObject:
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    for (std::size_t i = 0; i < value.object_value.size(); ++i) {
      if (i > 0U) {
        out.push_back(',');
      }
      AppendIndent(out, depth + 1U, indent);
      AppendQuotedString(out, value.object_value[i].first);
      out += ": ";
      AppendValue(value.object_value[i].second, depth + 1U, indent, out);
    }
    AppendIndent(out, depth, indent);
    out.push_back('}');
    return;
  }
}

} // namespace detail

// Canonical multi-line rendering: `indent` spaces per level, `": "` after
// keys, no trailing newline. Member order is the order the value was parsed in.
inline std::string FormatIndented(const Value& value, std::size_t indent = 2) {
  std::string out;
  detail::AppendValue(value, 0, indent, out);
  return out;
}

} // namespace packdoc::core::json

#endif // PACKDOC_CORE_JSON_FORMAT_HPP_
