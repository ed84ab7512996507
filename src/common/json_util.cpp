#include "llmshield/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace llmshield::common {

namespace {

int hex_value(const char ch) {
  if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
    return -1;
  }
  if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
    return ch - '0';
  }
  return std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10;
}

// Walks a document one character at a time and reports structural characters only, i.e.
// those outside string literals.
class StructureScanner {
public:
  // True when `ch` is outside a string and not a quote.
  bool structural(const char ch) {
    if (in_string_) {
      if (escaped_) {
        escaped_ = false;
      } else if (ch == '\\') {
        escaped_ = true;
      } else if (ch == '"') {
        in_string_ = false;
      }
      return false;
    }
    if (ch == '"') {
      in_string_ = true;
      return false;
    }
    return true;
  }

  [[nodiscard]] bool in_string() const { return in_string_; }

private:
  bool in_string_ = false;
  bool escaped_ = false;
};

std::size_t string_end(const std::string &json, const std::size_t quote_pos) {
  StructureScanner scanner;
  scanner.structural(json[quote_pos]);
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    scanner.structural(json[i]);
    if (!scanner.in_string()) {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t matching_close(const std::string &json, const std::size_t open_pos) {
  if (open_pos >= json.size() || (json[open_pos] != '{' && json[open_pos] != '[')) {
    return std::string::npos;
  }
  // Brackets and braces must nest properly, not just balance per kind.
  std::string stack;
  StructureScanner scanner;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (!scanner.structural(ch)) {
      continue;
    }
    if (ch == '{' || ch == '[') {
      stack.push_back(ch);
    } else if (ch == '}' || ch == ']') {
      if (stack.empty() || stack.back() != (ch == '}' ? '{' : '[')) {
        return std::string::npos;
      }
      stack.pop_back();
      if (stack.empty()) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string field_value(const std::string &json, const std::string &field, const char open) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != open) {
    return "";
  }
  const auto end = matching_close(json, pos);
  return end == std::string::npos ? "" : json.substr(pos, end - pos + 1);
}

// Raw text of the scalar starting at pos: number, true, false or null.
std::string scalar_at(const std::string &json, std::size_t &pos) {
  const std::size_t start = pos;
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return json.substr(start, pos - start);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  std::size_t i = 0;
  while (i < raw.size()) {
    if (raw[i] != '\\' || i + 1 == raw.size()) {
      out.push_back(raw[i++]);
      continue;
    }
    const char kind = raw[i + 1];
    i += 2;
    if (kind == 'n') {
      out.push_back('\n');
    } else if (kind == 'r') {
      out.push_back('\r');
    } else if (kind == 't') {
      out.push_back('\t');
    } else if (kind == 'u') {
      int code = 0;
      std::size_t digits = 0;
      while (digits < 4 && i + digits < raw.size() && hex_value(raw[i + digits]) >= 0) {
        code = code * 16 + hex_value(raw[i + digits]);
        ++digits;
      }
      // Only ASCII code points are decoded; anything else keeps its text.
      if (digits == 4 && code < 0x80) {
        out.push_back(static_cast<char>(code));
        i += 4;
      } else {
        out.push_back('u');
      }
    } else {
      out.push_back(kind);
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  return json.find("\"" + key + "\"", from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

bool json_is_object(const std::string &json) {
  const std::size_t start = json_skip_ws(json, 0);
  if (start >= json.size() || json[start] != '{') {
    return false;
  }
  const std::size_t end = matching_close(json, start);
  return end != std::string::npos && json_skip_ws(json, end + 1) == json.size();
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return field_value(json, field, '{');
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return field_value(json, field, '[');
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array = json_get_array(json, field);
  std::vector<std::string> out;
  for (std::size_t pos = 1; pos < array.size(); ++pos) {
    if (array[pos] != '"') {
      continue;
    }
    const auto end = string_end(array, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(json_unescape(array.substr(pos + 1, end - pos - 1)));
    pos = end;
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  if (json.size() < 2 || json.front() != '{') {
    return result;
  }

  std::size_t pos = 1;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] != '"') {
      ++pos;
      continue;
    }

    const auto key_end = string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    const char lead = json[pos];
    if (lead == '"' || lead == '{' || lead == '[') {
      const auto end = lead == '"' ? string_end(json, pos) : matching_close(json, pos);
      if (end == std::string::npos) {
        break;
      }
      result[key] = lead == '"' ? json_unescape(json.substr(pos + 1, end - pos - 1))
                                : json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      result[key] = scalar_at(json, pos);
    }
  }
  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  StructureScanner scanner;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    if (!scanner.structural(array_json[i]) || array_json[i] != '{') {
      continue;
    }
    const auto end = matching_close(array_json, i);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(i, end - i + 1));
    i = end;
  }
  return out;
}

} // namespace llmshield::common
