#include "llmshield/common/toml.hpp"

#include "llmshield/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <sstream>

namespace llmshield::common {

namespace {

// Tracks whether the characters fed so far leave us inside a basic string.
class QuoteState {
public:
  void feed(const char ch) {
    if (escaped_) {
      escaped_ = false;
    } else if (in_string_ && ch == '\\') {
      escaped_ = true;
    } else if (ch == '"') {
      in_string_ = !in_string_;
    }
  }

  [[nodiscard]] bool in_string() const { return in_string_; }

private:
  bool in_string_ = false;
  bool escaped_ = false;
};

std::string strip_comment(const std::string &line) {
  QuoteState quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (!quotes.in_string() && line[i] == '#') {
      return line.substr(0, i);
    }
    quotes.feed(line[i]);
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> elements;
  QuoteState quotes;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= body.size(); ++i) {
    if (i == body.size() || (!quotes.in_string() && body[i] == ',')) {
      std::string element = trim(body.substr(start, i - start));
      if (!element.empty()) {
        elements.push_back(std::move(element));
      }
      start = i + 1;
      continue;
    }
    quotes.feed(body[i]);
  }
  return elements;
}

std::string unquote(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return raw;
  }
  std::string out;
  out.reserve(raw.size() - 2);
  for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 2 < raw.size()) {
      ++i;
    }
    out.push_back(raw[i]);
  }
  return out;
}

template <typename Number> std::optional<Number> parse_number(const std::string &text) {
  Number parsed{};
  const char *last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, parsed);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

Result<TomlDocument> line_error(const std::string &what, const std::size_t line_number) {
  return Result<TomlDocument>::failure(what + " at line " + std::to_string(line_number),
                                       ErrorCode::Configuration);
}

} // namespace

std::optional<std::string> TomlDocument::raw(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return trim(it->second);
}

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto value = raw(key);
  return value ? unquote(*value) : fallback;
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const std::string value = to_lower(raw(key).value_or(""));
  if (value == "true" || value == "false") {
    return value == "true";
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  return parse_number<std::uint64_t>(raw(key).value_or("")).value_or(fallback);
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  return parse_number<double>(raw(key).value_or("")).value_or(fallback);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const std::string value = raw(key).value_or("");
  if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : split_array_elements(value.substr(1, value.size() - 2))) {
    out.push_back(unquote(element));
  }
  return out;
}

std::vector<std::string> TomlDocument::keys_in_section(const std::string &section) const {
  const std::string prefix = section + ".";
  std::vector<std::string> keys;
  for (const auto &entry : values) {
    if (starts_with(entry.first, prefix) && entry.first.size() > prefix.size()) {
      keys.push_back(entry.first.substr(prefix.size()));
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string section;
  std::string line;
  for (std::size_t line_number = 1; std::getline(stream, line); ++line_number) {
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return line_error("Unterminated section header", line_number);
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return line_error("Invalid empty section", line_number);
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return line_error("Invalid key/value", line_number);
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return line_error("Missing key", line_number);
    }
    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, trim(clean.substr(equals + 1))).second) {
      return line_error("Duplicate key '" + full_key + "'", line_number);
    }
  }
  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string quoted = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(ch);
  }
  return quoted + "\"";
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::string out = "[";
  for (const auto &value : values) {
    out += (out.size() > 1 ? ", " : "") + quote_toml_string(value);
  }
  return out + "]";
}

} // namespace llmshield::common
