#include "llmshield/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace llmshield::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split(const std::string &value, const char delimiter) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, delimiter)) {
    const std::string trimmed = trim(part);
    if (!trimmed.empty()) {
      parts.push_back(trimmed);
    }
  }
  return parts;
}

std::string join(const std::vector<std::string> &parts, const std::string &sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

// "credit_card" -> "Credit Card"
std::string title_case(const std::string &snake_name) {
  std::string out;
  out.reserve(snake_name.size());
  bool word_start = true;
  for (const char ch : snake_name) {
    if (ch == '_') {
      out.push_back(' ');
      word_start = true;
      continue;
    }
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalpha(uch) == 0) {
      out.push_back(ch);
      word_start = true;
      continue;
    }
    out.push_back(static_cast<char>(word_start ? std::toupper(uch) : std::tolower(uch)));
    word_start = false;
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set", ErrorCode::Io);
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        "Failed to create directory: " + path.string() + ": " + ec.message(), ErrorCode::Io);
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return Result<std::string>::failure("Unable to open file: " + path.string(), ErrorCode::Io);
  }
  std::ostringstream out;
  out << file.rdbuf();
  return Result<std::string>::success(out.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return Status::error("Failed to create directory: " + ensure_ec.message(), ErrorCode::Io);
    }
  }

  const std::filesystem::path tmp_path = path.string() + ".tmp";
  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return Status::error("Unable to write temporary file: " + tmp_path.string(), ErrorCode::Io);
  }
  file << content;
  file.close();
  if (!file) {
    return Status::error("Failed writing temporary file: " + tmp_path.string(), ErrorCode::Io);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return Status::error("Failed to atomically replace " + path.string() + ": " + ec.message(),
                         ErrorCode::Io);
  }
  return Status::success();
}

} // namespace llmshield::common
