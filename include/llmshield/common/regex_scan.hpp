#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace llmshield::common {

// A single std::regex match attempt recurses once per consumed character, so text longer than
// kScanWindow is matched window by window. Neighbouring windows share kScanOverlap bytes.
inline constexpr std::size_t kScanWindow = 4096;
inline constexpr std::size_t kScanOverlap = 256;

struct ScanWindow {
  std::size_t begin = 0;
  std::size_t end = 0;
  // Matches starting at or after this offset are reported by the next window.
  std::size_t owned_end = 0;
};

struct RegexMatch {
  std::size_t start = 0;
  std::size_t length = 0;
  std::string value;
};

// Windows end after whitespace when the back half of the window has any. Text no longer than
// `window` yields exactly one window covering all of it.
[[nodiscard]] std::vector<ScanWindow> scan_windows(const std::string &text,
                                                   std::size_t window = kScanWindow,
                                                   std::size_t overlap = kScanOverlap);

[[nodiscard]] bool bounded_search(const std::string &text, const std::regex &pattern);

// Non-overlapping matches in text order, like std::sregex_iterator over the whole text.
[[nodiscard]] std::vector<RegexMatch> bounded_matches(const std::string &text,
                                                      const std::regex &pattern);

// std::regex_replace with the same "$&"/"$1" format syntax.
[[nodiscard]] std::string bounded_replace(const std::string &text, const std::regex &pattern,
                                          const std::string &format);

} // namespace llmshield::common
