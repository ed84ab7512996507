#include "llmshield/common/regex_scan.hpp"

#include <algorithm>
#include <cctype>
#include <functional>

namespace llmshield::common {

namespace {

std::regex_constants::match_flag_type window_flags(const ScanWindow &window,
                                                   const std::size_t text_size) {
  auto flags = std::regex_constants::match_default;
  if (window.begin > 0) {
    flags |= std::regex_constants::match_prev_avail;
  }
  if (window.end < text_size) {
    flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
  }
  return flags;
}

// Visits accepted matches in order; returning false stops the scan.
void visit_matches(const std::string &text, const std::regex &pattern,
                   const std::function<bool(std::size_t, const std::smatch &)> &visit) {
  std::size_t consumed = 0;
  for (const auto &window : scan_windows(text)) {
    const auto first = text.begin() + static_cast<std::ptrdiff_t>(window.begin);
    const auto last = text.begin() + static_cast<std::ptrdiff_t>(window.end);
    for (auto it = std::sregex_iterator(first, last, pattern, window_flags(window, text.size()));
         it != std::sregex_iterator(); ++it) {
      const std::size_t start = window.begin + static_cast<std::size_t>(it->position());
      if (start >= window.owned_end) {
        break;
      }
      if (start < consumed) {
        continue;
      }
      if (!visit(start, *it)) {
        return;
      }
      consumed = start + static_cast<std::size_t>(it->length());
    }
  }
}

} // namespace

std::vector<ScanWindow> scan_windows(const std::string &text, const std::size_t window,
                                     const std::size_t overlap) {
  std::vector<ScanWindow> windows;
  std::size_t pos = 0;
  while (text.size() - pos > window) {
    std::size_t cut = pos + window;
    for (std::size_t i = cut; i > pos + window / 2; --i) {
      if (std::isspace(static_cast<unsigned char>(text[i - 1])) != 0) {
        cut = i;
        break;
      }
    }
    const std::size_t owned_end = cut - std::min(overlap, (cut - pos) / 2);
    windows.push_back(ScanWindow{.begin = pos, .end = cut, .owned_end = owned_end});
    pos = owned_end;
  }
  windows.push_back(ScanWindow{.begin = pos, .end = text.size(), .owned_end = text.size()});
  return windows;
}

bool bounded_search(const std::string &text, const std::regex &pattern) {
  bool found = false;
  visit_matches(text, pattern, [&found](std::size_t, const std::smatch &) {
    found = true;
    return false;
  });
  return found;
}

std::vector<RegexMatch> bounded_matches(const std::string &text, const std::regex &pattern) {
  std::vector<RegexMatch> matches;
  visit_matches(text, pattern, [&matches](const std::size_t start, const std::smatch &match) {
    matches.push_back(RegexMatch{.start = start,
                                 .length = static_cast<std::size_t>(match.length()),
                                 .value = match.str()});
    return true;
  });
  return matches;
}

std::string bounded_replace(const std::string &text, const std::regex &pattern,
                            const std::string &format) {
  std::string out;
  out.reserve(text.size());
  std::size_t copied = 0;
  visit_matches(text, pattern,
                [&](const std::size_t start, const std::smatch &match) {
                  out.append(text, copied, start - copied);
                  out += match.format(format);
                  copied = start + static_cast<std::size_t>(match.length());
                  return true;
                });
  out.append(text, copied, std::string::npos);
  return out;
}

} // namespace llmshield::common
