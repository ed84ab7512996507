#include "llmshield/validators/toxicity.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/json_util.hpp"
#include "llmshield/common/regex_scan.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <tuple>
#include <utility>

namespace llmshield::validators {

namespace {

constexpr auto kIgnoreCase = std::regex::ECMAScript | std::regex::icase;
constexpr std::size_t kMaxReportedMatches = 5;

using PatternTable = std::vector<std::pair<const char *, double>>;

const PatternTable &profanity_table() {
  static const PatternTable table = {
      {R"(\bf[*u]ck)", 0.8},  {R"(\bsh[*i]t)", 0.6}, {R"(\bd[*a]mn)", 0.4},
      {R"(\bhell\b)", 0.3},   {R"(\bcrap)", 0.3},    {R"(\b[a@]ss\b)", 0.5},
      {R"(\bb[*i]tch)", 0.7},
  };
  return table;
}

const PatternTable &hate_table() {
  static const PatternTable table = {
      {R"(\b(hate|despise|detest)\s+(all\s+)?(jews|muslims|christians|blacks|whites|asians))",
       0.95},
      {R"(\b(kill|eliminate|destroy)\s+(all\s+)?(jews|muslims|christians|blacks|whites|asians))",
       1.0},
      {R"(\bgenocide\b)", 0.9},
      {R"(\bethnic\s+cleansing\b)", 0.95},
      {R"(\bmaster\s+race\b)", 0.9},
      {R"(\bracial\s+purity\b)", 0.9},
  };
  return table;
}

const PatternTable &violence_table() {
  static const PatternTable table = {
      {R"(\b(kill|murder|stab|shoot)\s+(you|him|her|them))", 0.9},
      {R"(\b(punch|beat|attack)\s+(you|him|her|them))", 0.7},
      {R"(\bI\s+(will|am\s+going\s+to)\s+(kill|murder|hurt))", 0.95},
      {R"(\b(bomb|explosion|terrorist)\s+(threat|attack))", 0.9},
      {R"(\bweapon\s+(of\s+mass\s+destruction|WMD))", 0.9},
      {R"(\b(torture|mutilate)\b)", 0.85},
  };
  return table;
}

const PatternTable &harassment_table() {
  static const PatternTable table = {
      {R"(\b(you\s+are|you're)\s+(stupid|dumb|idiot|moron|retard))", 0.7},
      {R"(\bnobody\s+(likes|wants|cares\s+about)\s+you\b)", 0.75},
      {R"(\b(go\s+)?kill\s+yourself\b)", 0.95},
      {R"(\byou\s+should\s+(die|disappear)\b)", 0.9},
      {R"(\bworthless\s+(person|human|individual)\b)", 0.8},
      {R"(\b(stalking|harassing|threatening)\b)", 0.85},
  };
  return table;
}

const PatternTable &self_harm_table() {
  static const PatternTable table = {
      {R"(\b(want\s+to|going\s+to)\s+(die|end\s+it|kill\s+myself))", 0.95},
      {R"(\bsuicid(e|al)\b)", 0.9},
      {R"(\bself[\s-]?harm)", 0.9},
      {R"(\bcut(ting)?\s+myself\b)", 0.95},
      {R"(\blife\s+is\s+not\s+worth\s+living\b)", 0.85},
      {R"(\bend\s+my\s+life\b)", 0.95},
  };
  return table;
}

std::string collapse_whitespace(const std::string &text) {
  std::istringstream stream(text);
  std::string word;
  std::string out;
  while (stream >> word) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += word;
  }
  return out;
}

std::string remove_zero_width(std::string text) {
  // U+200B..U+200D and U+FEFF in UTF-8.
  static const std::vector<std::string> sequences = {"\xE2\x80\x8B", "\xE2\x80\x8C",
                                                     "\xE2\x80\x8D", "\xEF\xBB\xBF"};
  for (const auto &sequence : sequences) {
    std::size_t pos = 0;
    while ((pos = text.find(sequence, pos)) != std::string::npos) {
      text.erase(pos, sequence.size());
    }
  }
  return text;
}

std::set<std::string> lower_words(const std::string &text) {
  std::istringstream stream(common::to_lower(text));
  std::set<std::string> words;
  std::string word;
  while (stream >> word) {
    words.insert(word);
  }
  return words;
}

bool intersects(const std::set<std::string> &left, const std::set<std::string> &right) {
  return std::any_of(left.begin(), left.end(),
                     [&right](const std::string &word) { return right.contains(word); });
}

std::string matches_to_json(const std::vector<ToxicityMatch> &matches) {
  std::ostringstream out;
  out << "[";
  const std::size_t count = std::min(matches.size(), kMaxReportedMatches);
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"category\":" << common::json_quote(matches[i].category)
        << ",\"score\":" << format_score(matches[i].score)
        << ",\"pattern\":" << common::json_quote(matches[i].pattern) << "}";
  }
  out << "]";
  return out.str();
}

std::string maxima_to_json(const std::map<std::string, double> &maxima) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[category, value] : maxima) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(category) << ":" << format_score(value);
  }
  out << "}";
  return out.str();
}

} // namespace

ToxicityValidator::ToxicityValidator() {
  const std::vector<std::tuple<const char *, double, const PatternTable *>> layout = {
      {"profanity", 0.8, &profanity_table()},  {"hate_speech", 1.0, &hate_table()},
      {"violence", 0.9, &violence_table()},    {"harassment", 0.85, &harassment_table()},
      {"self_harm", 1.0, &self_harm_table()},
  };
  for (const auto &[category_name, weight, table] : layout) {
    Category category{.name = category_name, .weight = weight, .patterns = {}};
    for (const auto &[source, score] : *table) {
      category.patterns.push_back(
          WeightedPattern{.regex = std::regex(source, kIgnoreCase), .source = source, .score = score});
    }
    categories_.push_back(std::move(category));
  }

  context_modifiers_ = {
      {std::regex(R"(\b(educational|academic|research|medical|clinical)\b)", kIgnoreCase), -0.3},
      {std::regex(R"(\b(fiction|story|novel|character|plot)\b)", kIgnoreCase), -0.2},
      {std::regex(R"(\b(quote|citation|reference)\b)", kIgnoreCase), -0.2},
      {std::regex(R"(\b(historical|history|past)\b)", kIgnoreCase), -0.15},
  };

  // Matched case-sensitively against the raw text.
  intensity_modifiers_ = {
      {std::regex(R"(!{2,})"), 0.1},
      {std::regex(R"(\b[A-Z]{4,}\b)"), 0.1},
      {std::regex(R"((.)\1{3,})"), 0.05},
      {std::regex(R"([!?]{3,})"), 0.1},
  };

  academic_words_ = {"research", "study",      "analysis", "examine",  "investigate",
                     "medical",  "clinical",   "scientific", "academic", "educational"};
  fictional_words_ = {"story", "novel", "fiction", "character", "plot",
                      "movie", "book",  "scene",   "dialogue",  "narrative"};
}

std::string ToxicityValidator::preprocess(const std::string &text) {
  static const std::regex punctuation(R"(\s*([,.!?;:])\s*)");
  const std::string cleaned = remove_zero_width(collapse_whitespace(text));
  return common::bounded_replace(cleaned, punctuation, "$1 ");
}

common::Result<ToxicityAnalysis> ToxicityValidator::analyze(const std::string &text) const {
  ToxicityAnalysis analysis;
  try {
    const std::string processed = preprocess(text);

    std::string top_category;
    double top_score = 0.0;
    for (const auto &category : categories_) {
      double category_max = 0.0;
      bool matched = false;
      for (const auto &pattern : category.patterns) {
        if (!common::bounded_search(processed, pattern.regex)) {
          continue;
        }
        const double weighted = pattern.score * category.weight;
        analysis.matches.push_back(
            ToxicityMatch{.category = category.name, .score = weighted, .pattern = pattern.source});
        category_max = matched ? std::max(category_max, weighted) : weighted;
        matched = true;
      }
      if (!matched) {
        continue;
      }
      analysis.category_maxima[category.name] = category_max;
      if (top_category.empty() || category_max > top_score) {
        top_category = category.name;
        top_score = category_max;
      }
    }

    if (!analysis.category_maxima.empty()) {
      double sum = 0.0;
      for (const auto &[name, value] : analysis.category_maxima) {
        sum += value;
      }
      analysis.base_score = sum / static_cast<double>(analysis.category_maxima.size());
    }

    for (const auto &modifier : context_modifiers_) {
      if (common::bounded_search(text, modifier.regex)) {
        analysis.context_modifier += modifier.delta;
      }
    }
    for (const auto &modifier : intensity_modifiers_) {
      if (common::bounded_search(text, modifier.regex)) {
        analysis.intensity_modifier += modifier.delta;
      }
    }

    const auto words = lower_words(text);
    if (intersects(words, academic_words_)) {
      analysis.context_modifier -= 0.2;
    }
    if (intersects(words, fictional_words_)) {
      analysis.context_modifier -= 0.15;
    }

    analysis.score = std::clamp(
        analysis.base_score + analysis.context_modifier + analysis.intensity_modifier, 0.0, 1.0);

    if (analysis.score > 0.5) {
      analysis.reason = top_category.empty() ? std::string("Potentially toxic content detected")
                                             : common::title_case(top_category) + " detected";
    }
  } catch (const std::regex_error &e) {
    return common::Result<ToxicityAnalysis>::failure(
        std::string("toxicity pattern evaluation failed: ") + e.what(), common::ErrorCode::Validator);
  }
  return common::Result<ToxicityAnalysis>::success(std::move(analysis));
}

common::Result<ValidationResult> ToxicityValidator::validate(const std::string &text) const {
  auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<ValidationResult>::failure_from(analysis);
  }
  const auto &a = analysis.value();

  ValidationResult result;
  result.score = a.score;
  result.reason = a.reason;
  result.attributes["base_score"] = format_score(a.base_score);
  result.attributes["context_modifier"] = format_score(a.context_modifier);
  result.attributes["intensity_modifier"] = format_score(a.intensity_modifier);
  result.set_json_attribute("categories", maxima_to_json(a.category_maxima));
  result.set_json_attribute("matches", matches_to_json(a.matches));
  if (a.reason.has_value()) {
    result.attributes["reason"] = *a.reason;
  }
  return common::Result<ValidationResult>::success(std::move(result));
}

common::Result<std::string> ToxicityValidator::explain(const std::string &text) const {
  const auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<std::string>::failure_from(analysis);
  }
  const auto &a = analysis.value();
  if (a.score < 0.3) {
    return common::Result<std::string>::success("Text appears to be non-toxic and safe.");
  }
  if (a.score < 0.5) {
    return common::Result<std::string>::success(
        "Text contains mildly concerning language but is likely acceptable in context.");
  }
  if (a.score < 0.7) {
    return common::Result<std::string>::success(
        "Text is potentially toxic. " + a.reason.value_or("Multiple concerning patterns detected") +
        ".");
  }
  return common::Result<std::string>::success(
      "Text is highly toxic. " + a.reason.value_or("Strong toxic patterns detected") +
      ". This content may violate community guidelines.");
}

common::Result<std::map<std::string, double>>
ToxicityValidator::category_scores(const std::string &text) const {
  const auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<std::map<std::string, double>>::failure_from(analysis);
  }
  std::map<std::string, double> scores;
  for (const auto &category : categories_) {
    const auto it = analysis.value().category_maxima.find(category.name);
    scores[category.name] = it == analysis.value().category_maxima.end() ? 0.0 : it->second;
  }
  return common::Result<std::map<std::string, double>>::success(std::move(scores));
}

} // namespace llmshield::validators
