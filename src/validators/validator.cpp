#include "llmshield/validators/validator.hpp"

#include <iomanip>
#include <sstream>

namespace llmshield::validators {

std::string format_score(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << value;
  std::string text = out.str();
  while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.') {
    text.pop_back();
  }
  return text;
}

} // namespace llmshield::validators
