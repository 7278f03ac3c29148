#include "toymc/core/TruthLabel.hpp"

#include <algorithm>
#include <cctype>

namespace TOYMC {

namespace {

bool IsLabelChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

std::string SanitizeLabel(const std::string &text) {
  std::string result = text;
  std::replace_if(
      result.begin(), result.end(), [](char c) { return !IsLabelChar(c); },
      '_');
  return result;
}

bool IsValidLabel(const std::string &label) {
  return !label.empty() &&
         std::all_of(label.begin(), label.end(), IsLabelChar);
}

} // namespace TOYMC
