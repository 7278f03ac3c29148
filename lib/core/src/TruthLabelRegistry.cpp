#include "toymc/core/TruthLabelRegistry.hpp"

#include "toymc/core/Errors.hpp"

#include <algorithm>
#include <limits>

namespace TOYMC {

void TruthLabelRegistry::Add(const std::string &owner,
                             const TruthLabelEntry &entry) {
  if (entry.code < 0 || entry.code > std::numeric_limits<uint32_t>::max()) {
    throw InvalidLookupError(owner, entry.label, entry.code,
                             ErrorCode::InvalidLookupCode);
  }
  if (!IsValidLabel(entry.label)) {
    throw InvalidLookupError(owner, entry.label, entry.code,
                             ErrorCode::InvalidLookupLabel);
  }

  const auto code = static_cast<uint32_t>(entry.code);
  if (fLabelsByCode.count(code) != 0) {
    throw InvalidLookupError(owner, entry.label, entry.code,
                             ErrorCode::DuplicateLookupCode);
  }
  if (fCodesByLabel.count(entry.label) != 0) {
    throw InvalidLookupError(owner, entry.label, entry.code,
                             ErrorCode::DuplicateLookupLabel);
  }

  fLabelsByCode.emplace(code, entry.label);
  fCodesByLabel.emplace(entry.label, code);
  fMaxLabelLength = std::max(fMaxLabelLength, entry.label.size());
}

std::optional<std::string> TruthLabelRegistry::FindLabel(uint32_t code) const {
  const auto it = fLabelsByCode.find(code);
  if (it == fLabelsByCode.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<uint32_t>
TruthLabelRegistry::FindCode(const std::string &label) const {
  const auto it = fCodesByLabel.find(label);
  if (it == fCodesByLabel.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace TOYMC
