#ifndef TOYMC_CORE_TRUTH_LABEL_HPP
#define TOYMC_CORE_TRUTH_LABEL_HPP

#include <cstdint>
#include <string>

namespace TOYMC {

/**
 * @brief One (code, label) pair declared by an event type
 *
 * code is signed so that an invalid negative value can be reported
 * instead of silently wrapping.
 */
struct TruthLabelEntry {
  int64_t code = -1;
  std::string label;
};

/// Replace every character outside [A-Za-z0-9_] with '_'
std::string SanitizeLabel(const std::string &text);

/// true if label is non-empty and only contains [A-Za-z0-9_]
bool IsValidLabel(const std::string &label);

} // namespace TOYMC

#endif // TOYMC_CORE_TRUTH_LABEL_HPP
