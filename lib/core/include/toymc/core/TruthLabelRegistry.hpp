#ifndef TOYMC_CORE_TRUTH_LABEL_REGISTRY_HPP
#define TOYMC_CORE_TRUTH_LABEL_REGISTRY_HPP

#include "toymc/core/TruthLabel.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace TOYMC {

/**
 * @brief Bidirectional truth-label lookup table of a run
 *
 * Filled from the Labels() of every registered event type once generation
 * is complete. Each entry is checked as it is added:
 * - the code is a non-negative 32-bit integer
 * - the label is non-empty and only contains [A-Za-z0-9_]
 * - neither the code nor the label was added before
 *
 * A violation throws InvalidLookupError carrying the owner name, label and
 * code, and leaves the registry unchanged.
 */
class TruthLabelRegistry {
public:
  TruthLabelRegistry() = default;

  /**
   * @brief Add one entry
   * @param owner Name of the event type that declared the entry
   * @param entry Code and label
   */
  void Add(const std::string &owner, const TruthLabelEntry &entry);

  /// Labels keyed by code, ascending
  const std::map<uint32_t, std::string> &GetLabelsByCode() const {
    return fLabelsByCode;
  }

  /// Codes keyed by label, lexicographic
  const std::map<std::string, uint32_t> &GetCodesByLabel() const {
    return fCodesByLabel;
  }

  std::optional<std::string> FindLabel(uint32_t code) const;
  std::optional<uint32_t> FindCode(const std::string &label) const;

  /// Length of the longest label, 0 when empty
  size_t GetMaxLabelLength() const { return fMaxLabelLength; }

  size_t Size() const { return fLabelsByCode.size(); }
  bool Empty() const { return fLabelsByCode.empty(); }

private:
  std::map<uint32_t, std::string> fLabelsByCode;
  std::map<std::string, uint32_t> fCodesByLabel;
  size_t fMaxLabelLength = 0;
};

} // namespace TOYMC

#endif // TOYMC_CORE_TRUTH_LABEL_REGISTRY_HPP
