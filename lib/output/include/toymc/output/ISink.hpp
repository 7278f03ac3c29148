#ifndef TOYMC_OUTPUT_ISINK_HPP
#define TOYMC_OUTPUT_ISINK_HPP

#include "toymc/core/Event.hpp"
#include "toymc/core/TruthLabelRegistry.hpp"

#include <cstdint>
#include <string>

namespace TOYMC {

/**
 * @brief Destination of a finished run
 *
 * Call protocol used by the Engine:
 *   Open(destination)
 *   WriteLookup(registry)                 once
 *   Write(event), WriteTruth(truthIndex)  once per record, in order
 *   Finalize()
 *
 * The artifact is complete only after Finalize() returns. Any call other
 * than Open() on a sink that is not open throws ConfigurationError
 * (SinkNotOpen).
 */
class ISink {
public:
  virtual ~ISink() = default;

  /// Create or overwrite the artifact at destination
  virtual void Open(const std::string &destination) = 0;

  virtual void Write(const Event &event) = 0;

  /// Truth code of the record passed to the preceding Write()
  virtual void WriteTruth(uint32_t truthIndex) = 0;

  virtual void WriteLookup(const TruthLabelRegistry &registry) = 0;

  /// Flush and close
  virtual void Finalize() = 0;

  virtual bool IsOpen() const = 0;
};

} // namespace TOYMC

#endif // TOYMC_OUTPUT_ISINK_HPP
