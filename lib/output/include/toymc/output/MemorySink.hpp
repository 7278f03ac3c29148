#ifndef TOYMC_OUTPUT_MEMORY_SINK_HPP
#define TOYMC_OUTPUT_MEMORY_SINK_HPP

#include "toymc/output/ISink.hpp"

#include <map>
#include <string>
#include <vector>

namespace TOYMC {

/**
 * @brief Sink that keeps the run in memory
 *
 * Used for dry runs and tests. Reopening discards earlier content.
 */
class MemorySink : public ISink {
public:
  MemorySink() = default;

  void Open(const std::string &destination) override;
  void Write(const Event &event) override;
  void WriteTruth(uint32_t truthIndex) override;
  void WriteLookup(const TruthLabelRegistry &registry) override;
  void Finalize() override;
  bool IsOpen() const override { return fOpen; }

  const std::string &GetDestination() const { return fDestination; }
  const std::vector<Event> &GetEvents() const { return fEvents; }
  const std::vector<uint32_t> &GetTruth() const { return fTruth; }
  const std::map<uint32_t, std::string> &GetLookup() const { return fLookup; }
  bool IsFinalized() const { return fFinalized; }

private:
  void RequireOpen(const char *operation) const;

  bool fOpen = false;
  bool fFinalized = false;
  std::string fDestination;
  std::vector<Event> fEvents;
  std::vector<uint32_t> fTruth;
  std::map<uint32_t, std::string> fLookup;
};

} // namespace TOYMC

#endif // TOYMC_OUTPUT_MEMORY_SINK_HPP
