#include "toymc/output/MemorySink.hpp"

#include "toymc/core/Errors.hpp"

namespace TOYMC {

void MemorySink::Open(const std::string &destination) {
  fDestination = destination;
  fEvents.clear();
  fTruth.clear();
  fLookup.clear();
  fFinalized = false;
  fOpen = true;
}

void MemorySink::Write(const Event &event) {
  RequireOpen("Write");
  fEvents.push_back(event);
}

void MemorySink::WriteTruth(uint32_t truthIndex) {
  RequireOpen("WriteTruth");
  fTruth.push_back(truthIndex);
}

void MemorySink::WriteLookup(const TruthLabelRegistry &registry) {
  RequireOpen("WriteLookup");
  fLookup = registry.GetLabelsByCode();
}

void MemorySink::Finalize() {
  RequireOpen("Finalize");
  fOpen = false;
  fFinalized = true;
}

void MemorySink::RequireOpen(const char *operation) const {
  if (!fOpen) {
    throw ConfigurationError(std::string("MemorySink::") + operation +
                                 "() called while the sink is not open",
                             ErrorCode::SinkNotOpen);
  }
}

} // namespace TOYMC
