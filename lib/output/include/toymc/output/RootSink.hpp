#ifndef TOYMC_OUTPUT_ROOT_SINK_HPP
#define TOYMC_OUTPUT_ROOT_SINK_HPP

#include "toymc/core/Logger.hpp"
#include "toymc/output/ISink.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class TDirectory;
class TFile;
class TTree;

namespace TOYMC {

/**
 * @brief Writes a run to a ROOT file
 *
 * File layout:
 *   /Event/Data/<calib name>   calibrated statistics (default CalibStats)
 *   /Event/Rec/<reco name>     reconstructed quantities (default AdSimpleNL)
 *   /MCTruth                   truth_label/i, one entry per record
 *   /MCTruthLookup             single entry; "<label>/i" branches sorted by
 *                              label, "_<code>[N]/C" branches sorted by code,
 *                              N = longest label + 1
 *
 * The three per-record trees are filled together by WriteTruth(), so they
 * stay aligned entry by entry. Branch buffers are members of the sink,
 * which is therefore neither copyable nor movable.
 */
class RootSink : public ISink {
public:
  explicit RootSink(const std::string &recoName = "AdSimpleNL",
                    const std::string &calibName = "CalibStats");
  ~RootSink() override;

  RootSink(const RootSink &) = delete;
  RootSink &operator=(const RootSink &) = delete;

  void Open(const std::string &destination) override;
  void Write(const Event &event) override;
  void WriteTruth(uint32_t truthIndex) override;
  void WriteLookup(const TruthLabelRegistry &registry) override;
  void Finalize() override;
  bool IsOpen() const override { return fFile != nullptr; }

  const std::string &GetRecoName() const { return fRecoName; }
  const std::string &GetCalibName() const { return fCalibName; }

  /// Records filled so far
  uint64_t GetEntries() const { return fEntries; }

private:
  void CreateTrees();
  void RequireOpen(const char *operation) const;
  static TDirectory *GetOrMakeDirectory(TDirectory *parent,
                                        const char *name);

  std::string fRecoName;
  std::string fCalibName;
  std::string fDestination;

  std::unique_ptr<TFile> fFile;
  // Owned by fFile
  TTree *fCalibTree = nullptr;
  TTree *fRecoTree = nullptr;
  TTree *fTruthTree = nullptr;

  bool fPending = false;
  uint64_t fEntries = 0;

  // Calib buffers
  int32_t fTriggerNumber = 0;
  int32_t fSeconds = 0;
  int32_t fNanoSeconds = 0;
  int32_t fDetector = 0;
  int32_t fNHit = 0;
  float fCharge = 0.0f;
  float fQuad = 0.0f;
  float fMax = 0.0f;
  float fPSD_t1 = 0.0f;
  float fPSD_t2 = 0.0f;
  float f2inch_maxQ = 0.0f;

  // Reco buffers
  int32_t fSite = 0;
  uint32_t fTriggerType = 0;
  float fEnergy = 0.0f;
  float fX = 0.0f;
  float fY = 0.0f;
  float fZ = 0.0f;

  uint32_t fTruthLabel = 0;

  std::shared_ptr<Logger> fLogger;
};

} // namespace TOYMC

#endif // TOYMC_OUTPUT_ROOT_SINK_HPP
