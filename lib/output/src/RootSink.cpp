#include "toymc/output/RootSink.hpp"

#include "toymc/core/Errors.hpp"

#include <TDirectory.h>
#include <TFile.h>
#include <TTree.h>

#include <sstream>

namespace TOYMC {

RootSink::RootSink(const std::string &recoName, const std::string &calibName)
    : fRecoName(recoName), fCalibName(calibName),
      fLogger(Logger::GetLogger("RootSink")) {
  if (recoName.empty() || calibName.empty()) {
    throw ConfigurationError("RootSink: tree names must not be empty");
  }
}

RootSink::~RootSink() {
  if (fFile) {
    // Not finalized: leave the incomplete file closed but unwritten
    fLogger->Warning("Closing " + fDestination + " without Finalize()");
    fFile->Close();
  }
}

void RootSink::Open(const std::string &destination) {
  if (fFile) {
    throw ConfigurationError("RootSink: " + fDestination + " is already open",
                             ErrorCode::InvalidStateTransition);
  }

  std::unique_ptr<TFile> file(TFile::Open(destination.c_str(), "RECREATE"));
  if (!file || file->IsZombie()) {
    throw ConfigurationError("RootSink: cannot create ROOT file " +
                                 destination,
                             ErrorCode::OutputOpenFailed);
  }

  fFile = std::move(file);
  fDestination = destination;
  fEntries = 0;
  fPending = false;
  CreateTrees();
  fLogger->Info("Opened " + destination);
}

void RootSink::CreateTrees() {
  TDirectory *event = GetOrMakeDirectory(fFile.get(), "Event");

  GetOrMakeDirectory(event, "Data")->cd();
  fCalibTree = new TTree(
      fCalibName.c_str(),
      ("Tree at /Event/Data/" + fCalibName + " holding Data_" + fCalibName)
          .c_str());
  fCalibTree->Branch("triggerNumber", &fTriggerNumber, "triggerNumber/I");
  fCalibTree->Branch("context.mTimeStamp.mSec", &fSeconds,
                     "context.mTimeStamp.mSec/I");
  fCalibTree->Branch("context.mTimeStamp.mNanoSec", &fNanoSeconds,
                     "context.mTimeStamp.mNanoSec/I");
  fCalibTree->Branch("context.mDetId", &fDetector, "context.mDetId/I");
  fCalibTree->Branch("nHit", &fNHit, "nHit/I");
  fCalibTree->Branch("NominalCharge", &fCharge, "NominalCharge/F");
  fCalibTree->Branch("Quadrant", &fQuad, "Quadrant/F");
  fCalibTree->Branch("MaxQ", &fMax, "MaxQ/F");
  fCalibTree->Branch("time_PSD", &fPSD_t1, "time_PSD/F");
  fCalibTree->Branch("time_PSD1", &fPSD_t2, "time_PSD1/F");
  fCalibTree->Branch("MaxQ_2inchPMT", &f2inch_maxQ, "MaxQ_2inchPMT/F");

  GetOrMakeDirectory(event, "Rec")->cd();
  fRecoTree = new TTree(
      fRecoName.c_str(),
      ("Tree at /Event/Rec/" + fRecoName + " holding Rec_" + fRecoName)
          .c_str());
  fRecoTree->Branch("context.mSite", &fSite, "context.mSite/I");
  fRecoTree->Branch("triggerType", &fTriggerType, "triggerType/i");
  fRecoTree->Branch("energy", &fEnergy, "energy/F");
  fRecoTree->Branch("x", &fX, "x/F");
  fRecoTree->Branch("y", &fY, "y/F");
  fRecoTree->Branch("z", &fZ, "z/F");

  fFile->cd();
  fTruthTree =
      new TTree("MCTruth", "Monte Carlo Truth information for each entry");
  fTruthTree->Branch("truth_label", &fTruthLabel, "truth_label/i");
}

void RootSink::Write(const Event &event) {
  RequireOpen("Write");
  if (fPending) {
    throw ConfigurationError(
        "RootSink: Write() called twice without WriteTruth()",
        ErrorCode::OutputWriteFailed);
  }

  fTriggerNumber = event.triggerNumber;
  fSeconds = static_cast<int32_t>(event.GetSeconds());
  fNanoSeconds = static_cast<int32_t>(event.GetNanoSeconds());
  fDetector = event.detector;
  fNHit = event.nHit;
  fCharge = event.charge;
  fQuad = event.fQuad;
  fMax = event.fMax;
  fPSD_t1 = event.fPSD_t1;
  fPSD_t2 = event.fPSD_t2;
  f2inch_maxQ = event.f2inch_maxQ;

  fSite = event.site;
  fTriggerType = event.triggerType;
  fEnergy = event.energy;
  fX = event.x;
  fY = event.y;
  fZ = event.z;

  fPending = true;
}

void RootSink::WriteTruth(uint32_t truthIndex) {
  RequireOpen("WriteTruth");
  if (!fPending) {
    throw ConfigurationError(
        "RootSink: WriteTruth() called without a preceding Write()",
        ErrorCode::OutputWriteFailed);
  }

  fTruthLabel = truthIndex;
  if (fCalibTree->Fill() < 0 || fRecoTree->Fill() < 0 ||
      fTruthTree->Fill() < 0) {
    throw ConfigurationError("RootSink: failed to fill trees in " +
                                 fDestination,
                             ErrorCode::OutputWriteFailed);
  }
  fPending = false;
  ++fEntries;
}

void RootSink::WriteLookup(const TruthLabelRegistry &registry) {
  RequireOpen("WriteLookup");

  const auto &codesByLabel = registry.GetCodesByLabel();
  const auto &labelsByCode = registry.GetLabelsByCode();
  const size_t bufSize = registry.GetMaxLabelLength() + 1;

  // Buffers must stay alive until Fill()
  std::vector<uint32_t> codes;
  codes.reserve(codesByLabel.size());
  for (const auto &[label, code] : codesByLabel) {
    codes.push_back(code);
  }
  std::vector<std::vector<char>> labels;
  labels.reserve(labelsByCode.size());
  for (const auto &[code, label] : labelsByCode) {
    std::vector<char> buf(bufSize, '\0');
    label.copy(buf.data(), label.size());
    labels.push_back(std::move(buf));
  }

  fFile->cd();
  auto *lookup = new TTree("MCTruthLookup", "Monte Carlo Truth lookup table");
  size_t i = 0;
  for (const auto &[label, code] : codesByLabel) {
    lookup->Branch(label.c_str(), &codes[i++], (label + "/i").c_str());
  }
  i = 0;
  for (const auto &[code, label] : labelsByCode) {
    const std::string name = "_" + std::to_string(code);
    std::ostringstream leaf;
    leaf << name << "[" << bufSize << "]/C";
    lookup->Branch(name.c_str(), labels[i++].data(), leaf.str().c_str());
  }
  lookup->Fill();
  lookup->ResetBranchAddresses();

  fLogger->Debug("Wrote lookup table with " +
                 std::to_string(registry.Size()) + " labels");
}

void RootSink::Finalize() {
  RequireOpen("Finalize");
  if (fPending) {
    throw ConfigurationError(
        "RootSink: Finalize() with a record missing its truth entry",
        ErrorCode::OutputWriteFailed);
  }

  if (fFile->Write() < 0) {
    throw ConfigurationError("RootSink: failed to write " + fDestination,
                             ErrorCode::OutputWriteFailed);
  }
  fFile->Close();
  fFile.reset();
  fCalibTree = nullptr;
  fRecoTree = nullptr;
  fTruthTree = nullptr;

  fLogger->Info("Finalized " + fDestination + " with " +
                std::to_string(fEntries) + " entries");
}

void RootSink::RequireOpen(const char *operation) const {
  if (!fFile) {
    throw ConfigurationError(std::string("RootSink::") + operation +
                                 "() called while no file is open",
                             ErrorCode::SinkNotOpen);
  }
}

TDirectory *RootSink::GetOrMakeDirectory(TDirectory *parent,
                                         const char *name) {
  auto *dir = parent->GetDirectory(name);
  if (!dir) {
    dir = parent->mkdir(name);
  }
  if (!dir) {
    throw ConfigurationError(std::string("RootSink: cannot create directory ") +
                                 name,
                             ErrorCode::OutputWriteFailed);
  }
  return dir;
}

} // namespace TOYMC
