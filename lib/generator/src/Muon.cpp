#include "toymc/generator/Muon.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace TOYMC {

Muon::Muon(const std::string &name, int32_t site, double rate_hz,
           uint32_t trigger_type)
    : IEventType(name), fRateHz(rate_hz), fSite(site),
      fTriggerType(trigger_type), fDetectors(AvailableDetectors(site)),
      fWPNHitSpectrum(Spectra::UniformInteger(15, 100)),
      fADMuonEnergySpectrum(Spectra::Uniform(20.0, 2000.0)),
      fShowerEnergySpectrum(Spectra::Uniform(2500.0, 5000.0)) {
  CheckRate(name, rate_hz);
}

std::vector<int32_t> Muon::AvailableDetectors(int32_t site) {
  switch (site) {
  case 1:
  case 2:
    return {1, 2};
  case 4:
    return {1, 2, 3, 4};
  default: {
    std::ostringstream oss;
    oss << "Unknown site " << site << " (expected 1, 2 or 4)";
    throw ConfigurationError(oss.str(), ErrorCode::UnknownSite);
  }
  }
}

std::vector<Event> Muon::GenerateEvents(RandomSource &rng, double duration_s,
                                        double t0_s) const {
  const uint32_t truthWP = RequireCode(fTruthLabelWP, LabelFor("WP"));
  const uint32_t truthAD = RequireCode(fTruthLabelAD, LabelFor("AD"));
  const uint32_t truthShower =
      RequireCode(fTruthLabelShower, LabelFor("shower"));

  const uint64_t count = ActualEventCount(rng, duration_s, fRateHz);
  const auto timestamps = DrawTimestamps(rng, count, duration_s, t0_s);

  // Index partition of the WP muons
  const auto nAD = static_cast<size_t>(
      std::floor(static_cast<double>(timestamps.size()) * fProbWPAndAD));
  const auto nShower = static_cast<size_t>(
      std::floor(static_cast<double>(timestamps.size()) * fProbWPAndShower));

  std::vector<Event> events;
  events.reserve(timestamps.size() + nAD + nShower);
  for (const auto timestamp : timestamps) {
    events.push_back(NewWPEvent(rng, timestamp, truthWP));
  }
  for (size_t i = 0; i < nAD; ++i) {
    events.push_back(NewADEvent(rng, timestamps[i] + fAdDelayNs, truthAD,
                                fADMuonEnergySpectrum, "AD muon energy"));
  }
  for (size_t i = nAD; i < nAD + nShower; ++i) {
    events.push_back(NewADEvent(rng, timestamps[i] + fAdDelayNs, truthShower,
                                fShowerEnergySpectrum, "shower energy"));
  }
  return events;
}

std::vector<TruthLabelEntry> Muon::Labels() const {
  return {MakeEntry(fTruthLabelWP, LabelFor("WP")),
          MakeEntry(fTruthLabelAD, LabelFor("AD")),
          MakeEntry(fTruthLabelShower, LabelFor("shower"))};
}

void Muon::SetProbabilities(double prob_wp_and_ad, double prob_wp_and_shower) {
  const auto inUnitRange = [](double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 1.0;
  };
  if (!inUnitRange(prob_wp_and_ad) || !inUnitRange(prob_wp_and_shower) ||
      prob_wp_and_ad + prob_wp_and_shower > 1.0) {
    std::ostringstream oss;
    oss << "Muon '" << GetName() << "': invalid probabilities (AD "
        << prob_wp_and_ad << ", shower " << prob_wp_and_shower
        << "); each must be in [0, 1] with a sum <= 1";
    throw ConfigurationError(oss.str());
  }
  fProbWPAndAD = prob_wp_and_ad;
  fProbWPAndShower = prob_wp_and_shower;
}

void Muon::SetAdDelayNs(int64_t delay_ns) {
  if (delay_ns < 0) {
    throw ConfigurationError("Muon '" + GetName() +
                             "': AD delay must not be negative");
  }
  fAdDelayNs = delay_ns;
}

void Muon::SetWPNHitSpectrum(IntegerSpectrum spectrum) {
  if (!spectrum) {
    throw ConfigurationError("Muon '" + GetName() +
                             "': WP nHit spectrum must be callable");
  }
  fWPNHitSpectrum = std::move(spectrum);
}

void Muon::SetADMuonEnergySpectrum(EnergySpectrum spectrum) {
  if (!spectrum) {
    throw ConfigurationError("Muon '" + GetName() +
                             "': AD muon energy spectrum must be callable");
  }
  fADMuonEnergySpectrum = std::move(spectrum);
}

void Muon::SetShowerEnergySpectrum(EnergySpectrum spectrum) {
  if (!spectrum) {
    throw ConfigurationError("Muon '" + GetName() +
                             "': shower energy spectrum must be callable");
  }
  fShowerEnergySpectrum = std::move(spectrum);
}

Event Muon::NewWPEvent(RandomSource &rng, int64_t timestamp,
                       uint32_t truth) const {
  Event event;
  event.truthIndex = truth;
  event.timeStampNs = timestamp;
  event.detector = kWaterPoolDetector;
  event.triggerType = fTriggerType;
  event.site = fSite;
  event.nHit = fWPNHitSpectrum(rng);
  return event;
}

Event Muon::NewADEvent(RandomSource &rng, int64_t timestamp, uint32_t truth,
                       const EnergySpectrum &spectrum,
                       const char *quantity) const {
  Event event;
  event.truthIndex = truth;
  event.timeStampNs = timestamp;
  event.detector = rng.Choice(fDetectors);
  event.triggerType = fTriggerType;
  event.site = fSite;
  FillADPlaceholders(event, CheckFinite(spectrum(rng), quantity));
  return event;
}

} // namespace TOYMC
