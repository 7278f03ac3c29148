#include "toymc/generator/Single.hpp"

#include <utility>

namespace TOYMC {

Single::Single(const std::string &name, double rate_hz, int32_t site,
               int32_t detector, uint32_t trigger_type)
    : IEventType(name), fRateHz(rate_hz), fSite(site), fDetector(detector),
      fTriggerType(trigger_type), fEnergySpectrum(Spectra::Uniform(1.0, 3.5)),
      fPositionSpectrum(Spectra::UniformCylinder(kDefaultRadiusMm,
                                                 2.0 * kDefaultRadiusMm)) {
  CheckRate(name, rate_hz);
}

std::vector<Event> Single::GenerateEvents(RandomSource &rng, double duration_s,
                                          double t0_s) const {
  const uint32_t truth = RequireCode(fTruthLabel, LabelFor());
  const uint64_t count = ActualEventCount(rng, duration_s, fRateHz);
  const auto timestamps = DrawTimestamps(rng, count, duration_s, t0_s);

  std::vector<Event> events;
  events.reserve(timestamps.size());
  for (const auto timestamp : timestamps) {
    events.push_back(NewEvent(rng, timestamp, truth));
  }
  return events;
}

std::vector<TruthLabelEntry> Single::Labels() const {
  return {MakeEntry(fTruthLabel, LabelFor())};
}

void Single::SetEnergySpectrum(EnergySpectrum spectrum) {
  if (!spectrum) {
    throw ConfigurationError("Single '" + GetName() +
                             "': energy spectrum must be callable");
  }
  fEnergySpectrum = std::move(spectrum);
}

void Single::SetPositionSpectrum(VolumeSampler sampler) {
  if (!sampler) {
    throw ConfigurationError("Single '" + GetName() +
                             "': position sampler must be callable");
  }
  fPositionSpectrum = std::move(sampler);
}

Event Single::NewEvent(RandomSource &rng, int64_t timestamp,
                       uint32_t truth) const {
  Event event;
  event.truthIndex = truth;
  event.timeStampNs = timestamp;
  event.detector = fDetector;
  event.triggerType = fTriggerType;
  event.site = fSite;

  const double energy = CheckFinite(fEnergySpectrum(rng), "energy");
  const Position pos = fPositionSpectrum(rng);
  FillADPlaceholders(event, energy);
  event.x = static_cast<float>(CheckFinite(pos.x, "position x"));
  event.y = static_cast<float>(CheckFinite(pos.y, "position y"));
  event.z = static_cast<float>(CheckFinite(pos.z, "position z"));
  return event;
}

} // namespace TOYMC
