#include "toymc/generator/Correlated.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace TOYMC {

Correlated::Correlated(const std::string &name, int32_t site, int32_t detector,
                       double rate_hz, double coincidence_ns,
                       uint32_t trigger_type)
    : IEventType(name), fRateHz(rate_hz), fSite(site), fDetector(detector),
      fTriggerType(trigger_type), fCoincidenceNs(coincidence_ns),
      fPromptEnergySpectrum(Spectra::Uniform(0.7, 4.0)),
      fDelayedEnergySpectrum(Spectra::Uniform(7.0, 9.0)) {
  CheckRate(name, rate_hz);
  if (!std::isfinite(coincidence_ns) || coincidence_ns <= 0.0) {
    std::ostringstream oss;
    oss << "Correlated '" << name
        << "': coincidence time must be positive, got " << coincidence_ns;
    throw ConfigurationError(oss.str());
  }
  SetDefaultGeometry(kDefaultRadiusMm, kDefaultDistanceMm);
}

std::vector<Event> Correlated::GenerateEvents(RandomSource &rng,
                                              double duration_s,
                                              double t0_s) const {
  const uint32_t truthPrompt = RequireCode(fTruthLabelPrompt, LabelFor("prompt"));
  const uint32_t truthDelayed =
      RequireCode(fTruthLabelDelayed, LabelFor("delayed"));

  const uint64_t count = ActualEventCount(rng, duration_s, fRateHz);
  const auto promptTimes = DrawTimestamps(rng, count, duration_s, t0_s);

  std::vector<int64_t> delays;
  delays.reserve(promptTimes.size());
  for (size_t i = 0; i < promptTimes.size(); ++i) {
    delays.push_back(static_cast<int64_t>(rng.Exponential(fCoincidenceNs)));
  }

  std::vector<Event> events;
  events.reserve(2 * promptTimes.size());
  for (size_t i = 0; i < promptTimes.size(); ++i) {
    Position promptPosition;
    events.push_back(
        NewPromptEvent(rng, promptTimes[i], truthPrompt, promptPosition));
    events.push_back(NewDelayedEvent(rng, promptTimes[i] + delays[i],
                                     truthDelayed, promptPosition));
  }
  return events;
}

std::vector<TruthLabelEntry> Correlated::Labels() const {
  return {MakeEntry(fTruthLabelPrompt, LabelFor("prompt")),
          MakeEntry(fTruthLabelDelayed, LabelFor("delayed"))};
}

void Correlated::SetPromptEnergySpectrum(EnergySpectrum spectrum) {
  if (!spectrum) {
    throw ConfigurationError("Correlated '" + GetName() +
                             "': prompt energy spectrum must be callable");
  }
  fPromptEnergySpectrum = std::move(spectrum);
}

void Correlated::SetDelayedEnergySpectrum(EnergySpectrum spectrum) {
  if (!spectrum) {
    throw ConfigurationError("Correlated '" + GetName() +
                             "': delayed energy spectrum must be callable");
  }
  fDelayedEnergySpectrum = std::move(spectrum);
}

void Correlated::SetPromptPositionSpectrum(VolumeSampler sampler) {
  if (!sampler) {
    throw ConfigurationError("Correlated '" + GetName() +
                             "': prompt position sampler must be callable");
  }
  fPromptPositionSpectrum = std::move(sampler);
}

void Correlated::SetDelayedPositionFromPrompt(CorrelatedVolumeSampler sampler) {
  if (!sampler) {
    throw ConfigurationError("Correlated '" + GetName() +
                             "': delayed position sampler must be callable");
  }
  fDelayedPositionFromPrompt = std::move(sampler);
}

void Correlated::SetDefaultGeometry(double radius_mm, double distance_mm) {
  fPromptPositionSpectrum = Spectra::UniformCylinder(radius_mm, 2.0 * radius_mm);
  fDelayedPositionFromPrompt =
      Spectra::CorrelatedExponentialCylinder(radius_mm, distance_mm);
  fRadiusMm = radius_mm;
  fDistanceMm = distance_mm;
}

void Correlated::SetPromptDelayedDistance(double distance_mm) {
  fDelayedPositionFromPrompt =
      Spectra::CorrelatedExponentialCylinder(fRadiusMm, distance_mm);
  fDistanceMm = distance_mm;
}

Event Correlated::NewPromptEvent(RandomSource &rng, int64_t timestamp,
                                 uint32_t truth, Position &position) const {
  const double energy = CheckFinite(fPromptEnergySpectrum(rng), "prompt energy");
  position = fPromptPositionSpectrum(rng);
  CheckFinite(position.x, "prompt position x");
  CheckFinite(position.y, "prompt position y");
  CheckFinite(position.z, "prompt position z");
  return NewEvent(timestamp, truth, energy, position);
}

Event Correlated::NewDelayedEvent(RandomSource &rng, int64_t timestamp,
                                  uint32_t truth,
                                  const Position &prompt_position) const {
  const double energy =
      CheckFinite(fDelayedEnergySpectrum(rng), "delayed energy");
  const Position position = fDelayedPositionFromPrompt(rng, prompt_position);
  CheckFinite(position.x, "delayed position x");
  CheckFinite(position.y, "delayed position y");
  CheckFinite(position.z, "delayed position z");
  return NewEvent(timestamp, truth, energy, position);
}

Event Correlated::NewEvent(int64_t timestamp, uint32_t truth, double energy,
                           const Position &position) const {
  Event event;
  event.truthIndex = truth;
  event.timeStampNs = timestamp;
  event.detector = fDetector;
  event.triggerType = fTriggerType;
  event.site = fSite;
  FillADPlaceholders(event, energy);
  event.x = static_cast<float>(position.x);
  event.y = static_cast<float>(position.y);
  event.z = static_cast<float>(position.z);
  return event;
}

} // namespace TOYMC
