#ifndef TOYMC_GENERATOR_SINGLE_HPP
#define TOYMC_GENERATOR_SINGLE_HPP

#include "toymc/generator/IEventType.hpp"
#include "toymc/generator/Spectrum.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TOYMC {

/**
 * @brief Uncorrelated events occurring uniformly at random
 *
 * One record per occurrence, all with the same truth code.
 *
 * Configurable strategies:
 * - energy spectrum (default uniform 1 - 3.5 MeV)
 * - position sampler (default uniform in a cylinder, R = 2000 mm, H = 2R)
 */
class Single : public IEventType {
public:
  Single(const std::string &name, double rate_hz, int32_t site,
         int32_t detector,
         uint32_t trigger_type = Event::kDefaultTriggerType);

  std::vector<Event> GenerateEvents(RandomSource &rng, double duration_s,
                                    double t0_s) const override;
  std::vector<TruthLabelEntry> Labels() const override;
  std::string GetTypeName() const override { return "Single"; }

  // === Truth label ===
  void SetTruthLabel(int64_t code) { fTruthLabel = code; }
  std::optional<int64_t> GetTruthLabel() const { return fTruthLabel; }

  // === Strategies ===
  void SetEnergySpectrum(EnergySpectrum spectrum);
  void SetPositionSpectrum(VolumeSampler sampler);

  // === Parameters ===
  double GetRate() const { return fRateHz; }
  int32_t GetSite() const { return fSite; }
  int32_t GetDetector() const { return fDetector; }
  uint32_t GetTriggerType() const { return fTriggerType; }

  static constexpr double kDefaultRadiusMm = 2000.0;

private:
  Event NewEvent(RandomSource &rng, int64_t timestamp, uint32_t truth) const;

  double fRateHz;
  int32_t fSite;
  int32_t fDetector;
  uint32_t fTriggerType;
  std::optional<int64_t> fTruthLabel;

  EnergySpectrum fEnergySpectrum;
  VolumeSampler fPositionSpectrum;
};

} // namespace TOYMC

#endif // TOYMC_GENERATOR_SINGLE_HPP
