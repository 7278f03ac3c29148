#ifndef TOYMC_GENERATOR_CORRELATED_HPP
#define TOYMC_GENERATOR_CORRELATED_HPP

#include "toymc/generator/IEventType.hpp"
#include "toymc/generator/Spectrum.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TOYMC {

/**
 * @brief Prompt/delayed pairs, e.g. inverse beta decay
 *
 * Each occurrence yields a prompt record followed by its delayed record.
 * The delay is exponential with mean coincidence_ns, truncated to whole
 * nanoseconds; delayed times are not clamped to the run window. The
 * delayed position is displaced from the prompt one (see
 * Spectra::CorrelatedExponentialCylinder).
 *
 * Configurable strategies:
 * - prompt energy (default uniform 0.7 - 4 MeV)
 * - delayed energy (default uniform 7 - 9 MeV)
 * - prompt position (default uniform in a cylinder, R = 1500 mm, H = 2R)
 * - delayed position from prompt (default exponential displacement with
 *   50 mm mean, bounded by R)
 */
class Correlated : public IEventType {
public:
  Correlated(const std::string &name, int32_t site, int32_t detector,
             double rate_hz, double coincidence_ns,
             uint32_t trigger_type = Event::kDefaultTriggerType);

  std::vector<Event> GenerateEvents(RandomSource &rng, double duration_s,
                                    double t0_s) const override;
  std::vector<TruthLabelEntry> Labels() const override;
  std::string GetTypeName() const override { return "Correlated"; }

  // === Truth labels ===
  void SetTruthLabelPrompt(int64_t code) { fTruthLabelPrompt = code; }
  void SetTruthLabelDelayed(int64_t code) { fTruthLabelDelayed = code; }
  std::optional<int64_t> GetTruthLabelPrompt() const {
    return fTruthLabelPrompt;
  }
  std::optional<int64_t> GetTruthLabelDelayed() const {
    return fTruthLabelDelayed;
  }

  // === Strategies ===
  void SetPromptEnergySpectrum(EnergySpectrum spectrum);
  void SetDelayedEnergySpectrum(EnergySpectrum spectrum);
  void SetPromptPositionSpectrum(VolumeSampler sampler);
  void SetDelayedPositionFromPrompt(CorrelatedVolumeSampler sampler);

  /**
   * @brief Reset both default position samplers
   * @param radius_mm Cylinder radius and delayed-position boundary (mm)
   * @param distance_mm Mean prompt-delayed displacement per axis (mm)
   *
   * Replaces custom position samplers set earlier.
   */
  void SetDefaultGeometry(double radius_mm, double distance_mm);

  /// Rebuild the default delayed sampler with a new mean displacement
  void SetPromptDelayedDistance(double distance_mm);

  // === Parameters ===
  double GetRate() const { return fRateHz; }
  double GetCoincidenceNs() const { return fCoincidenceNs; }
  double GetPromptDelayedDistance() const { return fDistanceMm; }
  double GetRadius() const { return fRadiusMm; }
  int32_t GetSite() const { return fSite; }
  int32_t GetDetector() const { return fDetector; }
  uint32_t GetTriggerType() const { return fTriggerType; }

  static constexpr double kDefaultRadiusMm = 1500.0;
  static constexpr double kDefaultDistanceMm = 50.0;

private:
  Event NewPromptEvent(RandomSource &rng, int64_t timestamp, uint32_t truth,
                       Position &position) const;
  Event NewDelayedEvent(RandomSource &rng, int64_t timestamp, uint32_t truth,
                        const Position &prompt_position) const;
  Event NewEvent(int64_t timestamp, uint32_t truth, double energy,
                 const Position &position) const;

  double fRateHz;
  int32_t fSite;
  int32_t fDetector;
  uint32_t fTriggerType;
  double fCoincidenceNs;
  double fRadiusMm = kDefaultRadiusMm;
  double fDistanceMm = kDefaultDistanceMm;

  std::optional<int64_t> fTruthLabelPrompt;
  std::optional<int64_t> fTruthLabelDelayed;

  EnergySpectrum fPromptEnergySpectrum;
  EnergySpectrum fDelayedEnergySpectrum;
  VolumeSampler fPromptPositionSpectrum;
  CorrelatedVolumeSampler fDelayedPositionFromPrompt;
};

} // namespace TOYMC

#endif // TOYMC_GENERATOR_CORRELATED_HPP
