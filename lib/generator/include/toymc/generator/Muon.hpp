#ifndef TOYMC_GENERATOR_MUON_HPP
#define TOYMC_GENERATOR_MUON_HPP

#include "toymc/generator/IEventType.hpp"
#include "toymc/generator/Spectrum.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TOYMC {

/**
 * @brief Cosmic muons crossing the water pool
 *
 * Every muon produces one water-pool (WP) record. A fraction of the muons
 * also produces a record in one of the site's ADs, either a regular
 * AD muon or a shower muon, a fixed delay after the WP trigger.
 *
 * The association is index-partitioned: with count WP muons,
 * the first floor(count * prob_WP_and_AD) also make an AD muon and the
 * next floor(count * prob_WP_and_shower) also make a shower muon.
 * Records are emitted WP first, then AD, then shower.
 */
class Muon : public IEventType {
public:
  Muon(const std::string &name, int32_t site, double rate_hz,
       uint32_t trigger_type = Event::kDefaultTriggerType);

  std::vector<Event> GenerateEvents(RandomSource &rng, double duration_s,
                                    double t0_s) const override;
  std::vector<TruthLabelEntry> Labels() const override;
  std::string GetTypeName() const override { return "Muon"; }

  /**
   * @brief ADs installed at a site
   * @return {1, 2} for sites 1 and 2, {1, 2, 3, 4} for site 4
   *
   * Throws ConfigurationError (UnknownSite) for any other site.
   */
  static std::vector<int32_t> AvailableDetectors(int32_t site);

  // === Truth labels ===
  void SetTruthLabelWP(int64_t code) { fTruthLabelWP = code; }
  void SetTruthLabelAD(int64_t code) { fTruthLabelAD = code; }
  void SetTruthLabelShower(int64_t code) { fTruthLabelShower = code; }
  std::optional<int64_t> GetTruthLabelWP() const { return fTruthLabelWP; }
  std::optional<int64_t> GetTruthLabelAD() const { return fTruthLabelAD; }
  std::optional<int64_t> GetTruthLabelShower() const {
    return fTruthLabelShower;
  }

  /// Both must lie in [0, 1] and sum to at most 1
  void SetProbabilities(double prob_wp_and_ad, double prob_wp_and_shower);
  double GetProbWPAndAD() const { return fProbWPAndAD; }
  double GetProbWPAndShower() const { return fProbWPAndShower; }

  void SetAdDelayNs(int64_t delay_ns);
  int64_t GetAdDelayNs() const { return fAdDelayNs; }

  // === Strategies ===
  void SetWPNHitSpectrum(IntegerSpectrum spectrum);
  void SetADMuonEnergySpectrum(EnergySpectrum spectrum);
  void SetShowerEnergySpectrum(EnergySpectrum spectrum);

  double GetRate() const { return fRateHz; }
  int32_t GetSite() const { return fSite; }
  uint32_t GetTriggerType() const { return fTriggerType; }
  const std::vector<int32_t> &GetDetectors() const { return fDetectors; }

  static constexpr int32_t kWaterPoolDetector = 6;
  static constexpr double kDefaultProbWPAndAD = 0.1995;
  static constexpr double kDefaultProbWPAndShower = 0.0005;
  static constexpr int64_t kDefaultAdDelayNs = 50;

private:
  Event NewWPEvent(RandomSource &rng, int64_t timestamp, uint32_t truth) const;
  Event NewADEvent(RandomSource &rng, int64_t timestamp, uint32_t truth,
                   const EnergySpectrum &spectrum, const char *quantity) const;

  double fRateHz;
  int32_t fSite;
  uint32_t fTriggerType;
  std::vector<int32_t> fDetectors;

  double fProbWPAndAD = kDefaultProbWPAndAD;
  double fProbWPAndShower = kDefaultProbWPAndShower;
  int64_t fAdDelayNs = kDefaultAdDelayNs;

  std::optional<int64_t> fTruthLabelWP;
  std::optional<int64_t> fTruthLabelAD;
  std::optional<int64_t> fTruthLabelShower;

  IntegerSpectrum fWPNHitSpectrum;
  EnergySpectrum fADMuonEnergySpectrum;
  EnergySpectrum fShowerEnergySpectrum;
};

} // namespace TOYMC

#endif // TOYMC_GENERATOR_MUON_HPP
