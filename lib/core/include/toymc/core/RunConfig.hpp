#ifndef TOYMC_CORE_RUN_CONFIG_HPP
#define TOYMC_CORE_RUN_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TOYMC {

/**
 * @brief Declarative description of one sampling strategy
 *
 * type is one of:
 * - "uniform":     real value uniform in [min, max)
 * - "uniform_int": integer value uniform in [min, max] (inclusive)
 * - "fixed":       always returns value
 */
struct SpectrumConfig {
  std::string type = "uniform";
  double min = 0.0;
  double max = 0.0;
  double value = 0.0;
};

/**
 * @brief Settings for one event type instance
 *
 * Which fields are consulted depends on type ("Single", "Correlated",
 * "Muon"). Truth codes are keyed by subtype: "single" for Single,
 * "prompt"/"delayed" for Correlated, "WP"/"AD"/"shower" for Muon.
 */
struct EventTypeConfig {
  std::string type;
  std::string name;
  double rate_hz = 0.0;
  int32_t site = 1;
  int32_t detector = 1;
  std::optional<uint32_t> trigger_type;
  std::string count_model = "poisson"; ///< "poisson" or "expected"

  // Correlated
  double coincidence_ns = 0.0;
  std::optional<double> distance_mm;
  std::optional<double> radius_mm;

  // Muon
  std::optional<double> prob_wp_and_ad;
  std::optional<double> prob_wp_and_shower;
  std::optional<int64_t> ad_delay_ns;

  // Spectra, keyed by quantity ("energy", "prompt_energy", ...)
  std::vector<std::pair<std::string, SpectrumConfig>> spectra;

  // Truth-label codes keyed by subtype
  std::vector<std::pair<std::string, int64_t>> truth_codes;
};

/**
 * @brief Configuration for one generation run
 *
 * Example JSON:
 *   {
 *     "output": "toymc.root",
 *     "duration_s": 3600,
 *     "t0_s": 0,
 *     "seed": 42,
 *     "reco_name": "AdSimpleNL",
 *     "calib_name": "CalibStats",
 *     "logging": { "level": "info", "directory": "" },
 *     "event_types": [
 *       { "type": "Single", "name": "Single event", "rate_hz": 20,
 *         "site": 1, "detector": 1, "truth_codes": { "single": 0 } }
 *     ]
 *   }
 */
struct RunConfig {
  std::string output_path;          ///< Output destination
  double duration_s = 0.0;          ///< Data-taking duration (s)
  double t0_s = 0.0;                ///< Start of data taking (s)
  std::optional<uint64_t> seed;     ///< Unset means system-derived

  std::string reco_name = "AdSimpleNL";  ///< Tree under /Event/Rec
  std::string calib_name = "CalibStats"; ///< Tree under /Event/Data

  std::string log_level = "info";   ///< debug, info, warning, error
  std::string log_directory;        ///< Empty means stderr only

  bool assign_trigger_numbers = true;

  std::vector<EventTypeConfig> event_types;
};

} // namespace TOYMC

#endif // TOYMC_CORE_RUN_CONFIG_HPP
