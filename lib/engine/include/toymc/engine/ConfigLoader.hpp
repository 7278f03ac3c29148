#ifndef TOYMC_ENGINE_CONFIG_LOADER_HPP
#define TOYMC_ENGINE_CONFIG_LOADER_HPP

#include "toymc/core/RunConfig.hpp"
#include "toymc/generator/IEventType.hpp"
#include "toymc/generator/Spectrum.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace TOYMC {

/**
 * @brief JSON run configuration
 *
 * Parses the layout documented on RunConfig and turns EventTypeConfig
 * entries into configured IEventType instances.
 *
 * Spectrum keys per event type:
 * - Single:     "energy"
 * - Correlated: "prompt_energy", "delayed_energy"
 * - Muon:       "wp_nhit", "ad_energy", "shower_energy"
 *
 * Errors throw ConfigurationError: InvalidConfiguration for malformed,
 * missing or wrongly typed fields (the message names the JSON path),
 * ConfigurationNotFound for an unreadable file.
 */
class ConfigLoader {
public:
  static RunConfig LoadFromFile(const std::string &filename);
  static RunConfig LoadFromJSON(const nlohmann::json &config);

  static std::unique_ptr<IEventType>
  BuildEventType(const EventTypeConfig &config);

  static std::vector<std::unique_ptr<IEventType>>
  BuildEventTypes(const RunConfig &config);

  /// Built-in example set: one Single, two IBD Correlated and one Muon
  static std::vector<EventTypeConfig> DefaultEventTypes();

  static EnergySpectrum BuildEnergySpectrum(const SpectrumConfig &config);
  static IntegerSpectrum BuildIntegerSpectrum(const SpectrumConfig &config);

private:
  static EventTypeConfig ParseEventType(const nlohmann::json &entry,
                                        const std::string &path);
  static SpectrumConfig ParseSpectrum(const nlohmann::json &entry,
                                      const std::string &path);
};

} // namespace TOYMC

#endif // TOYMC_ENGINE_CONFIG_LOADER_HPP
