#include "toymc/engine/ConfigLoader.hpp"

#include "toymc/core/Errors.hpp"
#include "toymc/generator/Correlated.hpp"
#include "toymc/generator/Muon.hpp"
#include "toymc/generator/Single.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>

namespace TOYMC {

namespace {

using nlohmann::json;

[[noreturn]] void Invalid(const std::string &path, const std::string &what) {
  throw ConfigurationError("Invalid configuration at " + path + ": " + what,
                           ErrorCode::InvalidConfiguration);
}

const json &Require(const json &object, const char *key,
                    const std::string &path) {
  if (!object.contains(key)) {
    Invalid(path + "." + key, "missing required field");
  }
  return object.at(key);
}

double ToDouble(const json &value, const std::string &path) {
  if (!value.is_number()) {
    Invalid(path, "expected a number, got " + std::string(value.type_name()));
  }
  const double result = value.get<double>();
  if (!std::isfinite(result)) {
    Invalid(path, "expected a finite number");
  }
  return result;
}

int64_t ToInteger(const json &value, const std::string &path) {
  if (!value.is_number_integer()) {
    Invalid(path, "expected an integer, got " + std::string(value.type_name()));
  }
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    Invalid(path, "integer out of range");
  }
  return value.get<int64_t>();
}

int32_t ToInt32(const json &value, const std::string &path) {
  const int64_t result = ToInteger(value, path);
  if (result < std::numeric_limits<int32_t>::min() ||
      result > std::numeric_limits<int32_t>::max()) {
    Invalid(path, "integer out of range");
  }
  return static_cast<int32_t>(result);
}

std::string ToString(const json &value, const std::string &path) {
  if (!value.is_string()) {
    Invalid(path, "expected a string, got " + std::string(value.type_name()));
  }
  return value.get<std::string>();
}

bool ToBool(const json &value, const std::string &path) {
  if (!value.is_boolean()) {
    Invalid(path, "expected a boolean, got " + std::string(value.type_name()));
  }
  return value.get<bool>();
}

void RequireObject(const json &value, const std::string &path) {
  if (!value.is_object()) {
    Invalid(path, "expected an object, got " + std::string(value.type_name()));
  }
}

const SpectrumConfig *FindSpectrum(const EventTypeConfig &config,
                                   const std::string &key) {
  for (const auto &[name, spectrum] : config.spectra) {
    if (name == key) {
      return &spectrum;
    }
  }
  return nullptr;
}

std::optional<int64_t> FindCode(const EventTypeConfig &config,
                                const std::string &key) {
  for (const auto &[name, code] : config.truth_codes) {
    if (name == key) {
      return code;
    }
  }
  return std::nullopt;
}

// Reject keys the event type does not understand
void CheckKeys(const EventTypeConfig &config,
               const std::set<std::string> &spectrumKeys,
               const std::set<std::string> &codeKeys) {
  for (const auto &entry : config.spectra) {
    if (spectrumKeys.count(entry.first) == 0) {
      throw ConfigurationError(config.type + " '" + config.name +
                               "': unknown spectrum '" + entry.first + "'");
    }
  }
  for (const auto &entry : config.truth_codes) {
    if (codeKeys.count(entry.first) == 0) {
      throw ConfigurationError(config.type + " '" + config.name +
                               "': unknown truth code key '" + entry.first +
                               "'");
    }
  }
}

std::unique_ptr<IEventType> BuildSingle(const EventTypeConfig &config) {
  CheckKeys(config, {"energy"}, {"single"});
  auto single = std::make_unique<Single>(
      config.name, config.rate_hz, config.site, config.detector,
      config.trigger_type.value_or(Event::kDefaultTriggerType));
  if (const auto *spectrum = FindSpectrum(config, "energy")) {
    single->SetEnergySpectrum(ConfigLoader::BuildEnergySpectrum(*spectrum));
  }
  if (const auto code = FindCode(config, "single")) {
    single->SetTruthLabel(*code);
  }
  return single;
}

std::unique_ptr<IEventType> BuildCorrelated(const EventTypeConfig &config) {
  CheckKeys(config, {"prompt_energy", "delayed_energy"},
            {"prompt", "delayed"});
  auto correlated = std::make_unique<Correlated>(
      config.name, config.site, config.detector, config.rate_hz,
      config.coincidence_ns,
      config.trigger_type.value_or(Event::kDefaultTriggerType));
  if (config.radius_mm || config.distance_mm) {
    correlated->SetDefaultGeometry(
        config.radius_mm.value_or(Correlated::kDefaultRadiusMm),
        config.distance_mm.value_or(Correlated::kDefaultDistanceMm));
  }
  if (const auto *spectrum = FindSpectrum(config, "prompt_energy")) {
    correlated->SetPromptEnergySpectrum(
        ConfigLoader::BuildEnergySpectrum(*spectrum));
  }
  if (const auto *spectrum = FindSpectrum(config, "delayed_energy")) {
    correlated->SetDelayedEnergySpectrum(
        ConfigLoader::BuildEnergySpectrum(*spectrum));
  }
  if (const auto code = FindCode(config, "prompt")) {
    correlated->SetTruthLabelPrompt(*code);
  }
  if (const auto code = FindCode(config, "delayed")) {
    correlated->SetTruthLabelDelayed(*code);
  }
  return correlated;
}

std::unique_ptr<IEventType> BuildMuon(const EventTypeConfig &config) {
  CheckKeys(config, {"wp_nhit", "ad_energy", "shower_energy"},
            {"WP", "AD", "shower"});
  auto muon = std::make_unique<Muon>(
      config.name, config.site, config.rate_hz,
      config.trigger_type.value_or(Event::kDefaultTriggerType));
  if (config.prob_wp_and_ad || config.prob_wp_and_shower) {
    muon->SetProbabilities(
        config.prob_wp_and_ad.value_or(Muon::kDefaultProbWPAndAD),
        config.prob_wp_and_shower.value_or(Muon::kDefaultProbWPAndShower));
  }
  if (config.ad_delay_ns) {
    muon->SetAdDelayNs(*config.ad_delay_ns);
  }
  if (const auto *spectrum = FindSpectrum(config, "wp_nhit")) {
    muon->SetWPNHitSpectrum(ConfigLoader::BuildIntegerSpectrum(*spectrum));
  }
  if (const auto *spectrum = FindSpectrum(config, "ad_energy")) {
    muon->SetADMuonEnergySpectrum(ConfigLoader::BuildEnergySpectrum(*spectrum));
  }
  if (const auto *spectrum = FindSpectrum(config, "shower_energy")) {
    muon->SetShowerEnergySpectrum(ConfigLoader::BuildEnergySpectrum(*spectrum));
  }
  if (const auto code = FindCode(config, "WP")) {
    muon->SetTruthLabelWP(*code);
  }
  if (const auto code = FindCode(config, "AD")) {
    muon->SetTruthLabelAD(*code);
  }
  if (const auto code = FindCode(config, "shower")) {
    muon->SetTruthLabelShower(*code);
  }
  return muon;
}

} // namespace

RunConfig ConfigLoader::LoadFromFile(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw ConfigurationError("Cannot open configuration file " + filename,
                             ErrorCode::ConfigurationNotFound);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (content.empty()) {
    throw ConfigurationError("Configuration file " + filename + " is empty");
  }

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigurationError("Cannot parse " + filename + ": " + e.what());
  }
  return LoadFromJSON(config);
}

RunConfig ConfigLoader::LoadFromJSON(const nlohmann::json &config) {
  RequireObject(config, "$");

  RunConfig run;
  if (config.contains("output")) {
    run.output_path = ToString(config["output"], "$.output");
  }
  if (config.contains("duration_s")) {
    run.duration_s = ToDouble(config["duration_s"], "$.duration_s");
  }
  if (config.contains("t0_s")) {
    run.t0_s = ToDouble(config["t0_s"], "$.t0_s");
  }
  if (config.contains("seed") && !config["seed"].is_null()) {
    const auto &seed = config["seed"];
    if (!seed.is_number_unsigned()) {
      Invalid("$.seed", "expected a non-negative integer");
    }
    run.seed = seed.get<uint64_t>();
  }
  if (config.contains("reco_name")) {
    run.reco_name = ToString(config["reco_name"], "$.reco_name");
  }
  if (config.contains("calib_name")) {
    run.calib_name = ToString(config["calib_name"], "$.calib_name");
  }
  if (config.contains("assign_trigger_numbers")) {
    run.assign_trigger_numbers = ToBool(config["assign_trigger_numbers"],
                                        "$.assign_trigger_numbers");
  }
  if (config.contains("logging")) {
    const auto &logging = config["logging"];
    RequireObject(logging, "$.logging");
    if (logging.contains("level")) {
      run.log_level = ToString(logging["level"], "$.logging.level");
    }
    if (logging.contains("directory")) {
      run.log_directory = ToString(logging["directory"], "$.logging.directory");
    }
  }

  if (config.contains("event_types")) {
    const auto &types = config["event_types"];
    if (!types.is_array()) {
      Invalid("$.event_types", "expected an array");
    }
    for (size_t i = 0; i < types.size(); ++i) {
      run.event_types.push_back(
          ParseEventType(types[i], "$.event_types[" + std::to_string(i) + "]"));
    }
  }
  return run;
}

EventTypeConfig ConfigLoader::ParseEventType(const nlohmann::json &entry,
                                             const std::string &path) {
  RequireObject(entry, path);

  EventTypeConfig config;
  config.type = ToString(Require(entry, "type", path), path + ".type");
  config.name = ToString(Require(entry, "name", path), path + ".name");
  config.rate_hz = ToDouble(Require(entry, "rate_hz", path), path + ".rate_hz");

  if (config.type != "Single" && config.type != "Correlated" &&
      config.type != "Muon") {
    Invalid(path + ".type", "unknown event type '" + config.type + "'");
  }

  if (entry.contains("site")) {
    config.site = ToInt32(entry["site"], path + ".site");
  }
  if (entry.contains("detector")) {
    config.detector = ToInt32(entry["detector"], path + ".detector");
  }
  if (entry.contains("trigger_type")) {
    const int64_t triggerType =
        ToInteger(entry["trigger_type"], path + ".trigger_type");
    if (triggerType < 0 || triggerType > std::numeric_limits<uint32_t>::max()) {
      Invalid(path + ".trigger_type", "out of 32-bit range");
    }
    config.trigger_type = static_cast<uint32_t>(triggerType);
  }
  if (entry.contains("count_model")) {
    config.count_model = ToString(entry["count_model"], path + ".count_model");
  }

  if (config.type == "Correlated") {
    config.coincidence_ns = ToDouble(Require(entry, "coincidence_ns", path),
                                     path + ".coincidence_ns");
    if (entry.contains("distance_mm")) {
      config.distance_mm = ToDouble(entry["distance_mm"], path + ".distance_mm");
    }
    if (entry.contains("radius_mm")) {
      config.radius_mm = ToDouble(entry["radius_mm"], path + ".radius_mm");
    }
  }

  if (config.type == "Muon") {
    if (entry.contains("prob_wp_and_ad")) {
      config.prob_wp_and_ad =
          ToDouble(entry["prob_wp_and_ad"], path + ".prob_wp_and_ad");
    }
    if (entry.contains("prob_wp_and_shower")) {
      config.prob_wp_and_shower =
          ToDouble(entry["prob_wp_and_shower"], path + ".prob_wp_and_shower");
    }
    if (entry.contains("ad_delay_ns")) {
      config.ad_delay_ns = ToInteger(entry["ad_delay_ns"], path + ".ad_delay_ns");
    }
  }

  if (entry.contains("spectra")) {
    const auto &spectra = entry["spectra"];
    RequireObject(spectra, path + ".spectra");
    for (const auto &item : spectra.items()) {
      config.spectra.emplace_back(
          item.key(),
          ParseSpectrum(item.value(), path + ".spectra." + item.key()));
    }
  }

  if (entry.contains("truth_codes")) {
    const auto &codes = entry["truth_codes"];
    RequireObject(codes, path + ".truth_codes");
    for (const auto &item : codes.items()) {
      config.truth_codes.emplace_back(
          item.key(),
          ToInteger(item.value(), path + ".truth_codes." + item.key()));
    }
  }
  return config;
}

SpectrumConfig ConfigLoader::ParseSpectrum(const nlohmann::json &entry,
                                           const std::string &path) {
  RequireObject(entry, path);

  SpectrumConfig spectrum;
  spectrum.type = ToString(Require(entry, "type", path), path + ".type");
  if (spectrum.type == "uniform" || spectrum.type == "uniform_int") {
    spectrum.min = ToDouble(Require(entry, "min", path), path + ".min");
    spectrum.max = ToDouble(Require(entry, "max", path), path + ".max");
  } else if (spectrum.type == "fixed") {
    spectrum.value = ToDouble(Require(entry, "value", path), path + ".value");
  } else {
    Invalid(path + ".type", "unknown spectrum type '" + spectrum.type + "'");
  }
  return spectrum;
}

EnergySpectrum ConfigLoader::BuildEnergySpectrum(const SpectrumConfig &config) {
  if (config.type == "uniform") {
    if (!(config.min < config.max)) {
      throw ConfigurationError("Uniform spectrum requires min < max");
    }
    return Spectra::Uniform(config.min, config.max);
  }
  if (config.type == "fixed") {
    return Spectra::Fixed(config.value);
  }
  throw ConfigurationError("Spectrum type '" + config.type +
                           "' cannot describe a real quantity");
}

IntegerSpectrum
ConfigLoader::BuildIntegerSpectrum(const SpectrumConfig &config) {
  const auto toInt32 = [](double value) {
    if (value != std::floor(value) ||
        value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
      throw ConfigurationError("Integer spectrum bound is not a 32-bit integer");
    }
    return static_cast<int32_t>(value);
  };

  if (config.type == "uniform_int") {
    const int32_t lo = toInt32(config.min);
    const int32_t hi = toInt32(config.max);
    if (lo > hi) {
      throw ConfigurationError("Integer spectrum requires min <= max");
    }
    return Spectra::UniformInteger(lo, hi);
  }
  if (config.type == "fixed") {
    return Spectra::FixedInteger(toInt32(config.value));
  }
  throw ConfigurationError("Spectrum type '" + config.type +
                           "' cannot describe an integer quantity");
}

std::unique_ptr<IEventType>
ConfigLoader::BuildEventType(const EventTypeConfig &config) {
  std::unique_ptr<IEventType> eventType;
  if (config.type == "Single") {
    eventType = BuildSingle(config);
  } else if (config.type == "Correlated") {
    eventType = BuildCorrelated(config);
  } else if (config.type == "Muon") {
    eventType = BuildMuon(config);
  } else {
    throw ConfigurationError("Unknown event type '" + config.type + "'");
  }
  eventType->SetCountModel(ParseCountModel(config.count_model));
  return eventType;
}

std::vector<std::unique_ptr<IEventType>>
ConfigLoader::BuildEventTypes(const RunConfig &config) {
  std::vector<std::unique_ptr<IEventType>> eventTypes;
  eventTypes.reserve(config.event_types.size());
  for (const auto &entry : config.event_types) {
    eventTypes.push_back(BuildEventType(entry));
  }
  return eventTypes;
}

std::vector<EventTypeConfig> ConfigLoader::DefaultEventTypes() {
  std::vector<EventTypeConfig> types;

  EventTypeConfig single;
  single.type = "Single";
  single.name = "Single event";
  single.rate_hz = 20.0;
  single.truth_codes = {{"single", 0}};
  types.push_back(single);

  EventTypeConfig nGd;
  nGd.type = "Correlated";
  nGd.name = "IBD nGd";
  nGd.rate_hz = 0.007;
  nGd.coincidence_ns = 28000.0;
  nGd.truth_codes = {{"prompt", 1}, {"delayed", 2}};
  types.push_back(nGd);

  EventTypeConfig nH;
  nH.type = "Correlated";
  nH.name = "IBD nH";
  nH.rate_hz = 0.006;
  nH.coincidence_ns = 150000.0;
  nH.distance_mm = 100.0;
  SpectrumConfig nHDelayed;
  nHDelayed.type = "uniform";
  nHDelayed.min = 1.9;
  nHDelayed.max = 2.3;
  nH.spectra = {{"delayed_energy", nHDelayed}};
  nH.truth_codes = {{"prompt", 3}, {"delayed", 4}};
  types.push_back(nH);

  EventTypeConfig muon;
  muon.type = "Muon";
  muon.name = "Muon";
  muon.rate_hz = 200.0;
  muon.truth_codes = {{"WP", 5}, {"AD", 6}, {"shower", 7}};
  types.push_back(muon);

  return types;
}

} // namespace TOYMC
