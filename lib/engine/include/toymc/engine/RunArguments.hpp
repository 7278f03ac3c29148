#ifndef TOYMC_ENGINE_RUN_ARGUMENTS_HPP
#define TOYMC_ENGINE_RUN_ARGUMENTS_HPP

#include "toymc/core/RunConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TOYMC {

/**
 * @brief Command line of the toymc executable
 *
 * Usage:
 *   toymc <outfile> -t <seconds> [options]
 *
 * Options:
 *   -t, --runtime <int>     Data-taking duration in whole seconds
 *   -s, --seed <int>        Random seed (default: system-derived)
 *   --t0 <seconds>          Start of data taking (default: 0)
 *   -c, --config <file>     JSON run configuration
 *   --reco-name <name>      Tree under /Event/Rec (default: AdSimpleNL)
 *   --calib-name <name>     Tree under /Event/Data (default: CalibStats)
 *   --log-level <level>     debug, info, warning or error
 *   --dry-run               Generate without writing a file
 *   -h, --help              Show usage
 *
 * Values given on the command line override the configuration file.
 */
struct RunArguments {
  std::string outputPath;
  std::optional<int64_t> runtimeS;
  std::optional<uint64_t> seed;
  std::optional<double> t0S;
  std::optional<std::string> configPath;
  std::optional<std::string> recoName;
  std::optional<std::string> calibName;
  std::optional<std::string> logLevel;
  bool dryRun = false;
  bool showHelp = false;

  /**
   * @brief Parse arguments, program name excluded
   *
   * Throws ConfigurationError (InvalidArgument) on unknown options,
   * missing values, a non-integer or negative runtime, a malformed seed or
   * start time, or when neither a runtime nor a config file is given.
   */
  static RunArguments Parse(const std::vector<std::string> &args);

  static RunArguments Parse(int argc, const char *const argv[]);

  /// Override fields of config with the values given on the command line
  void ApplyTo(RunConfig &config) const;
};

std::string RunArgumentsUsage(const std::string &program);

} // namespace TOYMC

#endif // TOYMC_ENGINE_RUN_ARGUMENTS_HPP
