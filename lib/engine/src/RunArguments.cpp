#include "toymc/engine/RunArguments.hpp"

#include "toymc/core/Errors.hpp"
#include "toymc/core/Logger.hpp"

#include <cmath>
#include <sstream>

namespace TOYMC {

namespace {

[[noreturn]] void BadArgument(const std::string &message) {
  throw ConfigurationError(message, ErrorCode::InvalidArgument);
}

int64_t ParseInteger(const std::string &option, const std::string &text) {
  size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &pos);
  } catch (const std::exception &) {
    BadArgument(option + " expects an integer, got '" + text + "'");
  }
  if (pos != text.size()) {
    BadArgument(option + " expects an integer, got '" + text + "'");
  }
  return static_cast<int64_t>(value);
}

double ParseReal(const std::string &option, const std::string &text) {
  size_t pos = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &pos);
  } catch (const std::exception &) {
    BadArgument(option + " expects a number, got '" + text + "'");
  }
  if (pos != text.size() || !std::isfinite(value)) {
    BadArgument(option + " expects a number, got '" + text + "'");
  }
  return value;
}

} // namespace

RunArguments RunArguments::Parse(const std::vector<std::string> &args) {
  RunArguments parsed;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    const auto next = [&]() -> const std::string & {
      if (i + 1 >= args.size()) {
        BadArgument("Option " + arg + " requires a value");
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      parsed.showHelp = true;
    } else if (arg == "-t" || arg == "--runtime") {
      const int64_t runtime = ParseInteger(arg, next());
      if (runtime < 0) {
        BadArgument("Runtime must not be negative, got " +
                    std::to_string(runtime));
      }
      parsed.runtimeS = runtime;
    } else if (arg == "-s" || arg == "--seed") {
      const int64_t seed = ParseInteger(arg, next());
      if (seed < 0) {
        BadArgument("Seed must not be negative, got " + std::to_string(seed));
      }
      parsed.seed = static_cast<uint64_t>(seed);
    } else if (arg == "--t0") {
      const double t0 = ParseReal(arg, next());
      if (t0 < 0.0) {
        BadArgument("Start time must not be negative");
      }
      parsed.t0S = t0;
    } else if (arg == "-c" || arg == "--config") {
      parsed.configPath = next();
    } else if (arg == "--reco-name") {
      parsed.recoName = next();
    } else if (arg == "--calib-name") {
      parsed.calibName = next();
    } else if (arg == "--log-level") {
      parsed.logLevel = next();
      ParseLogLevel(*parsed.logLevel);
    } else if (arg == "--dry-run") {
      parsed.dryRun = true;
    } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
      BadArgument("Unknown option " + arg);
    } else if (parsed.outputPath.empty()) {
      parsed.outputPath = arg;
    } else {
      BadArgument("Unexpected argument '" + arg + "'");
    }
  }

  if (parsed.showHelp) {
    return parsed;
  }
  if (!parsed.runtimeS && !parsed.configPath) {
    BadArgument("A runtime (-t/--runtime) is required");
  }
  if (parsed.outputPath.empty() && !parsed.configPath && !parsed.dryRun) {
    BadArgument("An output file is required");
  }
  return parsed;
}

RunArguments RunArguments::Parse(int argc, const char *const argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return Parse(args);
}

void RunArguments::ApplyTo(RunConfig &config) const {
  if (!outputPath.empty()) {
    config.output_path = outputPath;
  }
  if (runtimeS) {
    config.duration_s = static_cast<double>(*runtimeS);
  }
  if (seed) {
    config.seed = seed;
  }
  if (t0S) {
    config.t0_s = *t0S;
  }
  if (recoName) {
    config.reco_name = *recoName;
  }
  if (calibName) {
    config.calib_name = *calibName;
  }
  if (logLevel) {
    config.log_level = *logLevel;
  }
  if (config.output_path.empty() && !dryRun) {
    BadArgument("An output file is required");
  }
}

std::string RunArgumentsUsage(const std::string &program) {
  std::ostringstream oss;
  oss << "ToyMC - Synthetic Trigger Stream Generator\n\n";
  oss << "Usage: " << program << " <outfile> -t <seconds> [options]\n\n";
  oss << "Options:\n";
  oss << "  -t, --runtime <int>     Data-taking duration in seconds\n";
  oss << "  -s, --seed <int>        Random seed (default: system-derived)\n";
  oss << "  --t0 <seconds>          Start of data taking (default: 0)\n";
  oss << "  -c, --config <file>     JSON run configuration\n";
  oss << "  --reco-name <name>      Reco tree name (default: AdSimpleNL)\n";
  oss << "  --calib-name <name>     Calib tree name (default: CalibStats)\n";
  oss << "  --log-level <level>     debug, info, warning, error\n";
  oss << "  --dry-run               Generate without writing a file\n";
  oss << "  -h, --help              Show this help message\n\n";
  oss << "Example:\n";
  oss << "  " << program << " toymc.root -t 3600 -s 42\n";
  return oss.str();
}

} // namespace TOYMC
