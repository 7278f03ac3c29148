#include "toymc/generator/IEventType.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

namespace TOYMC {

std::string CountModelToString(CountModel model) {
  switch (model) {
  case CountModel::Poisson:
    return "poisson";
  case CountModel::Expected:
    return "expected";
  default:
    return "unknown";
  }
}

CountModel ParseCountModel(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "poisson") return CountModel::Poisson;
  if (lower == "expected") return CountModel::Expected;
  throw ConfigurationError("Unknown count model: '" + text + "'");
}

IEventType::IEventType(const std::string &name) : fName(name) {
  if (name.empty()) {
    throw ConfigurationError("Event type name must not be empty");
  }
}

uint64_t IEventType::ActualEventCount(RandomSource &rng, double duration_s,
                                      double rate_hz) const {
  const double expected = duration_s * rate_hz;
  if (fCountModel == CountModel::Expected) {
    return expected > 0.0 ? static_cast<uint64_t>(std::floor(expected)) : 0;
  }
  return rng.Poisson(expected);
}

std::string IEventType::LabelFor(const std::string &suffix) const {
  if (suffix.empty()) {
    return SanitizeLabel(fName);
  }
  return SanitizeLabel(fName + "_" + suffix);
}

TruthLabelEntry IEventType::MakeEntry(const std::optional<int64_t> &code,
                                      const std::string &label) const {
  if (!code) {
    throw ConfigurationError("Event type '" + fName +
                                 "': truth label code for '" + label +
                                 "' is not set",
                             ErrorCode::MissingTruthLabel);
  }
  if (*code < 0 || *code > std::numeric_limits<uint32_t>::max()) {
    std::ostringstream oss;
    oss << "Event type '" << fName << "': truth label code " << *code
        << " for '" << label << "' is out of range";
    throw ConfigurationError(oss.str(), ErrorCode::MissingTruthLabel);
  }
  return TruthLabelEntry{*code, label};
}

uint32_t IEventType::RequireCode(const std::optional<int64_t> &code,
                                 const std::string &label) const {
  return static_cast<uint32_t>(MakeEntry(code, label).code);
}

double IEventType::CheckFinite(double value, const char *quantity) const {
  if (!std::isfinite(value)) {
    std::ostringstream oss;
    oss << "Event type '" << fName << "': " << quantity
        << " spectrum returned non-finite value " << value;
    throw SamplingError(oss.str(), ErrorCode::NonFiniteSample);
  }
  return value;
}

std::vector<int64_t> IEventType::DrawTimestamps(RandomSource &rng,
                                                uint64_t count,
                                                double duration_s,
                                                double t0_s) const {
  if (count == 0) {
    return {};
  }
  const int64_t t0_ns = ToNanoseconds(t0_s);
  const int64_t duration_ns = ToNanoseconds(duration_s);
  return rng.UniformIntArray(t0_ns, t0_ns + duration_ns,
                             static_cast<size_t>(count));
}

void IEventType::FillADPlaceholders(Event &event, double energy) {
  event.energy = static_cast<float>(energy);
  event.charge = static_cast<float>(energy * kPEPerMeV);
  event.nHit = 192;
  event.fMax = 0.1f;
  event.fQuad = 0.1f;
  event.fPSD_t1 = 0.99f;
  event.fPSD_t2 = 0.99f;
  event.f2inch_maxQ = 0.0f;
}

void IEventType::CheckRate(const std::string &name, double rate_hz) {
  if (!std::isfinite(rate_hz) || rate_hz < 0.0) {
    std::ostringstream oss;
    oss << "Event type '" << name << "': rate must be finite and >= 0, got "
        << rate_hz;
    throw ConfigurationError(oss.str());
  }
}

int64_t IEventType::ToNanoseconds(double seconds) {
  return static_cast<int64_t>(std::llround(seconds * 1e9));
}

} // namespace TOYMC
