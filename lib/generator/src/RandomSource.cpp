#include "toymc/generator/RandomSource.hpp"

#include <cmath>
#include <sstream>

namespace TOYMC {

namespace {

uint64_t DeriveSeed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

RandomSource::RandomSource(std::optional<uint64_t> seed)
    : fSeed(seed ? *seed : DeriveSeed()), fEngine(fSeed) {}

double RandomSource::Uniform(double lo, double hi) {
  if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi)) {
    std::ostringstream oss;
    oss << "Uniform() needs finite lo < hi, got [" << lo << ", " << hi << ")";
    throw SamplingError(oss.str(), ErrorCode::EmptySampleRange);
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(fEngine);
}

int64_t RandomSource::UniformInt(int64_t lo, int64_t hi) {
  if (hi <= lo) {
    std::ostringstream oss;
    oss << "UniformInt() needs lo < hi, got [" << lo << ", " << hi << ")";
    throw SamplingError(oss.str(), ErrorCode::EmptySampleRange);
  }
  std::uniform_int_distribution<int64_t> dist(lo, hi - 1);
  return dist(fEngine);
}

std::vector<int64_t> RandomSource::UniformIntArray(int64_t lo, int64_t hi,
                                                   size_t n) {
  std::vector<int64_t> values;
  values.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    values.push_back(UniformInt(lo, hi));
  }
  return values;
}

double RandomSource::Exponential(double scale) {
  if (!std::isfinite(scale) || scale <= 0.0) {
    std::ostringstream oss;
    oss << "Exponential() needs a positive finite scale, got " << scale;
    throw SamplingError(oss.str(), ErrorCode::EmptySampleRange);
  }
  std::exponential_distribution<double> dist(1.0 / scale);
  return dist(fEngine);
}

uint64_t RandomSource::Poisson(double mean) {
  if (!std::isfinite(mean)) {
    throw SamplingError("Poisson() needs a finite mean",
                        ErrorCode::NonFiniteSample);
  }
  if (mean <= 0.0) {
    return 0;
  }
  std::poisson_distribution<uint64_t> dist(mean);
  return dist(fEngine);
}

} // namespace TOYMC
