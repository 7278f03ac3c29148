#include "toymc/generator/Spectrum.hpp"

#include <cmath>
#include <sstream>

namespace TOYMC {
namespace Spectra {

EnergySpectrum Uniform(double lo, double hi) {
  return [lo, hi](RandomSource &rng) { return rng.Uniform(lo, hi); };
}

EnergySpectrum Fixed(double value) {
  return [value](RandomSource &) { return value; };
}

IntegerSpectrum UniformInteger(int32_t lo, int32_t hi) {
  return [lo, hi](RandomSource &rng) {
    return static_cast<int32_t>(
        rng.UniformInt(lo, static_cast<int64_t>(hi) + 1));
  };
}

IntegerSpectrum FixedInteger(int32_t value) {
  return [value](RandomSource &) { return value; };
}

VolumeSampler UniformCylinder(double radius, double height) {
  if (!(radius > 0.0) || !(height > 0.0)) {
    std::ostringstream oss;
    oss << "Cylinder needs positive radius and height, got R=" << radius
        << " H=" << height;
    throw ConfigurationError(oss.str());
  }

  return [radius, height](RandomSource &rng) {
    Position pos;
    // Start outside so the loop draws at least once
    pos.x = 2.0 * radius;
    pos.y = 2.0 * radius;
    int64_t attempts = 0;
    while (std::hypot(pos.x, pos.y) > radius) {
      if (++attempts > kMaxRejectionAttempts) {
        throw SamplingError("Cylinder rejection sampling did not converge",
                            ErrorCode::RejectionLimitReached);
      }
      pos.x = rng.Uniform(-radius, radius);
      pos.y = rng.Uniform(-radius, radius);
    }
    pos.z = rng.Uniform(-height / 2.0, height / 2.0);
    return pos;
  };
}

CorrelatedVolumeSampler CorrelatedExponentialCylinder(double radius,
                                                      double distance) {
  if (!(radius > 0.0) || !(distance > 0.0)) {
    std::ostringstream oss;
    oss << "Correlated cylinder needs positive radius and distance, got R="
        << radius << " d=" << distance;
    throw ConfigurationError(oss.str());
  }

  return [radius, distance](RandomSource &rng, const Position &reference) {
    if (std::hypot(reference.x, reference.y) > radius) {
      std::ostringstream oss;
      oss << "Reference position (" << reference.x << ", " << reference.y
          << ") lies outside radius " << radius;
      throw SamplingError(oss.str(), ErrorCode::PositionOutOfVolume);
    }

    Position pos;
    int64_t attempts = 0;
    do {
      if (++attempts > kMaxRejectionAttempts) {
        throw SamplingError(
            "Correlated position rejection sampling did not converge",
            ErrorCode::RejectionLimitReached);
      }
      pos.x = reference.x + rng.Exponential(distance);
      pos.y = reference.y + rng.Exponential(distance);
      pos.z = reference.z + rng.Exponential(distance);
    } while (std::hypot(pos.x, pos.y) > radius);
    return pos;
  };
}

} // namespace Spectra
} // namespace TOYMC
