#ifndef TOYMC_GENERATOR_SPECTRUM_HPP
#define TOYMC_GENERATOR_SPECTRUM_HPP

#include "toymc/generator/RandomSource.hpp"

#include <cstdint>
#include <functional>

namespace TOYMC {

/// Position inside the detector (mm), origin at the detector center
struct Position {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

/**
 * @brief Pluggable sampling strategies
 *
 * A spectrum function draws one physical quantity using the run's
 * RandomSource and nothing else. Event types hold one strategy per
 * quantity, set at construction to a default and replaceable with a setter.
 */
using EnergySpectrum = std::function<double(RandomSource &)>;
using IntegerSpectrum = std::function<int32_t(RandomSource &)>;
using VolumeSampler = std::function<Position(RandomSource &)>;
using CorrelatedVolumeSampler =
    std::function<Position(RandomSource &, const Position &)>;

namespace Spectra {

/// Maximum number of rejected draws before a sampler gives up
constexpr int64_t kMaxRejectionAttempts = 1000000;

/// Real value uniform in [lo, hi)
EnergySpectrum Uniform(double lo, double hi);

/// Always returns value; consumes no randomness
EnergySpectrum Fixed(double value);

/// Integer uniform in [lo, hi], both ends included
IntegerSpectrum UniformInteger(int32_t lo, int32_t hi);

/// Integer spectrum returning value; consumes no randomness
IntegerSpectrum FixedInteger(int32_t value);

/**
 * @brief Uniform position inside an upright cylinder
 * @param radius Cylinder radius (mm)
 * @param height Cylinder height (mm), centered on z = 0
 *
 * (x, y) is drawn uniformly in the bounding square and redrawn until
 * hypot(x, y) <= radius; z is then drawn uniformly in
 * [-height/2, height/2).
 */
VolumeSampler UniformCylinder(double radius, double height);

/**
 * @brief Position displaced from a reference point
 * @param radius Radial boundary (mm)
 * @param distance Mean displacement per axis (mm)
 *
 * Each axis is shifted by an independent Exponential(distance) draw,
 * always in the positive direction. The whole displacement is redrawn
 * while the result lies radially outside the boundary. A reference point
 * already outside the boundary raises SamplingError.
 */
CorrelatedVolumeSampler CorrelatedExponentialCylinder(double radius,
                                                      double distance);

} // namespace Spectra
} // namespace TOYMC

#endif // TOYMC_GENERATOR_SPECTRUM_HPP
