#ifndef TOYMC_GENERATOR_RANDOM_SOURCE_HPP
#define TOYMC_GENERATOR_RANDOM_SOURCE_HPP

#include "toymc/core/Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace TOYMC {

/**
 * @brief The single random number generator of a run
 *
 * Every random draw of a run goes through one RandomSource, in a fixed
 * call order, so that a run is reproducible from its seed. Components
 * receive it by reference and must never create a generator of their own.
 * Copying is disabled so that the stream cannot be forked by accident.
 */
class RandomSource {
public:
  /**
   * @brief Constructor with optional seed
   * @param seed Random seed (unset = derive from std::random_device)
   */
  explicit RandomSource(std::optional<uint64_t> seed = std::nullopt);

  RandomSource(const RandomSource &) = delete;
  RandomSource &operator=(const RandomSource &) = delete;

  /// Seed actually used, so system-seeded runs can be repeated
  uint64_t GetSeed() const { return fSeed; }

  /// Real value uniform in [lo, hi)
  double Uniform(double lo, double hi);

  /// Integer uniform in [lo, hi)
  int64_t UniformInt(int64_t lo, int64_t hi);

  /// n integers uniform in [lo, hi)
  std::vector<int64_t> UniformIntArray(int64_t lo, int64_t hi, size_t n);

  /// Exponential draw with mean scale
  double Exponential(double scale);

  /// Poisson draw; a mean <= 0 returns 0 without drawing
  uint64_t Poisson(double mean);

  /// Uniform choice from a non-empty ordered set
  template <typename T> const T &Choice(const std::vector<T> &items) {
    if (items.empty()) {
      throw SamplingError("Choice() from an empty set",
                          ErrorCode::EmptySampleRange);
    }
    const auto index =
        UniformInt(0, static_cast<int64_t>(items.size()));
    return items[static_cast<size_t>(index)];
  }

private:
  uint64_t fSeed;
  std::mt19937_64 fEngine;
};

} // namespace TOYMC

#endif // TOYMC_GENERATOR_RANDOM_SOURCE_HPP
