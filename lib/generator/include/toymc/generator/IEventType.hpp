#ifndef TOYMC_GENERATOR_IEVENT_TYPE_HPP
#define TOYMC_GENERATOR_IEVENT_TYPE_HPP

#include "toymc/core/Event.hpp"
#include "toymc/core/TruthLabel.hpp"
#include "toymc/generator/RandomSource.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TOYMC {

/**
 * @brief How an event type turns a rate into a number of occurrences
 */
enum class CountModel : uint8_t {
  Poisson = 0,  ///< Poisson(duration * rate), the default
  Expected = 1  ///< floor(duration * rate), legacy deterministic count
};

std::string CountModelToString(CountModel model);

/// Parse "poisson" or "expected"
CountModel ParseCountModel(const std::string &text);

/**
 * @brief Interface for event generators
 *
 * An event type models one physical process. Each occurrence of the
 * process yields one or more Event records; every record carries the
 * truth-label code of the subtype that produced it.
 *
 * Contract for implementations:
 * - GenerateEvents() draws randomness only from the rng it is given and
 *   leaves global state untouched
 * - primary timestamps lie in [t0, t0 + duration); derived timestamps
 *   (delayed, secondary) may exceed the window
 * - Labels() lists every code the instance can emit
 */
class IEventType {
public:
  explicit IEventType(const std::string &name);
  virtual ~IEventType() = default;

  /**
   * @brief Generate the records of one data-taking window
   * @param rng The run's RandomSource
   * @param duration_s Window length (s)
   * @param t0_s Window start (s)
   * @return Records in emission order, not sorted by time
   */
  virtual std::vector<Event> GenerateEvents(RandomSource &rng,
                                            double duration_s,
                                            double t0_s) const = 0;

  /**
   * @brief Truth-label codes this instance can emit
   *
   * Throws ConfigurationError if a code was never assigned.
   */
  virtual std::vector<TruthLabelEntry> Labels() const = 0;

  /**
   * @brief Number of occurrences for a window
   *
   * Draws Poisson(duration_s * rate_hz) unless the count model was set to
   * Expected. Override to force a count.
   */
  virtual uint64_t ActualEventCount(RandomSource &rng, double duration_s,
                                    double rate_hz) const;

  /// Variant name, e.g. "Single"
  virtual std::string GetTypeName() const = 0;

  const std::string &GetName() const { return fName; }

  void SetCountModel(CountModel model) { fCountModel = model; }
  CountModel GetCountModel() const { return fCountModel; }

protected:
  /// SanitizeLabel(name) or SanitizeLabel(name + "_" + suffix)
  std::string LabelFor(const std::string &suffix = "") const;

  /// Entry for Labels(); throws ConfigurationError on an unset or negative code
  TruthLabelEntry MakeEntry(const std::optional<int64_t> &code,
                            const std::string &label) const;

  /// Code to stamp on records; same checks as MakeEntry()
  uint32_t RequireCode(const std::optional<int64_t> &code,
                       const std::string &label) const;

  /// Throws SamplingError if a strategy returned a non-finite value
  double CheckFinite(double value, const char *quantity) const;

  /// count timestamps uniform in [t0, t0 + duration) (ns)
  std::vector<int64_t> DrawTimestamps(RandomSource &rng, uint64_t count,
                                      double duration_s, double t0_s) const;

  /// Placeholder calibration values of a regular AD trigger
  static void FillADPlaceholders(Event &event, double energy);

  static void CheckRate(const std::string &name, double rate_hz);

  static int64_t ToNanoseconds(double seconds);

  static constexpr double kPEPerMeV = 170.0;

private:
  std::string fName;
  CountModel fCountModel = CountModel::Poisson;
};

} // namespace TOYMC

#endif // TOYMC_GENERATOR_IEVENT_TYPE_HPP
