#ifndef TOYMC_ENGINE_ENGINE_HPP
#define TOYMC_ENGINE_ENGINE_HPP

#include "toymc/core/EngineState.hpp"
#include "toymc/core/Logger.hpp"
#include "toymc/core/TruthLabelRegistry.hpp"
#include "toymc/generator/IEventType.hpp"
#include "toymc/generator/RandomSource.hpp"
#include "toymc/output/ISink.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TOYMC {

/**
 * @brief What a finished run produced
 */
struct RunSummary {
  uint64_t seed = 0;
  std::string destination;
  uint64_t totalEvents = 0;
  size_t labelCount = 0;
  /// Records per event type, in registration order
  std::vector<std::pair<std::string, uint64_t>> eventsPerType;
};

/**
 * @brief Drives one generation run
 *
 * Run() performs, synchronously:
 * 1. GenerateEvents() on every event type in registration order, all
 *    drawing from the engine's single RandomSource
 * 2. stable sort by timestamp (ties keep generation order)
 * 3. trigger numbering per (site, detector), unless disabled
 * 4. truth-label registry build and validation
 * 5. handoff to the sink: Open, WriteLookup, Write/WriteTruth per record,
 *    Finalize
 *
 * Any error in steps 1-4 is thrown before the sink is opened.
 *
 * State transitions:
 *   Configuring --Run()--> Run
 */
class Engine {
public:
  /**
   * @brief Constructor
   * @param duration_s Data-taking duration (s)
   * @param t0_s Start of data taking (s)
   * @param seed Random seed (unset = system-derived)
   */
  explicit Engine(double duration_s, double t0_s = 0.0,
                  std::optional<uint64_t> seed = std::nullopt);

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  /// Register an event type; only allowed while Configuring
  void AddEventType(std::unique_ptr<IEventType> eventType);

  /// Register and return a reference for further configuration
  template <typename T, typename... Args> T &EmplaceEventType(Args &&...args) {
    auto eventType = std::make_unique<T>(std::forward<Args>(args)...);
    T &ref = *eventType;
    AddEventType(std::move(eventType));
    return ref;
  }

  void SetAssignTriggerNumbers(bool enable) { fAssignTriggerNumbers = enable; }
  bool GetAssignTriggerNumbers() const { return fAssignTriggerNumbers; }

  /**
   * @brief Generate, merge, validate and write the run
   * @param sink Output sink
   * @param destination Passed to sink.Open()
   */
  RunSummary Run(ISink &sink, const std::string &destination);

  EngineState GetState() const { return fState; }
  uint64_t GetSeed() const { return fRandom.GetSeed(); }
  double GetDuration() const { return fDurationS; }
  double GetT0() const { return fT0S; }
  size_t GetEventTypeCount() const { return fEventTypes.size(); }

private:
  void Preflight() const;
  std::vector<Event> GenerateAll(RunSummary &summary);
  void AssignTriggerNumbers(std::vector<Event> &events) const;
  TruthLabelRegistry BuildRegistry() const;

  double fDurationS;
  double fT0S;
  RandomSource fRandom;
  std::vector<std::unique_ptr<IEventType>> fEventTypes;
  bool fAssignTriggerNumbers = true;
  EngineState fState = EngineState::Configuring;

  std::shared_ptr<Logger> fLogger;
};

} // namespace TOYMC

#endif // TOYMC_ENGINE_ENGINE_HPP
