#include "toymc/engine/Engine.hpp"

#include "toymc/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>

namespace TOYMC {

Engine::Engine(double duration_s, double t0_s, std::optional<uint64_t> seed)
    : fDurationS(duration_s), fT0S(t0_s), fRandom(seed),
      fLogger(Logger::GetLogger("Engine")) {}

void Engine::AddEventType(std::unique_ptr<IEventType> eventType) {
  if (fState != EngineState::Configuring) {
    throw ConfigurationError("Cannot register event types in state " +
                                 EngineStateToString(fState),
                             ErrorCode::InvalidStateTransition);
  }
  if (!eventType) {
    throw ConfigurationError("Cannot register a null event type");
  }
  fLogger->Debug("Registered " + eventType->GetTypeName() + " '" +
                 eventType->GetName() + "'");
  fEventTypes.push_back(std::move(eventType));
}

RunSummary Engine::Run(ISink &sink, const std::string &destination) {
  if (fState != EngineState::Configuring) {
    throw ConfigurationError("Run() called in state " +
                                 EngineStateToString(fState),
                             ErrorCode::InvalidStateTransition);
  }
  fState = EngineState::Run;

  Preflight();

  RunSummary summary;
  summary.seed = fRandom.GetSeed();
  summary.destination = destination;

  {
    std::ostringstream oss;
    oss << "Starting run: duration " << fDurationS << " s, t0 " << fT0S
        << " s, seed " << summary.seed << ", " << fEventTypes.size()
        << " event types";
    fLogger->Info(oss.str());
  }

  auto events = GenerateAll(summary);

  std::stable_sort(events.begin(), events.end(),
                   [](const Event &a, const Event &b) {
                     return a.timeStampNs < b.timeStampNs;
                   });
  fLogger->Info("Sorted " + std::to_string(events.size()) + " events");

  if (fAssignTriggerNumbers) {
    AssignTriggerNumbers(events);
  }

  const auto registry = BuildRegistry();
  summary.labelCount = registry.Size();
  fLogger->Info("Truth-label registry holds " +
                std::to_string(registry.Size()) + " labels");

  sink.Open(destination);
  sink.WriteLookup(registry);
  for (const auto &event : events) {
    sink.Write(event);
    sink.WriteTruth(event.truthIndex);
  }
  sink.Finalize();

  summary.totalEvents = events.size();
  fLogger->Info("Finalized " + destination + " with " +
                std::to_string(summary.totalEvents) + " events");
  return summary;
}

void Engine::Preflight() const {
  if (!std::isfinite(fDurationS) || fDurationS < 0.0) {
    std::ostringstream oss;
    oss << "Duration must be finite and >= 0, got " << fDurationS;
    throw ConfigurationError(oss.str(), ErrorCode::InvalidArgument);
  }
  if (!std::isfinite(fT0S) || fT0S < 0.0) {
    std::ostringstream oss;
    oss << "Start time must be finite and >= 0, got " << fT0S;
    throw ConfigurationError(oss.str(), ErrorCode::InvalidArgument);
  }
}

std::vector<Event> Engine::GenerateAll(RunSummary &summary) {
  std::vector<Event> events;
  for (const auto &eventType : fEventTypes) {
    auto generated = eventType->GenerateEvents(fRandom, fDurationS, fT0S);
    fLogger->Info(eventType->GetTypeName() + " '" + eventType->GetName() +
                  "' generated " + std::to_string(generated.size()) +
                  " events");
    summary.eventsPerType.emplace_back(eventType->GetName(),
                                       generated.size());
    events.insert(events.end(), generated.begin(), generated.end());
  }
  return events;
}

void Engine::AssignTriggerNumbers(std::vector<Event> &events) const {
  std::map<std::pair<int32_t, int32_t>, int32_t> counters;
  for (auto &event : events) {
    const int32_t number = ++counters[{event.site, event.detector}];
    event = event.WithTriggerNumber(number);
  }
}

TruthLabelRegistry Engine::BuildRegistry() const {
  TruthLabelRegistry registry;
  for (const auto &eventType : fEventTypes) {
    for (const auto &entry : eventType->Labels()) {
      registry.Add(eventType->GetName(), entry);
    }
  }
  return registry;
}

} // namespace TOYMC
