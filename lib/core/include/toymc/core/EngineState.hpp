#ifndef TOYMC_CORE_ENGINE_STATE_HPP
#define TOYMC_CORE_ENGINE_STATE_HPP

#include <cstdint>
#include <string>

namespace TOYMC {

/**
 * @brief Lifecycle of the generation engine
 *
 * State transitions:
 *   Configuring --Run()--> Run
 *
 * Run is terminal: a finished (or failed) engine cannot be run again.
 */
enum class EngineState : uint8_t {
  Configuring = 0, ///< Event types may be registered
  Run = 1          ///< Generation started; no further changes accepted
};

/**
 * @brief Convert EngineState to string for logging/debugging
 */
inline std::string EngineStateToString(EngineState state) {
  switch (state) {
  case EngineState::Configuring:
    return "Configuring";
  case EngineState::Run:
    return "Run";
  default:
    return "Unknown";
  }
}

} // namespace TOYMC

#endif // TOYMC_CORE_ENGINE_STATE_HPP
