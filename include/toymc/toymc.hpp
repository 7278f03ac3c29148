#ifndef TOYMC_HPP
#define TOYMC_HPP

/**
 * @file toymc.hpp
 * @brief Main umbrella header for the ToyMC library
 *
 * This header provides access to all ToyMC components:
 * - Core records, errors, logging and the truth-label registry
 * - Event generators and sampling strategies
 * - Output sinks
 * - The generation engine and its configuration
 *
 * Usage:
 *   #include <toymc/toymc.hpp>
 */

// ============================================================================
// CORE LIBRARY HEADERS
// ============================================================================

#include "toymc/core/EngineState.hpp"
#include "toymc/core/ErrorCode.hpp"
#include "toymc/core/Errors.hpp"
#include "toymc/core/Event.hpp"
#include "toymc/core/Logger.hpp"
#include "toymc/core/RunConfig.hpp"
#include "toymc/core/TruthLabel.hpp"
#include "toymc/core/TruthLabelRegistry.hpp"

// ============================================================================
// GENERATOR LIBRARY HEADERS
// ============================================================================

#include "toymc/generator/Correlated.hpp"
#include "toymc/generator/IEventType.hpp"
#include "toymc/generator/Muon.hpp"
#include "toymc/generator/RandomSource.hpp"
#include "toymc/generator/Single.hpp"
#include "toymc/generator/Spectrum.hpp"

// ============================================================================
// OUTPUT LIBRARY HEADERS
// ============================================================================

#include "toymc/output/ISink.hpp"
#include "toymc/output/MemorySink.hpp"
#include "toymc/output/RootSink.hpp"

// ============================================================================
// ENGINE LIBRARY HEADERS
// ============================================================================

#include "toymc/engine/ConfigLoader.hpp"
#include "toymc/engine/Engine.hpp"
#include "toymc/engine/RunArguments.hpp"

#endif // TOYMC_HPP
