#ifndef TOYMC_CORE_ERROR_CODE_HPP
#define TOYMC_CORE_ERROR_CODE_HPP

#include <cstdint>
#include <string>

namespace TOYMC {

/**
 * @brief Error codes carried by every ToyMC exception
 */
enum class ErrorCode : uint16_t {
  Success = 0,

  // Configuration errors (100-199)
  InvalidConfiguration = 100,
  ConfigurationNotFound = 101,
  ConfigurationValidationFailed = 102,
  UnknownSite = 103,
  MissingTruthLabel = 104,
  InvalidArgument = 105,

  // State errors (200-299)
  InvalidStateTransition = 200,
  SinkNotOpen = 201,

  // Validation errors (300-399)
  InvalidLookupCode = 300,
  DuplicateLookupCode = 301,
  DuplicateLookupLabel = 302,
  InvalidLookupLabel = 303,

  // Sampling errors (400-499)
  NonFiniteSample = 400,
  EmptySampleRange = 401,
  RejectionLimitReached = 402,
  PositionOutOfVolume = 403,

  // Output errors (500-599)
  OutputOpenFailed = 500,
  OutputWriteFailed = 501,

  // Unknown error
  Unknown = 999
};

/**
 * @brief Convert ErrorCode to string for logging/debugging
 */
inline std::string ErrorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::InvalidConfiguration:
    return "InvalidConfiguration";
  case ErrorCode::ConfigurationNotFound:
    return "ConfigurationNotFound";
  case ErrorCode::ConfigurationValidationFailed:
    return "ConfigurationValidationFailed";
  case ErrorCode::UnknownSite:
    return "UnknownSite";
  case ErrorCode::MissingTruthLabel:
    return "MissingTruthLabel";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidStateTransition:
    return "InvalidStateTransition";
  case ErrorCode::SinkNotOpen:
    return "SinkNotOpen";
  case ErrorCode::InvalidLookupCode:
    return "InvalidLookupCode";
  case ErrorCode::DuplicateLookupCode:
    return "DuplicateLookupCode";
  case ErrorCode::DuplicateLookupLabel:
    return "DuplicateLookupLabel";
  case ErrorCode::InvalidLookupLabel:
    return "InvalidLookupLabel";
  case ErrorCode::NonFiniteSample:
    return "NonFiniteSample";
  case ErrorCode::EmptySampleRange:
    return "EmptySampleRange";
  case ErrorCode::RejectionLimitReached:
    return "RejectionLimitReached";
  case ErrorCode::PositionOutOfVolume:
    return "PositionOutOfVolume";
  case ErrorCode::OutputOpenFailed:
    return "OutputOpenFailed";
  case ErrorCode::OutputWriteFailed:
    return "OutputWriteFailed";
  case ErrorCode::Unknown:
  default:
    return "Unknown";
  }
}

} // namespace TOYMC

#endif // TOYMC_CORE_ERROR_CODE_HPP
