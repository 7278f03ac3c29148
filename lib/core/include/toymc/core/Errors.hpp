#ifndef TOYMC_CORE_ERRORS_HPP
#define TOYMC_CORE_ERRORS_HPP

#include "ErrorCode.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace TOYMC {

/**
 * @brief Base class of all errors raised while configuring or running
 *
 * Every error aborts the run before the sink is finalized. Nothing is
 * retried: generation is deterministic for a given seed.
 */
class ToyMCError : public std::runtime_error {
public:
  ToyMCError(ErrorCode code, const std::string &message);

  ErrorCode GetCode() const { return fCode; }

  /// Error kind name, e.g. "ConfigurationError"
  virtual std::string GetKind() const { return "ToyMCError"; }

private:
  ErrorCode fCode;
};

/**
 * @brief Invalid construction parameters or run arguments
 *
 * Raised at EventType construction, Engine pre-flight, config loading and
 * command line parsing.
 */
class ConfigurationError : public ToyMCError {
public:
  explicit ConfigurationError(const std::string &message,
                              ErrorCode code = ErrorCode::InvalidConfiguration);

  std::string GetKind() const override { return "ConfigurationError"; }
};

/**
 * @brief Consistency check failed on assembled run data
 */
class ValidationError : public ToyMCError {
public:
  ValidationError(ErrorCode code, const std::string &message);

  std::string GetKind() const override { return "ValidationError"; }
};

/**
 * @brief Invalid or duplicate truth-label code or label
 *
 * Carries the offending event type's name, the label text and the
 * supplied code.
 */
class InvalidLookupError : public ValidationError {
public:
  InvalidLookupError(const std::string &obj_name, const std::string &label_name,
                     int64_t supplied_number,
                     ErrorCode code = ErrorCode::InvalidLookupCode);

  std::string GetKind() const override { return "InvalidLookupError"; }

  const std::string &GetObjectName() const { return fObjectName; }
  const std::string &GetLabelName() const { return fLabelName; }
  int64_t GetSuppliedNumber() const { return fSuppliedNumber; }

private:
  std::string fObjectName;
  std::string fLabelName;
  int64_t fSuppliedNumber;
};

/**
 * @brief A spectrum or volume function produced an out-of-domain value
 */
class SamplingError : public ToyMCError {
public:
  explicit SamplingError(const std::string &message,
                         ErrorCode code = ErrorCode::NonFiniteSample);

  std::string GetKind() const override { return "SamplingError"; }
};

} // namespace TOYMC

#endif // TOYMC_CORE_ERRORS_HPP
