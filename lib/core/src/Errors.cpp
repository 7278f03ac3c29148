#include "toymc/core/Errors.hpp"

#include <sstream>

namespace TOYMC {

namespace {

std::string FormatLookupMessage(const std::string &obj_name,
                                const std::string &label_name,
                                int64_t supplied_number) {
  std::ostringstream oss;
  oss << "InvalidLookupError(obj_name='" << obj_name << "', label_name='"
      << label_name << "', supplied_number=" << supplied_number << ")";
  return oss.str();
}

} // namespace

ToyMCError::ToyMCError(ErrorCode code, const std::string &message)
    : std::runtime_error(message), fCode(code) {}

ConfigurationError::ConfigurationError(const std::string &message,
                                       ErrorCode code)
    : ToyMCError(code, message) {}

ValidationError::ValidationError(ErrorCode code, const std::string &message)
    : ToyMCError(code, message) {}

InvalidLookupError::InvalidLookupError(const std::string &obj_name,
                                       const std::string &label_name,
                                       int64_t supplied_number, ErrorCode code)
    : ValidationError(code,
                      FormatLookupMessage(obj_name, label_name, supplied_number)),
      fObjectName(obj_name), fLabelName(label_name),
      fSuppliedNumber(supplied_number) {}

SamplingError::SamplingError(const std::string &message, ErrorCode code)
    : ToyMCError(code, message) {}

} // namespace TOYMC
