/**
 * @file test_errors.cpp
 * @brief Unit tests for the error hierarchy
 */

#include <gtest/gtest.h>

#include <string>

#include "toymc/core/Errors.hpp"

using namespace TOYMC;

TEST(ErrorsTest, ConfigurationErrorDefaultsToInvalidConfiguration) {
  ConfigurationError error("bad rate");
  EXPECT_EQ(error.GetCode(), ErrorCode::InvalidConfiguration);
  EXPECT_EQ(error.GetKind(), "ConfigurationError");
  EXPECT_STREQ(error.what(), "bad rate");
}

TEST(ErrorsTest, ConfigurationErrorKeepsExplicitCode) {
  ConfigurationError error("site 3", ErrorCode::UnknownSite);
  EXPECT_EQ(error.GetCode(), ErrorCode::UnknownSite);
}

TEST(ErrorsTest, InvalidLookupErrorCarriesContext) {
  InvalidLookupError error("IBD nGd", "IBD_nGd_prompt", -1);

  EXPECT_EQ(error.GetObjectName(), "IBD nGd");
  EXPECT_EQ(error.GetLabelName(), "IBD_nGd_prompt");
  EXPECT_EQ(error.GetSuppliedNumber(), -1);
  EXPECT_EQ(error.GetCode(), ErrorCode::InvalidLookupCode);
  EXPECT_EQ(error.GetKind(), "InvalidLookupError");
  EXPECT_EQ(std::string(error.what()),
            "InvalidLookupError(obj_name='IBD nGd', "
            "label_name='IBD_nGd_prompt', supplied_number=-1)");
}

TEST(ErrorsTest, InvalidLookupErrorIsAValidationError) {
  try {
    throw InvalidLookupError("Muon", "Muon_AD", 6,
                             ErrorCode::DuplicateLookupCode);
  } catch (const ValidationError &e) {
    EXPECT_EQ(e.GetCode(), ErrorCode::DuplicateLookupCode);
    return;
  }
  FAIL() << "InvalidLookupError was not caught as ValidationError";
}

TEST(ErrorsTest, AllKindsDeriveFromRuntimeError) {
  EXPECT_THROW(throw SamplingError("nan energy"), std::runtime_error);
  EXPECT_THROW(throw ConfigurationError("x"), ToyMCError);
  EXPECT_THROW(throw ValidationError(ErrorCode::Unknown, "x"), ToyMCError);
}

TEST(ErrorsTest, SamplingErrorDefaultsToNonFiniteSample) {
  SamplingError error("energy is NaN");
  EXPECT_EQ(error.GetCode(), ErrorCode::NonFiniteSample);
  EXPECT_EQ(error.GetKind(), "SamplingError");
}

TEST(ErrorsTest, ErrorCodeToStringNamesCodes) {
  EXPECT_EQ(ErrorCodeToString(ErrorCode::UnknownSite), "UnknownSite");
  EXPECT_EQ(ErrorCodeToString(ErrorCode::DuplicateLookupLabel),
            "DuplicateLookupLabel");
  EXPECT_EQ(ErrorCodeToString(ErrorCode::OutputOpenFailed),
            "OutputOpenFailed");
}
