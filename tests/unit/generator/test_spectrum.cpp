/**
 * @file test_spectrum.cpp
 * @brief Unit tests for the sampling strategies
 */

#include <gtest/gtest.h>

#include <cmath>

#include "toymc/generator/Spectrum.hpp"

using namespace TOYMC;

class SpectrumTest : public ::testing::Test {
protected:
  RandomSource rng_{2024};
};

TEST_F(SpectrumTest, UniformEnergyStaysInRange) {
  auto spectrum = Spectra::Uniform(7.0, 9.0);
  for (int i = 0; i < 1000; ++i) {
    const double energy = spectrum(rng_);
    EXPECT_GE(energy, 7.0);
    EXPECT_LT(energy, 9.0);
  }
}

TEST_F(SpectrumTest, FixedConsumesNoRandomness) {
  RandomSource reference(2024);
  auto spectrum = Spectra::Fixed(2.2);
  EXPECT_DOUBLE_EQ(spectrum(rng_), 2.2);
  EXPECT_EQ(rng_.UniformInt(0, 1000000), reference.UniformInt(0, 1000000));
}

TEST_F(SpectrumTest, UniformIntegerIncludesBothEnds) {
  auto spectrum = Spectra::UniformInteger(15, 17);
  bool sawLow = false;
  bool sawHigh = false;
  for (int i = 0; i < 1000; ++i) {
    const int32_t nHit = spectrum(rng_);
    ASSERT_GE(nHit, 15);
    ASSERT_LE(nHit, 17);
    sawLow = sawLow || nHit == 15;
    sawHigh = sawHigh || nHit == 17;
  }
  EXPECT_TRUE(sawLow);
  EXPECT_TRUE(sawHigh);
}

TEST_F(SpectrumTest, CylinderSamplesLieInsideRadius) {
  const double radius = 2000.0;
  const double height = 4000.0;
  auto sampler = Spectra::UniformCylinder(radius, height);
  for (int i = 0; i < 10000; ++i) {
    const Position pos = sampler(rng_);
    ASSERT_LE(std::hypot(pos.x, pos.y), radius);
    ASSERT_GE(pos.z, -height / 2.0);
    ASSERT_LE(pos.z, height / 2.0);
  }
}

TEST_F(SpectrumTest, CylinderRejectsNonPositiveDimensions) {
  EXPECT_THROW(Spectra::UniformCylinder(0.0, 100.0), ConfigurationError);
  EXPECT_THROW(Spectra::UniformCylinder(100.0, -1.0), ConfigurationError);
}

TEST_F(SpectrumTest, CorrelatedDisplacementIsPositiveAndBounded) {
  const double radius = 1500.0;
  auto sampler = Spectra::CorrelatedExponentialCylinder(radius, 50.0);
  const Position prompt{-100.0, 200.0, 10.0};
  for (int i = 0; i < 1000; ++i) {
    const Position delayed = sampler(rng_, prompt);
    EXPECT_GT(delayed.x, prompt.x);
    EXPECT_GT(delayed.y, prompt.y);
    EXPECT_GT(delayed.z, prompt.z);
    EXPECT_LE(std::hypot(delayed.x, delayed.y), radius);
  }
}

TEST_F(SpectrumTest, CorrelatedMeanDisplacementMatchesDistance) {
  auto sampler = Spectra::CorrelatedExponentialCylinder(1.0e6, 100.0);
  const Position origin{};
  const int n = 20000;
  double sumZ = 0.0;
  for (int i = 0; i < n; ++i) {
    sumZ += sampler(rng_, origin).z;
  }
  EXPECT_NEAR(sumZ / n, 100.0, 5.0);
}

TEST_F(SpectrumTest, CorrelatedReferenceOutsideBoundaryThrows) {
  auto sampler = Spectra::CorrelatedExponentialCylinder(1500.0, 50.0);
  try {
    sampler(rng_, Position{1600.0, 0.0, 0.0});
    FAIL() << "Expected SamplingError";
  } catch (const SamplingError &e) {
    EXPECT_EQ(e.GetCode(), ErrorCode::PositionOutOfVolume);
  }
}
