/**
 * @file test_random_source.cpp
 * @brief Unit tests for RandomSource
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "toymc/generator/RandomSource.hpp"

using namespace TOYMC;

TEST(RandomSourceTest, ExplicitSeedIsReported) {
  RandomSource rng(1234);
  EXPECT_EQ(rng.GetSeed(), 1234u);
}

TEST(RandomSourceTest, SameSeedGivesSameSequence) {
  RandomSource a(42);
  RandomSource b(42);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(a.Uniform(0.0, 1.0), b.Uniform(0.0, 1.0));
    EXPECT_EQ(a.UniformInt(0, 1000), b.UniformInt(0, 1000));
    EXPECT_EQ(a.Exponential(50.0), b.Exponential(50.0));
    EXPECT_EQ(a.Poisson(20.0), b.Poisson(20.0));
  }
}

TEST(RandomSourceTest, SystemSeedCanBeReplayed) {
  RandomSource original;
  RandomSource replay(original.GetSeed());
  EXPECT_EQ(original.UniformInt(0, 1000000), replay.UniformInt(0, 1000000));
}

TEST(RandomSourceTest, UniformStaysInHalfOpenRange) {
  RandomSource rng(7);
  for (int i = 0; i < 10000; ++i) {
    const double value = rng.Uniform(1.0, 3.5);
    EXPECT_GE(value, 1.0);
    EXPECT_LT(value, 3.5);
  }
}

TEST(RandomSourceTest, UniformIntExcludesUpperBound) {
  RandomSource rng(7);
  bool sawLow = false;
  for (int i = 0; i < 1000; ++i) {
    const int64_t value = rng.UniformInt(5, 8);
    EXPECT_GE(value, 5);
    EXPECT_LT(value, 8);
    sawLow = sawLow || value == 5;
  }
  EXPECT_TRUE(sawLow);
}

TEST(RandomSourceTest, UniformIntArrayMatchesSingleDraws) {
  RandomSource a(99);
  RandomSource b(99);
  const auto values = a.UniformIntArray(0, 1000000000, 16);
  ASSERT_EQ(values.size(), 16u);
  for (const auto value : values) {
    EXPECT_EQ(value, b.UniformInt(0, 1000000000));
  }
}

TEST(RandomSourceTest, ExponentialMeanMatchesScale) {
  RandomSource rng(11);
  const int n = 100000;
  double sum = 0.0;
  for (int i = 0; i < n; ++i) {
    const double value = rng.Exponential(28000.0);
    ASSERT_GT(value, 0.0);
    sum += value;
  }
  EXPECT_NEAR(sum / n, 28000.0, 28000.0 * 0.02);
}

TEST(RandomSourceTest, PoissonOfNonPositiveMeanIsZeroWithoutDrawing) {
  RandomSource a(5);
  RandomSource b(5);
  EXPECT_EQ(a.Poisson(0.0), 0u);
  EXPECT_EQ(a.Poisson(-3.0), 0u);
  EXPECT_EQ(a.UniformInt(0, 1000000), b.UniformInt(0, 1000000));
}

TEST(RandomSourceTest, ChoicePicksFromSet) {
  RandomSource rng(3);
  const std::vector<int> detectors{1, 2, 3, 4};
  std::vector<int> seen(5, 0);
  for (int i = 0; i < 1000; ++i) {
    const int detector = rng.Choice(detectors);
    ASSERT_GE(detector, 1);
    ASSERT_LE(detector, 4);
    ++seen[detector];
  }
  for (int detector = 1; detector <= 4; ++detector) {
    EXPECT_GT(seen[detector], 0);
  }
}

TEST(RandomSourceTest, InvalidParametersThrow) {
  RandomSource rng(1);
  EXPECT_THROW(rng.Uniform(2.0, 1.0), SamplingError);
  EXPECT_THROW(rng.Uniform(0.0, std::numeric_limits<double>::infinity()),
               SamplingError);
  EXPECT_THROW(rng.UniformInt(3, 3), SamplingError);
  EXPECT_THROW(rng.Exponential(0.0), SamplingError);
  EXPECT_THROW(rng.Poisson(std::nan("")), SamplingError);
  EXPECT_THROW(rng.Choice(std::vector<int>{}), SamplingError);
}
