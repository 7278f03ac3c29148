/**
 * @file test_single.cpp
 * @brief Unit tests for the Single event type
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "toymc/generator/Single.hpp"

using namespace TOYMC;

class SingleTest : public ::testing::Test {
protected:
  void SetUp() override {
    single_ = std::make_unique<Single>("Single event", 20.0, 1, 1);
    single_->SetTruthLabel(0);
  }

  std::unique_ptr<Single> single_;
  RandomSource rng_{42};
};

// === Construction ===

TEST_F(SingleTest, DefaultsFromConstructor) {
  EXPECT_EQ(single_->GetName(), "Single event");
  EXPECT_EQ(single_->GetTypeName(), "Single");
  EXPECT_DOUBLE_EQ(single_->GetRate(), 20.0);
  EXPECT_EQ(single_->GetTriggerType(), Event::kDefaultTriggerType);
  EXPECT_EQ(single_->GetCountModel(), CountModel::Poisson);
}

TEST_F(SingleTest, NegativeRateIsRejected) {
  EXPECT_THROW(Single("bad", -1.0, 1, 1), ConfigurationError);
}

TEST_F(SingleTest, EmptyNameIsRejected) {
  EXPECT_THROW(Single("", 1.0, 1, 1), ConfigurationError);
}

// === Labels ===

TEST_F(SingleTest, LabelIsSanitizedName) {
  const auto labels = single_->Labels();
  ASSERT_EQ(labels.size(), 1u);
  EXPECT_EQ(labels[0].code, 0);
  EXPECT_EQ(labels[0].label, "Single_event");
}

TEST_F(SingleTest, UnsetLabelFailsBeforeGenerating) {
  Single unlabeled("S", 20.0, 1, 1);
  try {
    unlabeled.GenerateEvents(rng_, 1.0, 0.0);
    FAIL() << "Expected ConfigurationError";
  } catch (const ConfigurationError &e) {
    EXPECT_EQ(e.GetCode(), ErrorCode::MissingTruthLabel);
  }
  EXPECT_THROW(unlabeled.Labels(), ConfigurationError);
}

TEST_F(SingleTest, NegativeLabelIsRejected) {
  single_->SetTruthLabel(-2);
  EXPECT_THROW(single_->Labels(), ConfigurationError);
}

// === Generation ===

TEST_F(SingleTest, ZeroRateGivesNoEvents) {
  Single quiet("quiet", 0.0, 1, 1);
  quiet.SetTruthLabel(1);
  EXPECT_TRUE(quiet.GenerateEvents(rng_, 1.0, 0.0).empty());
  EXPECT_TRUE(quiet.GenerateEvents(rng_, 86400.0, 0.0).empty());
}

TEST_F(SingleTest, CountIsFirstPoissonDraw) {
  RandomSource reference(42);
  const uint64_t expected = reference.Poisson(20.0);

  const auto events = single_->GenerateEvents(rng_, 1.0, 0.0);
  EXPECT_EQ(events.size(), expected);
}

TEST_F(SingleTest, TimestampsLieInWindow) {
  const auto events = single_->GenerateEvents(rng_, 10.0, 5.0);
  ASSERT_FALSE(events.empty());
  for (const auto &event : events) {
    EXPECT_GE(event.timeStampNs, 5 * Event::kNsPerSecond);
    EXPECT_LT(event.timeStampNs, 15 * Event::kNsPerSecond);
  }
}

TEST_F(SingleTest, RecordsCarryDefaultsAndPlaceholders) {
  const auto events = single_->GenerateEvents(rng_, 10.0, 0.0);
  ASSERT_FALSE(events.empty());
  for (const auto &event : events) {
    EXPECT_EQ(event.truthIndex, 0u);
    EXPECT_EQ(event.site, 1);
    EXPECT_EQ(event.detector, 1);
    EXPECT_EQ(event.triggerType, 0x10001100u);
    EXPECT_EQ(event.triggerNumber, 0);
    EXPECT_GE(event.energy, 1.0f);
    EXPECT_LE(event.energy, 3.5f);
    EXPECT_FLOAT_EQ(event.charge, event.energy * 170.0f);
    EXPECT_EQ(event.nHit, 192);
    EXPECT_FLOAT_EQ(event.fMax, 0.1f);
    EXPECT_FLOAT_EQ(event.fQuad, 0.1f);
    EXPECT_FLOAT_EQ(event.fPSD_t1, 0.99f);
    EXPECT_FLOAT_EQ(event.fPSD_t2, 0.99f);
    EXPECT_FLOAT_EQ(event.f2inch_maxQ, 0.0f);
    EXPECT_LE(std::hypot(event.x, event.y), 2000.0 + 1e-3);
    EXPECT_LE(std::fabs(event.z), 2000.0f);
  }
}

TEST_F(SingleTest, CustomStrategiesAreUsed) {
  single_->SetEnergySpectrum(Spectra::Fixed(5.0));
  single_->SetPositionSpectrum(
      [](RandomSource &) { return Position{1.0, 2.0, 3.0}; });

  const auto events = single_->GenerateEvents(rng_, 1.0, 0.0);
  ASSERT_FALSE(events.empty());
  EXPECT_FLOAT_EQ(events[0].energy, 5.0f);
  EXPECT_FLOAT_EQ(events[0].charge, 850.0f);
  EXPECT_FLOAT_EQ(events[0].x, 1.0f);
  EXPECT_FLOAT_EQ(events[0].y, 2.0f);
  EXPECT_FLOAT_EQ(events[0].z, 3.0f);
}

TEST_F(SingleTest, EmptyStrategyIsRejected) {
  EXPECT_THROW(single_->SetEnergySpectrum(EnergySpectrum()),
               ConfigurationError);
  EXPECT_THROW(single_->SetPositionSpectrum(VolumeSampler()),
               ConfigurationError);
}

TEST_F(SingleTest, NonFiniteEnergyIsSamplingError) {
  single_->SetEnergySpectrum(
      Spectra::Fixed(std::numeric_limits<double>::quiet_NaN()));
  EXPECT_THROW(single_->GenerateEvents(rng_, 10.0, 0.0), SamplingError);
}

TEST_F(SingleTest, ExpectedCountModelUsesFloor) {
  single_->SetCountModel(CountModel::Expected);
  EXPECT_EQ(single_->GenerateEvents(rng_, 1.5, 0.0).size(), 30u);
  EXPECT_EQ(single_->ActualEventCount(rng_, 0.99, 1.0), 0u);
}

TEST_F(SingleTest, ParseCountModel) {
  EXPECT_EQ(ParseCountModel("poisson"), CountModel::Poisson);
  EXPECT_EQ(ParseCountModel("Expected"), CountModel::Expected);
  EXPECT_THROW(ParseCountModel("binomial"), ConfigurationError);
}
