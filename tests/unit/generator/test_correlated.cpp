/**
 * @file test_correlated.cpp
 * @brief Unit tests for the Correlated event type
 */

#include <gtest/gtest.h>

#include <cmath>

#include "toymc/generator/Correlated.hpp"

using namespace TOYMC;

class CorrelatedTest : public ::testing::Test {
protected:
  void SetUp() override {
    ibd_ = std::make_unique<Correlated>("IBD nGd", 1, 2, 50.0, 28000.0);
    ibd_->SetTruthLabelPrompt(1);
    ibd_->SetTruthLabelDelayed(2);
  }

  std::unique_ptr<Correlated> ibd_;
  RandomSource rng_{314};
};

TEST_F(CorrelatedTest, Defaults) {
  EXPECT_EQ(ibd_->GetTypeName(), "Correlated");
  EXPECT_DOUBLE_EQ(ibd_->GetCoincidenceNs(), 28000.0);
  EXPECT_DOUBLE_EQ(ibd_->GetRadius(), 1500.0);
  EXPECT_DOUBLE_EQ(ibd_->GetPromptDelayedDistance(), 50.0);
}

TEST_F(CorrelatedTest, NonPositiveCoincidenceIsRejected) {
  EXPECT_THROW(Correlated("x", 1, 1, 1.0, 0.0), ConfigurationError);
  EXPECT_THROW(Correlated("x", 1, 1, 1.0, -5.0), ConfigurationError);
}

TEST_F(CorrelatedTest, LabelsForPromptAndDelayed) {
  const auto labels = ibd_->Labels();
  ASSERT_EQ(labels.size(), 2u);
  EXPECT_EQ(labels[0].code, 1);
  EXPECT_EQ(labels[0].label, "IBD_nGd_prompt");
  EXPECT_EQ(labels[1].code, 2);
  EXPECT_EQ(labels[1].label, "IBD_nGd_delayed");
}

TEST_F(CorrelatedTest, MissingDelayedLabelFails) {
  Correlated pair("pair", 1, 1, 1.0, 1000.0);
  pair.SetTruthLabelPrompt(3);
  EXPECT_THROW(pair.Labels(), ConfigurationError);
  EXPECT_THROW(pair.GenerateEvents(rng_, 1.0, 0.0), ConfigurationError);
}

TEST_F(CorrelatedTest, EmitsPromptDelayedPairs) {
  const auto events = ibd_->GenerateEvents(rng_, 10.0, 0.0);
  ASSERT_FALSE(events.empty());
  ASSERT_EQ(events.size() % 2, 0u);

  for (size_t i = 0; i < events.size(); i += 2) {
    const auto &prompt = events[i];
    const auto &delayed = events[i + 1];
    EXPECT_EQ(prompt.truthIndex, 1u);
    EXPECT_EQ(delayed.truthIndex, 2u);
    EXPECT_EQ(prompt.detector, delayed.detector);
    EXPECT_EQ(prompt.site, delayed.site);
    EXPECT_EQ(prompt.triggerType, delayed.triggerType);
    EXPECT_GE(delayed.timeStampNs, prompt.timeStampNs);

    EXPECT_LT(prompt.timeStampNs, 10 * Event::kNsPerSecond);
    EXPECT_GE(prompt.energy, 0.7f);
    EXPECT_LE(prompt.energy, 4.0f);
    EXPECT_GE(delayed.energy, 7.0f);
    EXPECT_LE(delayed.energy, 9.0f);

    EXPECT_GE(delayed.x, prompt.x);
    EXPECT_GE(delayed.y, prompt.y);
    EXPECT_GE(delayed.z, prompt.z);
    EXPECT_LE(std::hypot(prompt.x, prompt.y), 1500.0 + 1e-3);
    EXPECT_LE(std::hypot(delayed.x, delayed.y), 1500.0 + 1e-3);
  }
}

TEST_F(CorrelatedTest, DrawOrderIsCountTimesDelaysThenQuantities) {
  // Strategies that consume no randomness isolate the timing draws
  ibd_->SetPromptEnergySpectrum(Spectra::Fixed(3.0));
  ibd_->SetDelayedEnergySpectrum(Spectra::Fixed(8.0));
  ibd_->SetPromptPositionSpectrum(
      [](RandomSource &) { return Position{0.0, 0.0, 0.0}; });
  ibd_->SetDelayedPositionFromPrompt(
      [](RandomSource &, const Position &p) { return p; });

  RandomSource reference(314);
  const uint64_t count = reference.Poisson(2.0 * 50.0);
  const auto times =
      reference.UniformIntArray(0, 2 * Event::kNsPerSecond, count);
  std::vector<int64_t> delays;
  for (uint64_t i = 0; i < count; ++i) {
    delays.push_back(static_cast<int64_t>(reference.Exponential(28000.0)));
  }

  const auto events = ibd_->GenerateEvents(rng_, 2.0, 0.0);
  ASSERT_EQ(events.size(), 2 * count);
  for (uint64_t i = 0; i < count; ++i) {
    EXPECT_EQ(events[2 * i].timeStampNs, times[i]);
    EXPECT_EQ(events[2 * i + 1].timeStampNs, times[i] + delays[i]);
    EXPECT_FLOAT_EQ(events[2 * i].charge, 510.0f);
    EXPECT_FLOAT_EQ(events[2 * i + 1].charge, 1360.0f);
  }
}

TEST_F(CorrelatedTest, MeanDelayMatchesCoincidenceTime) {
  Correlated fast("fast", 1, 1, 1000.0, 28000.0);
  fast.SetTruthLabelPrompt(0);
  fast.SetTruthLabelDelayed(1);
  fast.SetCountModel(CountModel::Expected);

  const auto events = fast.GenerateEvents(rng_, 10.0, 0.0);
  ASSERT_EQ(events.size(), 20000u);
  double sum = 0.0;
  for (size_t i = 0; i < events.size(); i += 2) {
    sum += static_cast<double>(events[i + 1].timeStampNs -
                               events[i].timeStampNs);
  }
  EXPECT_NEAR(sum / 10000.0, 28000.0, 28000.0 * 0.05);
}

TEST_F(CorrelatedTest, DelayedTimesMayLeaveTheWindow) {
  Correlated slow("slow", 1, 1, 1000.0, 1.0e9);
  slow.SetTruthLabelPrompt(0);
  slow.SetTruthLabelDelayed(1);

  const auto events = slow.GenerateEvents(rng_, 1.0, 0.0);
  bool anyOutside = false;
  for (size_t i = 1; i < events.size(); i += 2) {
    anyOutside = anyOutside || events[i].timeStampNs >= Event::kNsPerSecond;
  }
  EXPECT_TRUE(anyOutside);
}

TEST_F(CorrelatedTest, DistanceAndGeometrySetters) {
  ibd_->SetPromptDelayedDistance(100.0);
  EXPECT_DOUBLE_EQ(ibd_->GetPromptDelayedDistance(), 100.0);
  EXPECT_DOUBLE_EQ(ibd_->GetRadius(), 1500.0);

  ibd_->SetDefaultGeometry(2000.0, 75.0);
  EXPECT_DOUBLE_EQ(ibd_->GetRadius(), 2000.0);
  EXPECT_DOUBLE_EQ(ibd_->GetPromptDelayedDistance(), 75.0);

  EXPECT_THROW(ibd_->SetPromptDelayedDistance(0.0), ConfigurationError);
}
