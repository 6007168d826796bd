#include <tdcore_agent/Exploration.hh>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

static std::vector<int> actionList(int a, int b, int c) {
  std::vector<int> v;
  v.push_back(a);
  v.push_back(b);
  v.push_back(c);
  return v;
}

TEST(AtLeastNTimesTest, UnderVisitedActionsUseOptimisticReward) {
  AtLeastNTimesExploration explore(10.0, 2);
  std::map<int, float> u;
  u[0] = 5.0; u[1] = 1.0; u[2] = 3.0;
  std::map<int, int> n;
  n[0] = 3; n[1] = 1; n[2] = 3;
  EXPECT_EQ(1, explore.chooseAction(actionList(0, 1, 2), u, 1.0, n));
}

TEST(AtLeastNTimesTest, OptimisticRewardOverridesTableValue) {
  // a pessimistic floor hides a good but rarely tried action
  AtLeastNTimesExploration explore(-100.0, 1);
  std::map<int, float> u;
  u[0] = 50.0; u[1] = 1.0; u[2] = -5.0;
  std::map<int, int> n;
  n[1] = 4; n[2] = 4;
  EXPECT_EQ(1, explore.chooseAction(actionList(0, 1, 2), u, 1.0, n));
}

TEST(AtLeastNTimesTest, WellVisitedActionsAreGreedy) {
  AtLeastNTimesExploration explore(10.0, 2);
  std::map<int, float> u;
  u[0] = 0.5; u[1] = 4.0; u[2] = 3.0;
  std::map<int, int> n;
  n[0] = 2; n[1] = 2; n[2] = 2;
  EXPECT_EQ(1, explore.chooseAction(actionList(0, 1, 2), u, 1.0, n));
}

TEST(AtLeastNTimesTest, TiesGoToFirstCandidate) {
  AtLeastNTimesExploration explore(10.0, 1);
  std::map<int, float> u;
  std::map<int, int> n;
  EXPECT_EQ(2, explore.chooseAction(actionList(2, 0, 1), u, 1.0, n));

  n[2] = 1; n[0] = 1; n[1] = 1;
  u[0] = 7.0; u[1] = 7.0;
  EXPECT_EQ(0, explore.chooseAction(actionList(2, 0, 1), u, 1.0, n));
}

TEST(AtLeastNTimesTest, MissingUtilitiesAreZero) {
  AtLeastNTimesExploration explore(10.0, 0);
  std::map<int, float> u;
  u[1] = -1.0; u[2] = -2.0;
  std::map<int, int> n;
  EXPECT_EQ(0, explore.chooseAction(actionList(1, 0, 2), u, 1.0, n));
}

TEST(AtLeastNTimesDeathTest, EmptyActionsAreFatal) {
  AtLeastNTimesExploration explore(1.0, 1);
  std::map<int, float> u;
  std::map<int, int> n;
  EXPECT_EXIT(explore.chooseAction(std::vector<int>(), u, 1.0, n),
              ::testing::ExitedWithCode(255), "no actions");
}

TEST(AtLeastNTimesDeathTest, NegativeMinNIsFatal) {
  EXPECT_EXIT(AtLeastNTimesExploration(1.0, -1),
              ::testing::ExitedWithCode(255), "non-negative");
}


TEST(BoltzmannTest, AlwaysReturnsACandidate) {
  Random rng(3);
  BoltzmannExploration explore(rng);
  std::vector<int> acts = actionList(4, 9, 2);
  std::map<int, float> u;
  u[4] = -3.0; u[9] = 12.0; u[2] = 0.5;
  std::map<int, int> n;
  for (int i = 0; i < 2000; i++){
    const double temp = (i % 10) * 0.3;
    const int a = explore.chooseAction(acts, u, temp, n);
    EXPECT_TRUE(std::find(acts.begin(), acts.end(), a) != acts.end());
  }
}

TEST(BoltzmannTest, EqualUtilitiesAreUniform) {
  Random rng(11);
  BoltzmannExploration explore(rng);
  std::vector<int> acts = actionList(0, 1, 2);
  std::map<int, float> u;
  u[0] = 2.0; u[1] = 2.0; u[2] = 2.0;
  std::map<int, int> n;

  const int draws = 30000;
  std::map<int, int> hits;
  for (int i = 0; i < draws; i++)
    hits[explore.chooseAction(acts, u, 0.5, n)]++;

  for (int a = 0; a < 3; a++)
    EXPECT_NEAR(1.0 / 3.0, hits[a] / (double)draws, 0.02) << "action " << a;

  std::vector<double> p = explore.probabilities(acts, u, 0.5);
  for (unsigned i = 0; i < p.size(); i++)
    EXPECT_DOUBLE_EQ(1.0 / 3.0, p[i]);
}

TEST(BoltzmannTest, ProbabilitiesFollowNormalisedUtilities) {
  Random rng(5);
  BoltzmannExploration explore(rng);
  std::vector<int> acts;
  acts.push_back(0);
  acts.push_back(1);
  std::map<int, float> u;
  u[0] = -4.0; u[1] = 6.0;

  std::vector<double> p = explore.probabilities(acts, u, 1.0);
  const double e = std::exp(1.0);
  EXPECT_NEAR(1.0 / (1.0 + e), p[0], 1e-9);
  EXPECT_NEAR(e / (1.0 + e), p[1], 1e-9);

  std::map<int, int> n;
  const int draws = 20000;
  int ones = 0;
  for (int i = 0; i < draws; i++)
    if (explore.chooseAction(acts, u, 1.0, n) == 1) ones++;
  EXPECT_NEAR(p[1], ones / (double)draws, 0.02);
}

TEST(BoltzmannTest, LowTemperatureSharpensHighTemperatureFlattens) {
  Random rng;
  BoltzmannExploration explore(rng);
  std::vector<int> acts = actionList(0, 1, 2);
  std::map<int, float> u;
  u[0] = 1.0; u[1] = 3.0; u[2] = 2.0;

  std::vector<double> cold = explore.probabilities(acts, u, 0.05);
  EXPECT_GT(cold[1], 0.99);

  std::vector<double> hot = explore.probabilities(acts, u, 1000.0);
  for (unsigned i = 0; i < hot.size(); i++)
    EXPECT_NEAR(1.0 / 3.0, hot[i], 0.01);

  double sum = 0.0;
  for (unsigned i = 0; i < cold.size(); i++)
    sum += cold[i];
  EXPECT_NEAR(1.0, sum, 1e-12);
}

TEST(BoltzmannTest, TemperatureIsFloored) {
  Random rng;
  BoltzmannExploration explore(rng);
  std::vector<int> acts = actionList(0, 1, 2);
  std::map<int, float> u;
  u[0] = 1.0; u[1] = 3.0; u[2] = 2.0;

  std::vector<double> zero = explore.probabilities(acts, u, 0.0);
  std::vector<double> floor = explore.probabilities(acts, u, 0.01);
  for (unsigned i = 0; i < zero.size(); i++){
    EXPECT_FALSE(std::isnan(zero[i]));
    EXPECT_DOUBLE_EQ(floor[i], zero[i]);
  }

  std::map<int, int> n;
  EXPECT_EQ(1, explore.chooseAction(acts, u, 0.0, n));
}

TEST(BoltzmannTest, InversionPicksFirstBucketAboveDraw) {
  std::vector<double> probs;
  probs.push_back(0.25);
  probs.push_back(0.25);
  probs.push_back(0.5);

  EXPECT_EQ(0u, BoltzmannExploration::invertCumulative(probs, 0.0));
  EXPECT_EQ(0u, BoltzmannExploration::invertCumulative(probs, 0.2));
  EXPECT_EQ(1u, BoltzmannExploration::invertCumulative(probs, 0.25));
  EXPECT_EQ(2u, BoltzmannExploration::invertCumulative(probs, 0.6));
}

TEST(BoltzmannTest, DrawAboveRoundedTotalTakesLastAction) {
  Random rng;
  BoltzmannExploration explore(rng);
  std::vector<int> acts;
  acts.push_back(4);
  acts.push_back(8);
  acts.push_back(9);
  std::map<int, float> u;
  u[4] = 1.0;
  u[8] = 2.0;
  u[9] = 0.5;

  // total falls just short of 1
  std::vector<double> probs = explore.probabilities(acts, u, 0.5);
  for (unsigned i = 0; i < probs.size(); i++)
    probs[i] *= 1.0 - 1e-9;

  EXPECT_EQ(2u, BoltzmannExploration::invertCumulative(probs, 1.0 - 1e-12));
}

TEST(BoltzmannDeathTest, EmptyActionsAreFatal) {
  Random rng;
  BoltzmannExploration explore(rng);
  std::map<int, float> u;
  std::map<int, int> n;
  EXPECT_EXIT(explore.chooseAction(std::vector<int>(), u, 1.0, n),
              ::testing::ExitedWithCode(255), "no actions");
}
