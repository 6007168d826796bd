#include <tdcore_agent/PerformanceCounter.hh>
#include <tdcore_agent/Exploration.hh>
#include <tdcore_agent/Temperature.hh>

#include <gtest/gtest.h>

#include <sstream>

#include "test_helpers.hh"

class PerformanceCounterTest : public ::testing::Test {
protected:
  PerformanceCounterTest(): greedy(0.0, 0), temp(1.0, 0.5) {}

  /** One three-step episode ending with the given reward. */
  void episode(PerformanceCounter &counter, TabularLearner &learner,
               float start, float terminalReward) {
    learner.newEpisode();
    learner.step(S(start));
    counter.set_reward(-1.0);
    learner.step(S(start + 1));
    counter.set_reward(-1.0);
    learner.step(S(start + 2));
    counter.set_reward(terminalReward, true);
  }

  AtLeastNTimesExploration greedy;
  ExponentialTemperature temp;
};

TEST_F(PerformanceCounterTest, AccumulatesTerminalRewardsOnly) {
  ListQLearner q(&greedy, 0.9, &temp);
  PerformanceCounter counter(&q, "td");

  episode(counter, q, 0, 2.0);
  episode(counter, q, 0, -0.5);
  episode(counter, q, 0, 4.0);

  const std::vector<float> &acc = counter.getAccumulatedRewards();
  ASSERT_EQ(3u, acc.size());
  EXPECT_FLOAT_EQ(2.0, acc[0]);
  EXPECT_FLOAT_EQ(1.5, acc[1]);
  EXPECT_FLOAT_EQ(5.5, acc[2]);
}

TEST_F(PerformanceCounterTest, CountsEveryVisitedState) {
  ListQLearner q(&greedy, 0.9, &temp);
  PerformanceCounter counter(&q, "td");

  episode(counter, q, 0, 1.0);
  episode(counter, q, 10, 1.0);

  const std::vector<size_t> &known = counter.getKnownStates();
  ASSERT_EQ(2u, known.size());
  // the state ending each trial counts even before its terminal write
  EXPECT_EQ(3u, known[0]);
  EXPECT_EQ(6u, known[1]);
  EXPECT_EQ(6u, q.getTable().numStates());
}

TEST_F(PerformanceCounterTest, TemperatureIsTakenBeforeTrialEnds) {
  ListQLearner q(&greedy, 0.9, &temp);
  PerformanceCounter counter(&q, "td");

  episode(counter, q, 0, 1.0);
  episode(counter, q, 0, 1.0);
  episode(counter, q, 0, 1.0);

  const std::vector<double> &temps = counter.getTemperatures();
  ASSERT_EQ(3u, temps.size());
  EXPECT_DOUBLE_EQ(temp.temperature(0), temps[0]);
  EXPECT_DOUBLE_EQ(temp.temperature(1), temps[1]);
  EXPECT_DOUBLE_EQ(temp.temperature(2), temps[2]);
  EXPECT_EQ(3, q.getTrials());
}

TEST_F(PerformanceCounterTest, LearningIsUnchanged) {
  ListSarsaLearner watched(&greedy, 0.8, &temp);
  ListSarsaLearner plain(&greedy, 0.8, &temp);
  PerformanceCounter counter(&watched, "sarsa");

  for (int i = 0; i < 5; i++){
    const float r = (i % 2) ? 3.0 : -2.0;

    watched.newEpisode();
    plain.newEpisode();
    for (int t = 0; t < 4; t++){
      EXPECT_EQ(plain.step(S(t)), watched.step(S(t)));
      plain.set_reward(-1.0);
      counter.set_reward(-1.0);
    }
    plain.set_reward(r, true);
    counter.set_reward(r, true);
  }

  EXPECT_TRUE(sameTable(plain.getTable(), watched.getTable()));
  EXPECT_EQ(plain.getTrials(), watched.getTrials());
}

TEST_F(PerformanceCounterTest, ActsAsTheLearnerThroughAgentInterface) {
  ConstantTemperature unitRate(1.0);
  ListQLearner q(&greedy, 0.5, &unitRate);
  q.acts.byState[S(1)] = std::vector<int>(1, 1);
  PerformanceCounter counter(&q, "td");

  Agent *agent = &counter;
  EXPECT_EQ(0, agent->first_action(S(0)));
  EXPECT_EQ(1, agent->next_action(-1.0, S(1)));
  agent->last_action(6.0);

  EXPECT_FLOAT_EQ(-1.0, q.getTable().value(S(0), 0));
  EXPECT_FLOAT_EQ(6.0, q.getTable().value(S(1), 1));
  ASSERT_EQ(1u, counter.getAccumulatedRewards().size());
  EXPECT_FLOAT_EQ(6.0, counter.getAccumulatedRewards()[0]);
  EXPECT_EQ(&q, counter.getLearner());
  EXPECT_EQ("td", counter.getName());
}

TEST_F(PerformanceCounterTest, PrintsOneLinePerTrial) {
  ListQLearner q(&greedy, 0.9, &temp);
  PerformanceCounter counter(&q, "td");
  episode(counter, q, 0, 2.0);
  episode(counter, q, 0, 2.0);

  std::ostringstream out;
  counter.printStatistics(out);

  std::istringstream in(out.str());
  std::string line;
  std::getline(in, line);
  EXPECT_EQ("# td", line);
  std::getline(in, line);
  EXPECT_EQ('#', line[0]);

  int trial;
  float acc;
  size_t known;
  double t;
  in >> trial >> acc >> known >> t;
  EXPECT_EQ(0, trial);
  EXPECT_FLOAT_EQ(2.0, acc);
  EXPECT_EQ(2u, known);
  in >> trial >> acc >> known >> t;
  EXPECT_EQ(1, trial);
  EXPECT_FLOAT_EQ(4.0, acc);
  EXPECT_FALSE(in.fail());
}

TEST(PerformanceCounterDeathTest, NeedsLearner) {
  EXPECT_EXIT(PerformanceCounter(NULL, "none"),
              ::testing::ExitedWithCode(255), "needs a learner");
}
