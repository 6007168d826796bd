#include <tdcore_agent/TDQLearner.hh>

#include <iostream>

TDQLearner::TDQLearner(ExplorationPolicy *explore, float discountfactor,
                       TemperatureSchedule *temperature,
                       const ValueTable &initial):
  TabularLearner(explore, discountfactor, temperature, initial)
{}

TDQLearner::~TDQLearner() {}

void TDQLearner::update_rule(const std::vector<float> &s, int a, float r,
                             const std::vector<float> &cs, int ca) {
  const double lr = learning_rate(table.count(s, a));
  const float q = table.value(s, a);
  const float best = table.maxValue(cs, currentActions());

  const float updated = q + lr * (r + gamma * best - q);
  table.setValue(s, a, updated);

  if (ACTDEBUG){
    std::cout << "Q update act " << a << ": " << q << " -> " << updated
              << " (lr " << lr << ", max next " << best << ")" << std::endl;
  }
}
