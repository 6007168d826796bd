#include <tdcore_agent/SarsaLearner.hh>

#include <iostream>

SarsaLearner::SarsaLearner(ExplorationPolicy *explore, float discountfactor,
                           TemperatureSchedule *temperature,
                           const ValueTable &initial):
  TabularLearner(explore, discountfactor, temperature, initial)
{}

SarsaLearner::~SarsaLearner() {}

void SarsaLearner::update_rule(const std::vector<float> &s, int a, float r,
                               const std::vector<float> &cs, int ca) {
  const double lr = learning_rate(table.count(s, a));
  const float q = table.value(s, a);
  const float next = table.value(cs, ca);

  const float updated = q + lr * (r + gamma * next - q);
  table.setValue(s, a, updated);

  if (ACTDEBUG){
    std::cout << "Sarsa update act " << a << ": " << q << " -> " << updated
              << " (lr " << lr << ", next act " << ca << " val " << next
              << ")" << std::endl;
  }
}
