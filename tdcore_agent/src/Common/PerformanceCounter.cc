#include <tdcore_agent/PerformanceCounter.hh>

#include <cstdlib>

PerformanceCounter::PerformanceCounter(TabularLearner *learner,
                                       const std::string &name):
  learner(learner), name(name)
{
  if (learner == NULL){
    std::cerr << "ERROR: performance counter needs a learner" << std::endl;
    exit(-1);
  }
}

PerformanceCounter::~PerformanceCounter() {}

void PerformanceCounter::set_reward(float r, bool terminal) {
  if (terminal){
    if (accumulatedRewards.empty())
      accumulatedRewards.push_back(r);
    else
      accumulatedRewards.push_back(accumulatedRewards.back() + r);

    knownStates.push_back(learner->numKnownStates());

    // measured before the learner counts this trial
    temperatures.push_back(learner->getTemperatureSchedule()->temperature(learner->getTrials()));
  }

  learner->set_reward(r, terminal);
}

int PerformanceCounter::first_action(const std::vector<float> &s) {
  return learner->first_action(s);
}

int PerformanceCounter::next_action(float r, const std::vector<float> &s) {
  set_reward(r);
  return learner->step(s);
}

void PerformanceCounter::last_action(float r) {
  set_reward(r, true);
}

void PerformanceCounter::setDebug(bool d) {
  learner->setDebug(d);
}

void PerformanceCounter::printStatistics(std::ostream &out) const {
  out << "# " << name << std::endl;
  out << "# trial accumulated_reward known_states temperature" << std::endl;
  for (unsigned i = 0; i < accumulatedRewards.size(); i++){
    out << i << " " << accumulatedRewards[i] << " "
        << knownStates[i] << " " << temperatures[i] << std::endl;
  }
}
