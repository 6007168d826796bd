#include <tdcore_agent/TabularLearner.hh>

#include <algorithm>
#include <cstdlib>
#include <iostream>

TabularLearner::TabularLearner(ExplorationPolicy *explore, float discountfactor,
                               TemperatureSchedule *temperature,
                               const ValueTable &initial):
  table(initial), gamma(discountfactor),
  temperature(temperature), explore(explore),
  lastAction(NO_ACTION), lastReward(0.0),
  haveLast(false), trials(0)
{

  ACTDEBUG = false; //true; //false;

  if (explore == NULL){
    std::cerr << "ERROR: learner needs an exploration policy" << std::endl;
    exit(-1);
  }
  if (temperature == NULL){
    std::cerr << "ERROR: learner needs a temperature schedule" << std::endl;
    exit(-1);
  }
  if (!(gamma > 0.0 && gamma <= 1.0)){
    std::cerr << "ERROR: discount factor must be in (0,1], got "
              << gamma << std::endl;
    exit(-1);
  }

  for (ValueTable::const_iterator i = table.begin(); i != table.end(); i++)
    known.insert(i->first);

}

TabularLearner::~TabularLearner() {}

void TabularLearner::set_reward(float r, bool terminal) {

  if (ACTDEBUG){
    std::cout << "Reward " << r << (terminal ? " (terminal)" : "") << std::endl;
  }

  lastReward = r;

  if (terminal){
    trials++;
    if (haveLast){
      // absorbing value, no bootstrapping
      table.setValue(lastState, lastAction, r);
    } else if (ACTDEBUG){
      std::cout << "Terminal reward before any step, nothing to update" << std::endl;
    }
  }
}

int TabularLearner::step(const std::vector<float> &percept) {

  const std::vector<float> state = update_state(percept);
  candidates = actions(state);
  known.insert(state);

  int current = NO_ACTION;
  if (!candidates.empty()){
    current = explore->chooseAction(candidates, table.values(state),
                                    temperature->temperature(trials),
                                    table.counts(state));
  }

  if (haveLast){
    table.increment(lastState, lastAction);
    update_rule(lastState, lastAction, lastReward, state, current);
  }

  if (ACTDEBUG){
    std::cout << "Took action " << current << " from state ";
    printState(state);
    std::cout << std::endl;
    const ValueTable::action_values_t &Q_s = table.values(state);
    for (unsigned i = 0; i < candidates.size(); i++){
      ValueTable::action_values_t::const_iterator q = Q_s.find(candidates[i]);
      std::cout << " Action: " << candidates[i]
                << " val: " << (q == Q_s.end() ? 0.0 : q->second)
                << " visits: " << table.count(state, candidates[i]) << std::endl;
    }
  }

  lastState = state;
  lastAction = current;
  haveLast = true;
  return current;
}

void TabularLearner::newEpisode() {
  lastState.clear();
  lastAction = NO_ACTION;
  lastReward = 0.0;
  haveLast = false;
}

double TabularLearner::learning_rate(int n) const {
  return std::min(1.0, temperature->temperature(n));
}

std::vector<int> TabularLearner::actions(const std::vector<float> &s) {
  return std::vector<int>();
}

std::vector<float> TabularLearner::update_state(const std::vector<float> &percept) {
  return percept;
}

int TabularLearner::first_action(const std::vector<float> &s) {
  if (ACTDEBUG){
    std::cout << "First - in state: ";
    printState(s);
    std::cout << std::endl;
  }
  newEpisode();
  return step(s);
}

int TabularLearner::next_action(float r, const std::vector<float> &s) {
  set_reward(r);
  return step(s);
}

void TabularLearner::last_action(float r) {
  set_reward(r, true);
}

void TabularLearner::setDebug(bool d){
  ACTDEBUG = d;
}

void TabularLearner::printState(const std::vector<float> &s){
  for (unsigned j = 0; j < s.size(); j++){
    std::cout << s[j] << ", ";
  }
}
