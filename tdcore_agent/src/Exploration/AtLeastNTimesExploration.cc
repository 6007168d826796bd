#include <tdcore_agent/Exploration.hh>

#include <cstdlib>
#include <iostream>

AtLeastNTimesExploration::AtLeastNTimesExploration(float optimisticReward,
                                                   int minN):
  optimisticReward(optimisticReward), minN(minN)
{
  if (minN < 0){
    std::cerr << "ERROR: minimum visit count must be non-negative, got "
              << minN << std::endl;
    exit(-1);
  }
}

AtLeastNTimesExploration::~AtLeastNTimesExploration() {}

int AtLeastNTimesExploration::chooseAction(const std::vector<int> &actions,
                                           const std::map<int, float> &utilities,
                                           double temperature,
                                           const std::map<int, int> &counts) {
  if (actions.empty()){
    std::cerr << "ERROR: AtLeastNTimesExploration called with no actions"
              << std::endl;
    exit(-1);
  }

  int best = actions[0];
  float bestVal = 0.0;

  for (unsigned i = 0; i < actions.size(); i++){
    std::map<int, int>::const_iterator n = counts.find(actions[i]);
    const int visits = (n == counts.end()) ? 0 : n->second;

    float val;
    if (visits < minN){
      val = optimisticReward;
    } else {
      std::map<int, float>::const_iterator u = utilities.find(actions[i]);
      val = (u == utilities.end()) ? 0.0 : u->second;
    }

    // strict comparison keeps the first of equal maxima
    if (i == 0 || val > bestVal){
      best = actions[i];
      bestVal = val;
    }
  }

  return best;
}
