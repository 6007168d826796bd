/** \file TDQLearner.hh
    Defines the TDQLearner class
*/

#ifndef _TDQLEARNER_HH_
#define _TDQLEARNER_HH_

#include <tdcore_agent/TabularLearner.hh>

/** Off-policy temporal-difference learner (Q-learning).  Bootstraps
    from the best value available in the next state, whatever action is
    actually taken there. */
class TDQLearner: public TabularLearner {
public:
  /** Standard constructor
      \param explore Exploration policy, not owned
      \param discountfactor The discount factor, in (0, 1]
      \param temperature Temperature schedule, not owned
      \param initial Values to seed the table with */
  TDQLearner(ExplorationPolicy *explore, float discountfactor,
             TemperatureSchedule *temperature,
             const ValueTable &initial = ValueTable());

  virtual ~TDQLearner();

protected:
  virtual void update_rule(const std::vector<float> &s, int a, float r,
                           const std::vector<float> &cs, int ca);
};

#endif
