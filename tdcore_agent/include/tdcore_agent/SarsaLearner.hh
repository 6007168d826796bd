/** \file SarsaLearner.hh
    Defines the SarsaLearner class
*/

#ifndef _SARSALEARNER_HH_
#define _SARSALEARNER_HH_

#include <tdcore_agent/TabularLearner.hh>

/** On-policy temporal-difference learner (one-step Sarsa, no
    eligibility traces).  Bootstraps from the value of the action the
    exploration policy actually chose in the next state. */
class SarsaLearner: public TabularLearner {
public:
  /** Standard constructor
      \param explore Exploration policy, not owned
      \param discountfactor The discount factor, in (0, 1]
      \param temperature Temperature schedule, not owned
      \param initial Values to seed the table with */
  SarsaLearner(ExplorationPolicy *explore, float discountfactor,
               TemperatureSchedule *temperature,
               const ValueTable &initial = ValueTable());

  virtual ~SarsaLearner();

protected:
  virtual void update_rule(const std::vector<float> &s, int a, float r,
                           const std::vector<float> &cs, int ca);
};

#endif
