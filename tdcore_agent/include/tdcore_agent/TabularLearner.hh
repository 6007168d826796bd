/** \file TabularLearner.hh
    Defines the TabularLearner class, the common base of the
    temporal-difference learners.
*/

#ifndef _TABULARLEARNER_HH_
#define _TABULARLEARNER_HH_

#include <tdcore_common/core.hh>
#include <tdcore_agent/ValueTable.hh>

#include <set>
#include <vector>

/** Tabular learner with a deferred one-step update.  Each call to step
    chooses the action for the current state and then updates the value
    of the previous state-action pair with the reward given since.
    Subclasses supply the update rule; problems supply their action sets
    by overriding actions(). */
class TabularLearner: public Agent {
public:
  /** Standard constructor
      \param explore Exploration policy, not owned
      \param discountfactor The discount factor, in (0, 1]
      \param temperature Temperature schedule used for exploration and
                         learning rates, not owned
      \param initial Values to seed the table with */
  TabularLearner(ExplorationPolicy *explore, float discountfactor,
                 TemperatureSchedule *temperature,
                 const ValueTable &initial = ValueTable());

  /** Unimplemented copy constructor: internal state cannot be simply
      copied. */
  TabularLearner(const TabularLearner &);

  virtual ~TabularLearner();

  /** Record the reward for the last action.  A terminal reward ends the
      trial and becomes the value of the last state-action pair as is. */
  void set_reward(float r, bool terminal = false);

  /** Advance one timestep.
      \param percept The current perception.
      \return The chosen action, or NO_ACTION if the state has none. */
  int step(const std::vector<float> &percept);

  /** Forget the last state, action and reward so the next step starts a
      new episode.  The table, visit counts and trial count are kept. */
  void newEpisode();

  /** min(1, temperature(n)) */
  double learning_rate(int n) const;

  /** Legal actions of a state.  Override per problem; none by default.
      Action ids must be non-negative, NO_ACTION is reserved. */
  virtual std::vector<int> actions(const std::vector<float> &s);

  /** Map a raw perception to a state.  Identity by default. */
  virtual std::vector<float> update_state(const std::vector<float> &percept);

  // Agent interface
  virtual int first_action(const std::vector<float> &s);
  virtual int next_action(float r, const std::vector<float> &s);
  virtual void last_action(float r);
  virtual void setDebug(bool d);

  const ValueTable &getTable() const { return table; }

  /** Number of distinct states seen so far: those passed to step and
      those in the initial table, with or without recorded values. */
  size_t numKnownStates() const { return known.size(); }

  int getTrials() const { return trials; }
  float getDiscountFactor() const { return gamma; }
  const TemperatureSchedule *getTemperatureSchedule() const { return temperature; }
  bool hasLastState() const { return haveLast; }
  const std::vector<float> &getLastState() const { return lastState; }
  int getLastAction() const { return lastAction; }

  void printState(const std::vector<float> &s);

protected:
  /** Update Q[s][a] for the transition s, a -> r, cs, ca. */
  virtual void update_rule(const std::vector<float> &s, int a, float r,
                           const std::vector<float> &cs, int ca) = 0;

  /** Candidate actions of the state passed to the current step. */
  const std::vector<int> &currentActions() const { return candidates; }

  ValueTable table;
  const float gamma;
  TemperatureSchedule *temperature;
  ExplorationPolicy *explore;

  bool ACTDEBUG;

private:
  std::vector<float> lastState;
  int lastAction;
  float lastReward;
  bool haveLast;
  int trials;

  std::vector<int> candidates;
  std::set<std::vector<float> > known;
};

#endif
