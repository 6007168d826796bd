/** \file PerformanceCounter.hh
    Per-trial statistics of a learner.
*/

#ifndef _PERFORMANCECOUNTER_HH_
#define _PERFORMANCECOUNTER_HH_

#include <tdcore_agent/TabularLearner.hh>

#include <iostream>
#include <string>
#include <vector>

/** Records statistics about a learner each time a trial ends.  Drivers
    pass rewards through the counter instead of straight to the learner;
    the counter takes its measurements and then forwards the reward
    unchanged, so learning is not affected.  The counter is itself an
    Agent, so drivers written against that interface can use it in
    place of the learner. */
class PerformanceCounter: public Agent {
public:
  /** \param learner Learner to observe, not owned
      \param name Label used when printing */
  PerformanceCounter(TabularLearner *learner, const std::string &name);

  virtual ~PerformanceCounter();

  /** Record, then forward to learner->set_reward(r, terminal). */
  void set_reward(float r, bool terminal = false);

  // Agent interface, forwarded to the learner
  virtual int first_action(const std::vector<float> &s);
  virtual int next_action(float r, const std::vector<float> &s);
  virtual void last_action(float r);
  virtual void setDebug(bool d);

  /** Sum of the terminal rewards seen up to each trial. */
  const std::vector<float> &getAccumulatedRewards() const { return accumulatedRewards; }

  /** Number of states the learner had seen by the end of each trial. */
  const std::vector<size_t> &getKnownStates() const { return knownStates; }

  /** Temperature in effect during each trial. */
  const std::vector<double> &getTemperatures() const { return temperatures; }

  const std::string &getName() const { return name; }
  TabularLearner *getLearner() const { return learner; }

  /** One line per trial: trial, accumulated reward, known states,
      temperature. */
  void printStatistics(std::ostream &out) const;

private:
  TabularLearner *learner;
  std::string name;

  std::vector<float> accumulatedRewards;
  std::vector<size_t> knownStates;
  std::vector<double> temperatures;
};

#endif
