/** \file Exploration.hh
    Exploration policies for the tabular learners.
*/

#ifndef _EXPLORATION_HH_
#define _EXPLORATION_HH_

#include <tdcore_common/Random.h>
#include <tdcore_common/core.hh>

#include <map>
#include <vector>

/** Optimistic exploration: every action tried fewer than minN times in
    the current state is treated as if it were worth optimisticReward.
    The action with the highest resulting utility is taken, ties going
    to the earliest candidate. */
class AtLeastNTimesExploration: public ExplorationPolicy {
public:
  /** Standard constructor
      \param optimisticReward Utility assumed for under-visited actions
      \param minN Number of visits before the table value is trusted */
  AtLeastNTimesExploration(float optimisticReward, int minN);

  virtual ~AtLeastNTimesExploration();

  virtual int chooseAction(const std::vector<int> &actions,
                           const std::map<int, float> &utilities,
                           double temperature,
                           const std::map<int, int> &counts);

private:
  const float optimisticReward;
  const int minN;
};

/** Softmax (Boltzmann) exploration over min-max normalised utilities.
    Low temperatures concentrate the distribution on the best action,
    high temperatures flatten it toward uniform. */
class BoltzmannExploration: public ExplorationPolicy {
public:
  /** \param rng Random source shared with the rest of the run. */
  BoltzmannExploration(Random &rng);

  virtual ~BoltzmannExploration();

  virtual int chooseAction(const std::vector<int> &actions,
                           const std::map<int, float> &utilities,
                           double temperature,
                           const std::map<int, int> &counts);

  /** Selection probabilities of each candidate, in the order of
      actions.  Uniform when all utilities are equal. */
  std::vector<double> probabilities(const std::vector<int> &actions,
                                    const std::map<int, float> &utilities,
                                    double temperature) const;

  /** Index of the first entry whose cumulative probability exceeds r.
      The last index when rounding leaves r above the total. */
  static unsigned invertCumulative(const std::vector<double> &probs, double r);

private:
  Random &rng;
};

#endif
