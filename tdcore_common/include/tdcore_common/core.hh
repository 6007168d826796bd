#ifndef _TDCORE_CORE_H_
#define _TDCORE_CORE_H_

#include "Random.h"
#include <vector>
#include <map>


/** \file
    Fundamental declarations for the universal concepts of the tabular
    learning core: environments, agents, exploration policies and
    temperature schedules.
*/


/** Action returned when the current state offers no legal action. */
const int NO_ACTION = -1;

/** Temperature below which exploration and learning rates saturate. */
const double MIN_TEMPERATURE = 0.01;


/** Interface for an environment, whose states can be represented as
    vectors of floats and whose actions can be represented as ints.
    Implementations of the Environment interface determine how actions
    influence sensations.  Note that this design assumes only one
    agent. */
class Environment {
public:
  /** Provides access to the current sensation that the environment
      gives to the agent.
      \return The current sensation. */
  virtual const std::vector<float> &sensation() const = 0;

  /** Allows an agent to affect its environment.
      \param action The action the agent wishes to apply.
      \return The immediate one-step reward caused by the action. */
  virtual float apply(int action) = 0;

  /** Determines whether the environment has reached a terminal state.
      \return true iff the task is episodic and the present episode
      has ended.  Nonepisodic tasks should simply always
      return false. */
  virtual bool terminal() const = 0;

  /** Resets the internal state of the environment according to some
      initial state distribution. */
  virtual void reset() = 0;

  virtual ~Environment() {};

};

/** Interface for an agent.  Implementations of the Agent interface
    determine the choice of actions given previous sensations and
    rewards. */
class Agent {
public:
  /** Determines the first action that an agent takes in an
      environment.  This method implies that the environment is
      currently in an initial state.
      \param s The initial sensation from the environment.
      \return The action the agent wishes to take first. */
  virtual int first_action(const std::vector<float> &s) = 0;

  /** Determines the next action that an agent takes in an environment
      and gives feedback for the previous action.  This method may
      only be called if the last method called was first_action or
      next_action.
      \param r The one-step reward resulting from the previous action.
      \param s The current sensation from the environment.
      \return The action the agent wishes to take next. */
  virtual int next_action(float r, const std::vector<float> &s) = 0;

  /** Gives feedback for the last action taken.  It implies that the
      task is episodic and has just terminated.  Note that terminal
      sensations (states) are not represented.
      \param r The one-step reward resulting from the previous action. */
  virtual void last_action(float r) = 0;

  /** Set some debug flags on/off */
  virtual void setDebug(bool d) = 0;

  virtual ~Agent() {};
};

/** Interface for a schedule mapping a number of trials (or visits) to a
    positive temperature.  Schedules must be non-increasing in n. */
class TemperatureSchedule {
public:
  /** \param n A non-negative count.
      \return The temperature after n trials, in (0, initial]. */
  virtual double temperature(int n) const = 0;

  virtual ~TemperatureSchedule() {};
};

/** Interface for an exploration policy: picks one action out of a
    non-empty candidate set given the current estimates of a state. */
class ExplorationPolicy {
public:
  /** Select an action.
      \param actions Legal actions, in the order given by the problem.
                     Must not be empty.
      \param utilities Recorded utilities of the state; a missing action
                       has utility 0.
      \param temperature Current temperature.
      \param counts Visit counts of the state; a missing action has
                    count 0.
      \return One element of actions. */
  virtual int chooseAction(const std::vector<int> &actions,
                           const std::map<int, float> &utilities,
                           double temperature,
                           const std::map<int, int> &counts) = 0;

  virtual ~ExplorationPolicy() {};
};


#endif
