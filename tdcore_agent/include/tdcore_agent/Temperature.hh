/** \file Temperature.hh
    Temperature schedules used both as learning rates and as the
    sharpness of softmax exploration.
*/

#ifndef _TEMPERATURE_HH_
#define _TEMPERATURE_HH_

#include <tdcore_common/core.hh>

/** Exponential decay: initial / exp(n * alpha).  Saturates at
    MIN_TEMPERATURE once exp(n * alpha) overflows. */
class ExponentialTemperature: public TemperatureSchedule {
public:
  /** Standard constructor
      \param initial Temperature at n = 0, must be positive
      \param alpha Decay rate, must be non-negative */
  ExponentialTemperature(double initial, double alpha);

  virtual ~ExponentialTemperature();

  virtual double temperature(int n) const;

  double getInitial() const { return initial; }
  double getAlpha() const { return alpha; }

private:
  const double initial;
  const double alpha;
};

/** The same temperature for every n. */
class ConstantTemperature: public TemperatureSchedule {
public:
  ConstantTemperature(double value);
  virtual ~ConstantTemperature();

  virtual double temperature(int n) const;

private:
  const double value;
};

#endif
