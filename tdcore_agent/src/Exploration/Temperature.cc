#include <tdcore_agent/Temperature.hh>

#include <cmath>
#include <cstdlib>
#include <iostream>

ExponentialTemperature::ExponentialTemperature(double initial, double alpha):
  initial(initial), alpha(alpha)
{
  if (initial <= 0.0){
    std::cerr << "ERROR: initial temperature must be positive, got "
              << initial << std::endl;
    exit(-1);
  }
  if (alpha < 0.0){
    std::cerr << "ERROR: temperature decay must be non-negative, got "
              << alpha << std::endl;
    exit(-1);
  }
}

ExponentialTemperature::~ExponentialTemperature() {}

double ExponentialTemperature::temperature(int n) const {
  const double denom = std::exp(n * alpha);
  if (std::isinf(denom))
    return MIN_TEMPERATURE;
  return initial / denom;
}


ConstantTemperature::ConstantTemperature(double value):
  value(value)
{
  if (value <= 0.0){
    std::cerr << "ERROR: temperature must be positive, got "
              << value << std::endl;
    exit(-1);
  }
}

ConstantTemperature::~ConstantTemperature() {}

double ConstantTemperature::temperature(int n) const {
  return value;
}
