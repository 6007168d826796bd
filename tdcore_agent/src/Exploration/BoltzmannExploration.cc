#include <tdcore_agent/Exploration.hh>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>

BoltzmannExploration::BoltzmannExploration(Random &rng):
  rng(rng)
{}

BoltzmannExploration::~BoltzmannExploration() {}

static std::vector<float> candidateUtilities(const std::vector<int> &actions,
                                             const std::map<int, float> &utilities) {
  std::vector<float> u(actions.size(), 0.0);
  for (unsigned i = 0; i < actions.size(); i++){
    std::map<int, float>::const_iterator it = utilities.find(actions[i]);
    if (it != utilities.end())
      u[i] = it->second;
  }
  return u;
}

std::vector<double>
BoltzmannExploration::probabilities(const std::vector<int> &actions,
                                    const std::map<int, float> &utilities,
                                    double temperature) const {
  std::vector<double> probs(actions.size(), 0.0);
  if (actions.empty())
    return probs;

  const std::vector<float> u = candidateUtilities(actions, utilities);
  const float umax = *std::max_element(u.begin(), u.end());
  const float umin = *std::min_element(u.begin(), u.end());

  if (umax == umin){
    for (unsigned i = 0; i < probs.size(); i++)
      probs[i] = 1.0 / probs.size();
    return probs;
  }

  temperature = std::max(temperature, MIN_TEMPERATURE);

  double sum = 0.0;
  for (unsigned i = 0; i < u.size(); i++){
    const double norm = (u[i] - umin) / (umax - umin);
    probs[i] = std::exp(norm / temperature);
    sum += probs[i];
  }
  for (unsigned i = 0; i < probs.size(); i++){
    probs[i] /= sum;
  }

  return probs;
}

int BoltzmannExploration::chooseAction(const std::vector<int> &actions,
                                       const std::map<int, float> &utilities,
                                       double temperature,
                                       const std::map<int, int> &counts) {
  if (actions.empty()){
    std::cerr << "ERROR: BoltzmannExploration called with no actions"
              << std::endl;
    exit(-1);
  }

  const std::vector<float> u = candidateUtilities(actions, utilities);
  if (*std::max_element(u.begin(), u.end()) ==
      *std::min_element(u.begin(), u.end())){
    return actions[rng.uniformDiscrete(0, actions.size() - 1)];
  }

  const std::vector<double> probs =
    probabilities(actions, utilities, temperature);

  return actions[invertCumulative(probs, rng.uniform())];
}

unsigned BoltzmannExploration::invertCumulative(const std::vector<double> &probs,
                                                double r) {
  unsigned i = 0;
  double tot = probs[0];
  while (i + 1 < probs.size() && r >= tot){
    ++i;
    tot += probs[i];
  }
  return i;
}
