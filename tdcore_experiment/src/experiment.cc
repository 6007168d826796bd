/** \file Main file that runs tabular learners in a maze
*/

#include <tdcore_common/Random.h>
#include <tdcore_common/core.hh>

#include <stdio.h>
#include <string.h>

//////////////////
// Environments //
//////////////////
#include <tdcore_env/GridMaze.hh>


////////////
// Agents //
////////////
#include <tdcore_agent/TDQLearner.hh>
#include <tdcore_agent/SarsaLearner.hh>
#include <tdcore_agent/Exploration.hh>
#include <tdcore_agent/Temperature.hh>
#include <tdcore_agent/PerformanceCounter.hh>


#include <vector>
#include <iostream>

#include <getopt.h>
#include <stdlib.h>

unsigned NUMEPISODES = 500;
unsigned MAXSTEPS = 1000; // per episode
bool PRINTS = false;

#define EXPLORE_COUNTS    0
#define EXPLORE_BOLTZMANN 1

const std::string exploreNames[] = {
  "At Least N Times",
  "Boltzmann"
};


/** Q-learner whose action sets come from a maze. */
class MazeQLearner: public TDQLearner {
public:
  MazeQLearner(const GridMaze *maze, ExplorationPolicy *explore,
               float gamma, TemperatureSchedule *temperature):
    TDQLearner(explore, gamma, temperature), maze(maze) {}

  virtual std::vector<int> actions(const std::vector<float> &s){
    return maze->actions(s);
  }

private:
  const GridMaze *maze;
};

/** Sarsa learner whose action sets come from a maze. */
class MazeSarsaLearner: public SarsaLearner {
public:
  MazeSarsaLearner(const GridMaze *maze, ExplorationPolicy *explore,
                   float gamma, TemperatureSchedule *temperature):
    SarsaLearner(explore, gamma, temperature), maze(maze) {}

  virtual std::vector<int> actions(const std::vector<float> &s){
    return maze->actions(s);
  }

private:
  const GridMaze *maze;
};


void displayHelp(){
  std::cout << "\n Call experiment --agent type [options]\n";
  std::cout << "Agent types: td sarsa both\n";

  std::cout << "\n Agent Options:\n";
  std::cout << "--gamma value (discount factor in (0,1])\n";
  std::cout << "--explore type (counts, boltzmann)\n";
  std::cout << "--optimistic value (For counts: utility assumed for under-visited actions)\n";
  std::cout << "--minn value (For counts: visits before the learned value is used)\n";
  std::cout << "--temperature value (initial temperature)\n";
  std::cout << "--decay value (exponential temperature decay per trial)\n";

  std::cout << "\n Env Options:\n";
  std::cout << "--width value (maze width, random walls)\n";
  std::cout << "--height value (maze height, random walls)\n";
  std::cout << "--deterministic (moves never slip)\n";
  std::cout << "--stochastic (moves slip with probability 0.2)\n";

  std::cout << "\n--prints (turn on debug printing of actions/rewards)\n";
  std::cout << "--nepisodes value (# of episodes to run (500 default))\n";
  std::cout << "--maxsteps value (max # of steps per episode (1000 default))\n";
  std::cout << "--seed value (integer seed for random number generator)\n";

  exit(-1);

}


/** Run one learner for NUMEPISODES episodes and print its statistics. */
void runLearner(const char* agentType, int exploreType,
                float discountfactor, float optimistic, int minN,
                float initialtemp, float decay,
                unsigned width, unsigned height, bool stochastic,
                int seed){

  Random rng(seed);

  GridMaze* e;
  if (width > 0 || height > 0){
    e = new GridMaze(rng, height > 0 ? height : 5, width > 0 ? width : 5,
                     stochastic);
  } else {
    e = new GridMaze(rng, stochastic);
  }
  if (PRINTS) std::cout << "Maze:\n" << *e << std::endl;

  ExplorationPolicy* explore;
  if (exploreType == EXPLORE_BOLTZMANN)
    explore = new BoltzmannExploration(rng);
  else
    explore = new AtLeastNTimesExploration(optimistic, minN);

  TemperatureSchedule* temperature = new ExponentialTemperature(initialtemp, decay);

  TabularLearner* learner;
  if (strcmp(agentType, "td") == 0){
    if (PRINTS) std::cout << "Agent: TD Q-Learner" << std::endl;
    learner = new MazeQLearner(e, explore, discountfactor, temperature);
  }
  else if (strcmp(agentType, "sarsa") == 0){
    if (PRINTS) std::cout << "Agent: SARSA" << std::endl;
    learner = new MazeSarsaLearner(e, explore, discountfactor, temperature);
  }
  else {
    std::cerr << "ERROR: Invalid agent type" << std::endl;
    exit(-1);
  }

  PerformanceCounter* counter = new PerformanceCounter(learner, agentType);
  Agent* agent = counter;
  agent->setDebug(PRINTS);

  float rsum = 0;

  for (unsigned i = 0; i < NUMEPISODES; ++i) {
    // performance tracking
    float sum = 0;
    unsigned steps = 0;

    // first action
    std::vector<float> es = e->sensation();
    int a = agent->first_action(es);
    float r = e->apply(a);

    // update performance
    sum += r;
    ++steps;

    while (!e->terminal() && steps < MAXSTEPS) {

      // perform an action
      es = e->sensation();
      a = agent->next_action(r, es);
      r = e->apply(a);

      // update performance info
      sum += r;
      ++steps;
    }

    // terminal/last state
    if (e->terminal()){
      agent->last_action(r);
    }else{
      agent->next_action(r, e->sensation());
    }

    e->reset();
    std::cerr << sum << std::endl;
    if (PRINTS) std::cout << "Episode " << i << " steps: " << steps
                          << " return: " << sum << std::endl;

    rsum += sum;
  }

  if (PRINTS){
    std::cout << "Final table:" << std::endl;
    learner->getTable().print(std::cout);
  }

  counter->printStatistics(std::cout);
  std::cout << "# " << agentType << " avg return: "
            << (rsum / (float)NUMEPISODES) << std::endl;

  delete counter;
  delete learner;
  delete temperature;
  delete explore;
  delete e;
}


int main(int argc, char **argv) {

  // default params for env and agent
  char* agentType = NULL;
  float discountfactor = 0.9;
  int exploreType = EXPLORE_COUNTS;
  float optimistic = 10.0;
  int minN = 2;
  float initialtemp = 1.0;
  float decay = 0.01;
  unsigned width = 0;
  unsigned height = 0;
  bool stochastic = false;
  int seed = 1;

  // parse agent type
  bool gotAgent = false;
  for (int i = 1; i < argc-1; i++){
    if (strcmp(argv[i], "--agent") == 0){
      gotAgent = true;
      agentType = argv[i+1];
    }
  }
  if (!gotAgent) {
    std::cout << "--agent type  option is required" << std::endl;
    displayHelp();
  }
  if (strcmp(agentType, "td") != 0 && strcmp(agentType, "sarsa") != 0
      && strcmp(agentType, "both") != 0){
    std::cout << "Unknown agent type: " << agentType << std::endl;
    displayHelp();
  }

  // parse other arguments
  int ch;
  const char* optflags = "gxomtdwhs:";
  int option_index = 0;
  static struct option long_options[] = {
    {"gamma", 1, 0, 'g'},
    {"discountfactor", 1, 0, 'g'},
    {"explore", 1, 0, 'x'},
    {"optimistic", 1, 0, 'o'},
    {"minn", 1, 0, 'm'},
    {"temperature", 1, 0, 't'},
    {"decay", 1, 0, 'd'},
    {"width", 1, 0, 'w'},
    {"height", 1, 0, 1},
    {"seed", 1, 0, 's'},
    {"agent", 1, 0, 'q'},
    {"prints", 0, 0, 'p'},
    {"deterministic", 0, 0, 2},
    {"stochastic", 0, 0, 3},
    {"nepisodes", 1, 0, 4},
    {"maxsteps", 1, 0, 5},
    {0, 0, 0, 0}
  };

  bool countOptionChanged = false;

  while(-1 != (ch = getopt_long_only(argc, argv, optflags, long_options, &option_index))) {
    switch(ch) {

    case 'g':
      discountfactor = std::atof(optarg);
      std::cout << "discountfactor: " << discountfactor << std::endl;
      if (!(discountfactor > 0.0 && discountfactor <= 1.0)){
        std::cout << "--gamma must be in (0,1]" << std::endl;
        exit(-1);
      }
      break;

    case 'x':
      {
        if (strcmp(optarg, "counts") == 0) exploreType = EXPLORE_COUNTS;
        else if (strcmp(optarg, "boltzmann") == 0) exploreType = EXPLORE_BOLTZMANN;
        else if (strcmp(optarg, "softmax") == 0) exploreType = EXPLORE_BOLTZMANN;
        else {
          std::cout << "Unknown exploration type: " << optarg << std::endl;
          displayHelp();
        }
        std::cout << "explore: " << exploreNames[exploreType] << std::endl;
        break;
      }

    case 'o':
      countOptionChanged = true;
      optimistic = std::atof(optarg);
      std::cout << "optimistic reward: " << optimistic << std::endl;
      break;

    case 'm':
      countOptionChanged = true;
      minN = std::atoi(optarg);
      std::cout << "min n: " << minN << std::endl;
      if (minN < 0){
        std::cout << "--minn must be >= 0" << std::endl;
        exit(-1);
      }
      break;

    case 't':
      initialtemp = std::atof(optarg);
      std::cout << "initial temperature: " << initialtemp << std::endl;
      if (initialtemp <= 0.0){
        std::cout << "--temperature must be > 0" << std::endl;
        exit(-1);
      }
      break;

    case 'd':
      decay = std::atof(optarg);
      std::cout << "temperature decay: " << decay << std::endl;
      if (decay < 0.0){
        std::cout << "--decay must be >= 0" << std::endl;
        exit(-1);
      }
      break;

    case 'w':
      width = std::atoi(optarg);
      std::cout << "width: " << width << std::endl;
      break;

    case 1:
      height = std::atoi(optarg);
      std::cout << "height: " << height << std::endl;
      break;

    case 's':
      seed = std::atoi(optarg);
      std::cout << "seed: " << seed << std::endl;
      break;

    case 'q':
      // already processed this one
      std::cout << "agent: " << agentType << std::endl;
      break;

    case 'p':
      PRINTS = true;
      break;

    case 2:
      stochastic = false;
      std::cout << "stochastic: " << stochastic << std::endl;
      break;

    case 3:
      stochastic = true;
      std::cout << "stochastic: " << stochastic << std::endl;
      break;

    case 4:
      NUMEPISODES = std::atoi(optarg);
      std::cout << "Num Episodes: " << NUMEPISODES << std::endl;
      break;

    case 5:
      MAXSTEPS = std::atoi(optarg);
      std::cout << "Max Steps: " << MAXSTEPS << std::endl;
      break;

    case 'h':
    case '?':
    case 0:
    default:
      displayHelp();
      break;
    }
  }

  // check for conflicting options
  if (countOptionChanged && exploreType != EXPLORE_COUNTS){
    std::cout << "No reason to set --optimistic or --minn when not using counts exploration" << std::endl;
    exit(-1);
  }

  if (NUMEPISODES == 0 || MAXSTEPS == 0){
    std::cout << "--nepisodes and --maxsteps must be > 0" << std::endl;
    exit(-1);
  }

  if (strcmp(agentType, "both") == 0){
    runLearner("td", exploreType, discountfactor, optimistic, minN,
               initialtemp, decay, width, height, stochastic, seed);
    runLearner("sarsa", exploreType, discountfactor, optimistic, minN,
               initialtemp, decay, width, height, stochastic, seed);
  } else {
    runLearner(agentType, exploreType, discountfactor, optimistic, minN,
               initialtemp, decay, width, height, stochastic, seed);
  }

  return 0;
} // end main
