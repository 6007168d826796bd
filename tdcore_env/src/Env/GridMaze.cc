/** \file GridMaze.cc
    Implements the GridMaze domain.
*/

#include <tdcore_env/GridMaze.hh>

#include <cstdlib>
#include <deque>

const float GridMaze::STEP_REWARD = -1.0;
const float GridMaze::GOAL_REWARD = 10.0;
const double GridMaze::SLIP_PROB = 0.2;

/** Default map, indexed [column][row] for ns and [row][column] for ew. */
static const bool defaultNS[5][4] = {
  {false, false, false, false},
  {true,  false, false, false},
  {false, true,  false, false},
  {false, false, true,  false},
  {false, false, false, false}
};

static const bool defaultEW[5][4] = {
  {false, false, false, false},
  {false, true,  false, false},
  {false, false, true,  false},
  {true,  false, false, false},
  {false, false, false, true}
};

GridMaze::GridMaze(Random &rand, bool stochastic):
  h(5), w(5),
  ns(5, std::vector<bool>(4, false)),
  ew(5, std::vector<bool>(4, false)),
  noisy(stochastic), rng(rand), s(2)
{
  for (unsigned i = 0; i < 5; i++){
    for (unsigned j = 0; j < 4; j++){
      ns[i][j] = defaultNS[i][j];
      ew[i][j] = defaultEW[i][j];
    }
  }
  reset();
}

GridMaze::GridMaze(Random &rand, unsigned height, unsigned width,
                   const std::vector<std::vector<bool> > &northsouth,
                   const std::vector<std::vector<bool> > &eastwest,
                   bool stochastic):
  h(height), w(width), ns(northsouth), ew(eastwest),
  noisy(stochastic), rng(rand), s(2)
{
  bool valid = (h > 0 && w > 0 && ns.size() == w && ew.size() == h);
  for (unsigned i = 0; valid && i < ns.size(); i++)
    valid = (ns[i].size() == h - 1);
  for (unsigned i = 0; valid && i < ew.size(); i++)
    valid = (ew[i].size() == w - 1);
  if (!valid){
    std::cerr << "ERROR: wall matrices do not match a " << h << "x" << w
              << " maze" << std::endl;
    exit(-1);
  }
  reset();
}

GridMaze::GridMaze(Random &rand, unsigned height, unsigned width,
                   bool stochastic):
  h(height), w(width),
  ns(width, std::vector<bool>(height > 0 ? height - 1 : 0, false)),
  ew(height, std::vector<bool>(width > 0 ? width - 1 : 0, false)),
  noisy(stochastic), rng(rand), s(2)
{
  if (h == 0 || w == 0){
    std::cerr << "ERROR: maze must be at least 1x1" << std::endl;
    exit(-1);
  }
  randomize_walls();
  reset();
}

GridMaze::~GridMaze() {}

const std::vector<float> &GridMaze::sensation() const { return s; }

float GridMaze::apply(int action) {
  if (action < NORTH || action > WEST){
    std::cerr << "Invalid action " << action << " in GridMaze::apply" << std::endl;
    return 0;
  }

  unsigned nsCoord = static_cast<unsigned>(s[0]);
  unsigned ewCoord = static_cast<unsigned>(s[1]);

  int effect = action;
  if (noisy && rng.bernoulli(SLIP_PROB)){
    const std::vector<int> legal = actions(s);
    if (!legal.empty())
      effect = legal[rng.uniformDiscrete(0, legal.size() - 1)];
  }

  if (!wall(nsCoord, ewCoord, effect)){
    switch(effect) {
    case NORTH: ++nsCoord; break;
    case SOUTH: --nsCoord; break;
    case EAST:  ++ewCoord; break;
    case WEST:  --ewCoord; break;
    }
    s[0] = nsCoord;
    s[1] = ewCoord;
  }

  if (isGoal(nsCoord, ewCoord))
    return GOAL_REWARD;
  return STEP_REWARD;
}

bool GridMaze::terminal() const {
  return isGoal(static_cast<unsigned>(s[0]), static_cast<unsigned>(s[1]));
}

void GridMaze::reset() {
  s[0] = 0;
  s[1] = 0;
}

std::vector<int> GridMaze::actions(const std::vector<float> &state) const {
  std::vector<int> legal;
  if (state.size() < 2)
    return legal;

  const unsigned nsCoord = static_cast<unsigned>(state[0]);
  const unsigned ewCoord = static_cast<unsigned>(state[1]);
  if (nsCoord >= h || ewCoord >= w || isGoal(nsCoord, ewCoord))
    return legal;

  for (int dir = NORTH; dir <= WEST; dir++){
    if (!wall(nsCoord, ewCoord, dir))
      legal.push_back(dir);
  }
  return legal;
}

bool GridMaze::wall(unsigned nsCoord, unsigned ewCoord, unsigned dir) const {
  switch(dir) {
  case NORTH:
    return nsCoord + 1 >= h || ns[ewCoord][nsCoord];
  case SOUTH:
    return nsCoord == 0 || ns[ewCoord][nsCoord - 1];
  case EAST:
    return ewCoord + 1 >= w || ew[nsCoord][ewCoord];
  case WEST:
    return ewCoord == 0 || ew[nsCoord][ewCoord - 1];
  }
  return true;
}

bool GridMaze::isGoal(unsigned nsCoord, unsigned ewCoord) const {
  return nsCoord == h - 1 && ewCoord == w - 1;
}

void GridMaze::randomize_walls() {
  const double density = 0.25;

  // a wall that cuts the goal off is removed again
  for (unsigned i = 0; i < ns.size(); i++){
    for (unsigned j = 0; j < ns[i].size(); j++){
      if (!rng.bernoulli(density)) continue;
      ns[i][j] = true;
      if (!goal_reachable()) ns[i][j] = false;
    }
  }
  for (unsigned i = 0; i < ew.size(); i++){
    for (unsigned j = 0; j < ew[i].size(); j++){
      if (!rng.bernoulli(density)) continue;
      ew[i][j] = true;
      if (!goal_reachable()) ew[i][j] = false;
    }
  }
}

bool GridMaze::goal_reachable() const {
  std::vector<std::vector<bool> > seen(h, std::vector<bool>(w, false));
  std::deque<std::pair<unsigned, unsigned> > open;
  open.push_back(std::make_pair(0u, 0u));
  seen[0][0] = true;

  while (!open.empty()){
    const unsigned i = open.front().first;
    const unsigned j = open.front().second;
    open.pop_front();
    if (isGoal(i, j))
      return true;

    for (unsigned dir = NORTH; dir <= WEST; dir++){
      if (wall(i, j, dir)) continue;
      unsigned ni = i, nj = j;
      switch(dir) {
      case NORTH: ++ni; break;
      case SOUTH: --ni; break;
      case EAST:  ++nj; break;
      case WEST:  --nj; break;
      }
      if (!seen[ni][nj]){
        seen[ni][nj] = true;
        open.push_back(std::make_pair(ni, nj));
      }
    }
  }
  return false;
}

std::ostream &operator<<(std::ostream &out, const GridMaze &g) {
  for (unsigned i = 0; i < g.w; ++i)
    out << " -";
  out << " \n";

  for (unsigned row = g.h; row > 0; --row) {
    const unsigned r = row - 1;
    out << "|";
    for (unsigned c = 0; c < g.w; ++c){
      out << ((r == g.h - 1 && c == g.w - 1) ? "G" : (r == 0 && c == 0) ? "S" : " ");
      out << ((c + 1 < g.w && !g.ew[r][c]) ? " " : "|");
    }
    out << "\n";

    if (r > 0){
      for (unsigned c = 0; c < g.w; ++c)
        out << (g.ns[c][r-1] ? " -" : "  ");
      out << " \n";
    }
  }

  for (unsigned i = 0; i < g.w; ++i)
    out << " -";
  out << " \n";

  return out;
}
