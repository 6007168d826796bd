/** \file GridMaze.hh
    Defines the GridMaze domain: a walled grid in which the legal
    actions of a cell are the directions not blocked by a wall.
*/

#ifndef _GRIDMAZE_H_
#define _GRIDMAZE_H_

#include <tdcore_common/Random.h>
#include <tdcore_common/core.hh>

#include <iostream>
#include <vector>

/** Episodic maze.  The agent starts in the south-west corner and must
    reach the north-east corner.  Every move costs -1, reaching the goal
    pays GOAL_REWARD and ends the episode. */
class GridMaze: public Environment {
public:
  enum maze_action_t {NORTH, SOUTH, EAST, WEST};

  /** Creates the default 5x5 maze.
      \param rand Random number generator, used only when stochastic.
      \param stochastic Whether moves sometimes slip to a random legal
                        direction. */
  GridMaze(Random &rand, bool stochastic);

  /** Creates a maze using the given wall occupancy matrices.
      \param rand Random number generator to use.
      \param height Height of the maze.
      \param width  Width of the maze.
      \param northsouth Whether each interior wall blocking NS
                        movement exists, organized first by [w]
                        columns and then by [h-1] rows.
      \param eastwest Whether each interior wall blocking EW movement
                      exists, organized first by [h] rows and then by
                      [w-1] columns.
      \param stochastic Whether moves sometimes slip. */
  GridMaze(Random &rand, unsigned height, unsigned width,
           const std::vector<std::vector<bool> > &northsouth,
           const std::vector<std::vector<bool> > &eastwest,
           bool stochastic);

  /** Creates a maze of the given size with random interior walls.  The
      goal is always reachable from the start. */
  GridMaze(Random &rand, unsigned height, unsigned width, bool stochastic);

  virtual ~GridMaze();

  virtual const std::vector<float> &sensation() const;
  virtual float apply(int action);

  virtual bool terminal() const;
  virtual void reset();

  /** Legal actions from a sensation: every direction not blocked by a
      wall or the border, in NORTH, SOUTH, EAST, WEST order.  Empty at
      the goal. */
  std::vector<int> actions(const std::vector<float> &s) const;

  /** Checks if a wall blocks movement in a given direction.
      \param nsCoord The coordinate along the NS direction.
      \param ewCoord The coordinate along the EW direction.
      \param dir The direction in which to check movement. */
  bool wall(unsigned nsCoord, unsigned ewCoord, unsigned dir) const;

  unsigned height() const { return h; }
  unsigned width() const { return w; }

  friend std::ostream &operator<<(std::ostream &out, const GridMaze &g);

  static const float STEP_REWARD;
  static const float GOAL_REWARD;
  static const double SLIP_PROB;

private:
  /** Place random interior walls until the goal is reachable. */
  void randomize_walls();

  /** Breadth-first search from the start to the goal. */
  bool goal_reachable() const;

  bool isGoal(unsigned nsCoord, unsigned ewCoord) const;

  const unsigned h;
  const unsigned w;

  /** The occupancy matrix for the walls that obstruct NS movement.
      Element i,j is true if in the ith column the wall between rows j
      and j+1 is present. */
  std::vector<std::vector<bool> > ns;

  /** Element i,j is true if in the ith row the wall between columns j
      and j+1 is present. */
  std::vector<std::vector<bool> > ew;

  const bool noisy;
  Random &rng;

  std::vector<float> s;
};

#endif
