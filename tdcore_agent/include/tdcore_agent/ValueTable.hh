/** \file ValueTable.hh
    Defines the ValueTable class
*/

#ifndef _VALUETABLE_HH_
#define _VALUETABLE_HH_

#include <map>
#include <vector>
#include <iostream>

/** Sparse table of state-action utilities Q[s][a] together with the
    visit counts N[s][a] of each pair.  Missing utilities read as 0 and
    missing counts read as 0; reading never creates entries. */
class ValueTable {
public:
  typedef std::vector<float> state_t;
  typedef std::map<int, float> action_values_t;
  typedef std::map<int, int> action_counts_t;
  typedef std::map<state_t, action_values_t>::const_iterator const_iterator;

  ValueTable();

  /** \return Q[s][a], or 0 if it was never written. */
  float value(const state_t &s, int a) const;

  /** Overwrite Q[s][a]. */
  void setValue(const state_t &s, int a, float v);

  /** \return All recorded utilities of s (empty if s has none). */
  const action_values_t &values(const state_t &s) const;

  /** Maximum utility reachable from s.  Considers every recorded
      utility of s and a default of 0 for each candidate action not yet
      recorded.
      \return The maximum, or 0 when s has no recorded utility and
              candidates is empty. */
  float maxValue(const state_t &s, const std::vector<int> &candidates) const;

  /** \return N[s][a], or 0 if the pair was never left. */
  int count(const state_t &s, int a) const;

  /** \return All recorded visit counts of s (empty if s has none). */
  const action_counts_t &counts(const state_t &s) const;

  /** Increase N[s][a] by one. */
  void increment(const state_t &s, int a);

  /** \return Number of states with at least one recorded utility. */
  size_t numStates() const;

  const_iterator begin() const { return Q.begin(); }
  const_iterator end() const { return Q.end(); }

  /** Print every recorded utility, one state per line. */
  void print(std::ostream &out) const;

private:
  std::map<state_t, action_values_t> Q;
  std::map<state_t, action_counts_t> N;

  static const action_values_t emptyValues;
  static const action_counts_t emptyCounts;
};

#endif
