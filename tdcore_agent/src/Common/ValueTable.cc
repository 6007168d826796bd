#include <tdcore_agent/ValueTable.hh>

const ValueTable::action_values_t ValueTable::emptyValues;
const ValueTable::action_counts_t ValueTable::emptyCounts;

ValueTable::ValueTable() {}

float ValueTable::value(const state_t &s, int a) const {
  std::map<state_t, action_values_t>::const_iterator si = Q.find(s);
  if (si == Q.end())
    return 0.0;
  action_values_t::const_iterator ai = si->second.find(a);
  if (ai == si->second.end())
    return 0.0;
  return ai->second;
}

void ValueTable::setValue(const state_t &s, int a, float v) {
  Q[s][a] = v;
}

const ValueTable::action_values_t &ValueTable::values(const state_t &s) const {
  std::map<state_t, action_values_t>::const_iterator si = Q.find(s);
  if (si == Q.end())
    return emptyValues;
  return si->second;
}

float ValueTable::maxValue(const state_t &s,
                           const std::vector<int> &candidates) const {
  const action_values_t &Q_s = values(s);

  bool found = false;
  float best = 0.0;
  for (action_values_t::const_iterator i = Q_s.begin(); i != Q_s.end(); i++){
    if (!found || i->second > best){
      best = i->second;
      found = true;
    }
  }

  // unrecorded candidates count as 0
  for (unsigned i = 0; i < candidates.size(); i++){
    if (Q_s.find(candidates[i]) == Q_s.end() && (!found || best < 0.0)){
      best = 0.0;
      found = true;
    }
  }

  return best;
}

int ValueTable::count(const state_t &s, int a) const {
  std::map<state_t, action_counts_t>::const_iterator si = N.find(s);
  if (si == N.end())
    return 0;
  action_counts_t::const_iterator ai = si->second.find(a);
  if (ai == si->second.end())
    return 0;
  return ai->second;
}

const ValueTable::action_counts_t &ValueTable::counts(const state_t &s) const {
  std::map<state_t, action_counts_t>::const_iterator si = N.find(s);
  if (si == N.end())
    return emptyCounts;
  return si->second;
}

void ValueTable::increment(const state_t &s, int a) {
  N[s][a] += 1;
}

size_t ValueTable::numStates() const {
  return Q.size();
}

void ValueTable::print(std::ostream &out) const {
  for (const_iterator i = Q.begin(); i != Q.end(); i++){
    const state_t &s = i->first;
    for (unsigned j = 0; j < s.size(); j++){
      out << s[j] << ", ";
    }
    out << ":";
    for (action_values_t::const_iterator a = i->second.begin();
         a != i->second.end(); a++){
      out << " Q[" << a->first << "]=" << a->second
          << " (n=" << count(s, a->first) << ")";
    }
    out << std::endl;
  }
}
