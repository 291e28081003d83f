#pragma once

#include "aut.hh"

#include <map>
#include <optional>
#include <set>

namespace tsautils {
using namespace std;

// labelled export forms of finite automata. initial and final states carry
// the labels of their pseudo-edges (e.g. constructor / destructor names),
// an empty label set stands for a single unlabelled pseudo-edge.

template <typename S, typename T>
struct Dfa {
  set<S> states;
  map<S, set<T>> initial_states;
  map<S, set<T>> final_states;
  map<S, map<T, S>> delta;

  void add_state(S const& s) { states.emplace(s); }

  void add_initial_state(S const& s, optional<T> const& label = nullopt) {
    add_state(s);
    auto& lbls = initial_states[s];
    if (label)
      lbls.emplace(*label);
  }

  void add_final_state(S const& s, optional<T> const& label = nullopt) {
    add_state(s);
    auto& lbls = final_states[s];
    if (label)
      lbls.emplace(*label);
  }

  // a second destination for the same source and symbol replaces the first
  void add_transition(S const& src, T const& sym, S const& dst) {
    add_state(src);
    add_state(dst);
    delta[src][sym] = dst;
  }
};

template <typename S, typename T>
struct Nfa {
  set<S> states;
  map<S, set<T>> initial_states;
  map<S, set<T>> final_states;
  map<S, map<T, set<S>>> delta;

  void add_state(S const& s) { states.emplace(s); }

  void add_initial_state(S const& s, optional<T> const& label = nullopt) {
    add_state(s);
    auto& lbls = initial_states[s];
    if (label)
      lbls.emplace(*label);
  }

  void add_final_state(S const& s, optional<T> const& label = nullopt) {
    add_state(s);
    auto& lbls = final_states[s];
    if (label)
      lbls.emplace(*label);
  }

  void add_transition(S const& src, T const& sym, S const& dst) {
    add_state(src);
    add_state(dst);
    delta[src][sym].emplace(dst);
  }
};

// flat transition set -> nfa. pseudo-edges stay unlabelled
template <typename S, typename T>
Nfa<State<S>, Symbol<T>> to_nfa(Automaton<S, T> const& aut) {
  Nfa<State<S>, Symbol<T>> ret;
  for (auto const& s : aut.states())
    ret.add_state(s);
  for (auto const& s : aut.initial_states())
    ret.add_initial_state(s);
  for (auto const& s : aut.final_states())
    ret.add_final_state(s);
  for (auto const& t : aut.transitions())
    ret.add_transition(t.source, t.symbol, t.destination);
  return ret;
}

}  // namespace tsautils
