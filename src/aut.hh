#pragma once

#include "common/util.hh"
#include "common/graph.hh"
#include "types.hh"

#include <range/v3/all.hpp>

#include <cassert>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <vector>

namespace tsautils {
using namespace std;

// a transition from source to destination through symbol
template <typename S, typename T>
struct Transition {
  State<S> source;
  State<S> destination;
  Symbol<T> symbol;

  Transition(State<S> const& src, State<S> const& dst, Symbol<T> const& sym)
    : source(src), destination(dst), symbol(sym) {}

  bool operator==(Transition const& o) const {
    return source == o.source && destination == o.destination && symbol == o.symbol;
  }
  bool operator<(Transition const& o) const {
    return tie(source, destination, symbol) < tie(o.source, o.destination, o.symbol);
  }
};

// finite automaton with explicit initial and final state sets.
// transitions are stored as a flat set and as adjacency graph for traversal.
// nothing is ever removed.
template <typename S, typename T>
class Automaton {
  set<State<S>> allstates;
  set<State<S>> init;
  set<State<S>> fin;
  set<Transition<S, T>> trans;

  // one symbol per (source, destination) pair
  DiGraph<State<S>, Symbol<T>> graph;

public:
  // add a state (no-op if present), returns the stored node
  State<S> const& add_state(State<S> const& s) {
    allstates.emplace(s);
    return graph.add_node(s);
  }

  State<S> const& add_initial_state(State<S> const& s) {
    init.emplace(s);
    return add_state(s);
  }

  State<S> const& add_final_state(State<S> const& s) {
    fin.emplace(s);
    return add_state(s);
  }

  // add transition, endpoints become states if they are not yet.
  // if an edge between the same pair existed, its graph label is replaced
  // and the old symbol is returned.
  optional<Symbol<T>> add_transition(Transition<S, T> const& t) {
    add_state(t.source);
    add_state(t.destination);
    trans.emplace(t);
    return graph.add_edge(t.source, t.destination, t.symbol);
  }

  size_t num_states() const { return allstates.size(); }
  size_t num_transitions() const { return trans.size(); }

  set<State<S>> const& states() const { return allstates; }
  set<State<S>> const& initial_states() const { return init; }
  set<State<S>> const& final_states() const { return fin; }
  set<Transition<S, T>> const& transitions() const { return trans; }
  DiGraph<State<S>, Symbol<T>> const& get_graph() const { return graph; }

  bool has_state(State<S> const& s) const { return contains(allstates, s); }
  bool is_initial(State<S> const& s) const { return contains(init, s); }
  bool is_final(State<S> const& s) const { return contains(fin, s); }

  vector<State<S>> succ(State<S> const& s) const { return graph.succ(s); }
  vector<State<S>> pred(State<S> const& s) const { return graph.pred(s); }

  // all states reachable from s by at least one transition.
  // s itself is only contained if it is on a cycle.
  set<State<S>> reachable(State<S> const& s) const {
    assert(has_state(s));
    succ_fun<State<S>> const sucs = [this](State<S> const& v){ return graph.succ(v); };
    return reachable_states(s, sucs);
  }

  // some final state is reachable from s by at least one transition.
  // a final state without a cycle back to itself is NOT productive.
  bool is_productive(State<S> const& s) const {
    return ranges::any_of(reachable(s), [this](State<S> const& q){ return is_final(q); });
  }

  //at most one outgoing transition per source and symbol
  bool is_deterministic() const {
    set<pair<State<S>, Symbol<T>>> seen;
    for (auto const& t : trans)
      if (!seen.emplace(t.source, t.symbol).second)
        return false;
    return true;
  }
};

// states that are neither initial nor reachable from some initial state
template <typename S, typename T>
vector<State<S>> unreachable_states(Automaton<S, T> const& aut) {
  set<State<S>> reached(cbegin(aut.initial_states()), cend(aut.initial_states()));
  for (auto const& i : aut.initial_states()) {
    auto const r = aut.reachable(i);
    reached.insert(cbegin(r), cend(r));
  }
  vector<State<S>> const all(cbegin(aut.states()), cend(aut.states()));
  return set_diff(all, vector<State<S>>(cbegin(reached), cend(reached)));
}

// states for which is_productive fails
template <typename S, typename T>
vector<State<S>> unproductive_states(Automaton<S, T> const& aut) {
  return aut.states()
    | ranges::views::filter([&aut](State<S> const& s){ return !aut.is_productive(s); })
    | ranges::to<vector>();
}

}  // namespace tsautils
