#pragma once

#include "common/util.hh"

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tsautils {
namespace intermediate {
using namespace std;

// drawing hints attached to a destination
struct Metadata {
  // direct destination: drawn node name. decision branch: edge text.
  optional<string> transition_label;

  bool operator==(Metadata const& o) const { return transition_label == o.transition_label; }
};

// a destination state. no state = terminal pseudo-state
template <typename S>
struct StateNode {
  optional<S> state;
  Metadata metadata;

  StateNode() = default;
  StateNode(optional<S> s) : state(move(s)) {}
  StateNode(optional<S> s, string label) : state(move(s)), metadata{move(label)} {}

  bool is_final() const { return !state; }
  optional<string> const& label() const { return metadata.transition_label; }

  bool operator==(StateNode const& o) const {
    return state == o.state && metadata == o.metadata;
  }
};

// branch point, candidates are reached without further input
template <typename S>
using Decision = vector<StateNode<S>>;

template <typename S>
using Node = variant<StateNode<S>, Decision<S>>;

template <typename S>
StateNode<S> state_node(S const& s) { return StateNode<S>(s); }

template <typename S>
StateNode<S> final_node() { return StateNode<S>(nullopt); }

template <typename S>
StateNode<S> labeled(StateNode<S> n, string const& label) {
  n.metadata.transition_label = label;
  return n;
}

template <typename S>
Decision<S> decision(initializer_list<StateNode<S>> branches) {
  return Decision<S>(branches);
}

template <typename S>
Decision<S> decision(vector<S> const& states) {
  Decision<S> ret;
  for (auto const& s : states)
    ret.emplace_back(s);
  return ret;
}

// transition symbol. equality and order only look at the symbol
template <typename T>
struct Transition {
  T transition;

  Transition(T t) : transition(move(t)) {}

  T const& get() const { return transition; }

  bool operator==(Transition const& o) const { return transition == o.transition; }
  bool operator<(Transition const& o) const { return transition < o.transition; }
};

template <typename T>
ostream& operator<<(ostream& os, Transition<T> const& t) { return os << t.transition; }

// automaton with decision nodes and label overrides, as derived from
// (possibly conditional) state transition declarations.
// source nullopt = initial pseudo-state.
template <typename S, typename T>
class IntermediateAutomaton {
public:
  using delta_type = map<optional<S>, map<Transition<T>, Node<S>>>;

private:
  set<S> allstates;
  set<S> choicestates;
  delta_type trans;

public:
  bool add_state(S const& s) { return allstates.emplace(s).second; }
  bool add_choice(S const& s) { return choicestates.emplace(s).second; }

  // at most one destination per (source, transition), the last one wins.
  // returns whether an older destination was replaced.
  bool add_transition(optional<S> const& source, Transition<T> const& t, Node<S> dst) {
    auto& out = trans[source];
    auto it = out.find(t);
    if (it != out.end()) {
      it->second = move(dst);
      return true;
    }
    out.emplace(t, move(dst));
    return false;
  }

  set<S> const& states() const { return allstates; }
  set<S> const& choices() const { return choicestates; }
  delta_type const& delta() const { return trans; }

  bool has_state(S const& s) const { return contains(allstates, s); }
  bool is_choice(S const& s) const { return contains(choicestates, s); }

  size_t num_transitions() const {
    size_t n = 0;
    for (auto const& it : trans)
      n += it.second.size();
    return n;
  }
};

}  // namespace intermediate

using intermediate::IntermediateAutomaton;

}  // namespace tsautils

namespace std {
template <typename T>
struct hash<tsautils::intermediate::Transition<T>> {
  size_t operator()(tsautils::intermediate::Transition<T> const& t) const {
    return hash<T>()(t.transition);
  }
};
}  // namespace std
