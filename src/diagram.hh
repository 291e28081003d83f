#pragma once

#include "common/util.hh"
#include "aut.hh"
#include "fa.hh"
#include "intermediate.hh"

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace tsautils {
using namespace std;

// end of a drawn edge: one of the two pseudo-states or a named node
struct Endpoint {
  enum class Kind { initial_pseudo, final_pseudo, state };

  Kind kind;
  string name;  // only for Kind::state

  static Endpoint pseudo_initial() { return {Kind::initial_pseudo, ""}; }
  static Endpoint pseudo_final() { return {Kind::final_pseudo, ""}; }
  static Endpoint named(string const& n) { return {Kind::state, n}; }

  bool operator==(Endpoint const& o) const { return kind == o.kind && name == o.name; }
};

struct DiagramEdge {
  Endpoint source;
  Endpoint destination;
  optional<string> label;

  bool operator==(DiagramEdge const& o) const {
    return source == o.source && destination == o.destination && label == o.label;
  }
};

// format independent picture of an automaton, in output order
struct Diagram {
  vector<string> states;     // ordinary states
  vector<string> choices;    // branch points
  vector<string> accepting;  // final states of edge-list automata
  vector<DiagramEdge> edges;

  bool uses_initial() const;
  bool uses_final() const;
};

// ----------------------------------------------------------------------------

// interpret one (source, transition, destination) entry of an intermediate
// automaton as drawn edges. this is the only place these rules live:
// direct destination: edge text = transition, override renames the target.
// decision: one edge per branch, edge text = branch override (if any),
// the transition itself is not shown.
// an edge from the initial pseudo-state must lead to a real state,
// anything else is a broken automaton and throws logic_error.
template <typename S, typename T>
vector<DiagramEdge> interpret_transition(optional<S> const& src,
    intermediate::Transition<T> const& t, intermediate::Node<S> const& dst) {
  using intermediate::StateNode;
  using intermediate::Decision;

  string const sym = to_str(t);

  if (!src) {
    auto const* sn = get_if<StateNode<S>>(&dst);
    if (!sn)
      throw logic_error("invalid transition '" + sym + "': initial pseudo-state -> decision");
    if (sn->is_final())
      throw logic_error("invalid transition '" + sym + "': initial pseudo-state -> final pseudo-state");
  }

  Endpoint const from = src ? Endpoint::named(to_str(*src)) : Endpoint::pseudo_initial();

  vector<DiagramEdge> ret;
  visit(overloaded {
    [&](StateNode<S> const& n) {
      if (n.is_final())
        ret.push_back({from, Endpoint::pseudo_final(), sym});
      else if (n.label())
        ret.push_back({from, Endpoint::named(*n.label()), sym});
      else
        ret.push_back({from, Endpoint::named(to_str(*n.state)), sym});
    },
    [&](Decision<S> const& d) {
      for (auto const& b : d) {
        auto const to = b.is_final() ? Endpoint::pseudo_final() : Endpoint::named(to_str(*b.state));
        ret.push_back({from, to, b.label()});
      }
    }
  }, dst);
  return ret;
}

// pseudo-edges of labelled initial / final states (empty set = one unlabelled edge)
template <typename S, typename T>
void add_pseudo_edges(Diagram& d, map<S, set<T>> const& lbls, bool initial) {
  for (auto const& it : lbls) {
    auto const node = Endpoint::named(to_str(it.first));
    vector<optional<string>> texts;
    for (auto const& l : it.second)
      texts.push_back(to_str(l));
    if (texts.empty())
      texts.push_back(nullopt);

    for (auto const& txt : texts) {
      if (initial)
        d.edges.push_back({Endpoint::pseudo_initial(), node, txt});
      else
        d.edges.push_back({node, Endpoint::pseudo_final(), txt});
    }
  }
}

template <typename S, typename T>
Diagram make_diagram(Nfa<S, T> const& nfa) {
  Diagram d;
  for (auto const& s : nfa.states)
    d.states.push_back(to_str(s));
  for (auto const& it : nfa.final_states)
    d.accepting.push_back(to_str(it.first));

  add_pseudo_edges(d, nfa.initial_states, true);
  add_pseudo_edges(d, nfa.final_states, false);
  for (auto const& src : nfa.delta)
    for (auto const& sym : src.second)
      for (auto const& dst : sym.second)
        d.edges.push_back({Endpoint::named(to_str(src.first)), Endpoint::named(to_str(dst)), to_str(sym.first)});
  return d;
}

template <typename S, typename T>
Diagram make_diagram(Dfa<S, T> const& dfa) {
  Diagram d;
  for (auto const& s : dfa.states)
    d.states.push_back(to_str(s));
  for (auto const& it : dfa.final_states)
    d.accepting.push_back(to_str(it.first));

  add_pseudo_edges(d, dfa.initial_states, true);
  add_pseudo_edges(d, dfa.final_states, false);
  for (auto const& src : dfa.delta)
    for (auto const& sym : src.second)
      d.edges.push_back({Endpoint::named(to_str(src.first)), Endpoint::named(to_str(sym.second)), to_str(sym.first)});
  return d;
}

template <typename S, typename T>
Diagram make_diagram(Automaton<S, T> const& aut) {
  return make_diagram(to_nfa(aut));
}

template <typename S, typename T>
Diagram make_diagram(IntermediateAutomaton<S, T> const& aut) {
  Diagram d;
  for (auto const& c : aut.choices())
    d.choices.push_back(to_str(c));
  for (auto const& s : aut.states())
    if (!aut.is_choice(s))
      d.states.push_back(to_str(s));

  for (auto const& src : aut.delta())
    for (auto const& it : src.second) {
      auto const es = interpret_transition(src.first, it.first, it.second);
      d.edges.insert(d.edges.end(), cbegin(es), cend(es));
    }
  return d;
}

}  // namespace tsautils
